#include "ReportWriter.h"
#include <algorithm>
#include <fstream>
#include <iomanip>
#include <iostream>
#include <limits>
#include <map>

using json = nlohmann::json;

json summaryToJson(const ClusterSummary& summary) {
    return {
        {"cluster", summary.clusterId},
        {"crashes", summary.crashCount},
        {"fatalities", summary.fatalitySum},
        {"lat", summary.centroidLatitude},
        {"lon", summary.centroidLongitude},
        {"zone_label", summary.tierLabel},
        {"zone_color", summary.tierColor},
    };
}

json rankingToJson(const std::vector<RankedHotspot>& ranking) {
    json entries = json::array();
    for (const auto& hotspot : ranking) {
        json entry = summaryToJson(hotspot.summary);
        entry["rank"] = hotspot.displayRank;
        entry["cluster_name"] = hotspot.displayName;
        entries.push_back(entry);
    }
    return entries;
}

static json recordToJson(const CSV& table, size_t row) {
    const CrashRecord& record = table.rows[row];
    json entry = {
        {"row", row},
        {"lat", record.latitude},
        {"lon", record.longitude},
        {"fatals", std::max(0, record.fatals)},
        {"county", record.county_name},
        {"city", record.city_name},
        {"weather", record.weather_name},
        {"route", record.route_name},
    };
    if (record.year != std::numeric_limits<int>::min()) {
        entry["year"] = record.year;
    }
    json extra = json::object();
    for (size_t i = 0; i < table.extra_columns.size() && i < record.extra.size(); ++i) {
        extra[table.extra_columns[i]] = record.extra[i];
    }
    entry["extra"] = extra;
    return entry;
}

json buildReport(const CSV& table, const HotspotRequest& request,
                 const HotspotReport& report, const ViewMetrics& metrics) {
    json result;
    result["parameters"] = {
        {"eps", request.params.eps},
        {"min_samples", request.params.min_samples},
        {"show_outliers", request.includeNoise},
        {"top_n", request.topN},
    };
    result["status"] = statusCodeName(report.status.code);
    if (!report.status.message.empty()) {
        result["message"] = report.status.message;
    }

    json view = {
        {"total_crashes", metrics.totalCrashes},
        {"total_fatalities", metrics.totalFatalities},
    };
    if (metrics.hasYearRange) {
        view["year_min"] = metrics.minYear;
        view["year_max"] = metrics.maxYear;
    }
    result["view"] = view;

    std::map<int, const ClusterSummary*> byCluster;
    json summaries = json::array();
    for (const auto& summary : report.summaries) {
        byCluster[summary.clusterId] = &summary;
        summaries.push_back(summaryToJson(summary));
    }
    result["clusters"] = summaries;

    json points = json::array();
    const ClusterAssignment& assignment = report.assignment;
    for (size_t i = 0; i < assignment.size(); ++i) {
        int clusterId = assignment.clusterIds[i];
        if (clusterId == NOISE_CLUSTER && !request.includeNoise) continue;

        json entry = recordToJson(table, assignment.rows[i]);
        entry["cluster"] = clusterId;
        entry["core"] = static_cast<bool>(assignment.corePoints[i]);
        auto it = byCluster.find(clusterId);
        if (it != byCluster.end()) {
            entry["fatalities"] = it->second->fatalitySum;
            entry["zone_label"] = it->second->tierLabel;
            entry["zone_color"] = it->second->tierColor;
        } else {
            entry["zone_label"] = "Outlier";
            entry["zone_color"] = OUTLIER_COLOR;
        }
        points.push_back(entry);
    }
    result["points"] = points;

    result["most_dangerous"] = rankingToJson(report.mostDangerous);
    result["busiest"] = rankingToJson(report.busiest);
    return result;
}

bool writeReport(const std::string& path, const json& report) {
    std::ofstream file(path);
    if (!file.is_open()) {
        std::cerr << "Failed to open report file: " << path << std::endl;
        return false;
    }
    // Text cells come straight from the CSV and may not be UTF-8.
    try {
        file << report.dump(2, ' ', false, json::error_handler_t::replace) << std::endl;
    } catch (const json::exception& e) {
        std::cerr << "Failed to serialize report " << path << ": " << e.what() << std::endl;
        return false;
    }
    if (!file) {
        std::cerr << "Failed to write report file: " << path << std::endl;
        return false;
    }
    return true;
}

void printViewMetrics(std::ostream& out, const ViewMetrics& metrics) {
    out << "Total Crashes: " << metrics.totalCrashes << "\n";
    out << "Total Fatalities: " << metrics.totalFatalities << "\n";
    if (metrics.hasYearRange) {
        out << "Year Range: " << metrics.minYear << "-" << metrics.maxYear << "\n";
    } else {
        out << "Year Range: -\n";
    }
}

void printTopHotspots(std::ostream& out, const std::string& title, const std::vector<RankedHotspot>& ranking) {
    out << title << ":\n";
    if (ranking.empty()) {
        out << "  (no hotspots)\n";
        return;
    }
    for (const auto& hotspot : ranking) {
        out << "  " << hotspot.displayName << ": "
            << hotspot.summary.tierLabel << ", "
            << hotspot.summary.fatalitySum << " fatalities, "
            << hotspot.summary.crashCount << " crashes\n";
    }
}
