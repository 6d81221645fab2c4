#include <iostream>
#include <string>

#include "./parser/CSV.h"
#include "Config.h"
#include "HotspotPipeline.h"
#include "ReportWriter.h"
#include "ViewMetrics.h"

int main(int argc, char** argv) {
    if (argc < 2) {
        std::cerr << "Usage: " << argv[0] << " <config_file.json>" << std::endl;
        return 1;
    }

    HotspotConfig config;
    if (!loadConfig(argv[1], config)) {
        return 1;
    }

    CSV csv = makeCSV(config.csvPath);
    if (csv.size() == 0) {
        std::cerr << "No data points match the current filters. Please adjust the filters and try again." << std::endl;
        return 1;
    }

    HotspotRequest request{{config.eps, config.minSamples}, config.showOutliers, config.topN};
    std::cout << "Clustering " << csv.size() << " crashes (eps=" << config.eps
              << ", min_samples=" << config.minSamples << ", scope=" << config.scope
              << ", top_n=" << config.topN << ")" << std::endl;

    ViewMetrics metrics = computeViewMetrics(csv.rows);
    HotspotReport report = findHotspots(csv.rows, request);

    switch (report.status.code) {
    case ClusterStatusCode::InvalidParameter:
        std::cerr << "Clustering failed: " << report.status.message << std::endl;
        return 1;
    case ClusterStatusCode::NoValidPoints:
        std::cout << report.status.message << std::endl;
        break;
    case ClusterStatusCode::Ok:
        std::cout << "Found " << report.summaries.size() << " clusters, "
                  << report.assignment.noiseCount() << " outliers" << std::endl;
        break;
    }

    std::cout << "\n--- CURRENT VIEW ---\n";
    printViewMetrics(std::cout, metrics);

    if (report.emptyClusterSet()) {
        std::cout << "\nNo clusters found after DBSCAN." << std::endl;
    } else if (report.status.ok()) {
        std::cout << "\n";
        printTopHotspots(std::cout, "Top " + std::to_string(config.topN) + " Most Dangerous Hotspots",
                         report.mostDangerous);
        std::cout << "\n";
        printTopHotspots(std::cout, "Top " + std::to_string(config.topN) + " Crash Hotspots",
                         report.busiest);
    }
    std::cout << std::endl;

    if (!config.reportPath.empty()) {
        if (!writeReport(config.reportPath, buildReport(csv, request, report, metrics))) {
            return 1;
        }
        std::cout << "Report written to " << config.reportPath << std::endl;
    }

    return 0;
}
