#include "ClusterAggregator.h"
#include <algorithm>
#include <map>

namespace {

struct ClusterAccumulator {
    int crashCount = 0;
    long long fatalitySum = 0;
    double latitudeSum = 0.0;
    double longitudeSum = 0.0;
};

} // namespace

std::vector<ClusterSummary> aggregateClusters(const std::vector<CrashRecord>& records,
                                              const ClusterAssignment& assignment) {
    std::map<int, ClusterAccumulator> clusterStats;
    for (size_t i = 0; i < assignment.size(); ++i) {
        int clusterId = assignment.clusterIds[i];
        if (clusterId == NOISE_CLUSTER) continue;

        const CrashRecord& record = records[assignment.rows[i]];
        auto& stats = clusterStats[clusterId];
        stats.crashCount++;
        stats.fatalitySum += std::max(0, record.fatals);
        stats.latitudeSum += record.latitude;
        stats.longitudeSum += record.longitude;
    }

    std::vector<ClusterSummary> summaries;
    summaries.reserve(clusterStats.size());
    for (const auto& [clusterId, stats] : clusterStats) {
        ZoneClassification zone = classifyZone(stats.fatalitySum);
        summaries.push_back({clusterId,
                             stats.crashCount,
                             stats.fatalitySum,
                             stats.latitudeSum / stats.crashCount,
                             stats.longitudeSum / stats.crashCount,
                             zone.tier,
                             zone.label,
                             zone.color});
    }
    return summaries;
}

std::vector<size_t> collectNoiseRows(const ClusterAssignment& assignment) {
    std::vector<size_t> noiseRows;
    for (size_t i = 0; i < assignment.size(); ++i) {
        if (assignment.clusterIds[i] == NOISE_CLUSTER) {
            noiseRows.push_back(assignment.rows[i]);
        }
    }
    return noiseRows;
}
