#include "HotspotPipeline.h"
#include <utility>

HotspotReport findHotspots(const std::vector<CrashRecord>& records, const HotspotRequest& request) {
    HotspotReport report;

    ClusteringEngine engine(request.params);
    ClusteringResult clustering = engine.clusterCrashes(records);
    report.status = clustering.status;
    if (!report.status.ok()) {
        return report;
    }
    report.assignment = std::move(clustering.assignment);

    report.summaries = aggregateClusters(records, report.assignment);
    report.mostDangerous = HotspotRanker(RankingKey::ByFatalities, request.topN).rank(report.summaries);
    report.busiest = HotspotRanker(RankingKey::ByCrashCount, request.topN).rank(report.summaries);

    if (request.includeNoise) {
        report.outlierRows = collectNoiseRows(report.assignment);
    }
    return report;
}
