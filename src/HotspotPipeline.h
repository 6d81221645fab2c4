#ifndef HOTSPOT_PIPELINE_H
#define HOTSPOT_PIPELINE_H

#include <vector>
#include "ClusterAggregator.h"
#include "ClusteringEngine.h"
#include "HotspotRanker.h"
#include "./parser/CSV.h"

struct HotspotRequest {
    DbscanParams params;
    bool includeNoise;
    size_t topN;
};

struct HotspotReport {
    ClusterStatus status;
    ClusterAssignment assignment;
    std::vector<ClusterSummary> summaries;
    std::vector<RankedHotspot> mostDangerous;
    std::vector<RankedHotspot> busiest;
    // Filled only when the request asks for noise.
    std::vector<size_t> outlierRows;

    // Clustering ran but found no dense region.
    bool emptyClusterSet() const { return status.ok() && summaries.empty(); }
};

// clustering -> aggregation -> ranking. Nothing is kept between calls.
HotspotReport findHotspots(const std::vector<CrashRecord>& records, const HotspotRequest& request);

#endif
