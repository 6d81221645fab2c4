#ifndef CLUSTER_AGGREGATOR_H
#define CLUSTER_AGGREGATOR_H

#include <string>
#include <vector>
#include "ClusteringEngine.h"
#include "ZoneClassifier.h"
#include "./parser/CSV.h"

struct ClusterSummary {
    int clusterId;
    int crashCount;
    long long fatalitySum;
    double centroidLatitude;
    double centroidLongitude;
    DangerTier tier;
    std::string tierLabel;
    std::string tierColor;
};

// One summary per non-noise cluster id in `assignment`, ascending by id.
// Rows of the assignment index into `records`.
std::vector<ClusterSummary> aggregateClusters(const std::vector<CrashRecord>& records,
                                              const ClusterAssignment& assignment);

// Table rows labeled as noise, ascending.
std::vector<size_t> collectNoiseRows(const ClusterAssignment& assignment);

#endif
