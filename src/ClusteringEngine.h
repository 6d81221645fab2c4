#ifndef CLUSTERING_ENGINE_H
#define CLUSTERING_ENGINE_H

#include <string>
#include <vector>
#include "NeighborIndex.h"
#include "./parser/CSV.h"

const int NOISE_CLUSTER = -1;

enum class ClusterStatusCode {
    Ok,
    NoValidPoints,
    InvalidParameter
};

struct ClusterStatus {
    ClusterStatusCode code = ClusterStatusCode::Ok;
    std::string message;

    bool ok() const { return code == ClusterStatusCode::Ok; }
};

struct DbscanParams {
    double eps;
    int min_samples;
};

// Column-wise assignment: entry i says that table row rows[i] belongs to
// cluster clusterIds[i] (NOISE_CLUSTER for noise). Rows are ascending.
struct ClusterAssignment {
    std::vector<size_t> rows;
    std::vector<int> clusterIds;
    std::vector<bool> corePoints;

    size_t size() const { return rows.size(); }
    bool empty() const { return rows.empty(); }
    int clusterCount() const;
    size_t coreCount() const;
    size_t noiseCount() const;
};

struct ClusteringResult {
    ClusterStatus status;
    ClusterAssignment assignment;
};

class ClusteringEngine {
public:
    ClusteringEngine(double eps, int minSamples);
    explicit ClusteringEngine(const DbscanParams& params);

    // Rows of the result are positions in `points`.
    ClusteringResult clusterPoints(const std::vector<GeoPoint>& points) const;
    // Rows of the result are positions in `records`; records without a
    // valid location are left out of the assignment.
    ClusteringResult clusterCrashes(const std::vector<CrashRecord>& records) const;

    static ClusterStatus validate(double eps, int minSamples);

private:
    const double EPS;
    const int MIN_SAMPLES;
};

std::string statusCodeName(ClusterStatusCode code);

#endif
