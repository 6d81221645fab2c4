#include "ClusteringEngine.h"
#include <algorithm>
#include <omp.h>
#include <sstream>
#include <utility>

int ClusterAssignment::clusterCount() const {
    int highest = NOISE_CLUSTER;
    for (int id : clusterIds) {
        highest = std::max(highest, id);
    }
    return highest + 1;
}

size_t ClusterAssignment::coreCount() const {
    return static_cast<size_t>(std::count(corePoints.begin(), corePoints.end(), true));
}

size_t ClusterAssignment::noiseCount() const {
    return static_cast<size_t>(std::count(clusterIds.begin(), clusterIds.end(), NOISE_CLUSTER));
}

ClusteringEngine::ClusteringEngine(double eps, int minSamples)
    : EPS(eps), MIN_SAMPLES(minSamples) {}

ClusteringEngine::ClusteringEngine(const DbscanParams& params)
    : EPS(params.eps), MIN_SAMPLES(params.min_samples) {}

ClusterStatus ClusteringEngine::validate(double eps, int minSamples) {
    // Written as !(eps > 0) so that NaN is rejected too.
    if (!(eps > 0.0)) {
        std::ostringstream message;
        message << "eps must be greater than 0, got " << eps;
        return {ClusterStatusCode::InvalidParameter, message.str()};
    }
    if (minSamples < 1) {
        std::ostringstream message;
        message << "min_samples must be at least 1, got " << minSamples;
        return {ClusterStatusCode::InvalidParameter, message.str()};
    }
    return {ClusterStatusCode::Ok, ""};
}

ClusteringResult ClusteringEngine::clusterPoints(const std::vector<GeoPoint>& points) const {
    ClusteringResult result;
    result.status = validate(EPS, MIN_SAMPLES);
    if (!result.status.ok()) {
        return result;
    }
    if (points.empty()) {
        result.status = {ClusterStatusCode::NoValidPoints, "No valid data points for clustering"};
        return result;
    }

    const size_t n = points.size();
    const size_t minSamples = static_cast<size_t>(MIN_SAMPLES);
    NeighborIndex index(points, EPS);

    // Core flags only depend on each point's own neighborhood, so the
    // queries are independent and the result does not depend on scheduling.
    std::vector<char> core(n, 0);
    #pragma omp parallel for schedule(dynamic, 256)
    for (size_t i = 0; i < n; ++i) {
        core[i] = index.countNeighbors(i) >= minSamples ? 1 : 0;
    }

    // Expansion walks points in input order; a border point keeps the
    // first cluster that reaches it.
    std::vector<int> labels(n, NOISE_CLUSTER);
    std::vector<size_t> frontier;
    int nextCluster = 0;
    for (size_t i = 0; i < n; ++i) {
        if (labels[i] != NOISE_CLUSTER || !core[i]) continue;

        labels[i] = nextCluster;
        frontier.push_back(i);
        while (!frontier.empty()) {
            size_t current = frontier.back();
            frontier.pop_back();
            for (size_t neighbor : index.regionQuery(current)) {
                if (labels[neighbor] != NOISE_CLUSTER) continue;
                labels[neighbor] = nextCluster;
                if (core[neighbor]) {
                    frontier.push_back(neighbor);
                }
            }
        }
        ++nextCluster;
    }

    ClusterAssignment& assignment = result.assignment;
    assignment.rows.resize(n);
    assignment.corePoints.resize(n);
    for (size_t i = 0; i < n; ++i) {
        assignment.rows[i] = i;
        assignment.corePoints[i] = core[i] != 0;
    }
    assignment.clusterIds = std::move(labels);
    return result;
}

ClusteringResult ClusteringEngine::clusterCrashes(const std::vector<CrashRecord>& records) const {
    std::vector<GeoPoint> points;
    std::vector<size_t> sourceRows;
    points.reserve(records.size());
    sourceRows.reserve(records.size());
    for (size_t i = 0; i < records.size(); ++i) {
        if (records[i].hasValidLocation()) {
            points.push_back({records[i].latitude, records[i].longitude});
            sourceRows.push_back(i);
        }
    }

    ClusteringResult result = clusterPoints(points);
    if (result.status.code == ClusterStatusCode::NoValidPoints) {
        result.status.message = "No valid data points for clustering (LATITUDE and LONGITUD contain NaN)";
    }
    for (size_t& row : result.assignment.rows) {
        row = sourceRows[row];
    }
    return result;
}

std::string statusCodeName(ClusterStatusCode code) {
    switch (code) {
    case ClusterStatusCode::Ok:
        return "Ok";
    case ClusterStatusCode::NoValidPoints:
        return "NoValidPoints";
    case ClusterStatusCode::InvalidParameter:
        return "InvalidParameter";
    }
    return "Unknown";
}
