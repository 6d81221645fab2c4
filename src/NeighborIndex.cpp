#include "NeighborIndex.h"
#include <algorithm>
#include <cmath>

namespace {

// Grid coordinates must stay small enough that rounding in (x - min) / cellSize
// stays well below the cell widening applied to eps.
const double MAX_CELLS_PER_AXIS = 1048576.0;
const double CELL_WIDENING = 1e-9;

} // namespace

NeighborIndex::NeighborIndex(const std::vector<GeoPoint>& points, double eps, SearchMode mode)
    : points(points), EPS(eps), gridEnabled(false), cellSize(0.0), minLatitude(0.0), minLongitude(0.0) {
    if (mode == SearchMode::Exhaustive || points.empty() || !std::isfinite(EPS)) {
        return;
    }

    double maxLatitude = points.front().latitude;
    double maxLongitude = points.front().longitude;
    minLatitude = maxLatitude;
    minLongitude = maxLongitude;
    for (const auto& p : points) {
        minLatitude = std::min(minLatitude, p.latitude);
        maxLatitude = std::max(maxLatitude, p.latitude);
        minLongitude = std::min(minLongitude, p.longitude);
        maxLongitude = std::max(maxLongitude, p.longitude);
    }

    cellSize = EPS * (1.0 + CELL_WIDENING);
    if ((maxLatitude - minLatitude) / cellSize > MAX_CELLS_PER_AXIS ||
        (maxLongitude - minLongitude) / cellSize > MAX_CELLS_PER_AXIS) {
        return;
    }

    gridEnabled = true;
    for (size_t i = 0; i < points.size(); ++i) {
        cells[cellOf(points[i])].push_back(i);
    }
}

bool NeighborIndex::withinRadius(const GeoPoint& a, const GeoPoint& b) const {
    double dLat = a.latitude - b.latitude;
    double dLon = a.longitude - b.longitude;
    return std::sqrt(dLat * dLat + dLon * dLon) <= EPS;
}

NeighborIndex::CellKey NeighborIndex::cellOf(const GeoPoint& p) const {
    return {static_cast<int32_t>(std::floor((p.latitude - minLatitude) / cellSize)),
            static_cast<int32_t>(std::floor((p.longitude - minLongitude) / cellSize))};
}

template <typename Visitor>
void NeighborIndex::visitNeighbors(size_t pointIdx, Visitor&& visit) const {
    const GeoPoint& center = points[pointIdx];

    if (!gridEnabled) {
        for (size_t j = 0; j < points.size(); ++j) {
            if (withinRadius(center, points[j])) {
                visit(j);
            }
        }
        return;
    }

    CellKey home = cellOf(center);
    for (int32_t dRow = -1; dRow <= 1; ++dRow) {
        for (int32_t dCol = -1; dCol <= 1; ++dCol) {
            auto it = cells.find({home.row + dRow, home.col + dCol});
            if (it == cells.end()) continue;
            for (size_t j : it->second) {
                if (withinRadius(center, points[j])) {
                    visit(j);
                }
            }
        }
    }
}

std::vector<size_t> NeighborIndex::regionQuery(size_t pointIdx) const {
    std::vector<size_t> neighbors;
    visitNeighbors(pointIdx, [&neighbors](size_t j) { neighbors.push_back(j); });
    if (gridEnabled) {
        std::sort(neighbors.begin(), neighbors.end());
    }
    return neighbors;
}

size_t NeighborIndex::countNeighbors(size_t pointIdx) const {
    size_t count = 0;
    visitNeighbors(pointIdx, [&count](size_t) { ++count; });
    return count;
}
