#ifndef NEIGHBOR_INDEX_H
#define NEIGHBOR_INDEX_H

#include <cstddef>
#include <cstdint>
#include <functional>
#include <unordered_map>
#include <vector>

struct GeoPoint {
    double latitude;
    double longitude;
};

// Radius search over planar (latitude, longitude) pairs. A point is a
// neighbor of P when its Euclidean distance to P is <= eps; P is its own
// neighbor.
class NeighborIndex {
public:
    enum class SearchMode { Auto, Exhaustive };

    NeighborIndex(const std::vector<GeoPoint>& points, double eps, SearchMode mode = SearchMode::Auto);

    // Indices of all neighbors of points[pointIdx], ascending.
    std::vector<size_t> regionQuery(size_t pointIdx) const;
    size_t countNeighbors(size_t pointIdx) const;

    bool usesGrid() const { return gridEnabled; }

private:
    struct CellKey {
        int32_t row;
        int32_t col;
        bool operator==(const CellKey& other) const { return row == other.row && col == other.col; }
    };

    struct CellKeyHash {
        size_t operator()(const CellKey& key) const {
            uint64_t packed = (static_cast<uint64_t>(static_cast<uint32_t>(key.row)) << 32) |
                              static_cast<uint32_t>(key.col);
            return std::hash<uint64_t>()(packed);
        }
    };

    const std::vector<GeoPoint>& points;
    const double EPS;
    bool gridEnabled;
    double cellSize;
    double minLatitude;
    double minLongitude;
    std::unordered_map<CellKey, std::vector<size_t>, CellKeyHash> cells;

    bool withinRadius(const GeoPoint& a, const GeoPoint& b) const;
    CellKey cellOf(const GeoPoint& p) const;

    template <typename Visitor>
    void visitNeighbors(size_t pointIdx, Visitor&& visit) const;
};

#endif
