#include "HotspotRanker.h"
#include <algorithm>

HotspotRanker::HotspotRanker(RankingKey key, size_t topN) : KEY(key), TOP_N(topN) {}

long long HotspotRanker::keyOf(const ClusterSummary& summary) const {
    return KEY == RankingKey::ByFatalities ? summary.fatalitySum : summary.crashCount;
}

std::vector<RankedHotspot> HotspotRanker::rank(const std::vector<ClusterSummary>& summaries) const {
    std::vector<const ClusterSummary*> order;
    order.reserve(summaries.size());
    for (const auto& summary : summaries) {
        order.push_back(&summary);
    }

    size_t selected = std::min(TOP_N, order.size());
    std::partial_sort(order.begin(), order.begin() + selected, order.end(),
        [this](const ClusterSummary* a, const ClusterSummary* b) {
            long long keyA = keyOf(*a);
            long long keyB = keyOf(*b);
            if (keyA != keyB) return keyA > keyB;
            return a->clusterId < b->clusterId;
        });

    std::vector<RankedHotspot> ranked;
    ranked.reserve(selected);
    for (size_t i = 0; i < selected; ++i) {
        int displayRank = static_cast<int>(i) + 1;
        ranked.push_back({displayRank, "Cluster " + std::to_string(displayRank), *order[i]});
    }
    return ranked;
}

std::string rankingKeyName(RankingKey key) {
    return key == RankingKey::ByFatalities ? "fatalities" : "crashes";
}
