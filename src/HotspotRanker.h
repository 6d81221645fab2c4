#ifndef HOTSPOT_RANKER_H
#define HOTSPOT_RANKER_H

#include <string>
#include <vector>
#include "ClusterAggregator.h"

enum class RankingKey {
    ByFatalities,
    ByCrashCount
};

struct RankedHotspot {
    int displayRank;
    std::string displayName;
    ClusterSummary summary;
};

// Picks the top N summaries, descending by the ranking key, ties broken by
// ascending cluster id. Display ranks start at 1 and are rebuilt on every
// call; they are unrelated to cluster ids.
class HotspotRanker {
public:
    HotspotRanker(RankingKey key, size_t topN);

    std::vector<RankedHotspot> rank(const std::vector<ClusterSummary>& summaries) const;

private:
    const RankingKey KEY;
    const size_t TOP_N;

    long long keyOf(const ClusterSummary& summary) const;
};

std::string rankingKeyName(RankingKey key);

#endif
