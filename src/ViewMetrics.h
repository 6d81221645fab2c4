#ifndef VIEW_METRICS_H
#define VIEW_METRICS_H

#include <vector>
#include "./parser/CSV.h"

// Headline numbers for the table currently handed to the core.
struct ViewMetrics {
    size_t totalCrashes;
    long long totalFatalities;
    bool hasYearRange;
    int minYear;
    int maxYear;
};

ViewMetrics computeViewMetrics(const std::vector<CrashRecord>& records);

#endif
