#include "ViewMetrics.h"
#include <algorithm>
#include <limits>
#include <omp.h>

ViewMetrics computeViewMetrics(const std::vector<CrashRecord>& records) {
    const int missingYear = std::numeric_limits<int>::min();
    long long totalFatalities = 0;
    int minYear = std::numeric_limits<int>::max();
    int maxYear = missingYear;

    #pragma omp parallel for reduction(+:totalFatalities) reduction(min:minYear) reduction(max:maxYear)
    for (size_t i = 0; i < records.size(); ++i) {
        totalFatalities += std::max(0, records[i].fatals);
        if (records[i].year != missingYear) {
            minYear = std::min(minYear, records[i].year);
            maxYear = std::max(maxYear, records[i].year);
        }
    }

    bool hasYearRange = maxYear != missingYear;
    return {records.size(), totalFatalities, hasYearRange,
            hasYearRange ? minYear : 0, hasYearRange ? maxYear : 0};
}
