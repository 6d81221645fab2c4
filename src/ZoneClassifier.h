#ifndef ZONE_CLASSIFIER_H
#define ZONE_CLASSIFIER_H

#include <string>

enum class DangerTier {
    Danger,
    Mild,
    LowDanger
};

struct ZoneClassification {
    DangerTier tier;
    std::string label;
    std::string color;
};

const long long DANGER_THRESHOLD = 100;
const long long MILD_THRESHOLD = 50;

// Color used for noise points when they are passed through for display.
const char *const OUTLIER_COLOR = "black";

ZoneClassification classifyZone(long long fatalitySum);
std::string tierLabel(DangerTier tier);
std::string tierColor(DangerTier tier);

#endif
