#include "ZoneClassifier.h"

ZoneClassification classifyZone(long long fatalitySum) {
    DangerTier tier = DangerTier::LowDanger;
    if (fatalitySum >= DANGER_THRESHOLD) {
        tier = DangerTier::Danger;
    } else if (fatalitySum >= MILD_THRESHOLD) {
        tier = DangerTier::Mild;
    }
    return {tier, tierLabel(tier), tierColor(tier)};
}

std::string tierLabel(DangerTier tier) {
    switch (tier) {
    case DangerTier::Danger:
        return "Danger";
    case DangerTier::Mild:
        return "Mild";
    case DangerTier::LowDanger:
        return "Low Danger";
    }
    return "Low Danger";
}

std::string tierColor(DangerTier tier) {
    switch (tier) {
    case DangerTier::Danger:
        return "red";
    case DangerTier::Mild:
        return "yellow";
    case DangerTier::LowDanger:
        return "green";
    }
    return "green";
}
