#ifndef CONFIG_H
#define CONFIG_H

#include <string>
#include <nlohmann/json.hpp>

struct HotspotConfig {
    std::string csvPath;
    double eps = 0.1;
    int minSamples = 5;
    bool showOutliers = true;
    std::string scope = "state";
    size_t topN = 10;
    std::string reportPath;
};

// Hotspot count shown for a geographic scope: narrower scope, fewer
// hotspots. Returns 0 for an unknown scope.
size_t topNForScope(const std::string& scope);

bool parseConfig(const nlohmann::json& config, HotspotConfig& out);
bool loadConfig(const std::string& path, HotspotConfig& out);

#endif
