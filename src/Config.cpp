#include "Config.h"
#include <fstream>
#include <iostream>
#include <limits>

using json = nlohmann::json;

size_t topNForScope(const std::string& scope) {
    if (scope == "state") return 10;
    if (scope == "county") return 5;
    if (scope == "city") return 3;
    return 0;
}

bool parseConfig(const json& config, HotspotConfig& out) {
    if (!config.is_object()) {
        std::cerr << "Config must be a JSON object" << std::endl;
        return false;
    }

    HotspotConfig parsed;
    try {
        if (!config.contains("csv_path")) {
            std::cerr << "Config is missing required key: csv_path" << std::endl;
            return false;
        }
        parsed.csvPath = config["csv_path"].get<std::string>();

        parsed.eps = config.value("eps", parsed.eps);
        if (config.contains("min_samples")) {
            const json& minSamples = config["min_samples"];
            if (!minSamples.is_number_integer()) {
                std::cerr << "min_samples must be an integer" << std::endl;
                return false;
            }
            if (minSamples.is_number_unsigned()
                    ? minSamples.get<unsigned long long>() > static_cast<unsigned long long>(std::numeric_limits<int>::max())
                    : minSamples.get<long long>() < std::numeric_limits<int>::min()) {
                std::cerr << "min_samples is out of range: " << minSamples.dump() << std::endl;
                return false;
            }
            parsed.minSamples = config["min_samples"].get<int>();
        }
        parsed.showOutliers = config.value("show_outliers", parsed.showOutliers);
        parsed.reportPath = config.value("report_path", parsed.reportPath);

        parsed.scope = config.value("scope", parsed.scope);
        parsed.topN = topNForScope(parsed.scope);
        if (parsed.topN == 0) {
            std::cerr << "Unknown scope: " << parsed.scope << " (expected state, county or city)" << std::endl;
            return false;
        }

        if (config.contains("top_n")) {
            const json& topN = config["top_n"];
            if (!topN.is_number_integer() || topN.get<long long>() < 1) {
                std::cerr << "top_n must be a positive integer" << std::endl;
                return false;
            }
            parsed.topN = topN.get<size_t>();
        }
    } catch (const json::exception& e) {
        std::cerr << "Invalid config value: " << e.what() << std::endl;
        return false;
    }

    out = parsed;
    return true;
}

bool loadConfig(const std::string& path, HotspotConfig& out) {
    std::ifstream configFile(path);
    if (!configFile.is_open()) {
        std::cerr << "Failed to open config file: " << path << std::endl;
        return false;
    }

    json config;
    try {
        configFile >> config;
    } catch (const json::parse_error& e) {
        std::cerr << "Failed to parse config file " << path << ": " << e.what() << std::endl;
        return false;
    }

    if (!parseConfig(config, out)) {
        std::cerr << "Rejected config file: " << path << std::endl;
        return false;
    }
    return true;
}
