#ifndef REPORT_WRITER_H
#define REPORT_WRITER_H

#include <ostream>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>
#include "HotspotPipeline.h"
#include "ViewMetrics.h"
#include "./parser/CSV.h"

nlohmann::json summaryToJson(const ClusterSummary& summary);
nlohmann::json rankingToJson(const std::vector<RankedHotspot>& ranking);

// Everything the map and table views need: parameters, status, view
// metrics, the clustered table and both rankings. Noise rows are part of the
// table only when the request includes noise.
nlohmann::json buildReport(const CSV& table, const HotspotRequest& request,
                           const HotspotReport& report, const ViewMetrics& metrics);
bool writeReport(const std::string& path, const nlohmann::json& report);

void printViewMetrics(std::ostream& out, const ViewMetrics& metrics);
void printTopHotspots(std::ostream& out, const std::string& title, const std::vector<RankedHotspot>& ranking);

#endif
