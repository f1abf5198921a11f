#ifndef FLEETRISK_REPORT_HPP
#define FLEETRISK_REPORT_HPP

#include <optional>
#include <string>
#include <vector>

#include "fleetrisk/fleet.hpp"
#include "fleetrisk/inference.hpp"
#include "fleetrisk/stressor_model.hpp"
#include "fleetrisk/synthesis.hpp"

namespace fleetrisk {

// Milliseconds; `total` includes request parsing, `calculation` only scoring.
struct ResponseTiming {
    double total = 0.0;
    double calculation = 0.0;
};

// Envelope returned for one scoring request. Exactly one of result/error is set.
struct RiskResponse {
    bool success = false;
    std::string engine;
    std::optional<VehicleRiskResult> result;
    std::optional<CohortComparison> comparison;
    std::vector<SparklineData> sparklines;
    std::string error;
    ResponseTiming timing{};
};

RiskResponse success_response(VehicleRiskResult result, const std::string& engine, ResponseTiming timing);
RiskResponse failure_response(const std::string& error, const std::string& engine);

std::string to_json(const VehicleRiskResult& result);
std::string to_json(const FailureProbabilityResult& result);
std::string to_json(const CohortComparison& comparison);
std::string to_json(const std::vector<SparklineData>& sparklines);
std::string to_json(const FleetSummary& summary);
std::string to_json(const FleetProjection& projection);
std::string to_json(const RiskResponse& response);

}  // namespace fleetrisk

#endif  // FLEETRISK_REPORT_HPP
