#include "fleetrisk/report.hpp"

#include <cstdint>
#include <sstream>
#include <utility>

#include "fleetrisk/common.hpp"

namespace fleetrisk {

namespace {

std::string quoted(const std::string& value) {
    return "\"" + json_escape(value) + "\"";
}

template <typename T, typename Fn>
std::string json_array(const T& items, Fn&& write) {
    std::ostringstream out;
    out << "[";
    bool first = true;
    for (const auto& item : items) {
        if (!first) {
            out << ",";
        }
        first = false;
        out << write(item);
    }
    out << "]";
    return out.str();
}

std::string number(double value) {
    std::ostringstream out;
    out.precision(10);
    out << value;
    return out.str();
}

}  // namespace

RiskResponse success_response(VehicleRiskResult result, const std::string& engine, ResponseTiming timing) {
    RiskResponse response;
    response.success = true;
    response.engine = engine;
    response.result = std::move(result);
    response.timing = timing;
    return response;
}

RiskResponse failure_response(const std::string& error, const std::string& engine) {
    RiskResponse response;
    response.success = false;
    response.engine = engine;
    response.error = error;
    return response;
}

std::string to_json(const VehicleRiskResult& result) {
    std::ostringstream out;
    out << "{\"vin\":" << quoted(result.vin) << ",\"priority_score\":" << result.priority_score
        << ",\"prior\":" << number(result.prior) << ",\"likelihood\":" << number(result.likelihood)
        << ",\"posterior\":" << number(result.posterior) << ",\"outlier_score\":" << number(result.outlier_score)
        << ",\"outlier_categories\":{";
    bool first = true;
    for (auto category : kDtcCategories) {
        if (!first) {
            out << ",";
        }
        first = false;
        const auto& outlier = result.outlier(category);
        out << quoted(to_string(category)) << ":{\"z_score\":" << number(outlier.z_score)
            << ",\"status\":" << quoted(to_string(outlier.status)) << "}";
    }
    out << "},\"factors\":{\"weather\":" << number(result.factors.weather)
        << ",\"dtc\":" << number(result.factors.dtc) << ",\"mileage\":" << number(result.factors.mileage)
        << ",\"environment\":" << number(result.factors.environment)
        << ",\"recalls\":" << number(result.factors.recalls) << "}}";
    return out.str();
}

std::string to_json(const FailureProbabilityResult& result) {
    std::ostringstream out;
    out << "{\"probability\":" << number(result.probability) << ",\"risk_tier\":{\"id\":"
        << quoted(result.risk_tier.id) << ",\"name\":" << quoted(result.risk_tier.name)
        << ",\"service_value\":" << number(result.risk_tier.service_value) << "}"
        << ",\"revenue_opportunity\":" << number(result.revenue_opportunity)
        << ",\"base_rate\":" << number(result.base_rate)
        << ",\"combined_multiplier\":" << number(result.combined_multiplier) << ",\"stressors\":"
        << json_array(result.stressors,
                      [](const StressorContribution& s) {
                          std::ostringstream item;
                          item << "{\"id\":" << quoted(s.id) << ",\"name\":" << quoted(s.name)
                               << ",\"likelihood_ratio\":" << number(s.likelihood_ratio)
                               << ",\"intensity\":" << number(s.intensity)
                               << ",\"contribution\":" << number(s.contribution)
                               << ",\"is_active\":" << (s.is_active ? "true" : "false") << "}";
                          return item.str();
                      })
        << ",\"primary_risk\":" << quoted(result.primary_risk) << ",\"recommended_parts\":"
        << json_array(result.recommended_parts, [](const std::string& part) { return quoted(part); }) << "}";
    return out.str();
}

std::string to_json(const CohortComparison& comparison) {
    std::ostringstream out;
    out << "{\"vehicle_score\":" << comparison.vehicle_score
        << ",\"cohort_percentile\":" << comparison.cohort_percentile
        << ",\"vehicles_in_cohort\":" << comparison.vehicles_in_cohort
        << ",\"better_than\":" << comparison.better_than << ",\"worse_than\":" << comparison.worse_than
        << ",\"cohort_distribution\":"
        << json_array(comparison.cohort_distribution, [](std::uint32_t n) { return std::to_string(n); }) << "}";
    return out.str();
}

std::string to_json(const std::vector<SparklineData>& sparklines) {
    return json_array(sparklines, [](const SparklineData& line) {
        std::ostringstream item;
        item << "{\"category\":" << quoted(to_string(line.category))
             << ",\"values\":" << json_array(line.values, [](double v) { return number(v); })
             << ",\"trend\":" << quoted(to_string(line.trend))
             << ",\"current_z_score\":" << number(line.current_z_score) << "}";
        return item.str();
    });
}

std::string to_json(const FleetSummary& summary) {
    std::ostringstream out;
    out << "{\"total\":" << summary.total << ",\"critical\":" << summary.critical << ",\"high\":" << summary.high
        << ",\"medium\":" << summary.medium << ",\"low\":" << summary.low
        << ",\"average_score\":" << summary.average_score
        << ",\"with_critical_outlier\":" << summary.with_critical_outlier << "}";
    return out.str();
}

std::string to_json(const FleetProjection& projection) {
    std::ostringstream out;
    out << "{\"total_vehicles\":" << projection.total_vehicles
        << ",\"predicted_failures\":" << projection.predicted_failures
        << ",\"converted_services\":" << projection.converted_services << ",\"revenue_by_tier\":"
        << json_array(projection.revenue_by_tier,
                      [](const TierRevenue& tier) {
                          std::ostringstream item;
                          item << "{\"tier\":" << quoted(tier.tier) << ",\"vehicles\":" << tier.vehicles
                               << ",\"revenue\":" << tier.revenue << "}";
                          return item.str();
                      })
        << ",\"total_revenue\":" << projection.total_revenue
        << ",\"conversion_rate\":" << number(projection.conversion_rate) << "}";
    return out.str();
}

std::string to_json(const RiskResponse& response) {
    std::ostringstream out;
    out << "{\"success\":" << (response.success ? "true" : "false") << ",\"engine\":" << quoted(response.engine);
    if (response.success && response.result) {
        out << ",\"result\":" << to_json(*response.result);
        if (response.comparison) {
            out << ",\"comparison\":" << to_json(*response.comparison);
        }
        if (!response.sparklines.empty()) {
            out << ",\"sparklines\":" << to_json(response.sparklines);
        }
        out << ",\"timing\":{\"total\":" << number(response.timing.total)
            << ",\"calculation\":" << number(response.timing.calculation) << "}";
    } else {
        out << ",\"error\":" << quoted(response.error);
    }
    out << "}";
    return out.str();
}

}  // namespace fleetrisk
