#include "fleetrisk/fleet.hpp"

#include <algorithm>
#include <cmath>
#include <stdexcept>

namespace fleetrisk {

std::string to_string(PriorityLevel level) {
    switch (level) {
        case PriorityLevel::kCritical:
            return "critical";
        case PriorityLevel::kHigh:
            return "high";
        case PriorityLevel::kMedium:
            return "medium";
        case PriorityLevel::kLow:
            return "low";
    }
    return "low";
}

PriorityLevel priority_level(int priority_score) {
    if (priority_score >= 70) {
        return PriorityLevel::kCritical;
    }
    if (priority_score >= 50) {
        return PriorityLevel::kHigh;
    }
    if (priority_score >= 30) {
        return PriorityLevel::kMedium;
    }
    return PriorityLevel::kLow;
}

FleetSummary summarize_fleet(const std::vector<VehicleRiskResult>& results) {
    FleetSummary summary;
    summary.total = results.size();
    long score_total = 0;
    for (const auto& result : results) {
        switch (priority_level(result.priority_score)) {
            case PriorityLevel::kCritical:
                summary.critical += 1;
                break;
            case PriorityLevel::kHigh:
                summary.high += 1;
                break;
            case PriorityLevel::kMedium:
                summary.medium += 1;
                break;
            case PriorityLevel::kLow:
                summary.low += 1;
                break;
        }
        score_total += result.priority_score;
        const bool critical_outlier =
            std::any_of(result.outlier_categories.begin(), result.outlier_categories.end(),
                        [](const CategoryOutlier& o) { return o.status == OutlierStatus::kCriticalOutlier; });
        if (critical_outlier) {
            summary.with_critical_outlier += 1;
        }
    }
    if (!results.empty()) {
        summary.average_score =
            static_cast<int>(std::lround(static_cast<double>(score_total) / static_cast<double>(results.size())));
    }
    return summary;
}

FleetProjection project_fleet_revenue(long vehicle_count, const TierDistribution& distribution,
                                      double conversion_rate) {
    if (vehicle_count < 0) {
        throw std::invalid_argument("vehicle_count must be non-negative");
    }
    if (conversion_rate < 0.0 || conversion_rate > 1.0) {
        throw std::invalid_argument("conversion_rate must be within [0, 1]");
    }

    FleetProjection projection;
    projection.total_vehicles = vehicle_count;
    projection.conversion_rate = conversion_rate;
    projection.predicted_failures = std::lround(static_cast<double>(vehicle_count) * kBaseFailureRate);
    projection.converted_services = std::lround(static_cast<double>(projection.predicted_failures) * conversion_rate);

    const std::array<double, kRiskTierCount> shares = {distribution.critical, distribution.high,
                                                        distribution.moderate, distribution.low};
    const auto& tiers = risk_tiers();
    for (std::size_t i = 0; i < kRiskTierCount; ++i) {
        auto& entry = projection.revenue_by_tier[i];
        entry.tier = tiers[i].name;
        entry.vehicles = std::lround(static_cast<double>(vehicle_count) * shares[i]);
        entry.revenue =
            std::lround(static_cast<double>(entry.vehicles) * conversion_rate * tiers[i].service_value);
        projection.total_revenue += entry.revenue;
    }
    return projection;
}

}  // namespace fleetrisk
