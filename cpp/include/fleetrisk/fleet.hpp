#ifndef FLEETRISK_FLEET_HPP
#define FLEETRISK_FLEET_HPP

#include <array>
#include <cstddef>
#include <string>
#include <vector>

#include "fleetrisk/inference.hpp"
#include "fleetrisk/stressors.hpp"

namespace fleetrisk {

enum class PriorityLevel {
    kCritical,
    kHigh,
    kMedium,
    kLow,
};

std::string to_string(PriorityLevel level);
// >= 70 critical, >= 50 high, >= 30 medium.
PriorityLevel priority_level(int priority_score);

struct FleetSummary {
    std::size_t total = 0;
    std::size_t critical = 0;
    std::size_t high = 0;
    std::size_t medium = 0;
    std::size_t low = 0;
    int average_score = 0;
    std::size_t with_critical_outlier = 0;
};

FleetSummary summarize_fleet(const std::vector<VehicleRiskResult>& results);

// Shares of the fleet per risk tier; expected to sum to 1 but not enforced.
struct TierDistribution {
    double critical = 0.0;
    double high = 0.0;
    double moderate = 0.0;
    double low = 0.0;
};

struct TierRevenue {
    std::string tier;
    long vehicles = 0;
    long revenue = 0;
};

struct FleetProjection {
    long total_vehicles = 0;
    long predicted_failures = 0;
    long converted_services = 0;
    std::array<TierRevenue, kRiskTierCount> revenue_by_tier{};
    long total_revenue = 0;
    double conversion_rate = 0.0;
};

constexpr double kDefaultConversionRate = 0.20;

FleetProjection project_fleet_revenue(long vehicle_count, const TierDistribution& distribution,
                                      double conversion_rate = kDefaultConversionRate);

}  // namespace fleetrisk

#endif  // FLEETRISK_FLEET_HPP
