#ifndef FLEETRISK_STRESSORS_HPP
#define FLEETRISK_STRESSORS_HPP

#include <array>
#include <cstddef>
#include <optional>
#include <string>
#include <vector>

namespace fleetrisk {

// Annual baseline 12V battery failure rate shared by both risk models.
constexpr double kBaseFailureRate = 0.023;

struct StressorConfig {
    std::string id;
    std::string name;
    double likelihood_ratio = 1.0;
    std::string source;
    std::string study;
    int year = 0;
    std::string description;
};

enum class StressorId {
    kWeather,
    kTripPattern,
    kColdStart,
    kAltitude,
    kCorrosion,
};

constexpr std::size_t kStressorCount = 5;

const std::array<StressorConfig, kStressorCount>& stressor_catalog();
const StressorConfig& stressor_config(StressorId id);

struct StressorIntensity {
    std::string stressor_id;
    double intensity = 0.0;
    double raw_value = 0.0;
    double threshold = 0.0;
    bool is_active = false;
};

StressorIntensity weather_intensity(double days_over_95f);
StressorIntensity trip_pattern_intensity(double short_trip_ratio, double daily_starts);
StressorIntensity cold_start_intensity(double days_below_minus_10f);
StressorIntensity altitude_intensity(double daily_elevation_change_m);
StressorIntensity corrosion_intensity(double salt_days_per_year, bool coastal_exposure);

struct RiskTier {
    std::string id;
    std::string name;
    double min_probability = 0.0;
    double max_probability = 0.0;
    double service_value = 0.0;
};

constexpr std::size_t kRiskTierCount = 4;

// Ordered CRITICAL, HIGH, MODERATE, LOW.
const std::array<RiskTier, kRiskTierCount>& risk_tiers();
const RiskTier& risk_tier_for(double probability);

struct StressorInput {
    double days_over_95f = 0.0;
    double days_below_minus_10f = 0.0;
    double short_trip_ratio = 0.0;
    double daily_starts = 0.0;
    double daily_elevation_change_m = 0.0;
    double salt_days_per_year = 0.0;
    bool coastal_exposure = false;
};

std::optional<StressorInput> stressor_preset(const std::string& name);
std::vector<std::string> stressor_preset_names();

}  // namespace fleetrisk

#endif  // FLEETRISK_STRESSORS_HPP
