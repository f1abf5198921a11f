#include "fleetrisk/stressors.hpp"

#include <algorithm>
#include <map>

namespace fleetrisk {

namespace {

const std::array<StressorConfig, kStressorCount> kCatalog = {{
    {"weather", "Weather Stressor", 3.5, "Argonne National Laboratory",
     "Temperature Effects on Lead-Acid Battery Performance and Life", 2018,
     "Vehicles in climates exceeding 95F for >30% of year show 3.5x higher battery failure"},
    {"trip_pattern", "Trip Pattern Stressor", 2.83, "HL Mando Corporation",
     "Short Trip Impact on 12V Battery State of Charge", 2021,
     "Vehicles with >60% trips under 10 minutes show 2.83x higher failure rate"},
    {"cold_start", "Cold Start Stressor", 6.5, "Varta Automotive", "Cold Climate Battery Performance Study", 2020,
     "Starts below -10F show 6.5x failure rate"},
    {"altitude", "Altitude Stressor", 1.6, "Exide", "High Altitude Battery Performance Study", 2019,
     "1,000m elevation change daily: 1.6x failure rate"},
    {"corrosion", "Corrosion Stressor", 2.1, "Battery Council International",
     "Road Salt Impact on Automotive Batteries", 2019, "Heavy road salt exposure shows 2.1x higher failure rate"},
}};

const std::array<RiskTier, kRiskTierCount> kTiers = {{
    {"critical", "CRITICAL", 0.15, 1.0, 1200.0},
    {"high", "HIGH", 0.08, 0.15, 850.0},
    {"moderate", "MODERATE", 0.04, 0.08, 450.0},
    {"low", "LOW", 0.0, 0.04, 150.0},
}};

const std::map<std::string, StressorInput>& presets() {
    static const std::map<std::string, StressorInput> instance = {
        {"phoenix", {145.0, 0.0, 0.65, 6.2, 100.0, 0.0, false}},
        {"seattle", {3.0, 5.0, 0.25, 2.8, 150.0, 10.0, true}},
        {"chicago", {15.0, 25.0, 0.55, 5.5, 50.0, 120.0, false}},
        {"denver", {20.0, 15.0, 0.35, 3.5, 800.0, 60.0, false}},
    };
    return instance;
}

double scaled(double raw, double threshold) {
    return std::clamp(raw / threshold, 0.0, 1.0);
}

}  // namespace

const std::array<StressorConfig, kStressorCount>& stressor_catalog() {
    return kCatalog;
}

const StressorConfig& stressor_config(StressorId id) {
    return kCatalog[static_cast<std::size_t>(id)];
}

StressorIntensity weather_intensity(double days_over_95f) {
    // 110 days is roughly 30% of the year.
    const double threshold = 110.0;
    return {"weather", scaled(days_over_95f, threshold), days_over_95f, threshold, days_over_95f > 30.0};
}

StressorIntensity trip_pattern_intensity(double short_trip_ratio, double daily_starts) {
    const double trip_threshold = 0.6;
    const double starts_threshold = 6.0;
    const double intensity =
        std::max(scaled(short_trip_ratio, trip_threshold), scaled(daily_starts, starts_threshold));
    return {"trip_pattern", intensity, short_trip_ratio, trip_threshold,
            short_trip_ratio > 0.4 || daily_starts > 4.0};
}

StressorIntensity cold_start_intensity(double days_below_minus_10f) {
    const double threshold = 30.0;
    return {"cold_start", scaled(days_below_minus_10f, threshold), days_below_minus_10f, threshold,
            days_below_minus_10f > 5.0};
}

StressorIntensity altitude_intensity(double daily_elevation_change_m) {
    const double threshold = 1000.0;
    return {"altitude", scaled(daily_elevation_change_m, threshold), daily_elevation_change_m, threshold,
            daily_elevation_change_m > 300.0};
}

StressorIntensity corrosion_intensity(double salt_days_per_year, bool coastal_exposure) {
    const double threshold = 120.0;
    const double coastal_bonus = coastal_exposure ? 0.3 : 0.0;
    const double intensity = std::min(scaled(salt_days_per_year, threshold) + coastal_bonus, 1.0);
    return {"corrosion", intensity, salt_days_per_year, threshold, salt_days_per_year > 30.0 || coastal_exposure};
}

const std::array<RiskTier, kRiskTierCount>& risk_tiers() {
    return kTiers;
}

const RiskTier& risk_tier_for(double probability) {
    for (const auto& tier : kTiers) {
        if (probability >= tier.min_probability && probability < tier.max_probability) {
            return tier;
        }
    }
    return kTiers.back();
}

std::optional<StressorInput> stressor_preset(const std::string& name) {
    const auto& table = presets();
    auto it = table.find(name);
    if (it == table.end()) {
        return std::nullopt;
    }
    return it->second;
}

std::vector<std::string> stressor_preset_names() {
    std::vector<std::string> names;
    for (const auto& [name, input] : presets()) {
        names.push_back(name);
    }
    return names;
}

}  // namespace fleetrisk
