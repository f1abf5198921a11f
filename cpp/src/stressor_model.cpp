#include "fleetrisk/stressor_model.hpp"

#include <algorithm>
#include <set>

namespace fleetrisk {

namespace {

const char* const kNoSignificantStressors = "No significant stressors";

std::vector<std::string> recommend_parts(const StressorIntensities& intensities) {
    std::vector<std::string> parts;
    auto active = [&](StressorId id) { return intensities[static_cast<std::size_t>(id)].is_active; };
    if (active(StressorId::kWeather)) {
        parts.insert(parts.end(), {"BAGM-48H6-800", "VC-13DL-G"});
    }
    if (active(StressorId::kTripPattern)) {
        parts.insert(parts.end(), {"BAGM-48H6-800", "FL-500S"});
    }
    if (active(StressorId::kColdStart)) {
        parts.insert(parts.end(), {"BXT-96R-590", "XO-5W30-Q1SP"});
    }
    if (active(StressorId::kCorrosion)) {
        parts.insert(parts.end(), {"BRF-1478", "PM-20"});
    }

    std::vector<std::string> unique;
    std::set<std::string> seen;
    for (auto& part : parts) {
        if (seen.insert(part).second) {
            unique.push_back(std::move(part));
        }
    }
    return unique;
}

}  // namespace

StressorIntensities stressor_intensities(const StressorInput& input) {
    return {
        weather_intensity(input.days_over_95f),
        trip_pattern_intensity(input.short_trip_ratio, input.daily_starts),
        cold_start_intensity(input.days_below_minus_10f),
        altitude_intensity(input.daily_elevation_change_m),
        corrosion_intensity(input.salt_days_per_year, input.coastal_exposure),
    };
}

double stressor_contribution(double likelihood_ratio, double intensity) {
    return 1.0 + (likelihood_ratio - 1.0) * intensity;
}

double stressor_probability(double combined_multiplier) {
    return std::min(kBaseFailureRate * combined_multiplier, kMaxStressorProbability);
}

FailureProbabilityResult assemble_assessment(const StressorIntensities& intensities,
                                             const std::array<double, kStressorCount>& contributions,
                                             double combined_multiplier) {
    FailureProbabilityResult result;
    result.combined_multiplier = combined_multiplier;
    result.probability = stressor_probability(combined_multiplier);
    result.risk_tier = risk_tier_for(result.probability);
    result.revenue_opportunity = result.risk_tier.service_value;

    const StressorContribution* primary = nullptr;
    const auto& catalog = stressor_catalog();
    result.stressors.reserve(kStressorCount);
    for (std::size_t i = 0; i < kStressorCount; ++i) {
        result.stressors.push_back(StressorContribution{catalog[i].id, catalog[i].name,
                                                        catalog[i].likelihood_ratio, intensities[i].intensity,
                                                        contributions[i], intensities[i].is_active});
    }
    for (const auto& stressor : result.stressors) {
        if (stressor.is_active && (primary == nullptr || stressor.contribution > primary->contribution)) {
            primary = &stressor;
        }
    }
    result.primary_risk = primary ? primary->name : kNoSignificantStressors;
    result.recommended_parts = recommend_parts(intensities);
    return result;
}

FailureProbabilityResult assess_stressors(const StressorInput& input) {
    const auto intensities = stressor_intensities(input);
    const auto& catalog = stressor_catalog();

    std::array<double, kStressorCount> contributions{};
    double combined = 1.0;
    for (std::size_t i = 0; i < kStressorCount; ++i) {
        contributions[i] = stressor_contribution(catalog[i].likelihood_ratio, intensities[i].intensity);
        combined *= contributions[i];
    }
    return assemble_assessment(intensities, contributions, combined);
}

}  // namespace fleetrisk
