#ifndef FLEETRISK_STRESSOR_MODEL_HPP
#define FLEETRISK_STRESSOR_MODEL_HPP

#include <array>
#include <string>
#include <vector>

#include "fleetrisk/stressors.hpp"

namespace fleetrisk {

struct StressorContribution {
    std::string id;
    std::string name;
    double likelihood_ratio = 1.0;
    double intensity = 0.0;
    double contribution = 1.0;   // 1 + (LR - 1) * intensity
    bool is_active = false;
};

// Output of the independence-assuming stressor model. Kept separate from
// VehicleRiskResult: the two models intentionally disagree.
struct FailureProbabilityResult {
    double probability = 0.0;
    RiskTier risk_tier{};
    double revenue_opportunity = 0.0;
    double base_rate = kBaseFailureRate;
    double combined_multiplier = 1.0;
    std::vector<StressorContribution> stressors;
    std::string primary_risk;
    std::vector<std::string> recommended_parts;
};

constexpr double kMaxStressorProbability = 0.95;

using StressorIntensities = std::array<StressorIntensity, kStressorCount>;

// Indexed by StressorId.
StressorIntensities stressor_intensities(const StressorInput& input);
double stressor_contribution(double likelihood_ratio, double intensity);
double stressor_probability(double combined_multiplier);

// Builds the result record from precomputed per-stressor contributions.
FailureProbabilityResult assemble_assessment(const StressorIntensities& intensities,
                                             const std::array<double, kStressorCount>& contributions,
                                             double combined_multiplier);

FailureProbabilityResult assess_stressors(const StressorInput& input);

}  // namespace fleetrisk

#endif  // FLEETRISK_STRESSOR_MODEL_HPP
