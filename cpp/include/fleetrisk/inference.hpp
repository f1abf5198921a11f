#ifndef FLEETRISK_INFERENCE_HPP
#define FLEETRISK_INFERENCE_HPP

#include <array>
#include <string>

#include "fleetrisk/cohort.hpp"
#include "fleetrisk/outlier.hpp"
#include "fleetrisk/weather.hpp"

namespace fleetrisk {

// Each value is a 0-100 exposure score.
struct EnvironmentExposure {
    double rust_exposure = 0.0;
    double stop_go_factor = 0.0;
    double terrain_factor = 0.0;
    double thermal_factor = 0.0;
};

struct VehicleRiskInput {
    std::string vin;
    double mileage = 0.0;
    double age_years = 0.0;
    double health_score = 100.0;
    DtcCounts dtcs{};
    EnvironmentExposure environment{};
    double active_recalls = 0.0;
};

// Per-factor likelihood ratios, before log-space weighting.
struct FactorBreakdown {
    double weather = 1.0;
    double dtc = 1.0;
    double mileage = 1.0;
    double environment = 1.0;
    double recalls = 1.0;
};

struct VehicleRiskResult {
    std::string vin;
    int priority_score = 0;
    double prior = 0.0;
    double likelihood = 1.0;
    double posterior = 0.0;
    double outlier_score = 0.0;
    std::array<CategoryOutlier, kDtcCategoryCount> outlier_categories{};
    FactorBreakdown factors{};

    const CategoryOutlier& outlier(DtcCategory category) const;
};

// Log-space dampening weights. The five factors all correlate with vehicle
// age, so a plain product would overstate the evidence.
struct EvidenceWeights {
    static constexpr double kWeather = 0.6;
    static constexpr double kDtc = 0.8;
    static constexpr double kMileage = 0.7;
    static constexpr double kEnvironment = 0.6;
    static constexpr double kRecalls = 0.5;
};

double prior_probability(double age_years, double health_score);

double raw_weather_likelihood(const WeatherConditions& weather);
// raw_weather_likelihood clamped to [0.5, 2.0].
double weather_likelihood(const WeatherConditions& weather);

// LR(z) = exp(z * ln(3) / 3) on z clamped to [-3, 3]: 3x at +3, 1/3x at -3.
double dtc_likelihood(double count, double mean, double std_dev);
// Geometric mean of the four category ratios.
double combine_dtc_likelihoods(double powertrain, double body, double chassis, double network);
double dtc_likelihood(const DtcCounts& dtcs, const CohortStats& cohort);

double mileage_likelihood(double mileage, double age_years);
double environment_likelihood(const EnvironmentExposure& environment);
double recall_likelihood(double active_recalls);

double combine_likelihoods(const FactorBreakdown& factors);
double posterior_from_likelihood_ratio(double prior, double likelihood_ratio);
int priority_score(double posterior);

// Reference implementation of the full pipeline. Total for finite input.
VehicleRiskResult score_vehicle(const VehicleRiskInput& input, const WeatherConditions& weather);

}  // namespace fleetrisk

#endif  // FLEETRISK_INFERENCE_HPP
