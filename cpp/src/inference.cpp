#include "fleetrisk/inference.hpp"

#include <algorithm>
#include <cmath>

namespace fleetrisk {

namespace {

constexpr double kPriorBaseRate = 0.023;
constexpr double kMaxPrior = 0.9;
constexpr double kMaxDtcLikelihood = 3.0;
constexpr double kMaxDtcZ = 3.0;
constexpr double kExpectedMilesPerYear = 12000.0;
constexpr double kMinLikelihoodRatio = 1e-6;

}  // namespace

const CategoryOutlier& VehicleRiskResult::outlier(DtcCategory category) const {
    return outlier_categories[static_cast<std::size_t>(category)];
}

double prior_probability(double age_years, double health_score) {
    const double age_factor = std::min(1.0 + (age_years / 10.0), 2.0);
    const double health_factor = 1.0 + ((100.0 - health_score) / 100.0);
    return std::clamp(kPriorBaseRate * age_factor * health_factor, 0.0, kMaxPrior);
}

double raw_weather_likelihood(const WeatherConditions& weather) {
    double likelihood = 1.0;

    if (weather.temperature < 20.0 || weather.temperature > 100.0) {
        likelihood *= 1.5;
    } else if (weather.temperature < 32.0 || weather.temperature > 90.0) {
        likelihood *= 1.2;
    }

    if (weather.precipitation > 0.5) {
        likelihood *= 1.3;
    } else if (weather.precipitation > 0.1) {
        likelihood *= 1.1;
    }

    // Corrosion.
    if (weather.humidity > 80.0) {
        likelihood *= 1.2;
    }

    // Thermal cycling.
    if (weather.temp_variance > 30.0) {
        likelihood *= 1.4;
    } else if (weather.temp_variance > 20.0) {
        likelihood *= 1.2;
    }

    return likelihood;
}

double weather_likelihood(const WeatherConditions& weather) {
    return std::clamp(raw_weather_likelihood(weather), 0.5, 2.0);
}

double dtc_likelihood(double count, double mean, double std_dev) {
    const double z = std::clamp(z_score(count, mean, std_dev), -kMaxDtcZ, kMaxDtcZ);
    const double k = std::log(kMaxDtcLikelihood) / kMaxDtcZ;
    return std::exp(k * z);
}

double combine_dtc_likelihoods(double powertrain, double body, double chassis, double network) {
    return std::exp((std::log(powertrain) + std::log(body) + std::log(chassis) + std::log(network)) / 4.0);
}

double dtc_likelihood(const DtcCounts& dtcs, const CohortStats& cohort) {
    return combine_dtc_likelihoods(
        dtc_likelihood(dtcs.powertrain, cohort.powertrain.mean, cohort.powertrain.std_dev),
        dtc_likelihood(dtcs.body, cohort.body.mean, cohort.body.std_dev),
        dtc_likelihood(dtcs.chassis, cohort.chassis.mean, cohort.chassis.std_dev),
        dtc_likelihood(dtcs.network, cohort.network.mean, cohort.network.std_dev));
}

double mileage_likelihood(double mileage, double age_years) {
    const double expected = std::max(kExpectedMilesPerYear * age_years, 1.0);
    const double ratio = mileage / expected;
    if (ratio > 1.5) {
        return 1.5;
    }
    if (ratio > 1.2) {
        return 1.25;
    }
    return 1.0;
}

double environment_likelihood(const EnvironmentExposure& environment) {
    const double score = (environment.rust_exposure * 0.3) + (environment.stop_go_factor * 0.25) +
                         (environment.terrain_factor * 0.25) + (environment.thermal_factor * 0.2);
    return 1.0 + (score / 100.0);
}

double recall_likelihood(double active_recalls) {
    return 1.0 + (std::clamp(active_recalls, 0.0, 5.0) * 0.10);
}

double combine_likelihoods(const FactorBreakdown& factors) {
    return std::exp((EvidenceWeights::kWeather * std::log(factors.weather)) +
                    (EvidenceWeights::kDtc * std::log(factors.dtc)) +
                    (EvidenceWeights::kMileage * std::log(factors.mileage)) +
                    (EvidenceWeights::kEnvironment * std::log(factors.environment)) +
                    (EvidenceWeights::kRecalls * std::log(factors.recalls)));
}

double posterior_from_likelihood_ratio(double prior, double likelihood_ratio) {
    const double lr = std::max(likelihood_ratio, kMinLikelihoodRatio);
    const double numerator = prior * lr;
    const double denominator = (1.0 - prior) + numerator;
    return std::clamp(numerator / denominator, 0.0, 1.0);
}

int priority_score(double posterior) {
    return static_cast<int>(std::lround(posterior * 100.0));
}

VehicleRiskResult score_vehicle(const VehicleRiskInput& input, const WeatherConditions& weather) {
    const auto& cohort = cohort_for_mileage(input.mileage);

    VehicleRiskResult result;
    result.vin = input.vin;
    result.prior = prior_probability(input.age_years, input.health_score);

    result.factors.weather = weather_likelihood(weather);
    result.factors.dtc = dtc_likelihood(input.dtcs, cohort);
    result.factors.mileage = mileage_likelihood(input.mileage, input.age_years);
    result.factors.environment = environment_likelihood(input.environment);
    result.factors.recalls = recall_likelihood(input.active_recalls);

    result.likelihood = combine_likelihoods(result.factors);
    result.posterior = posterior_from_likelihood_ratio(result.prior, result.likelihood);
    result.priority_score = priority_score(result.posterior);

    double z_total = 0.0;
    for (auto category : kDtcCategories) {
        const auto& stats = cohort.category(category);
        const double z = z_score(input.dtcs[category], stats.mean, stats.std_dev);
        result.outlier_categories[static_cast<std::size_t>(category)] = CategoryOutlier{z, classify_outlier(z)};
        z_total += z;
    }
    result.outlier_score = z_total / 4.0;

    return result;
}

}  // namespace fleetrisk
