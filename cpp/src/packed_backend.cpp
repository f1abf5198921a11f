#include "fleetrisk/packed_backend.hpp"

#include <algorithm>
#include <atomic>
#include <cmath>
#include <cstdlib>
#include <functional>
#include <numeric>
#include <stdexcept>
#include <system_error>
#include <thread>

namespace fleetrisk {

namespace {

enum Slot : std::size_t {
    kMileage = 0,
    kAge = 1,
    kHealth = 2,
    kDtcPowertrain = 3,
    kDtcBody = 4,
    kDtcChassis = 5,
    kDtcNetwork = 6,
    kRust = 7,
    kStopGo = 8,
    kTerrain = 9,
    kThermal = 10,
    kRecalls = 11,
    kFactorWeather = 12,
    kFactorDtc = 13,
    kFactorMileage = 14,
    kFactorEnvironment = 15,
    kFactorRecalls = 16,
    kPrior = 17,
    kLikelihood = 18,
    kPosterior = 19,
    kZPowertrain = 20,
};

std::size_t resolve_workers(int configured) {
    if (configured > 0) {
        return static_cast<std::size_t>(configured);
    }
    const unsigned hardware = std::thread::hardware_concurrency();
    return hardware == 0 ? 1 : hardware;
}

}  // namespace

PackedCohortTable pack_cohort_table() {
    PackedCohortTable table{};
    const auto& cohorts = cohort_table();
    for (std::size_t band = 0; band < kMileageBandCount; ++band) {
        double* row = table.data() + band * kCohortStride;
        for (auto category : kDtcCategories) {
            const auto& stats = cohorts[band].category(category);
            if (!std::isfinite(stats.mean) || !std::isfinite(stats.std_dev) || stats.std_dev <= 0.0) {
                throw std::runtime_error("cohort band " + cohorts[band].mileage_band + " has invalid " +
                                         to_string(category) + " statistics");
            }
            const std::size_t column = static_cast<std::size_t>(category) * 2;
            row[column] = stats.mean;
            row[column + 1] = stats.std_dev;
        }
    }
    return table;
}

void pack_vehicle(const VehicleRiskInput& input, double* record) {
    std::fill(record, record + kVehicleStride, 0.0);
    record[kMileage] = input.mileage;
    record[kAge] = input.age_years;
    record[kHealth] = input.health_score;
    record[kDtcPowertrain] = input.dtcs.powertrain;
    record[kDtcBody] = input.dtcs.body;
    record[kDtcChassis] = input.dtcs.chassis;
    record[kDtcNetwork] = input.dtcs.network;
    record[kRust] = input.environment.rust_exposure;
    record[kStopGo] = input.environment.stop_go_factor;
    record[kTerrain] = input.environment.terrain_factor;
    record[kThermal] = input.environment.thermal_factor;
    record[kRecalls] = input.active_recalls;
}

void score_packed(const PackedCohortTable& cohorts, double weather_ratio, double* records, std::size_t count) {
    for (std::size_t i = 0; i < count; ++i) {
        double* r = records + i * kVehicleStride;
        const double* c = cohorts.data() + mileage_band_index(r[kMileage]) * kCohortStride;

        r[kFactorWeather] = weather_ratio;
        r[kFactorDtc] = combine_dtc_likelihoods(
            dtc_likelihood(r[kDtcPowertrain], c[0], c[1]), dtc_likelihood(r[kDtcBody], c[2], c[3]),
            dtc_likelihood(r[kDtcChassis], c[4], c[5]), dtc_likelihood(r[kDtcNetwork], c[6], c[7]));
        r[kFactorMileage] = mileage_likelihood(r[kMileage], r[kAge]);
        r[kFactorEnvironment] =
            environment_likelihood(EnvironmentExposure{r[kRust], r[kStopGo], r[kTerrain], r[kThermal]});
        r[kFactorRecalls] = recall_likelihood(r[kRecalls]);

        r[kPrior] = prior_probability(r[kAge], r[kHealth]);
        r[kLikelihood] = combine_likelihoods(FactorBreakdown{r[kFactorWeather], r[kFactorDtc], r[kFactorMileage],
                                                             r[kFactorEnvironment], r[kFactorRecalls]});
        r[kPosterior] = posterior_from_likelihood_ratio(r[kPrior], r[kLikelihood]);

        for (std::size_t k = 0; k < kDtcCategoryCount; ++k) {
            r[kZPowertrain + k] = z_score(r[kDtcPowertrain + k], c[2 * k], c[2 * k + 1]);
        }
    }
}

VehicleRiskResult unpack_vehicle(const double* record, const std::string& vin) {
    VehicleRiskResult result;
    result.vin = vin;
    result.prior = record[kPrior];
    result.likelihood = record[kLikelihood];
    result.posterior = record[kPosterior];
    result.priority_score = priority_score(result.posterior);
    result.factors = FactorBreakdown{record[kFactorWeather], record[kFactorDtc], record[kFactorMileage],
                                     record[kFactorEnvironment], record[kFactorRecalls]};

    double z_total = 0.0;
    for (std::size_t k = 0; k < kDtcCategoryCount; ++k) {
        const double z = record[kZPowertrain + k];
        result.outlier_categories[k] = CategoryOutlier{z, classify_outlier(z)};
        z_total += z;
    }
    result.outlier_score = z_total / 4.0;
    return result;
}

PackedBackend::PackedBackend(const BackendConfig& config, Logger logger)
    : cohorts_(pack_cohort_table()),
      worker_threads_(resolve_workers(config.worker_threads)),
      chunk_size_(static_cast<std::size_t>(std::max(config.batch_chunk_size, 1))),
      inline_limit_(static_cast<std::size_t>(std::max(config.inline_batch_limit, 0))),
      logger_(std::move(logger)) {}

std::string PackedBackend::name() const {
    return kAcceleratedEngine;
}

std::size_t PackedBackend::worker_threads() const {
    return worker_threads_;
}

VehicleRiskResult PackedBackend::score(const VehicleRiskInput& input, const WeatherConditions& weather) const {
    std::array<double, kVehicleStride> record{};
    pack_vehicle(input, record.data());
    score_packed(cohorts_, weather_likelihood(weather), record.data(), 1);
    return unpack_vehicle(record.data(), input.vin);
}

std::vector<VehicleRiskResult> PackedBackend::score_batch(const std::vector<VehicleRiskInput>& inputs,
                                                          const WeatherConditions& weather) const {
    const std::size_t count = inputs.size();
    std::vector<double> records(count * kVehicleStride);
    for (std::size_t i = 0; i < count; ++i) {
        pack_vehicle(inputs[i], records.data() + i * kVehicleStride);
    }

    const double weather_ratio = weather_likelihood(weather);
    if (count <= inline_limit_ || worker_threads_ <= 1) {
        score_packed(cohorts_, weather_ratio, records.data(), count);
    } else {
        run_chunks(weather_ratio, records, count);
    }

    std::vector<VehicleRiskResult> results;
    results.reserve(count);
    for (std::size_t i = 0; i < count; ++i) {
        results.push_back(unpack_vehicle(records.data() + i * kVehicleStride, inputs[i].vin));
    }
    return results;
}

void PackedBackend::run_chunks(double weather_ratio, std::vector<double>& records, std::size_t count) const {
    const std::size_t chunks = (count + chunk_size_ - 1) / chunk_size_;
    std::atomic<std::size_t> next{0};
    auto worker = [&]() {
        for (std::size_t chunk = next.fetch_add(1); chunk < chunks; chunk = next.fetch_add(1)) {
            const std::size_t begin = chunk * chunk_size_;
            const std::size_t length = std::min(chunk_size_, count - begin);
            score_packed(cohorts_, weather_ratio, records.data() + begin * kVehicleStride, length);
        }
    };

    // The calling thread also drains the queue, so a failed spawn only costs throughput.
    const std::size_t helpers = std::min(worker_threads_, chunks) - 1;
    std::vector<std::thread> threads;
    threads.reserve(helpers);
    for (std::size_t i = 0; i < helpers; ++i) {
        try {
            threads.emplace_back(worker);
        } catch (const std::system_error& exc) {
            logger_.warn("worker_spawn_failed", {{"spawned", std::to_string(threads.size())}, {"error", exc.what()}});
            break;
        }
    }
    worker();
    for (auto& thread : threads) {
        thread.join();
    }

    logger_.debug("batch_chunked", {{"vehicles", std::to_string(count)},
                                    {"chunks", std::to_string(chunks)},
                                    {"threads", std::to_string(threads.size() + 1)}});
}

FailureProbabilityResult PackedBackend::assess(const StressorInput& input) const {
    const auto intensities = stressor_intensities(input);
    const auto& catalog = stressor_catalog();

    std::array<double, kStressorCount> contributions{};
    std::transform(catalog.begin(), catalog.end(), intensities.begin(), contributions.begin(),
                   [](const StressorConfig& config, const StressorIntensity& intensity) {
                       return stressor_contribution(config.likelihood_ratio, intensity.intensity);
                   });
    const double combined =
        std::accumulate(contributions.begin(), contributions.end(), 1.0, std::multiplies<double>());
    return assemble_assessment(intensities, contributions, combined);
}

std::unique_ptr<RiskBackend> load_accelerated_backend(const BackendConfig& config) {
    auto backend = std::make_unique<PackedBackend>(config);
    PortableBackend reference;
    const auto corpus = calibration_corpus();

    WeatherConditions harsh;
    harsh.temperature = 10.0;
    harsh.humidity = 90.0;
    harsh.precipitation = 0.8;
    harsh.temp_variance = 35.0;

    for (const auto& weather : {WeatherConditions{}, harsh}) {
        const auto expected = reference.score_batch(corpus, weather);
        const auto actual = backend->score_batch(corpus, weather);
        if (expected.size() != actual.size()) {
            throw std::runtime_error("accelerated backend returned a short batch");
        }
        for (std::size_t i = 0; i < expected.size(); ++i) {
            const double delta = std::abs(expected[i].priority_score - actual[i].priority_score);
            if (delta > config.equivalence_epsilon || expected[i].vin != actual[i].vin) {
                throw std::runtime_error("accelerated backend disagrees with portable backend on " +
                                         expected[i].vin);
            }
        }
    }
    return backend;
}

}  // namespace fleetrisk
