#include <array>
#include <atomic>
#include <cmath>
#include <cstdint>
#include <cstdio>
#include <fstream>
#include <iostream>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

#include "fleetrisk/backend.hpp"
#include "fleetrisk/common.hpp"
#include "fleetrisk/config.hpp"
#include "fleetrisk/engine.hpp"
#include "fleetrisk/fleet.hpp"
#include "fleetrisk/inference.hpp"
#include "fleetrisk/logging.hpp"
#include "fleetrisk/packed_backend.hpp"
#include "fleetrisk/report.hpp"
#include "fleetrisk/request.hpp"
#include "fleetrisk/stressor_model.hpp"
#include "fleetrisk/synthesis.hpp"

namespace {

int failures = 0;

void expect_true(bool condition, const std::string& message) {
    if (!condition) {
        std::cerr << "FAIL: " << message << "\n";
        failures += 1;
    }
}

void expect_near(double value, double expected, double tolerance, const std::string& message) {
    if (std::fabs(value - expected) > tolerance) {
        std::cerr << "FAIL: " << message << " (got " << value << ", expected " << expected << ")\n";
        failures += 1;
    }
}

template <typename Fn>
void expect_throws_invalid(Fn&& fn, const std::string& message) {
    try {
        fn();
    } catch (const std::invalid_argument&) {
        return;
    }
    std::cerr << "FAIL: " << message << " (no std::invalid_argument)\n";
    failures += 1;
}

fleetrisk::VehicleRiskInput scenario_vehicle() {
    return fleetrisk::calibration_corpus().front();
}

fleetrisk::WeatherConditions harsh_weather() {
    return fleetrisk::WeatherConditions{10.0, 90.0, 0.8, 35.0};
}

void set_dtc(fleetrisk::DtcCounts& dtcs, fleetrisk::DtcCategory category, double count) {
    switch (category) {
        case fleetrisk::DtcCategory::kPowertrain:
            dtcs.powertrain = count;
            break;
        case fleetrisk::DtcCategory::kBody:
            dtcs.body = count;
            break;
        case fleetrisk::DtcCategory::kChassis:
            dtcs.chassis = count;
            break;
        case fleetrisk::DtcCategory::kNetwork:
            dtcs.network = count;
            break;
    }
}

fleetrisk::BackendConfig threaded_config() {
    fleetrisk::BackendConfig config;
    config.worker_threads = 4;
    config.batch_chunk_size = 3;
    config.inline_batch_limit = 2;
    return config;
}

std::vector<fleetrisk::VehicleRiskInput> varied_fleet(std::size_t count) {
    std::vector<fleetrisk::VehicleRiskInput> fleet;
    for (std::size_t i = 0; i < count; ++i) {
        fleetrisk::VehicleRiskInput input;
        input.vin = "VIN" + std::to_string(i);
        input.mileage = static_cast<double>((i * 7919) % 230000);
        input.age_years = static_cast<double>(i % 16);
        input.health_score = static_cast<double>((i * 37) % 101);
        input.dtcs = {static_cast<double>(i % 7), static_cast<double>(i % 4), static_cast<double>(i % 3),
                      static_cast<double>(i % 5)};
        input.environment = {static_cast<double>((i * 13) % 101), static_cast<double>((i * 29) % 101),
                             static_cast<double>((i * 41) % 101), static_cast<double>((i * 53) % 101)};
        input.active_recalls = static_cast<double>(i % 8);
        fleet.push_back(input);
    }
    return fleet;
}

void test_primitives() {
    expect_near(fleetrisk::dtc_likelihood(1.8, 1.8, 1.0), 1.0, 1e-12, "dtc likelihood at cohort mean");
    expect_near(fleetrisk::dtc_likelihood(4.8, 1.8, 1.0), 3.0, 1e-9, "dtc likelihood at +3 sigma");
    expect_near(fleetrisk::dtc_likelihood(-1.2, 1.8, 1.0), 1.0 / 3.0, 1e-9, "dtc likelihood at -3 sigma");
    expect_near(fleetrisk::dtc_likelihood(50.0, 1.8, 1.0), 3.0, 1e-9, "dtc likelihood saturates");
    expect_near(fleetrisk::dtc_likelihood(0.0, 0.0, 0.0), 1.0, 1e-12, "dtc likelihood with zero spread");

    expect_near(fleetrisk::mileage_likelihood(75000.0, 4.0), 1.5, 1e-12, "mileage ratio 1.56");
    expect_near(fleetrisk::mileage_likelihood(60000.0, 4.0), 1.25, 1e-12, "mileage ratio 1.25");
    expect_near(fleetrisk::mileage_likelihood(0.0, 0.0), 1.0, 1e-12, "new vehicle mileage");

    expect_near(fleetrisk::weather_likelihood(fleetrisk::WeatherConditions{}), 1.0, 1e-12, "mild weather");
    expect_near(fleetrisk::raw_weather_likelihood(harsh_weather()), 1.5 * 1.3 * 1.2 * 1.4, 1e-9,
                "harsh weather raw product");
    expect_near(fleetrisk::weather_likelihood(harsh_weather()), 2.0, 1e-12, "harsh weather clamped");

    expect_near(fleetrisk::recall_likelihood(12.0), 1.5, 1e-12, "recalls capped at five");
    expect_near(fleetrisk::prior_probability(30.0, 0.0), 0.023 * 2.0 * 2.0, 1e-12, "prior age factor capped");
    expect_near(fleetrisk::posterior_from_likelihood_ratio(0.1, 0.0), 0.1 * 1e-6 / (0.9 + 0.1 * 1e-6), 1e-15,
                "likelihood ratio floored");
    expect_true(fleetrisk::priority_score(0.555) == 56, "priority score rounds half up");
}

void test_outlier_thresholds() {
    expect_true(fleetrisk::classify_outlier(2.5) == fleetrisk::OutlierStatus::kCriticalOutlier, "z 2.5 critical");
    expect_true(fleetrisk::classify_outlier(1.7) == fleetrisk::OutlierStatus::kModerateOutlier, "z 1.7 moderate");
    expect_true(fleetrisk::classify_outlier(1.2) == fleetrisk::OutlierStatus::kWatch, "z 1.2 watch");
    expect_true(fleetrisk::classify_outlier(0.5) == fleetrisk::OutlierStatus::kNormal, "z 0.5 normal");
    expect_true(fleetrisk::classify_outlier(-2.5) == fleetrisk::OutlierStatus::kCriticalOutlier, "z -2.5 critical");
    expect_true(fleetrisk::classify_outlier(2.0) == fleetrisk::OutlierStatus::kModerateOutlier,
                "threshold is exclusive");
    expect_near(fleetrisk::z_score(3.0, 1.0, 0.0), 20.0, 1e-9, "spread floored at 0.1");
}

void test_cohort_lookup() {
    expect_true(fleetrisk::cohort_for_mileage(24999.0).mileage_band == "0-25k", "band below 25k");
    expect_true(fleetrisk::cohort_for_mileage(75000.0).mileage_band == "75k-100k", "band boundary inclusive");
    expect_true(fleetrisk::cohort_for_mileage(500000.0).mileage_band == "150k+", "top band open ended");
    expect_throws_invalid([] { fleetrisk::cohort_for_band("9000k"); }, "unknown band rejected");
}

void test_scenario_score() {
    fleetrisk::PortableBackend backend;
    auto result = backend.score(scenario_vehicle(), fleetrisk::WeatherConditions{});
    expect_near(result.prior, 0.041216, 1e-12, "scenario prior");
    expect_near(result.factors.mileage, 1.5, 1e-12, "scenario mileage factor");
    expect_near(result.factors.environment, 1.345, 1e-12, "scenario environment factor");
    expect_near(result.factors.dtc, 0.9412014714, 1e-8, "scenario dtc factor");
    expect_near(result.likelihood, 1.5116224383, 1e-8, "scenario combined likelihood");
    expect_near(result.posterior, 0.0610163762, 1e-8, "scenario posterior");
    expect_true(result.priority_score == 6, "scenario priority score");
    expect_near(result.outlier_score, -0.1654761905, 1e-9, "scenario outlier score");
    expect_true(result.outlier(fleetrisk::DtcCategory::kNetwork).status == fleetrisk::OutlierStatus::kWatch,
                "scenario network watch");

    auto harsh = backend.score(scenario_vehicle(), harsh_weather());
    expect_true(harsh.priority_score == 9, "harsh weather scenario score");
}

void check_score_bounds(const fleetrisk::RiskBackend& backend) {
    for (const auto& input : varied_fleet(200)) {
        auto result = backend.score(input, harsh_weather());
        expect_true(result.priority_score >= 0 && result.priority_score <= 100, "score within bounds");
        expect_true(result.posterior >= 0.0 && result.posterior <= 1.0, "posterior within bounds");
        expect_true(result.factors.weather >= 0.5 && result.factors.weather <= 2.0, "weather factor bounds");
        expect_true(result.factors.dtc >= 1.0 / 3.0 - 1e-12 && result.factors.dtc <= 3.0 + 1e-12,
                    "dtc factor bounds");
        auto again = backend.score(input, harsh_weather());
        expect_true(again.posterior == result.posterior, "scoring is idempotent");
    }
}

void check_monotonicity(const fleetrisk::RiskBackend& backend) {
    for (auto category : fleetrisk::kDtcCategories) {
        auto input = scenario_vehicle();
        double previous = -1.0;
        int previous_score = -1;
        for (int count = 0; count <= 8; ++count) {
            set_dtc(input.dtcs, category, count);
            const auto result = backend.score(input, fleetrisk::WeatherConditions{});
            expect_true(result.posterior >= previous,
                        "more " + fleetrisk::to_string(category) + " codes never lower risk");
            expect_true(result.priority_score >= previous_score,
                        "more " + fleetrisk::to_string(category) + " codes never lower priority");
            previous = result.posterior;
            previous_score = result.priority_score;
        }
    }

    auto input = scenario_vehicle();
    double previous = 2.0;
    for (int health = 0; health <= 100; health += 10) {
        input.health_score = health;
        const double posterior = backend.score(input, fleetrisk::WeatherConditions{}).posterior;
        expect_true(posterior <= previous, "higher health never raises risk");
        previous = posterior;
    }
}

void test_backend_properties() {
    fleetrisk::PortableBackend portable;
    fleetrisk::PackedBackend packed(threaded_config());
    for (const fleetrisk::RiskBackend* backend : {static_cast<const fleetrisk::RiskBackend*>(&portable),
                                                  static_cast<const fleetrisk::RiskBackend*>(&packed)}) {
        check_score_bounds(*backend);
        check_monotonicity(*backend);
    }
}

void test_backend_equivalence() {
    fleetrisk::PortableBackend portable;
    fleetrisk::PackedBackend packed(threaded_config());
    expect_true(packed.name() == fleetrisk::kAcceleratedEngine, "packed backend name");
    expect_true(portable.name() == fleetrisk::kFallbackEngine, "portable backend name");
    expect_true(packed.worker_threads() == 4, "configured worker threads");

    const auto single_a = portable.score(scenario_vehicle(), fleetrisk::WeatherConditions{});
    const auto single_b = packed.score(scenario_vehicle(), fleetrisk::WeatherConditions{});
    expect_true(single_a.posterior == single_b.posterior, "scenario posterior identical across backends");
    expect_true(single_a.priority_score == single_b.priority_score, "scenario score identical across backends");

    const auto fleet = varied_fleet(101);
    for (const auto& weather : {fleetrisk::WeatherConditions{}, harsh_weather()}) {
        const auto expected = portable.score_batch(fleet, weather);
        const auto actual = packed.score_batch(fleet, weather);
        expect_true(expected.size() == actual.size(), "batch sizes match");
        for (std::size_t i = 0; i < expected.size() && i < actual.size(); ++i) {
            expect_true(expected[i].vin == actual[i].vin, "batch preserves input order");
            expect_true(expected[i].priority_score == actual[i].priority_score, "batch scores identical");
            expect_true(expected[i].posterior == actual[i].posterior, "batch posteriors identical");
            expect_true(expected[i].outlier_score == actual[i].outlier_score, "batch outlier scores identical");
            for (auto category : fleetrisk::kDtcCategories) {
                expect_true(expected[i].outlier(category).status == actual[i].outlier(category).status,
                            "batch outlier statuses identical");
            }
        }
    }

    expect_true(packed.score_batch({}, fleetrisk::WeatherConditions{}).empty(), "empty batch");

    auto preset = *fleetrisk::stressor_preset("chicago");
    const auto a = portable.assess(preset);
    const auto b = packed.assess(preset);
    expect_true(a.probability == b.probability, "stressor probability identical across backends");
    expect_true(a.primary_risk == b.primary_risk, "primary risk identical across backends");
}

void test_engine() {
    fleetrisk::EngineSettings settings;
    settings.engine.backend = "portable";
    fleetrisk::RiskEngine portable_engine(settings);
    expect_true(!portable_engine.init_backend(), "portable mode never loads accelerated backend");
    expect_true(portable_engine.engine_name() == "fallback", "portable engine label");

    settings.engine = threaded_config();
    fleetrisk::RiskEngine engine(settings);
    expect_true(engine.engine_name() == "fallback", "engine starts on fallback");
    expect_true(engine.init_backend(), "accelerated backend passes self-check");
    expect_true(engine.accelerated(), "accelerated flag");

    const auto mild = engine.score_vehicle(scenario_vehicle());
    engine.set_weather_conditions(10.0, 90.0, 0.8, 35.0);
    const auto harsh = engine.score_vehicle(scenario_vehicle());
    expect_true(harsh.posterior > mild.posterior, "harsh weather raises risk");
    expect_near(engine.weather_conditions().temperature, 10.0, 1e-12, "weather stored");

    const auto explicit_mild = engine.score_vehicle(scenario_vehicle(), fleetrisk::WeatherConditions{});
    expect_true(explicit_mild.posterior == mild.posterior, "per-call weather does not touch shared state");
    expect_near(engine.weather_conditions().temperature, 10.0, 1e-12, "shared weather unchanged");

    expect_throws_invalid([&] { engine.set_weather_conditions(std::nan(""), 50.0, 0.0, 15.0); },
                          "non-finite weather rejected");
    expect_near(engine.weather_conditions().temperature, 10.0, 1e-12, "rejected weather leaves state intact");

    const auto fleet = engine.score_fleet(varied_fleet(20));
    expect_true(fleet.size() == 20, "fleet scoring returns every vehicle");
    expect_true(fleet.back().vin == "VIN19", "fleet scoring keeps order");
}

void test_concurrent_weather_updates() {
    fleetrisk::EngineSettings settings;
    settings.engine.backend = "portable";
    fleetrisk::RiskEngine engine(settings);

    const auto mild_weather = fleetrisk::WeatherConditions{};
    const auto stormy_weather = harsh_weather();
    const double mild = engine.score_vehicle(scenario_vehicle(), mild_weather).posterior;
    const double stormy = engine.score_vehicle(scenario_vehicle(), stormy_weather).posterior;

    // A half-written record (e.g. harsh temperature with mild humidity) scores differently from both.
    std::atomic<bool> done{false};
    std::thread writer([&]() {
        for (int i = 0; i < 2000; ++i) {
            engine.set_weather_conditions(i % 2 == 0 ? stormy_weather : mild_weather);
        }
        done.store(true);
    });

    int torn = 0;
    int reads = 0;
    while (!done.load() || reads < 100) {
        const double posterior = engine.score_vehicle(scenario_vehicle()).posterior;
        if (posterior != mild && posterior != stormy) {
            torn += 1;
        }
        reads += 1;
    }
    writer.join();
    expect_true(torn == 0, "readers only see whole weather records");

    const auto final_weather = engine.weather_conditions();
    expect_near(final_weather.temperature, mild_weather.temperature, 1e-12, "last weather write wins");
    expect_near(final_weather.temp_variance, mild_weather.temp_variance, 1e-12, "last weather write complete");
}

void test_logging_reconfiguration() {
    auto logger = fleetrisk::get_logger("concurrency");
    std::atomic<bool> done{false};
    std::thread writer([&]() {
        while (!done.load()) {
            logger.info("suppressed", {{"thread", "writer"}});
        }
    });

    fleetrisk::LoggingConfig error_only;
    error_only.level = "ERROR";
    fleetrisk::LoggingConfig warn_only;
    warn_only.level = "WARN";
    for (int i = 0; i < 200; ++i) {
        fleetrisk::configure_logging(i % 2 == 0 ? warn_only : error_only);
        expect_true(!logger.enabled(fleetrisk::LogLevel::kInfo), "info stays filtered while reconfiguring");
    }
    done.store(true);
    writer.join();

    fleetrisk::configure_logging(error_only);
    expect_true(logger.enabled(fleetrisk::LogLevel::kError), "error level enabled");
    expect_true(!logger.enabled(fleetrisk::LogLevel::kWarn), "warn filtered at error level");
}

void test_stressor_model() {
    auto phoenix = fleetrisk::assess_stressors(*fleetrisk::stressor_preset("phoenix"));
    expect_near(phoenix.combined_multiplier, 3.5 * 2.83 * 1.06, 1e-9, "phoenix combined multiplier");
    expect_near(phoenix.probability, 0.023 * 3.5 * 2.83 * 1.06, 1e-9, "phoenix probability");
    expect_true(phoenix.risk_tier.id == "critical", "phoenix tier");
    expect_near(phoenix.revenue_opportunity, 1200.0, 1e-12, "phoenix revenue");
    expect_true(phoenix.primary_risk == "Weather Stressor", "phoenix primary risk");
    expect_true(phoenix.recommended_parts ==
                    std::vector<std::string>({"BAGM-48H6-800", "VC-13DL-G", "FL-500S"}),
                "phoenix parts deduplicated in order");

    fleetrisk::StressorInput extreme{400.0, 200.0, 1.0, 20.0, 5000.0, 365.0, true};
    auto capped = fleetrisk::assess_stressors(extreme);
    expect_near(capped.probability, 0.95, 1e-12, "probability capped");

    auto calm = fleetrisk::assess_stressors(fleetrisk::StressorInput{});
    expect_near(calm.probability, 0.023, 1e-12, "no stressors gives base rate");
    expect_true(calm.primary_risk == "No significant stressors", "no primary risk");
    expect_true(calm.risk_tier.id == "low", "calm tier");
    expect_true(calm.recommended_parts.empty(), "no parts without stressors");

    auto negative = fleetrisk::weather_intensity(-50.0);
    expect_near(negative.intensity, 0.0, 1e-12, "negative raw value floors intensity");

    expect_true(!fleetrisk::stressor_preset("atlantis").has_value(), "unknown preset");
    expect_true(fleetrisk::stressor_preset_names().size() == 4, "four presets");
}

void test_request_layer() {
    auto request = fleetrisk::parse_fleet_csv_line("WP0AB2A71KS123456,75000,2021,72,2,1,1,0,30,50,20,40,0");
    auto input = fleetrisk::to_risk_input(request, 2025);
    expect_true(input.vin == "WP0AB2A71KS123456", "csv vin");
    expect_near(input.age_years, 4.0, 1e-12, "age from model year");
    expect_near(input.dtcs.powertrain, 2.0, 1e-12, "csv powertrain");
    expect_near(input.environment.thermal_factor, 40.0, 1e-12, "csv thermal");

    auto sparse = fleetrisk::to_risk_input(fleetrisk::parse_fleet_csv_line("VIN-SPARSE,12000,2026"), 2025);
    expect_near(sparse.age_years, 0.0, 1e-12, "future model year floors age");
    expect_near(sparse.health_score, 75.0, 1e-12, "default health");
    expect_near(sparse.environment.rust_exposure, 20.0, 1e-12, "default rust exposure");
    expect_near(sparse.environment.stop_go_factor, 30.0, 1e-12, "default stop-go");
    expect_near(sparse.dtcs.network, 0.0, 1e-12, "default dtcs");

    fleetrisk::RiskRequest zero_health;
    zero_health.vin = "VIN-ZERO";
    zero_health.mileage = 1000.0;
    zero_health.year = 2024.0;
    zero_health.health_score = 0.0;
    expect_near(fleetrisk::to_risk_input(zero_health, 2025).health_score, 0.0, 1e-12, "explicit zero kept");

    expect_true(fleetrisk::is_csv_header("vin,mileage,year"), "header detected");
    expect_throws_invalid([] { fleetrisk::to_risk_input(fleetrisk::parse_fleet_csv_line(",1000,2020"), 2025); },
                          "missing vin rejected");
    expect_throws_invalid([] { fleetrisk::to_risk_input(fleetrisk::parse_fleet_csv_line("VIN1,,2020"), 2025); },
                          "missing mileage rejected");
    expect_throws_invalid([] { fleetrisk::parse_fleet_csv_line("VIN1,abc,2020"); }, "non-numeric mileage");
    expect_throws_invalid([] { fleetrisk::parse_fleet_csv_line("VIN1,1000,2020,50,nan"); }, "nan dtc rejected");
    expect_throws_invalid([] { fleetrisk::to_risk_input(fleetrisk::parse_fleet_csv_line("VIN1,-5,2020"), 2025); },
                          "negative mileage rejected");
    expect_throws_invalid(
        [] { fleetrisk::to_risk_input(fleetrisk::parse_fleet_csv_line("VIN1,1000,2020,150"), 2025); },
        "health above 100 rejected");
    expect_throws_invalid([] { fleetrisk::parse_fleet_csv_line("VIN1,1000,2020,50,1,1"); },
                          "partial dtc group rejected");

    fleetrisk::WeatherOverride override_weather;
    override_weather.temperature = 5.0;
    auto resolved = override_weather.resolve();
    expect_near(resolved.temperature, 5.0, 1e-12, "override temperature");
    expect_near(resolved.temp_variance, 15.0, 1e-12, "override default variance");
}

void test_synthesis() {
    auto distribution = fleetrisk::synthetic_fleet_distribution(2500);
    const std::array<std::uint32_t, 10> expected = {25, 103, 281, 512, 625, 512, 281, 103, 25, 4};
    expect_true(distribution == expected, "synthetic fleet distribution");

    fleetrisk::VehicleRiskResult result;
    result.priority_score = 45;
    auto comparison = fleetrisk::compare_to_fleet(result, 2500);
    expect_true(comparison.better_than == 921, "better than count");
    expect_true(comparison.worse_than == 1579, "worse than count");
    expect_true(comparison.cohort_percentile == 37, "cohort percentile");

    result.priority_score = 100;
    expect_true(fleetrisk::compare_to_fleet(result, 2500).better_than == 2467, "score 100 uses top bucket");

    fleetrisk::DtcCounts counts{3.0, 0.0, 1.0, 2.0};
    auto first = fleetrisk::generate_dtc_sparklines("VIN-SPARK", counts, 12345);
    auto second = fleetrisk::generate_dtc_sparklines("VIN-SPARK", counts, 12345);
    auto other = fleetrisk::generate_dtc_sparklines("VIN-OTHER", counts, 12345);
    expect_true(first.size() == 4, "one sparkline per category");
    bool differs = false;
    for (std::size_t i = 0; i < first.size(); ++i) {
        expect_true(first[i].values == second[i].values, "sparklines deterministic");
        expect_true(first[i].values.size() == fleetrisk::kSparklinePoints, "twelve points");
        expect_near(first[i].values.back(), counts[first[i].category], 1e-12, "last point is current");
        for (double value : first[i].values) {
            expect_true(value >= 0.0, "sparkline non-negative");
        }
        differs = differs || first[i].values != other[i].values;
    }
    expect_true(differs, "different vehicles get different histories");
    expect_near(first[0].current_z_score, (3.0 - 1.2) / 0.8, 1e-12, "sparkline z against middle band");

    expect_true(fleetrisk::classify_trend({0.0, 0.0, 1.0, 1.0}) == fleetrisk::Trend::kWorsening, "worsening");
    expect_true(fleetrisk::classify_trend({1.0, 1.0, 0.0, 0.0}) == fleetrisk::Trend::kImproving, "improving");
    expect_true(fleetrisk::classify_trend({1.0, 1.05, 1.0, 1.05}) == fleetrisk::Trend::kStable, "stable");
}

void test_fleet_summary() {
    std::vector<fleetrisk::VehicleRiskResult> results(4);
    results[0].priority_score = 85;
    results[1].priority_score = 55;
    results[2].priority_score = 30;
    results[3].priority_score = 10;
    results[3].outlier_categories[0] = {2.6, fleetrisk::OutlierStatus::kCriticalOutlier};
    auto summary = fleetrisk::summarize_fleet(results);
    expect_true(summary.total == 4, "summary total");
    expect_true(summary.critical == 1 && summary.high == 1 && summary.medium == 1 && summary.low == 1,
                "summary levels");
    expect_true(summary.average_score == 45, "summary average");
    expect_true(summary.with_critical_outlier == 1, "summary critical outliers");
    expect_true(fleetrisk::summarize_fleet({}).average_score == 0, "empty fleet");

    auto projection = fleetrisk::project_fleet_revenue(10000, {0.10, 0.20, 0.30, 0.40});
    expect_true(projection.predicted_failures == 230, "predicted failures");
    expect_true(projection.converted_services == 46, "converted services");
    expect_true(projection.revenue_by_tier[0].vehicles == 1000, "critical vehicles");
    expect_true(projection.revenue_by_tier[0].revenue == 240000, "critical revenue");
    expect_true(projection.total_revenue == 240000 + 340000 + 270000 + 120000, "total revenue");
    expect_throws_invalid([] { fleetrisk::project_fleet_revenue(-1, {}); }, "negative fleet rejected");
    expect_throws_invalid([] { fleetrisk::project_fleet_revenue(10, {}, 1.5); }, "conversion rate bounded");
}

void test_config_and_report() {
    const std::string path = "fleetrisk_test_config.toml";
    {
        std::ofstream file(path);
        file << "[logging]\nlevel = \"ERROR\"\njson = false\n\n"
             << "[engine]\nbackend = \"portable\" # never accelerate\nworker_threads = 2\n"
             << "batch_chunk_size = 64\n\n"
             << "[weather]\ntemperature = 95.5\n\n"
             << "[synthesis]\nseed = 7\nfleet_size = 1000\n\n"
             << "[request]\ncurrent_year = 2025\n";
    }
    auto settings = fleetrisk::EngineSettings::from_toml(path);
    std::remove(path.c_str());
    expect_true(settings.logging.level == "ERROR", "config log level");
    expect_true(!settings.logging.json, "config json flag");
    expect_true(settings.engine.backend == "portable", "config backend");
    expect_true(settings.engine.worker_threads == 2, "config workers");
    expect_true(settings.engine.batch_chunk_size == 64, "config chunk size");
    expect_true(settings.engine.inline_batch_limit == 1024, "config default inline limit");
    expect_near(settings.weather.temperature, 95.5, 1e-12, "config weather");
    expect_near(settings.weather.humidity, 50.0, 1e-12, "config default humidity");
    expect_true(settings.synthesis.seed == 7 && settings.synthesis.fleet_size == 1000, "config synthesis");
    expect_true(settings.request.current_year == 2025, "config request year");

    bool missing_threw = false;
    try {
        fleetrisk::EngineSettings::from_toml("does/not/exist.toml");
    } catch (const std::runtime_error&) {
        missing_threw = true;
    }
    expect_true(missing_threw, "missing config file throws");

    {
        std::ofstream file(path);
        file << "[synthesis]\nfleet_size = 4294967296\n";
    }
    bool overflow_threw = false;
    try {
        fleetrisk::EngineSettings::from_toml(path);
    } catch (const std::runtime_error&) {
        overflow_threw = true;
    }
    std::remove(path.c_str());
    expect_true(overflow_threw, "fleet size above 32 bits rejected");

    expect_true(fleetrisk::parse_uint32("4294967295", "fleet") == 4294967295u, "largest fleet size accepted");
    expect_true(fleetrisk::parse_uint32(" 2500 ", "fleet") == 2500u, "fleet size trimmed");
    expect_throws_invalid([] { fleetrisk::parse_uint32("4294967296", "fleet"); }, "uint32 overflow rejected");
    expect_throws_invalid([] { fleetrisk::parse_uint32("99999999999999999999999", "fleet"); },
                          "huge value rejected");
    expect_throws_invalid([] { fleetrisk::parse_uint32("-1", "fleet"); }, "negative fleet size rejected");
    expect_throws_invalid([] { fleetrisk::parse_uint32("25x", "fleet"); }, "trailing junk rejected");

    fleetrisk::PortableBackend backend;
    auto result = backend.score(scenario_vehicle(), fleetrisk::WeatherConditions{});
    auto json = fleetrisk::to_json(fleetrisk::success_response(result, "fallback", {0.75, 0.5}));
    expect_true(json.find("\"success\":true") != std::string::npos, "response success flag");
    expect_true(json.find("\"engine\":\"fallback\"") != std::string::npos, "response engine label");
    expect_true(json.find("\"priority_score\":6") != std::string::npos, "response priority score");
    expect_true(json.find("\"result\":{\"vin\":\"CAL-SCENARIO\"") != std::string::npos, "response result key");
    expect_true(json.find("\"timing\":{\"total\":0.75,\"calculation\":0.5}") != std::string::npos,
                "response timing object");
    expect_true(json.find("\"data\"") == std::string::npos, "no legacy data key");

    auto failure = fleetrisk::to_json(fleetrisk::failure_response("bad \"vin\"", "accelerated"));
    expect_true(failure.find("\"success\":false") != std::string::npos, "failure flag");
    expect_true(failure.find("bad \\\"vin\\\"") != std::string::npos, "failure message escaped");
}

}  // namespace

int main() {
    fleetrisk::LoggingConfig quiet;
    quiet.level = "ERROR";
    fleetrisk::configure_logging(quiet);

    try {
        test_primitives();
        test_outlier_thresholds();
        test_cohort_lookup();
        test_scenario_score();
        test_backend_properties();
        test_backend_equivalence();
        test_engine();
        test_concurrent_weather_updates();
        test_logging_reconfiguration();
        test_stressor_model();
        test_request_layer();
        test_synthesis();
        test_fleet_summary();
        test_config_and_report();
    } catch (const std::exception& exc) {
        std::cerr << "Unhandled exception: " << exc.what() << "\n";
        return 1;
    }

    if (failures > 0) {
        std::cerr << failures << " test(s) failed.\n";
        return 1;
    }

    std::cout << "All tests passed.\n";
    return 0;
}
