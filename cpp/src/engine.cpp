#include "fleetrisk/engine.hpp"

#include <stdexcept>
#include <utility>

#include "fleetrisk/packed_backend.hpp"

namespace fleetrisk {

namespace {

WeatherConditions from_defaults(const WeatherDefaults& defaults) {
    return WeatherConditions{defaults.temperature, defaults.humidity, defaults.precipitation,
                             defaults.temp_variance};
}

std::string describe(const WeatherConditions& weather) {
    return std::to_string(weather.temperature) + "F/" + std::to_string(weather.humidity) + "%/" +
           std::to_string(weather.precipitation) + "/" + std::to_string(weather.temp_variance) + "F";
}

}  // namespace

RiskEngine::RiskEngine(EngineSettings settings, Logger logger)
    : settings_(std::move(settings)),
      logger_(std::move(logger)),
      weather_(from_defaults(settings_.weather)),
      backend_(std::make_shared<PortableBackend>()) {
    if (!is_finite(weather_.load())) {
        throw std::invalid_argument("configured weather defaults must be finite");
    }
}

bool RiskEngine::init_backend() {
    std::shared_ptr<const RiskBackend> selected;
    if (settings_.engine.backend == "portable") {
        logger_.info("backend_fallback", {{"reason", "disabled by configuration"}});
    } else {
        try {
            selected = load_accelerated_backend(settings_.engine);
        } catch (const std::exception& exc) {
            logger_.warn("backend_fallback", {{"reason", exc.what()}});
        }
    }
    if (!selected) {
        selected = std::make_shared<PortableBackend>();
    }

    logger_.info("backend_selected", {{"engine", selected->name()}});
    std::lock_guard<std::mutex> guard(backend_mutex_);
    backend_ = std::move(selected);
    return backend_->name() == kAcceleratedEngine;
}

bool RiskEngine::accelerated() const {
    return backend()->name() == kAcceleratedEngine;
}

std::string RiskEngine::engine_name() const {
    return backend()->name();
}

void RiskEngine::set_weather_conditions(double temperature, double humidity, double precipitation,
                                        double temp_variance) {
    set_weather_conditions(WeatherConditions{temperature, humidity, precipitation, temp_variance});
}

void RiskEngine::set_weather_conditions(const WeatherConditions& weather) {
    if (!is_finite(weather)) {
        throw std::invalid_argument("weather conditions must be finite");
    }
    weather_.store(weather);
    logger_.info("weather_updated", {{"conditions", describe(weather)}});
}

WeatherConditions RiskEngine::weather_conditions() const {
    return weather_.load();
}

VehicleRiskResult RiskEngine::score_vehicle(const VehicleRiskInput& input) const {
    return backend()->score(input, weather_.load());
}

VehicleRiskResult RiskEngine::score_vehicle(const VehicleRiskInput& input, const WeatherConditions& weather) const {
    return backend()->score(input, weather);
}

std::vector<VehicleRiskResult> RiskEngine::score_fleet(const std::vector<VehicleRiskInput>& inputs) const {
    const auto active = backend();
    auto results = active->score_batch(inputs, weather_.load());
    logger_.debug("batch_scored", {{"vehicles", std::to_string(inputs.size())}, {"engine", active->name()}});
    return results;
}

FailureProbabilityResult RiskEngine::assess_stressors(const StressorInput& input) const {
    return backend()->assess(input);
}

CohortComparison RiskEngine::compare_to_fleet(const VehicleRiskResult& result, std::uint32_t fleet_size) const {
    return fleetrisk::compare_to_fleet(result, fleet_size);
}

CohortComparison RiskEngine::compare_to_fleet(const VehicleRiskResult& result) const {
    return fleetrisk::compare_to_fleet(result, settings_.synthesis.fleet_size);
}

const EngineSettings& RiskEngine::settings() const {
    return settings_;
}

std::shared_ptr<const RiskBackend> RiskEngine::backend() const {
    std::lock_guard<std::mutex> guard(backend_mutex_);
    return backend_;
}

}  // namespace fleetrisk
