#ifndef FLEETRISK_ENGINE_HPP
#define FLEETRISK_ENGINE_HPP

#include <cstdint>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

#include "fleetrisk/backend.hpp"
#include "fleetrisk/config.hpp"
#include "fleetrisk/logging.hpp"
#include "fleetrisk/synthesis.hpp"
#include "fleetrisk/weather.hpp"

namespace fleetrisk {

// Stable call surface over whichever backend is active. Starts on the portable
// backend; init_backend() may swap in the accelerated one.
class RiskEngine {
public:
    explicit RiskEngine(EngineSettings settings = {}, Logger logger = get_logger("RiskEngine"));

    // True when the accelerated backend is active. A false return is not an
    // error: the portable backend is fully functional.
    bool init_backend();
    bool accelerated() const;
    std::string engine_name() const;

    void set_weather_conditions(double temperature, double humidity, double precipitation, double temp_variance);
    void set_weather_conditions(const WeatherConditions& weather);
    WeatherConditions weather_conditions() const;

    VehicleRiskResult score_vehicle(const VehicleRiskInput& input) const;
    // Scores against an explicit weather context without touching the shared conditions.
    VehicleRiskResult score_vehicle(const VehicleRiskInput& input, const WeatherConditions& weather) const;
    std::vector<VehicleRiskResult> score_fleet(const std::vector<VehicleRiskInput>& inputs) const;

    FailureProbabilityResult assess_stressors(const StressorInput& input) const;
    CohortComparison compare_to_fleet(const VehicleRiskResult& result, std::uint32_t fleet_size) const;
    CohortComparison compare_to_fleet(const VehicleRiskResult& result) const;

    const EngineSettings& settings() const;

private:
    std::shared_ptr<const RiskBackend> backend() const;

    EngineSettings settings_;
    Logger logger_;
    WeatherCell weather_;
    mutable std::mutex backend_mutex_;
    std::shared_ptr<const RiskBackend> backend_;
};

}  // namespace fleetrisk

#endif  // FLEETRISK_ENGINE_HPP
