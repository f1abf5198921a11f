#include "fleetrisk/backend.hpp"

namespace fleetrisk {

std::string PortableBackend::name() const {
    return kFallbackEngine;
}

VehicleRiskResult PortableBackend::score(const VehicleRiskInput& input, const WeatherConditions& weather) const {
    return score_vehicle(input, weather);
}

std::vector<VehicleRiskResult> PortableBackend::score_batch(const std::vector<VehicleRiskInput>& inputs,
                                                            const WeatherConditions& weather) const {
    std::vector<VehicleRiskResult> results;
    results.reserve(inputs.size());
    for (const auto& input : inputs) {
        results.push_back(score_vehicle(input, weather));
    }
    return results;
}

FailureProbabilityResult PortableBackend::assess(const StressorInput& input) const {
    return assess_stressors(input);
}

std::vector<VehicleRiskInput> calibration_corpus() {
    return {
        {"CAL-SCENARIO", 75000.0, 4.0, 72.0, {2.0, 1.0, 1.0, 0.0}, {30.0, 50.0, 20.0, 40.0}, 0.0},
        {"CAL-NEW", 0.0, 0.0, 100.0, {0.0, 0.0, 0.0, 0.0}, {0.0, 0.0, 0.0, 0.0}, 0.0},
        {"CAL-BAND1", 30000.0, 2.0, 88.0, {1.0, 0.0, 0.0, 1.0}, {10.0, 20.0, 5.0, 15.0}, 1.0},
        {"CAL-BAND2", 60000.0, 5.0, 65.0, {3.0, 2.0, 0.0, 1.0}, {40.0, 35.0, 25.0, 30.0}, 2.0},
        {"CAL-BAND4", 120000.0, 9.0, 40.0, {6.0, 3.0, 2.0, 4.0}, {80.0, 60.0, 70.0, 55.0}, 3.0},
        {"CAL-BAND5", 210000.0, 14.0, 15.0, {12.0, 8.0, 6.0, 9.0}, {100.0, 100.0, 100.0, 100.0}, 9.0},
        {"CAL-LOWDTC", 90000.0, 7.0, 95.0, {0.0, 0.0, 0.0, 0.0}, {5.0, 5.0, 5.0, 5.0}, 0.0},
        {"CAL-HIGHMILES", 140000.0, 3.0, 55.0, {4.0, 1.0, 1.0, 2.0}, {50.0, 90.0, 40.0, 60.0}, 5.0},
    };
}

}  // namespace fleetrisk
