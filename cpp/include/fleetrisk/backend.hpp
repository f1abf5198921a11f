#ifndef FLEETRISK_BACKEND_HPP
#define FLEETRISK_BACKEND_HPP

#include <string>
#include <vector>

#include "fleetrisk/inference.hpp"
#include "fleetrisk/stressor_model.hpp"

namespace fleetrisk {

constexpr const char* kAcceleratedEngine = "accelerated";
constexpr const char* kFallbackEngine = "fallback";

// Both implementations must produce identical results, including clamps,
// weights and the log-space combination.
class RiskBackend {
public:
    virtual ~RiskBackend() = default;

    virtual std::string name() const = 0;
    virtual VehicleRiskResult score(const VehicleRiskInput& input, const WeatherConditions& weather) const = 0;
    virtual std::vector<VehicleRiskResult> score_batch(const std::vector<VehicleRiskInput>& inputs,
                                                       const WeatherConditions& weather) const = 0;
    virtual FailureProbabilityResult assess(const StressorInput& input) const = 0;
};

class PortableBackend : public RiskBackend {
public:
    std::string name() const override;
    VehicleRiskResult score(const VehicleRiskInput& input, const WeatherConditions& weather) const override;
    std::vector<VehicleRiskResult> score_batch(const std::vector<VehicleRiskInput>& inputs,
                                               const WeatherConditions& weather) const override;
    FailureProbabilityResult assess(const StressorInput& input) const override;
};

// Inputs used by the startup self-check that compares a candidate backend with
// the portable one. Covers every mileage band and the clamp boundaries.
std::vector<VehicleRiskInput> calibration_corpus();

}  // namespace fleetrisk

#endif  // FLEETRISK_BACKEND_HPP
