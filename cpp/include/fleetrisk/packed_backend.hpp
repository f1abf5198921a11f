#ifndef FLEETRISK_PACKED_BACKEND_HPP
#define FLEETRISK_PACKED_BACKEND_HPP

#include <array>
#include <cstddef>
#include <memory>
#include <vector>

#include "fleetrisk/backend.hpp"
#include "fleetrisk/config.hpp"
#include "fleetrisk/logging.hpp"

namespace fleetrisk {

// Flat record layout shared by pack/kernel/unpack.
//   [0..11]  mileage, age, health, dtc p/b/c/n, rust, stop-go, terrain, thermal, recalls
//   [12..16] factor ratios weather, dtc, mileage, environment, recalls
//   [17..19] prior, likelihood, posterior
//   [20..23] raw z-scores p/b/c/n
constexpr std::size_t kVehicleStride = 24;
constexpr std::size_t kCohortStride = 8;

using PackedCohortTable = std::array<double, kMileageBandCount * kCohortStride>;

// Throws std::runtime_error when the static table cannot be packed (non-finite
// or non-positive spread).
PackedCohortTable pack_cohort_table();

void pack_vehicle(const VehicleRiskInput& input, double* record);
VehicleRiskResult unpack_vehicle(const double* record, const std::string& vin);

// Scores `count` records in place. Weather likelihood is resolved once per call.
void score_packed(const PackedCohortTable& cohorts, double weather_ratio, double* records, std::size_t count);

class PackedBackend : public RiskBackend {
public:
    explicit PackedBackend(const BackendConfig& config, Logger logger = get_logger("PackedBackend"));

    std::string name() const override;
    VehicleRiskResult score(const VehicleRiskInput& input, const WeatherConditions& weather) const override;
    std::vector<VehicleRiskResult> score_batch(const std::vector<VehicleRiskInput>& inputs,
                                               const WeatherConditions& weather) const override;
    FailureProbabilityResult assess(const StressorInput& input) const override;

    std::size_t worker_threads() const;

private:
    void run_chunks(double weather_ratio, std::vector<double>& records, std::size_t count) const;

    PackedCohortTable cohorts_{};
    std::size_t worker_threads_ = 1;
    std::size_t chunk_size_ = 256;
    std::size_t inline_limit_ = 1024;
    Logger logger_;
};

// Builds the accelerated backend and verifies it against the portable one on
// calibration_corpus(). Throws std::runtime_error when the check fails.
std::unique_ptr<RiskBackend> load_accelerated_backend(const BackendConfig& config);

}  // namespace fleetrisk

#endif  // FLEETRISK_PACKED_BACKEND_HPP
