#ifndef FLEETRISK_SYNTHESIS_HPP
#define FLEETRISK_SYNTHESIS_HPP

#include <array>
#include <cstdint>
#include <string>
#include <vector>

#include "fleetrisk/cohort.hpp"
#include "fleetrisk/inference.hpp"

namespace fleetrisk {

// Everything in this header is illustrative display data synthesized from a
// single current reading. None of it feeds back into scoring.

enum class Trend {
    kImproving,
    kStable,
    kWorsening,
};

std::string to_string(Trend trend);

constexpr std::size_t kSparklinePoints = 12;

struct SparklineData {
    DtcCategory category = DtcCategory::kPowertrain;
    std::vector<double> values;
    Trend trend = Trend::kStable;
    double current_z_score = 0.0;
};

// Deterministic for a given (vin, seed). The last point is always the current count.
std::vector<SparklineData> generate_dtc_sparklines(const std::string& vin, const DtcCounts& current,
                                                   std::uint32_t seed);

Trend classify_trend(const std::vector<double>& values);

constexpr std::size_t kFleetBuckets = 10;
constexpr std::uint32_t kDefaultFleetSize = 2500;

// Percentile against a synthetic bell-shaped fleet centred near score 45. This
// is a display aid, not a measured distribution.
struct CohortComparison {
    int vehicle_score = 0;
    int cohort_percentile = 0;
    std::uint32_t vehicles_in_cohort = 0;
    std::uint32_t better_than = 0;
    std::uint32_t worse_than = 0;
    std::array<std::uint32_t, kFleetBuckets> cohort_distribution{};
};

std::array<std::uint32_t, kFleetBuckets> synthetic_fleet_distribution(std::uint32_t fleet_size);
CohortComparison compare_to_fleet(const VehicleRiskResult& result, std::uint32_t fleet_size = kDefaultFleetSize);

}  // namespace fleetrisk

#endif  // FLEETRISK_SYNTHESIS_HPP
