#ifndef FLEETRISK_COHORT_HPP
#define FLEETRISK_COHORT_HPP

#include <array>
#include <cstddef>
#include <string>

namespace fleetrisk {

enum class DtcCategory {
    kPowertrain,
    kBody,
    kChassis,
    kNetwork,
};

constexpr std::size_t kDtcCategoryCount = 4;
constexpr std::array<DtcCategory, kDtcCategoryCount> kDtcCategories = {
    DtcCategory::kPowertrain, DtcCategory::kBody, DtcCategory::kChassis, DtcCategory::kNetwork};

std::string to_string(DtcCategory category);

struct DtcCounts {
    double powertrain = 0.0;
    double body = 0.0;
    double chassis = 0.0;
    double network = 0.0;

    double operator[](DtcCategory category) const;
};

struct CategoryStats {
    double mean = 0.0;
    double std_dev = 0.0;
};

// Aggregated DTC statistics for one mileage band of the reference population.
struct CohortStats {
    std::string mileage_band;
    CategoryStats powertrain{};
    CategoryStats body{};
    CategoryStats chassis{};
    CategoryStats network{};
    int sample_size = 0;

    const CategoryStats& category(DtcCategory category) const;
};

constexpr std::size_t kMileageBandCount = 6;

// 0-25k, 25k-50k, 50k-75k, 75k-100k, 100k-150k, 150k+. Band edges are inclusive on the low side.
std::size_t mileage_band_index(double mileage);
const std::array<CohortStats, kMileageBandCount>& cohort_table();
const CohortStats& cohort_for_mileage(double mileage);
const CohortStats& cohort_for_band(const std::string& mileage_band);

// Lower bound applied to every cohort standard deviation before dividing.
constexpr double kMinCohortStdDev = 0.1;

}  // namespace fleetrisk

#endif  // FLEETRISK_COHORT_HPP
