#include "fleetrisk/cohort.hpp"

#include <stdexcept>

namespace fleetrisk {

namespace {

const std::array<CohortStats, kMileageBandCount> kCohorts = {{
    {"0-25k", {0.3, 0.4}, {0.2, 0.3}, {0.1, 0.2}, {0.4, 0.5}, 45000},
    {"25k-50k", {0.8, 0.6}, {0.4, 0.4}, {0.3, 0.3}, {0.6, 0.5}, 62000},
    {"50k-75k", {1.2, 0.8}, {0.6, 0.5}, {0.5, 0.4}, {0.8, 0.6}, 58000},
    {"75k-100k", {1.8, 1.0}, {0.9, 0.6}, {0.8, 0.5}, {1.0, 0.7}, 41000},
    {"100k-150k", {2.5, 1.2}, {1.2, 0.8}, {1.1, 0.7}, {1.3, 0.8}, 28000},
    {"150k+", {3.2, 1.5}, {1.6, 1.0}, {1.5, 0.9}, {1.6, 1.0}, 15000},
}};

}  // namespace

std::string to_string(DtcCategory category) {
    switch (category) {
        case DtcCategory::kPowertrain:
            return "powertrain";
        case DtcCategory::kBody:
            return "body";
        case DtcCategory::kChassis:
            return "chassis";
        case DtcCategory::kNetwork:
            return "network";
    }
    return "powertrain";
}

double DtcCounts::operator[](DtcCategory category) const {
    switch (category) {
        case DtcCategory::kPowertrain:
            return powertrain;
        case DtcCategory::kBody:
            return body;
        case DtcCategory::kChassis:
            return chassis;
        case DtcCategory::kNetwork:
            return network;
    }
    return powertrain;
}

const CategoryStats& CohortStats::category(DtcCategory category) const {
    switch (category) {
        case DtcCategory::kPowertrain:
            return powertrain;
        case DtcCategory::kBody:
            return body;
        case DtcCategory::kChassis:
            return chassis;
        case DtcCategory::kNetwork:
            return network;
    }
    return powertrain;
}

std::size_t mileage_band_index(double mileage) {
    if (mileage >= 150000.0) {
        return 5;
    }
    if (mileage >= 100000.0) {
        return 4;
    }
    if (mileage >= 75000.0) {
        return 3;
    }
    if (mileage >= 50000.0) {
        return 2;
    }
    if (mileage >= 25000.0) {
        return 1;
    }
    return 0;
}

const std::array<CohortStats, kMileageBandCount>& cohort_table() {
    return kCohorts;
}

const CohortStats& cohort_for_mileage(double mileage) {
    return kCohorts[mileage_band_index(mileage)];
}

const CohortStats& cohort_for_band(const std::string& mileage_band) {
    for (const auto& cohort : kCohorts) {
        if (cohort.mileage_band == mileage_band) {
            return cohort;
        }
    }
    throw std::invalid_argument("unknown mileage band: " + mileage_band);
}

}  // namespace fleetrisk
