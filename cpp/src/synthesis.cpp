#include "fleetrisk/synthesis.hpp"

#include <algorithm>
#include <cmath>
#include <numeric>
#include <random>

namespace fleetrisk {

namespace {

constexpr double kTrendThreshold = 0.1;
constexpr double kNoiseHalfWidth = 0.15;

// FNV-1a, so the per-vehicle stream does not depend on std::hash.
std::uint32_t fingerprint(const std::string& value) {
    std::uint32_t hash = 2166136261u;
    for (unsigned char ch : value) {
        hash ^= ch;
        hash *= 16777619u;
    }
    return hash;
}

}  // namespace

std::string to_string(Trend trend) {
    switch (trend) {
        case Trend::kImproving:
            return "improving";
        case Trend::kStable:
            return "stable";
        case Trend::kWorsening:
            return "worsening";
    }
    return "stable";
}

Trend classify_trend(const std::vector<double>& values) {
    if (values.size() < 2) {
        return Trend::kStable;
    }
    const std::size_t half = values.size() / 2;
    const double first = std::accumulate(values.begin(), values.begin() + half, 0.0) / half;
    const double second =
        std::accumulate(values.begin() + half, values.end(), 0.0) / (values.size() - half);
    const double slope = second - first;
    if (slope > kTrendThreshold) {
        return Trend::kWorsening;
    }
    if (slope < -kTrendThreshold) {
        return Trend::kImproving;
    }
    return Trend::kStable;
}

std::vector<SparklineData> generate_dtc_sparklines(const std::string& vin, const DtcCounts& current,
                                                   std::uint32_t seed) {
    std::seed_seq sequence{seed, fingerprint(vin)};
    std::mt19937 rng(sequence);
    std::uniform_real_distribution<double> noise(-kNoiseHalfWidth, kNoiseHalfWidth);

    // Z-scores are reported against the middle band regardless of mileage.
    const auto& reference = cohort_for_band("50k-75k");

    std::vector<SparklineData> output;
    output.reserve(kDtcCategoryCount);
    for (auto category : kDtcCategories) {
        const double now = current[category];
        SparklineData line;
        line.category = category;
        line.values.reserve(kSparklinePoints);

        double base = now * 0.6;
        for (std::size_t i = 0; i + 1 < kSparklinePoints; ++i) {
            const double step = (now - base) / 12.0;
            base += step + noise(rng);
            line.values.push_back(std::max(0.0, base));
        }
        line.values.push_back(now);

        line.trend = classify_trend(line.values);
        const auto& stats = reference.category(category);
        line.current_z_score = z_score(now, stats.mean, stats.std_dev);
        output.push_back(std::move(line));
    }
    return output;
}

std::array<std::uint32_t, kFleetBuckets> synthetic_fleet_distribution(std::uint32_t fleet_size) {
    std::array<std::uint32_t, kFleetBuckets> distribution{};
    for (std::size_t i = 0; i < kFleetBuckets; ++i) {
        const double centre = static_cast<double>(i) * 10.0 + 5.0;
        const double distance = std::abs(centre - 45.0);
        const double count = static_cast<double>(fleet_size) * 0.25 * std::exp(-(distance * distance) / 500.0);
        distribution[i] = static_cast<std::uint32_t>(std::lround(count));
    }
    return distribution;
}

CohortComparison compare_to_fleet(const VehicleRiskResult& result, std::uint32_t fleet_size) {
    CohortComparison comparison;
    comparison.vehicle_score = result.priority_score;
    comparison.vehicles_in_cohort = fleet_size;
    comparison.cohort_distribution = synthetic_fleet_distribution(fleet_size);

    const int bucket = std::clamp(result.priority_score / 10, 0, static_cast<int>(kFleetBuckets) - 1);
    std::uint32_t below = 0;
    for (int i = 0; i < bucket; ++i) {
        below += comparison.cohort_distribution[static_cast<std::size_t>(i)];
    }

    comparison.better_than = below;
    // The synthetic buckets do not sum to exactly fleet_size.
    comparison.worse_than = fleet_size >= below ? fleet_size - below : 0;
    comparison.cohort_percentile =
        fleet_size == 0 ? 0
                        : static_cast<int>(std::lround(static_cast<double>(below) / fleet_size * 100.0));
    return comparison;
}

}  // namespace fleetrisk
