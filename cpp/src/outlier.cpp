#include "fleetrisk/outlier.hpp"

#include <algorithm>
#include <cmath>

#include "fleetrisk/cohort.hpp"

namespace fleetrisk {

std::string to_string(OutlierStatus status) {
    switch (status) {
        case OutlierStatus::kNormal:
            return "normal";
        case OutlierStatus::kWatch:
            return "watch";
        case OutlierStatus::kModerateOutlier:
            return "moderate_outlier";
        case OutlierStatus::kCriticalOutlier:
            return "critical_outlier";
    }
    return "normal";
}

double z_score(double value, double mean, double std_dev) {
    return (value - mean) / std::max(std_dev, kMinCohortStdDev);
}

OutlierStatus classify_outlier(double z) {
    const double magnitude = std::abs(z);
    if (magnitude > 2.0) {
        return OutlierStatus::kCriticalOutlier;
    }
    if (magnitude > 1.5) {
        return OutlierStatus::kModerateOutlier;
    }
    if (magnitude > 1.0) {
        return OutlierStatus::kWatch;
    }
    return OutlierStatus::kNormal;
}

}  // namespace fleetrisk
