#ifndef FLEETRISK_OUTLIER_HPP
#define FLEETRISK_OUTLIER_HPP

#include <string>

namespace fleetrisk {

enum class OutlierStatus {
    kNormal,
    kWatch,
    kModerateOutlier,
    kCriticalOutlier,
};

std::string to_string(OutlierStatus status);

// Raw z-score of a count against a cohort mean, std floored at kMinCohortStdDev.
double z_score(double value, double mean, double std_dev);

// |z| > 2.0 critical, > 1.5 moderate, > 1.0 watch, otherwise normal.
OutlierStatus classify_outlier(double z);

struct CategoryOutlier {
    double z_score = 0.0;
    OutlierStatus status = OutlierStatus::kNormal;
};

}  // namespace fleetrisk

#endif  // FLEETRISK_OUTLIER_HPP
