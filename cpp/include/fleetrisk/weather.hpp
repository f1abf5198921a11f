#ifndef FLEETRISK_WEATHER_HPP
#define FLEETRISK_WEATHER_HPP

#include <mutex>

namespace fleetrisk {

struct WeatherConditions {
    double temperature = 70.0;     // F
    double humidity = 50.0;        // %
    double precipitation = 0.0;    // 0-1 intensity
    double temp_variance = 15.0;   // daily swing, F
};

bool is_finite(const WeatherConditions& weather);

// Current conditions shared by every scoring call. Writers replace the whole
// value under the lock so readers never observe a partially written record.
class WeatherCell {
public:
    explicit WeatherCell(WeatherConditions initial = {});

    WeatherConditions load() const;
    void store(const WeatherConditions& weather);

private:
    mutable std::mutex mutex_;
    WeatherConditions value_{};
};

}  // namespace fleetrisk

#endif  // FLEETRISK_WEATHER_HPP
