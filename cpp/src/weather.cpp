#include "fleetrisk/weather.hpp"

#include <cmath>

namespace fleetrisk {

bool is_finite(const WeatherConditions& weather) {
    return std::isfinite(weather.temperature) && std::isfinite(weather.humidity) &&
           std::isfinite(weather.precipitation) && std::isfinite(weather.temp_variance);
}

WeatherCell::WeatherCell(WeatherConditions initial) : value_(initial) {}

WeatherConditions WeatherCell::load() const {
    std::lock_guard<std::mutex> guard(mutex_);
    return value_;
}

void WeatherCell::store(const WeatherConditions& weather) {
    std::lock_guard<std::mutex> guard(mutex_);
    value_ = weather;
}

}  // namespace fleetrisk
