#ifndef FLEETRISK_REQUEST_HPP
#define FLEETRISK_REQUEST_HPP

#include <optional>
#include <string>

#include "fleetrisk/inference.hpp"
#include "fleetrisk/weather.hpp"

namespace fleetrisk {

// Per-field weather override; absent fields fall back to 70F / 50% / 0 / 15F.
struct WeatherOverride {
    std::optional<double> temperature;
    std::optional<double> humidity;
    std::optional<double> precipitation;
    std::optional<double> temp_variance;

    WeatherConditions resolve() const;
};

// A scoring request as received at the outer boundary, before defaults are applied.
struct RiskRequest {
    std::string vin;
    std::optional<double> mileage;
    std::optional<double> year;
    std::optional<double> health_score;
    std::optional<DtcCounts> dtcs;
    std::optional<EnvironmentExposure> environment;
    std::optional<double> recalls;
    std::optional<WeatherOverride> weather;
};

constexpr double kDefaultHealthScore = 75.0;
const EnvironmentExposure kDefaultEnvironment{20.0, 30.0, 20.0, 25.0};

// Throws std::invalid_argument naming the first offending field.
void validate(const RiskRequest& request);

// Validates, then applies defaults. Age is current_year - year, floored at 0.
VehicleRiskInput to_risk_input(const RiskRequest& request, int current_year,
                               double default_health_score = kDefaultHealthScore);

// vin,mileage,year,health,dtc_p,dtc_b,dtc_c,dtc_n,rust,stop_go,terrain,thermal,recalls
// Trailing columns may be empty or omitted; DTC and environment groups are all-or-nothing.
RiskRequest parse_fleet_csv_line(const std::string& line);
bool is_csv_header(const std::string& line);

int current_calendar_year();

}  // namespace fleetrisk

#endif  // FLEETRISK_REQUEST_HPP
