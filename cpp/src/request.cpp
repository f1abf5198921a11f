#include "fleetrisk/request.hpp"

#include <algorithm>
#include <chrono>
#include <cmath>
#include <ctime>
#include <stdexcept>
#include <vector>

#include "fleetrisk/common.hpp"

namespace fleetrisk {

namespace {

constexpr std::size_t kCsvColumns = 13;

void require_finite(double value, const std::string& field) {
    if (!std::isfinite(value)) {
        throw std::invalid_argument("non-finite value for " + field);
    }
}

void require_range(double value, double low, double high, const std::string& field) {
    require_finite(value, field);
    if (value < low || value > high) {
        throw std::invalid_argument(field + " out of range: " + std::to_string(value));
    }
}

void require_non_negative(double value, const std::string& field) {
    require_finite(value, field);
    if (value < 0.0) {
        throw std::invalid_argument(field + " must be non-negative");
    }
}

std::optional<double> optional_column(const std::vector<std::string>& columns, std::size_t index,
                                      const std::string& field) {
    if (index >= columns.size() || trim(columns[index]).empty()) {
        return std::nullopt;
    }
    return parse_finite(columns[index], field);
}

bool group_present(const std::vector<std::string>& columns, std::size_t begin, std::size_t end) {
    for (std::size_t i = begin; i < end; ++i) {
        if (i < columns.size() && !trim(columns[i]).empty()) {
            return true;
        }
    }
    return false;
}

double column(const std::vector<std::string>& columns, std::size_t index, const std::string& field) {
    if (index >= columns.size()) {
        throw std::invalid_argument("missing numeric value for " + field);
    }
    return parse_finite(columns[index], field);
}

}  // namespace

WeatherConditions WeatherOverride::resolve() const {
    WeatherConditions defaults;
    return WeatherConditions{temperature.value_or(defaults.temperature), humidity.value_or(defaults.humidity),
                             precipitation.value_or(defaults.precipitation),
                             temp_variance.value_or(defaults.temp_variance)};
}

void validate(const RiskRequest& request) {
    if (trim(request.vin).empty()) {
        throw std::invalid_argument("missing required field: vin");
    }
    if (!request.mileage.has_value()) {
        throw std::invalid_argument("missing required field: mileage");
    }
    if (!request.year.has_value()) {
        throw std::invalid_argument("missing required field: year");
    }
    require_non_negative(*request.mileage, "mileage");
    require_finite(*request.year, "year");
    if (request.health_score) {
        require_range(*request.health_score, 0.0, 100.0, "healthScore");
    }
    if (request.dtcs) {
        for (auto category : kDtcCategories) {
            require_non_negative((*request.dtcs)[category], "dtcs." + to_string(category));
        }
    }
    if (request.environment) {
        const auto& env = *request.environment;
        require_range(env.rust_exposure, 0.0, 100.0, "environment.rustExposure");
        require_range(env.stop_go_factor, 0.0, 100.0, "environment.stopGoFactor");
        require_range(env.terrain_factor, 0.0, 100.0, "environment.terrainFactor");
        require_range(env.thermal_factor, 0.0, 100.0, "environment.thermalFactor");
    }
    if (request.recalls) {
        require_non_negative(*request.recalls, "recalls");
    }
    if (request.weather && !is_finite(request.weather->resolve())) {
        throw std::invalid_argument("non-finite value in weather override");
    }
}

VehicleRiskInput to_risk_input(const RiskRequest& request, int current_year, double default_health_score) {
    validate(request);

    VehicleRiskInput input;
    input.vin = trim(request.vin);
    input.mileage = *request.mileage;
    input.age_years = std::max(0.0, static_cast<double>(current_year) - *request.year);
    input.health_score = request.health_score.value_or(default_health_score);
    input.dtcs = request.dtcs.value_or(DtcCounts{});
    input.environment = request.environment.value_or(kDefaultEnvironment);
    input.active_recalls = request.recalls.value_or(0.0);
    return input;
}

bool is_csv_header(const std::string& line) {
    const auto columns = split(line, ',');
    return !columns.empty() && trim(columns.front()) == "vin";
}

RiskRequest parse_fleet_csv_line(const std::string& line) {
    const auto columns = split(trim(line), ',');
    if (columns.size() > kCsvColumns) {
        throw std::invalid_argument("too many columns: " + std::to_string(columns.size()));
    }

    RiskRequest request;
    request.vin = trim(columns[0]);
    request.mileage = optional_column(columns, 1, "mileage");
    request.year = optional_column(columns, 2, "year");
    request.health_score = optional_column(columns, 3, "healthScore");

    if (group_present(columns, 4, 8)) {
        request.dtcs = DtcCounts{column(columns, 4, "dtcs.powertrain"), column(columns, 5, "dtcs.body"),
                                 column(columns, 6, "dtcs.chassis"), column(columns, 7, "dtcs.network")};
    }
    if (group_present(columns, 8, 12)) {
        request.environment =
            EnvironmentExposure{column(columns, 8, "environment.rustExposure"),
                                column(columns, 9, "environment.stopGoFactor"),
                                column(columns, 10, "environment.terrainFactor"),
                                column(columns, 11, "environment.thermalFactor")};
    }
    request.recalls = optional_column(columns, 12, "recalls");
    return request;
}

int current_calendar_year() {
    const std::time_t now = std::chrono::system_clock::to_time_t(std::chrono::system_clock::now());
    std::tm local{};
    localtime_r(&now, &local);
    return local.tm_year + 1900;
}

}  // namespace fleetrisk
