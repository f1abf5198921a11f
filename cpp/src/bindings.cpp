#include <pybind11/pybind11.h>
#include <pybind11/stl.h>

#include "fleetrisk/engine.hpp"
#include "fleetrisk/fleet.hpp"
#include "fleetrisk/report.hpp"
#include "fleetrisk/request.hpp"
#include "fleetrisk/stressor_model.hpp"
#include "fleetrisk/synthesis.hpp"

namespace py = pybind11;

PYBIND11_MODULE(fleetrisk_python, m) {
    m.doc() = "Pybind11 bindings for the fleetrisk C++ core.";

    py::enum_<fleetrisk::DtcCategory>(m, "DtcCategory")
        .value("POWERTRAIN", fleetrisk::DtcCategory::kPowertrain)
        .value("BODY", fleetrisk::DtcCategory::kBody)
        .value("CHASSIS", fleetrisk::DtcCategory::kChassis)
        .value("NETWORK", fleetrisk::DtcCategory::kNetwork);

    py::enum_<fleetrisk::OutlierStatus>(m, "OutlierStatus")
        .value("NORMAL", fleetrisk::OutlierStatus::kNormal)
        .value("WATCH", fleetrisk::OutlierStatus::kWatch)
        .value("MODERATE_OUTLIER", fleetrisk::OutlierStatus::kModerateOutlier)
        .value("CRITICAL_OUTLIER", fleetrisk::OutlierStatus::kCriticalOutlier);

    py::class_<fleetrisk::DtcCounts>(m, "DtcCounts")
        .def(py::init<>())
        .def_readwrite("powertrain", &fleetrisk::DtcCounts::powertrain)
        .def_readwrite("body", &fleetrisk::DtcCounts::body)
        .def_readwrite("chassis", &fleetrisk::DtcCounts::chassis)
        .def_readwrite("network", &fleetrisk::DtcCounts::network);

    py::class_<fleetrisk::EnvironmentExposure>(m, "EnvironmentExposure")
        .def(py::init<>())
        .def_readwrite("rust_exposure", &fleetrisk::EnvironmentExposure::rust_exposure)
        .def_readwrite("stop_go_factor", &fleetrisk::EnvironmentExposure::stop_go_factor)
        .def_readwrite("terrain_factor", &fleetrisk::EnvironmentExposure::terrain_factor)
        .def_readwrite("thermal_factor", &fleetrisk::EnvironmentExposure::thermal_factor);

    py::class_<fleetrisk::WeatherConditions>(m, "WeatherConditions")
        .def(py::init<>())
        .def_readwrite("temperature", &fleetrisk::WeatherConditions::temperature)
        .def_readwrite("humidity", &fleetrisk::WeatherConditions::humidity)
        .def_readwrite("precipitation", &fleetrisk::WeatherConditions::precipitation)
        .def_readwrite("temp_variance", &fleetrisk::WeatherConditions::temp_variance);

    py::class_<fleetrisk::VehicleRiskInput>(m, "VehicleRiskInput")
        .def(py::init<>())
        .def_readwrite("vin", &fleetrisk::VehicleRiskInput::vin)
        .def_readwrite("mileage", &fleetrisk::VehicleRiskInput::mileage)
        .def_readwrite("age_years", &fleetrisk::VehicleRiskInput::age_years)
        .def_readwrite("health_score", &fleetrisk::VehicleRiskInput::health_score)
        .def_readwrite("dtcs", &fleetrisk::VehicleRiskInput::dtcs)
        .def_readwrite("environment", &fleetrisk::VehicleRiskInput::environment)
        .def_readwrite("active_recalls", &fleetrisk::VehicleRiskInput::active_recalls);

    py::class_<fleetrisk::CategoryOutlier>(m, "CategoryOutlier")
        .def_readonly("z_score", &fleetrisk::CategoryOutlier::z_score)
        .def_readonly("status", &fleetrisk::CategoryOutlier::status);

    py::class_<fleetrisk::FactorBreakdown>(m, "FactorBreakdown")
        .def_readonly("weather", &fleetrisk::FactorBreakdown::weather)
        .def_readonly("dtc", &fleetrisk::FactorBreakdown::dtc)
        .def_readonly("mileage", &fleetrisk::FactorBreakdown::mileage)
        .def_readonly("environment", &fleetrisk::FactorBreakdown::environment)
        .def_readonly("recalls", &fleetrisk::FactorBreakdown::recalls);

    py::class_<fleetrisk::VehicleRiskResult>(m, "VehicleRiskResult")
        .def_readonly("vin", &fleetrisk::VehicleRiskResult::vin)
        .def_readonly("priority_score", &fleetrisk::VehicleRiskResult::priority_score)
        .def_readonly("prior", &fleetrisk::VehicleRiskResult::prior)
        .def_readonly("likelihood", &fleetrisk::VehicleRiskResult::likelihood)
        .def_readonly("posterior", &fleetrisk::VehicleRiskResult::posterior)
        .def_readonly("outlier_score", &fleetrisk::VehicleRiskResult::outlier_score)
        .def_readonly("factors", &fleetrisk::VehicleRiskResult::factors)
        .def("outlier", &fleetrisk::VehicleRiskResult::outlier)
        .def("to_json", [](const fleetrisk::VehicleRiskResult& result) { return fleetrisk::to_json(result); });

    py::class_<fleetrisk::StressorInput>(m, "StressorInput")
        .def(py::init<>())
        .def_readwrite("days_over_95f", &fleetrisk::StressorInput::days_over_95f)
        .def_readwrite("days_below_minus_10f", &fleetrisk::StressorInput::days_below_minus_10f)
        .def_readwrite("short_trip_ratio", &fleetrisk::StressorInput::short_trip_ratio)
        .def_readwrite("daily_starts", &fleetrisk::StressorInput::daily_starts)
        .def_readwrite("daily_elevation_change_m", &fleetrisk::StressorInput::daily_elevation_change_m)
        .def_readwrite("salt_days_per_year", &fleetrisk::StressorInput::salt_days_per_year)
        .def_readwrite("coastal_exposure", &fleetrisk::StressorInput::coastal_exposure);

    py::class_<fleetrisk::FailureProbabilityResult>(m, "FailureProbabilityResult")
        .def_readonly("probability", &fleetrisk::FailureProbabilityResult::probability)
        .def_readonly("revenue_opportunity", &fleetrisk::FailureProbabilityResult::revenue_opportunity)
        .def_readonly("combined_multiplier", &fleetrisk::FailureProbabilityResult::combined_multiplier)
        .def_readonly("primary_risk", &fleetrisk::FailureProbabilityResult::primary_risk)
        .def_readonly("recommended_parts", &fleetrisk::FailureProbabilityResult::recommended_parts)
        .def_property_readonly("risk_tier",
                               [](const fleetrisk::FailureProbabilityResult& result) { return result.risk_tier.id; })
        .def("to_json",
             [](const fleetrisk::FailureProbabilityResult& result) { return fleetrisk::to_json(result); });

    py::class_<fleetrisk::CohortComparison>(m, "CohortComparison")
        .def_readonly("vehicle_score", &fleetrisk::CohortComparison::vehicle_score)
        .def_readonly("cohort_percentile", &fleetrisk::CohortComparison::cohort_percentile)
        .def_readonly("vehicles_in_cohort", &fleetrisk::CohortComparison::vehicles_in_cohort)
        .def_readonly("better_than", &fleetrisk::CohortComparison::better_than)
        .def_readonly("worse_than", &fleetrisk::CohortComparison::worse_than)
        .def_readonly("cohort_distribution", &fleetrisk::CohortComparison::cohort_distribution);

    py::enum_<fleetrisk::Trend>(m, "Trend")
        .value("IMPROVING", fleetrisk::Trend::kImproving)
        .value("STABLE", fleetrisk::Trend::kStable)
        .value("WORSENING", fleetrisk::Trend::kWorsening);

    py::class_<fleetrisk::SparklineData>(m, "SparklineData")
        .def_readonly("category", &fleetrisk::SparklineData::category)
        .def_readonly("values", &fleetrisk::SparklineData::values)
        .def_readonly("trend", &fleetrisk::SparklineData::trend)
        .def_readonly("current_z_score", &fleetrisk::SparklineData::current_z_score);

    py::class_<fleetrisk::TierDistribution>(m, "TierDistribution")
        .def(py::init<>())
        .def_readwrite("critical", &fleetrisk::TierDistribution::critical)
        .def_readwrite("high", &fleetrisk::TierDistribution::high)
        .def_readwrite("moderate", &fleetrisk::TierDistribution::moderate)
        .def_readwrite("low", &fleetrisk::TierDistribution::low);

    py::class_<fleetrisk::TierRevenue>(m, "TierRevenue")
        .def_readonly("tier", &fleetrisk::TierRevenue::tier)
        .def_readonly("vehicles", &fleetrisk::TierRevenue::vehicles)
        .def_readonly("revenue", &fleetrisk::TierRevenue::revenue);

    py::class_<fleetrisk::FleetProjection>(m, "FleetProjection")
        .def_readonly("total_vehicles", &fleetrisk::FleetProjection::total_vehicles)
        .def_readonly("predicted_failures", &fleetrisk::FleetProjection::predicted_failures)
        .def_readonly("converted_services", &fleetrisk::FleetProjection::converted_services)
        .def_readonly("revenue_by_tier", &fleetrisk::FleetProjection::revenue_by_tier)
        .def_readonly("total_revenue", &fleetrisk::FleetProjection::total_revenue)
        .def_readonly("conversion_rate", &fleetrisk::FleetProjection::conversion_rate);

    py::class_<fleetrisk::RiskEngine>(m, "RiskEngine")
        .def(py::init([](const std::string& config_path) {
                 auto settings = config_path.empty() ? fleetrisk::EngineSettings{}
                                                     : fleetrisk::EngineSettings::from_toml(config_path);
                 return std::make_unique<fleetrisk::RiskEngine>(settings);
             }),
             py::arg("config_path") = "")
        .def("init_backend", &fleetrisk::RiskEngine::init_backend, py::call_guard<py::gil_scoped_release>())
        .def_property_readonly("engine_name", &fleetrisk::RiskEngine::engine_name)
        .def_property_readonly("accelerated", &fleetrisk::RiskEngine::accelerated)
        .def("set_weather_conditions",
             py::overload_cast<double, double, double, double>(&fleetrisk::RiskEngine::set_weather_conditions),
             py::arg("temperature"), py::arg("humidity"), py::arg("precipitation"), py::arg("temp_variance"))
        .def("score_vehicle",
             py::overload_cast<const fleetrisk::VehicleRiskInput&>(&fleetrisk::RiskEngine::score_vehicle,
                                                                   py::const_))
        .def("score_fleet", &fleetrisk::RiskEngine::score_fleet, py::call_guard<py::gil_scoped_release>())
        .def("assess_stressors", &fleetrisk::RiskEngine::assess_stressors)
        .def("compare_to_fleet",
             py::overload_cast<const fleetrisk::VehicleRiskResult&, std::uint32_t>(
                 &fleetrisk::RiskEngine::compare_to_fleet, py::const_),
             py::arg("result"), py::arg("fleet_size") = fleetrisk::kDefaultFleetSize);

    m.def("generate_dtc_sparklines", &fleetrisk::generate_dtc_sparklines, py::arg("vin"), py::arg("dtcs"),
          py::arg("seed") = 12345u);
    m.def("project_fleet_revenue", &fleetrisk::project_fleet_revenue, py::arg("vehicle_count"),
          py::arg("distribution"), py::arg("conversion_rate") = fleetrisk::kDefaultConversionRate);
    m.def("stressor_preset", &fleetrisk::stressor_preset, py::arg("name"));
    m.def("summarize_fleet",
          [](const std::vector<fleetrisk::VehicleRiskResult>& results) {
              return fleetrisk::to_json(fleetrisk::summarize_fleet(results));
          });
}
