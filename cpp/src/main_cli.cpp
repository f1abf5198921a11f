#include "fleetrisk/common.hpp"
#include "fleetrisk/config.hpp"
#include "fleetrisk/engine.hpp"
#include "fleetrisk/fleet.hpp"
#include "fleetrisk/logging.hpp"
#include "fleetrisk/report.hpp"
#include "fleetrisk/request.hpp"
#include "fleetrisk/synthesis.hpp"

#include <chrono>
#include <cstdint>
#include <cstdlib>
#include <fstream>
#include <iostream>
#include <stdexcept>
#include <utility>
#include <string>
#include <vector>

namespace {

void print_usage(const char* argv0) {
    std::cerr << "Usage: " << argv0
              << " --config <path> (--input <fleet.csv> | --preset <name>) [--sparklines] [--fleet-size <n>]\n";
}

struct PendingRow {
    std::size_t line = 0;
    std::string vin;
    std::string error;
    bool accepted = false;
};

int run_fleet(fleetrisk::RiskEngine& engine, const std::string& input_path, bool sparklines,
              std::uint32_t fleet_size) {
    std::ifstream input(input_path);
    if (!input) {
        throw std::runtime_error("Unable to open fleet file: " + input_path);
    }

    const auto& settings = engine.settings();
    const int current_year =
        settings.request.current_year > 0 ? settings.request.current_year : fleetrisk::current_calendar_year();
    auto logger = fleetrisk::get_logger("fleetrisk");

    const auto read_started = std::chrono::steady_clock::now();
    std::vector<PendingRow> rows;
    std::vector<fleetrisk::VehicleRiskInput> accepted;
    std::string line;
    std::size_t line_number = 0;
    while (std::getline(input, line)) {
        ++line_number;
        if (fleetrisk::trim(line).empty() || (line_number == 1 && fleetrisk::is_csv_header(line))) {
            continue;
        }
        PendingRow row;
        row.line = line_number;
        try {
            auto request = fleetrisk::parse_fleet_csv_line(line);
            row.vin = request.vin;
            accepted.push_back(
                fleetrisk::to_risk_input(request, current_year, settings.request.default_health_score));
            row.accepted = true;
        } catch (const std::invalid_argument& exc) {
            row.error = exc.what();
            logger.warn("request_rejected", {{"line", std::to_string(line_number)}, {"error", row.error}});
        }
        rows.push_back(std::move(row));
    }

    const auto started = std::chrono::steady_clock::now();
    const auto results = engine.score_fleet(accepted);
    const auto finished = std::chrono::steady_clock::now();

    // Batch timings are reported per vehicle.
    fleetrisk::ResponseTiming timing;
    if (!results.empty()) {
        const double count = static_cast<double>(results.size());
        timing.total = std::chrono::duration<double, std::milli>(finished - read_started).count() / count;
        timing.calculation = std::chrono::duration<double, std::milli>(finished - started).count() / count;
    }

    std::size_t next = 0;
    for (const auto& row : rows) {
        if (!row.accepted) {
            std::cout << fleetrisk::to_json(fleetrisk::failure_response(
                             "line " + std::to_string(row.line) + ": " + row.error, engine.engine_name()))
                      << "\n";
            continue;
        }
        auto response = fleetrisk::success_response(results[next], engine.engine_name(), timing);
        response.comparison = engine.compare_to_fleet(results[next], fleet_size);
        if (sparklines) {
            response.sparklines =
                fleetrisk::generate_dtc_sparklines(results[next].vin, accepted[next].dtcs, settings.synthesis.seed);
        }
        std::cout << fleetrisk::to_json(response) << "\n";
        ++next;
    }

    std::cout << "{\"summary\":" << fleetrisk::to_json(fleetrisk::summarize_fleet(results)) << "}\n";
    return 0;
}

int run_preset(const fleetrisk::RiskEngine& engine, const std::string& name) {
    auto preset = fleetrisk::stressor_preset(name);
    if (!preset) {
        std::string known;
        for (const auto& candidate : fleetrisk::stressor_preset_names()) {
            known += (known.empty() ? "" : ", ") + candidate;
        }
        throw std::invalid_argument("Unknown stressor preset '" + name + "' (known: " + known + ")");
    }
    std::cout << fleetrisk::to_json(engine.assess_stressors(*preset)) << "\n";
    return 0;
}

}  // namespace

int main(int argc, char** argv) {
    std::string config_path;
    std::string input_path;
    std::string preset;
    bool sparklines = false;
    std::uint32_t fleet_size = 0;

    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg == "--config" || arg == "--input" || arg == "--preset" || arg == "--fleet-size") {
            if (i + 1 >= argc) {
                print_usage(argv[0]);
                return 1;
            }
            std::string value = argv[++i];
            if (arg == "--config") {
                config_path = value;
            } else if (arg == "--input") {
                input_path = value;
            } else if (arg == "--preset") {
                preset = value;
            } else {
                try {
                    fleet_size = fleetrisk::parse_uint32(value, "--fleet-size");
                } catch (const std::invalid_argument& exc) {
                    std::cerr << exc.what() << "\n";
                    fleet_size = 0;
                }
                if (fleet_size == 0) {
                    print_usage(argv[0]);
                    return 1;
                }
            }
        } else if (arg == "--sparklines") {
            sparklines = true;
        } else {
            print_usage(argv[0]);
            return 1;
        }
    }

    if (config_path.empty() || input_path.empty() == preset.empty()) {
        print_usage(argv[0]);
        return 1;
    }

    try {
        auto settings = fleetrisk::EngineSettings::from_toml(config_path);
        fleetrisk::configure_logging(settings.logging);
        fleetrisk::RiskEngine engine(settings);
        engine.init_backend();

        if (!preset.empty()) {
            return run_preset(engine, preset);
        }
        const auto size = fleet_size > 0 ? fleet_size : settings.synthesis.fleet_size;
        return run_fleet(engine, input_path, sparklines, size);
    } catch (const std::exception& exc) {
        std::cerr << "fleetrisk error: " << exc.what() << "\n";
        return 1;
    }
}
