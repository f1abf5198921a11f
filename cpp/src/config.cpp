#include "fleetrisk/config.hpp"

#include <fstream>
#include <stdexcept>
#include <string>

#include "fleetrisk/common.hpp"

namespace fleetrisk {

namespace {

bool parse_bool(const std::string& value) {
    if (value == "true") {
        return true;
    }
    if (value == "false") {
        return false;
    }
    throw std::runtime_error("invalid boolean: " + value);
}

std::optional<std::string> parse_optional_string(const std::string& value) {
    auto stripped = strip_quotes(trim(value));
    if (stripped == "null" || stripped == "none") {
        return std::nullopt;
    }
    return stripped;
}

std::uint32_t parse_unsigned(const std::string& value, const std::string& key) {
    try {
        return parse_uint32(value, key);
    } catch (const std::invalid_argument& exc) {
        throw std::runtime_error(exc.what());
    }
}

void apply_logging(LoggingConfig& logging, const std::string& key, const std::string& value) {
    if (key == "level") {
        logging.level = strip_quotes(value);
    } else if (key == "json") {
        logging.json = parse_bool(value);
    } else if (key == "log_file") {
        logging.log_file = parse_optional_string(value);
    } else if (key == "max_bytes") {
        logging.max_bytes = std::stoi(value);
    } else if (key == "backup_count") {
        logging.backup_count = std::stoi(value);
    }
}

void apply_engine(BackendConfig& engine, const std::string& key, const std::string& value) {
    if (key == "backend") {
        const auto mode = strip_quotes(value);
        if (mode != "auto" && mode != "accelerated" && mode != "portable") {
            throw std::runtime_error("engine.backend must be auto, accelerated or portable: " + mode);
        }
        engine.backend = mode;
    } else if (key == "worker_threads") {
        engine.worker_threads = std::stoi(value);
    } else if (key == "batch_chunk_size") {
        engine.batch_chunk_size = std::stoi(value);
        if (engine.batch_chunk_size <= 0) {
            throw std::runtime_error("engine.batch_chunk_size must be positive");
        }
    } else if (key == "inline_batch_limit") {
        engine.inline_batch_limit = std::stoi(value);
    } else if (key == "equivalence_epsilon") {
        engine.equivalence_epsilon = std::stod(value);
    }
}

void apply_weather(WeatherDefaults& weather, const std::string& key, const std::string& value) {
    if (key == "temperature") {
        weather.temperature = std::stod(value);
    } else if (key == "humidity") {
        weather.humidity = std::stod(value);
    } else if (key == "precipitation") {
        weather.precipitation = std::stod(value);
    } else if (key == "temp_variance") {
        weather.temp_variance = std::stod(value);
    }
}

}  // namespace

EngineSettings EngineSettings::from_toml(const std::string& path) {
    std::ifstream file(path);
    if (!file) {
        throw std::runtime_error("unable to open config file: " + path);
    }

    EngineSettings settings;
    std::string current_section;
    std::string line;

    while (std::getline(file, line)) {
        auto hash_pos = line.find('#');
        if (hash_pos != std::string::npos) {
            line = line.substr(0, hash_pos);
        }
        line = trim(line);
        if (line.empty()) {
            continue;
        }
        if (line.front() == '[' && line.back() == ']') {
            current_section = trim(line.substr(1, line.size() - 2));
            continue;
        }
        auto eq_pos = line.find('=');
        if (eq_pos == std::string::npos) {
            continue;
        }
        auto key = trim(line.substr(0, eq_pos));
        auto value = trim(line.substr(eq_pos + 1));

        if (current_section == "logging") {
            apply_logging(settings.logging, key, value);
        } else if (current_section == "engine") {
            apply_engine(settings.engine, key, value);
        } else if (current_section == "weather") {
            apply_weather(settings.weather, key, value);
        } else if (current_section == "synthesis") {
            if (key == "seed") {
                settings.synthesis.seed = parse_unsigned(value, "synthesis.seed");
            } else if (key == "fleet_size") {
                settings.synthesis.fleet_size = parse_unsigned(value, "synthesis.fleet_size");
            }
        } else if (current_section == "request") {
            if (key == "current_year") {
                settings.request.current_year = std::stoi(value);
            } else if (key == "default_health_score") {
                settings.request.default_health_score = std::stod(value);
            }
        }
    }

    return settings;
}

}  // namespace fleetrisk
