#ifndef FLEETRISK_CONFIG_HPP
#define FLEETRISK_CONFIG_HPP

#include <cstdint>
#include <optional>
#include <string>

namespace fleetrisk {

struct LoggingConfig {
    std::string level = "INFO";
    bool json = true;
    std::optional<std::string> log_file = std::nullopt;
    int max_bytes = 1'000'000;
    int backup_count = 3;
};

struct BackendConfig {
    // "auto" tries the accelerated backend first, "portable" never does.
    std::string backend = "auto";
    int worker_threads = 0;
    int batch_chunk_size = 256;
    int inline_batch_limit = 1024;
    double equivalence_epsilon = 1.0;
};

struct WeatherDefaults {
    double temperature = 70.0;
    double humidity = 50.0;
    double precipitation = 0.0;
    double temp_variance = 15.0;
};

struct SynthesisConfig {
    std::uint32_t seed = 12345;
    std::uint32_t fleet_size = 2500;
};

struct RequestConfig {
    int current_year = 0;
    double default_health_score = 75.0;
};

struct EngineSettings {
    LoggingConfig logging{};
    BackendConfig engine{};
    WeatherDefaults weather{};
    SynthesisConfig synthesis{};
    RequestConfig request{};

    static EngineSettings from_toml(const std::string& path);
};

}  // namespace fleetrisk

#endif  // FLEETRISK_CONFIG_HPP
