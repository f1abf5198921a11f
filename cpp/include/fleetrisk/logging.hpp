#ifndef FLEETRISK_LOGGING_HPP
#define FLEETRISK_LOGGING_HPP

#include <map>
#include <string>

#include "fleetrisk/config.hpp"

namespace fleetrisk {

enum class LogLevel {
    kDebug,
    kInfo,
    kWarn,
    kError,
};

using LogFields = std::map<std::string, std::string>;

class Logger {
public:
    explicit Logger(std::string name);

    const std::string& name() const;
    bool enabled(LogLevel level) const;

    void log(LogLevel level, const std::string& message, const LogFields& extra = {}) const;

    void debug(const std::string& message, const LogFields& extra = {}) const;
    void info(const std::string& message, const LogFields& extra = {}) const;
    void warn(const std::string& message, const LogFields& extra = {}) const;
    void error(const std::string& message, const LogFields& extra = {}) const;

private:
    std::string name_;
};

LogLevel parse_log_level(const std::string& level);
void configure_logging(const LoggingConfig& config);
Logger get_logger(const std::string& name);

}  // namespace fleetrisk

#endif  // FLEETRISK_LOGGING_HPP
