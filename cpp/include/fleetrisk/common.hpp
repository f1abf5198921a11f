#ifndef FLEETRISK_COMMON_HPP
#define FLEETRISK_COMMON_HPP

#include <algorithm>
#include <cctype>
#include <chrono>
#include <cmath>
#include <cstdint>
#include <cstdio>
#include <limits>
#include <sstream>
#include <stdexcept>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace fleetrisk {

inline std::string ltrim(std::string value) {
    auto it = std::find_if_not(value.begin(), value.end(), [](unsigned char ch) {
        return std::isspace(ch) != 0;
    });
    value.erase(value.begin(), it);
    return value;
}

inline std::string rtrim(std::string value) {
    auto it = std::find_if_not(value.rbegin(), value.rend(), [](unsigned char ch) {
        return std::isspace(ch) != 0;
    });
    value.erase(it.base(), value.end());
    return value;
}

inline std::string trim(std::string value) {
    return rtrim(ltrim(std::move(value)));
}

inline std::vector<std::string> split(std::string_view value, char delimiter) {
    std::vector<std::string> parts;
    std::string current;
    for (char ch : value) {
        if (ch == delimiter) {
            parts.push_back(current);
            current.clear();
        } else {
            current.push_back(ch);
        }
    }
    parts.push_back(current);
    return parts;
}

inline std::string strip_quotes(std::string value) {
    if (value.size() >= 2 && ((value.front() == '"' && value.back() == '"') ||
                              (value.front() == '\'' && value.back() == '\''))) {
        value = value.substr(1, value.size() - 2);
    }
    return value;
}

// Strict number parse for boundary input: the whole token must be consumed and finite.
inline double parse_finite(const std::string& token, const std::string& field) {
    const std::string cleaned = trim(token);
    if (cleaned.empty()) {
        throw std::invalid_argument("missing numeric value for " + field);
    }
    size_t consumed = 0;
    double value = 0.0;
    try {
        value = std::stod(cleaned, &consumed);
    } catch (const std::exception&) {
        throw std::invalid_argument("invalid number for " + field + ": " + cleaned);
    }
    if (consumed != cleaned.size()) {
        throw std::invalid_argument("invalid number for " + field + ": " + cleaned);
    }
    if (!std::isfinite(value)) {
        throw std::invalid_argument("non-finite value for " + field);
    }
    return value;
}

// Decimal digits only; rejects signs and anything above UINT32_MAX instead of wrapping.
inline std::uint32_t parse_uint32(const std::string& token, const std::string& field) {
    const std::string cleaned = trim(token);
    if (cleaned.empty() || !std::all_of(cleaned.begin(), cleaned.end(), [](unsigned char ch) {
            return std::isdigit(ch) != 0;
        })) {
        throw std::invalid_argument("invalid unsigned integer for " + field + ": " + cleaned);
    }
    unsigned long long value = 0;
    try {
        value = std::stoull(cleaned);
    } catch (const std::out_of_range&) {
        throw std::invalid_argument(field + " out of range: " + cleaned);
    }
    if (value > std::numeric_limits<std::uint32_t>::max()) {
        throw std::invalid_argument(field + " out of range: " + cleaned);
    }
    return static_cast<std::uint32_t>(value);
}

inline std::string json_escape(std::string_view value) {
    std::string out;
    out.reserve(value.size());
    for (char ch : value) {
        switch (ch) {
            case '"':
                out += "\\\"";
                break;
            case '\\':
                out += "\\\\";
                break;
            case '\n':
                out += "\\n";
                break;
            case '\r':
                out += "\\r";
                break;
            case '\t':
                out += "\\t";
                break;
            default:
                if (static_cast<unsigned char>(ch) < 0x20) {
                    char buffer[8];
                    std::snprintf(buffer, sizeof(buffer), "\\u%04x", static_cast<unsigned>(ch));
                    out += buffer;
                } else {
                    out.push_back(ch);
                }
        }
    }
    return out;
}

inline double seconds_since_epoch() {
    using clock = std::chrono::system_clock;
    auto now = clock::now().time_since_epoch();
    return std::chrono::duration<double>(now).count();
}

}  // namespace fleetrisk

#endif  // FLEETRISK_COMMON_HPP
