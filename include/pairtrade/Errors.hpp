#pragma once
#include <stdexcept>
#include <string>

namespace pairtrade {

    // Invalid parameters, raised before any processing starts.
    class ConfigError : public std::invalid_argument {
    public:
        explicit ConfigError(const std::string& msg)
            : std::invalid_argument("Config error: " + msg) {}
    };

    // Unusable input data (too short, unreadable, misaligned).
    class DataError : public std::runtime_error {
    public:
        explicit DataError(const std::string& msg)
            : std::runtime_error("Data error: " + msg) {}
    };

} // namespace pairtrade
