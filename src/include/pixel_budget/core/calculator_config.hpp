#pragma once
#include "pixel_budget/utils/logger.hpp"
#include <string>
#include <stdexcept>

namespace pixel_budget {

/**
 * @brief Calculator inputs as supplied by the host or a config file
 */
struct NodeInputs {
    int width = 1024;
    int height = 1024;
    int num_pixels = 1048576;  // 1024 * 1024
};

/**
 * @brief Diagnostic output settings
 */
struct LoggingConfig {
    LogLevel level = LogLevel::INFO;
    bool colors = true;
};

/**
 * @brief Complete driver configuration
 *
 * INI layout:
 * ```
 * [inputs]
 * width = 1920
 * height = 1080
 * num_pixels = 1048576
 *
 * [logging]
 * level = INFO
 * colors = false
 * ```
 */
struct CalculatorConfig {
    NodeInputs inputs;
    LoggingConfig logging;

    void validate() const;
};

/**
 * @brief Validate configuration parameters
 *
 * Config files are checked strictly; the calculator itself tolerates
 * anything the host sends.
 */
inline void CalculatorConfig::validate() const {
    if (inputs.width <= 0) {
        throw std::invalid_argument("CalculatorConfig: inputs.width must be positive");
    }
    if (inputs.height <= 0) {
        throw std::invalid_argument("CalculatorConfig: inputs.height must be positive");
    }
    if (inputs.num_pixels <= 0) {
        throw std::invalid_argument("CalculatorConfig: inputs.num_pixels must be positive");
    }
}

inline void apply_logging_config(const LoggingConfig& config) {
    Logger& log = Logger::get();
    log.set_level(config.level);
    log.set_colors(config.colors);
}

} // namespace pixel_budget
