#pragma once
#include <string>

namespace pixel_budget {

/**
 * @brief Outcome of a size calculation
 *
 * Failures never propagate as exceptions; the calculator falls back to a
 * 1x1 result and reports the kind here.
 */
enum class SizeStatus {
    OK,
    INVALID_INPUT,     // width, height or num_pixels <= 0
    NUMERIC_ANOMALY    // non-finite intermediate in the closed-form step
};

inline std::string size_status_to_string(SizeStatus status) {
    switch (status) {
        case SizeStatus::OK:              return "ok";
        case SizeStatus::INVALID_INPUT:   return "invalid_input";
        case SizeStatus::NUMERIC_ANOMALY: return "numeric_anomaly";
        default:                          return "unknown";
    }
}

} // namespace pixel_budget
