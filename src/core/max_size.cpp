#include "pixel_budget/core/max_size.hpp"
#include "pixel_budget/utils/logger.hpp"
#include <algorithm>
#include <cmath>
#include <cstdint>

namespace pixel_budget {

namespace {

int64_t floor_to_int(double value) {
    return static_cast<int64_t>(std::floor(value));
}

MaxSizeResult fallback_result(SizeStatus status) {
    MaxSizeResult result;
    result.width_max = 1;
    result.height_max = 1;
    result.status = status;
    return result;
}

}  // namespace

MaxSizeResult compute_max_size(int width, int height, int num_pixels) {
    Logger& log = Logger::get();

    if (width <= 0 || height <= 0 || num_pixels <= 0) {
        log.error("[ImageResizeCalculator] Invalid input: width=%d, height=%d, num_pixels=%d",
                  width, height, num_pixels);
        return fallback_result(SizeStatus::INVALID_INPUT);
    }

    const int64_t budget = num_pixels;
    const int64_t original_pixels = static_cast<int64_t>(width) * height;

    if (original_pixels <= budget) {
        log.info("[ImageResizeCalculator] Original size fits: %dx%d <= %d pixels",
                 width, height, num_pixels);
        MaxSizeResult result;
        result.width_max = width;
        result.height_max = height;
        return result;
    }

    const double aspect_ratio = static_cast<double>(width) / static_cast<double>(height);

    // aspect * h^2 <= num_pixels  =>  h <= sqrt(num_pixels / aspect)
    const double h_theory = std::sqrt(static_cast<double>(budget) / aspect_ratio);
    if (!std::isfinite(aspect_ratio) || !std::isfinite(h_theory)) {
        log.error("[ImageResizeCalculator] Numeric anomaly: width=%d, height=%d, num_pixels=%d",
                  width, height, num_pixels);
        return fallback_result(SizeStatus::NUMERIC_ANOMALY);
    }

    int64_t h = std::max<int64_t>(1, floor_to_int(h_theory));
    int64_t w = std::max<int64_t>(1, floor_to_int(aspect_ratio * static_cast<double>(h)));

    // Floor on both axes can still overshoot the budget
    while (w * h > budget && (w > 1 || h > 1)) {
        if (w > h) {
            // Same stopping point as decrementing w one unit at a time
            w = std::max(h, budget / h);
        } else {
            --h;
            w = std::max<int64_t>(1, floor_to_int(aspect_ratio * static_cast<double>(h)));
        }
    }

    int refine_steps = 0;
    bool improved = true;
    int iteration = 0;

    while (improved && iteration < kMaxRefineIterations) {
        improved = false;
        ++iteration;

        int64_t test_h = h + 1;
        int64_t test_w = floor_to_int(aspect_ratio * static_cast<double>(test_h));
        if (test_w >= 1 && test_w * test_h <= budget) {
            h = test_h;
            w = test_w;
            improved = true;
            ++refine_steps;
            continue;
        }

        test_w = w + 1;
        test_h = floor_to_int(static_cast<double>(test_w) / aspect_ratio);
        if (test_h >= 1 && test_w * test_h <= budget) {
            w = test_w;
            h = test_h;
            improved = true;
            ++refine_steps;
        }
    }

    if (w <= 0) {
        w = 1;
    }
    if (h <= 0) {
        h = 1;
    }

    MaxSizeResult result;
    result.width_max = static_cast<int>(w);
    result.height_max = static_cast<int>(h);
    result.refine_steps = refine_steps;
    result.converged = !improved;

    if (!result.converged) {
        log.warn("[ImageResizeCalculator] Refinement stopped after %d iterations at %dx%d",
                 kMaxRefineIterations, result.width_max, result.height_max);
    }

    log.info("[ImageResizeCalculator] Calculated size: %dx%d = %lld pixels (limit: %d)",
             result.width_max, result.height_max,
             static_cast<long long>(result.pixel_count()), num_pixels);
    log.debug("   Original: %dx%d = %lld pixels", width, height,
              static_cast<long long>(original_pixels));
    log.debug("   Aspect ratio preserved: %.4f -> %.4f", aspect_ratio,
              static_cast<double>(w) / static_cast<double>(h));

    return result;
}

} // namespace pixel_budget
