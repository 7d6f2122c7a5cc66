#pragma once
#include "pixel_budget/core/size_status.hpp"
#include <cstdint>

namespace pixel_budget {

// Safety bound on the greedy refinement pass
constexpr int kMaxRefineIterations = 100;

struct MaxSizeResult {
    int width_max = 1;
    int height_max = 1;
    SizeStatus status = SizeStatus::OK;
    int refine_steps = 0;      // committed single-unit increments
    bool converged = true;     // false when the iteration ceiling stopped refinement

    bool ok() const { return status == SizeStatus::OK; }
    int64_t pixel_count() const {
        return static_cast<int64_t>(width_max) * static_cast<int64_t>(height_max);
    }
};

// ============================================================================
// Aspect-preserving maximum size under a pixel budget
// ============================================================================
// Returns the largest integer (w, h) with w * h <= num_pixels whose ratio
// follows width / height as closely as floor rounding allows.
//
// 1. Inputs that already fit are returned unchanged.
// 2. Closed form: h = floor(sqrt(num_pixels / ratio)), w = floor(ratio * h).
// 3. Correction: shrink the larger side until the product fits.
// 4. Refinement: greedy unit increments (height first) while within budget,
//    at most kMaxRefineIterations passes.
//
// The result is locally maximal (no unit increment of either side, with the
// other side recomputed from the ratio, stays within budget), not globally
// optimal over all integer pairs.
//
// Non-positive inputs yield (1, 1) with SizeStatus::INVALID_INPUT and an
// ERROR log line. Never throws.
MaxSizeResult compute_max_size(int width, int height, int num_pixels);

} // namespace pixel_budget
