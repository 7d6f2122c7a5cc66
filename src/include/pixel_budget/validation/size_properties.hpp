#pragma once
#include "pixel_budget/core/max_size.hpp"

namespace pixel_budget {

struct SizePropertyCheck {
    bool within_budget;        // w * h <= num_pixels (or 1x1 for invalid input)
    bool positive;             // w >= 1 and h >= 1
    bool unchanged_when_fits;  // inputs that fit come back as-is
    bool locally_maximal;      // only checked when refinement converged
    double ratio_error;        // |w/h - width/height| / (width/height)
    bool pass;
};

double aspect_ratio_error(int width, int height, int w, int h);

// Neither refinement candidate (h+1 with floor width, w+1 with floor height)
// is positive and within budget.
bool is_locally_maximal(int width, int height, int num_pixels, int w, int h);

SizePropertyCheck check_max_size(int width, int height, int num_pixels, const MaxSizeResult& result);

} // namespace pixel_budget
