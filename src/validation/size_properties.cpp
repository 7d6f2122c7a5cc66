#include "pixel_budget/validation/size_properties.hpp"
#include <cmath>
#include <cstdint>

namespace pixel_budget {

double aspect_ratio_error(int width, int height, int w, int h) {
    if (width <= 0 || height <= 0 || w <= 0 || h <= 0) {
        return 0.0;
    }
    double original = static_cast<double>(width) / height;
    double actual = static_cast<double>(w) / h;
    return std::abs(actual - original) / original;
}

bool is_locally_maximal(int width, int height, int num_pixels, int w, int h) {
    const double aspect_ratio = static_cast<double>(width) / height;
    const int64_t budget = num_pixels;

    int64_t test_h = static_cast<int64_t>(h) + 1;
    int64_t test_w = static_cast<int64_t>(std::floor(aspect_ratio * test_h));
    if (test_w >= 1 && test_w * test_h <= budget) {
        return false;
    }

    test_w = static_cast<int64_t>(w) + 1;
    test_h = static_cast<int64_t>(std::floor(test_w / aspect_ratio));
    if (test_h >= 1 && test_w * test_h <= budget) {
        return false;
    }
    return true;
}

SizePropertyCheck check_max_size(int width, int height, int num_pixels, const MaxSizeResult& result) {
    SizePropertyCheck check{};
    const int w = result.width_max;
    const int h = result.height_max;
    const bool valid_input = width > 0 && height > 0 && num_pixels > 0;

    check.positive = w >= 1 && h >= 1;

    if (valid_input) {
        check.within_budget = result.pixel_count() <= num_pixels;
    } else {
        check.within_budget = (w == 1 && h == 1);
    }

    const bool fits = valid_input &&
        static_cast<int64_t>(width) * height <= num_pixels;
    check.unchanged_when_fits = !fits || (w == width && h == height);

    if (valid_input && !fits && result.converged && result.ok()) {
        check.locally_maximal = is_locally_maximal(width, height, num_pixels, w, h);
    } else {
        check.locally_maximal = true;
    }

    check.ratio_error = valid_input ? aspect_ratio_error(width, height, w, h) : 0.0;

    check.pass = check.within_budget && check.positive &&
                 check.unchanged_when_fits && check.locally_maximal;
    return check;
}

} // namespace pixel_budget
