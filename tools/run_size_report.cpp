#include "pixel_budget/validation/validation_report.hpp"
#include "pixel_budget/utils/logger.hpp"
#include <iostream>

using namespace pixel_budget;

int main() {
    // Per-call INFO lines would drown the report
    Logger::get().set_level(LogLevel::WARN);

    SizeValidationResults results = run_size_validation();
    generate_size_report(std::cout, results);

    return results.overall_pass ? 0 : 1;
}
