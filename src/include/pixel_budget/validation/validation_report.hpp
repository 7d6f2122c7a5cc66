#pragma once
#include "pixel_budget/core/max_size.hpp"
#include "pixel_budget/validation/size_properties.hpp"
#include <iosfwd>
#include <string>
#include <vector>

namespace pixel_budget {

struct ReferenceScenario {
    std::string name;
    int width;
    int height;
    int num_pixels;
    double max_ratio_error;
};

struct ScenarioOutcome {
    ReferenceScenario scenario;
    MaxSizeResult result;
    SizePropertyCheck check;
    bool pass;
};

struct SizeValidationResults {
    std::vector<ScenarioOutcome> outcomes;
    bool overall_pass;
};

std::vector<ReferenceScenario> reference_scenarios();
ScenarioOutcome run_scenario(const ReferenceScenario& scenario);
SizeValidationResults run_size_validation();
SizeValidationResults run_size_validation(const std::vector<ReferenceScenario>& scenarios);
void generate_size_report(std::ostream& os, const SizeValidationResults& results);

} // namespace pixel_budget
