#include "pixel_budget/validation/validation_report.hpp"
#include <iostream>
#include <iomanip>
#include <sstream>

namespace pixel_budget {

std::vector<ReferenceScenario> reference_scenarios() {
    return {
        {"landscape 16:9", 1920, 1080, 1048576, 0.02},
        {"landscape 4:3", 1024, 768, 500000, 0.02},
        {"square", 512, 512, 200000, 0.0},
        {"already fits", 800, 600, 1000000, 0.0},
        {"portrait 9:16", 1080, 1920, 1048576, 0.02},
        {"max square", 65536, 65536, 16777216, 0.0},
        // Only one row fits, so the ratio cannot be kept
        {"extreme strip", 65536, 1, 1000, 1.0},
        {"invalid width", 0, 100, 1000, 0.0},
    };
}

ScenarioOutcome run_scenario(const ReferenceScenario& scenario) {
    ScenarioOutcome outcome{};
    outcome.scenario = scenario;
    outcome.result = compute_max_size(scenario.width, scenario.height, scenario.num_pixels);
    outcome.check = check_max_size(scenario.width, scenario.height, scenario.num_pixels,
                                   outcome.result);
    outcome.pass = outcome.check.pass &&
                   outcome.check.ratio_error <= scenario.max_ratio_error;
    return outcome;
}

SizeValidationResults run_size_validation(const std::vector<ReferenceScenario>& scenarios) {
    SizeValidationResults results;
    results.overall_pass = true;
    for (const auto& scenario : scenarios) {
        ScenarioOutcome outcome = run_scenario(scenario);
        results.overall_pass = results.overall_pass && outcome.pass;
        results.outcomes.push_back(outcome);
    }
    return results;
}

SizeValidationResults run_size_validation() {
    return run_size_validation(reference_scenarios());
}

void generate_size_report(std::ostream& os, const SizeValidationResults& results) {
    os << "=================================================================================\n";
    os << "                        SIZE CALCULATOR VALIDATION REPORT                        \n";
    os << "=================================================================================\n\n";

    os << "SCENARIOS\n";
    os << "---------\n";
    os << std::left << std::setw(18) << "Scenario" << std::right
       << std::setw(14) << "Input"
       << std::setw(10) << "Budget"
       << std::setw(14) << "Result"
       << std::setw(10) << "Pixels"
       << std::setw(12) << "Ratio err"
       << std::setw(8) << "Pass" << "\n";
    os << std::string(86, '-') << "\n";

    for (const auto& outcome : results.outcomes) {
        const ReferenceScenario& s = outcome.scenario;
        std::ostringstream input;
        input << s.width << "x" << s.height;
        std::ostringstream size;
        size << outcome.result.width_max << "x" << outcome.result.height_max;

        os << std::left << std::setw(18) << s.name << std::right
           << std::setw(14) << input.str()
           << std::setw(10) << s.num_pixels
           << std::setw(14) << size.str()
           << std::setw(10) << outcome.result.pixel_count()
           << std::setw(11) << std::fixed << std::setprecision(3)
           << outcome.check.ratio_error * 100.0 << "%"
           << std::setw(8) << (outcome.pass ? "YES" : "NO") << "\n";
    }
    os << "\n";

    os << "PROPERTY CHECKS\n";
    os << "---------------\n";
    for (const auto& outcome : results.outcomes) {
        const SizePropertyCheck& c = outcome.check;
        os << std::left << std::setw(18) << outcome.scenario.name << std::right
           << " budget=" << (c.within_budget ? "ok" : "FAIL")
           << " positive=" << (c.positive ? "ok" : "FAIL")
           << " unchanged=" << (c.unchanged_when_fits ? "ok" : "FAIL")
           << " local_max=" << (c.locally_maximal ? "ok" : "FAIL")
           << " status=" << size_status_to_string(outcome.result.status)
           << " steps=" << outcome.result.refine_steps
           << (outcome.result.converged ? "" : " (ceiling)") << "\n";
    }
    os << "\n";

    os << "=================================================================================\n";
    os << "OVERALL RESULT: " << (results.overall_pass ? "PASS\n" : "FAIL\n");
    os << "=================================================================================\n";
}

} // namespace pixel_budget
