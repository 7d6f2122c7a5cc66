#pragma once
#include "pixel_budget/core/calculator_config.hpp"
#include <string>
#include <vector>

namespace pixel_budget {

/**
 * @brief Declared integer input of a host node
 */
struct IntInputSpec {
    std::string name;
    int default_value = 0;
    int min_value = 0;
    int max_value = 0;
    int step = 1;
    std::string tooltip;

    bool contains(int value) const { return value >= min_value && value <= max_value; }
};

struct OutputSpec {
    std::string name;
    std::string type = "INT";
};

/**
 * @brief Everything the node-graph host needs to list and invoke the node
 */
struct NodeDescriptor {
    std::string type_name;
    std::string display_name;
    std::string category;
    std::string function_name;
    std::vector<IntInputSpec> inputs;
    std::vector<OutputSpec> outputs;

    const IntInputSpec* find_input(const std::string& name) const;
    const OutputSpec* find_output(const std::string& name) const;
};

struct NodeOutputs {
    int width_max = 1;
    int height_max = 1;
};

/**
 * @brief Host-facing wrapper around compute_max_size()
 *
 * Stateless: every member is a pure function of its arguments.
 */
class ResizeCalculatorNode {
public:
    static const NodeDescriptor& describe();

    static NodeInputs default_inputs();

    // Identity for the host cache: "<width>_<height>_<num_pixels>"
    static std::string cache_key(int width, int height, int num_pixels);
    static std::string cache_key(const NodeInputs& inputs);

    // Names of inputs outside their declared range; empty when all fit.
    // Values are reported, not clamped.
    static std::vector<std::string> out_of_range_inputs(const NodeInputs& inputs);

    static NodeOutputs execute(const NodeInputs& inputs);
};

} // namespace pixel_budget
