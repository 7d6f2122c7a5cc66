#include "pixel_budget/node/resize_calculator_node.hpp"
#include "pixel_budget/core/max_size.hpp"
#include "pixel_budget/utils/logger.hpp"
#include <utility>

namespace pixel_budget {

namespace {

NodeDescriptor make_descriptor() {
    NodeDescriptor desc;
    desc.type_name = "ImageResizeCalculator";
    desc.display_name = "Image Resize Calculator";
    desc.category = "AutoFlow/Image";
    desc.function_name = "calculate_max_size";
    desc.inputs = {
        {"width", 1024, 1, 65536, 1, "Original image width"},
        {"height", 1024, 1, 65536, 1, "Original image height"},
        {"num_pixels", 1048576, 1, 16777216, 1,
         "Target maximum total pixels (width_max * height_max <= num_pixels)"},
    };
    desc.outputs = {
        {"width_max", "INT"},
        {"height_max", "INT"},
    };
    return desc;
}

}  // namespace

const IntInputSpec* NodeDescriptor::find_input(const std::string& name) const {
    for (const auto& input : inputs) {
        if (input.name == name) {
            return &input;
        }
    }
    return nullptr;
}

const OutputSpec* NodeDescriptor::find_output(const std::string& name) const {
    for (const auto& output : outputs) {
        if (output.name == name) {
            return &output;
        }
    }
    return nullptr;
}

const NodeDescriptor& ResizeCalculatorNode::describe() {
    static const NodeDescriptor descriptor = make_descriptor();
    return descriptor;
}

NodeInputs ResizeCalculatorNode::default_inputs() {
    const NodeDescriptor& desc = describe();
    NodeInputs inputs;
    inputs.width = desc.find_input("width")->default_value;
    inputs.height = desc.find_input("height")->default_value;
    inputs.num_pixels = desc.find_input("num_pixels")->default_value;
    return inputs;
}

std::string ResizeCalculatorNode::cache_key(int width, int height, int num_pixels) {
    return std::to_string(width) + "_" + std::to_string(height) + "_" + std::to_string(num_pixels);
}

std::string ResizeCalculatorNode::cache_key(const NodeInputs& inputs) {
    return cache_key(inputs.width, inputs.height, inputs.num_pixels);
}

std::vector<std::string> ResizeCalculatorNode::out_of_range_inputs(const NodeInputs& inputs) {
    const NodeDescriptor& desc = describe();
    const std::pair<const char*, int> values[] = {
        {"width", inputs.width},
        {"height", inputs.height},
        {"num_pixels", inputs.num_pixels},
    };

    std::vector<std::string> names;
    for (const auto& entry : values) {
        const IntInputSpec* spec = desc.find_input(entry.first);
        if (spec != nullptr && !spec->contains(entry.second)) {
            names.push_back(spec->name);
        }
    }
    return names;
}

NodeOutputs ResizeCalculatorNode::execute(const NodeInputs& inputs) {
    const std::vector<std::string> outside = out_of_range_inputs(inputs);
    for (const auto& name : outside) {
        Logger::get().warn("[ImageResizeCalculator] Input '%s' outside declared range", name.c_str());
    }

    MaxSizeResult result = compute_max_size(inputs.width, inputs.height, inputs.num_pixels);

    NodeOutputs outputs;
    outputs.width_max = result.width_max;
    outputs.height_max = result.height_max;
    return outputs;
}

} // namespace pixel_budget
