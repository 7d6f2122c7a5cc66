#include "pixel_budget/core/config_loader.hpp"
#include "pixel_budget/core/max_size.hpp"
#include "pixel_budget/node/resize_calculator_node.hpp"
#include <iostream>
#include <iomanip>
#include <stdexcept>
#include <string>

using namespace pixel_budget;

/**
 * @brief Parse a strictly decimal integer argument
 */
int parse_int_argument(const std::string& name, const std::string& text) {
    size_t consumed = 0;
    int value = 0;
    try {
        value = std::stoi(text, &consumed);
    } catch (const std::logic_error&) {
        throw std::invalid_argument("Invalid integer for " + name + ": " + text);
    }
    if (consumed != text.size()) {
        throw std::invalid_argument("Invalid integer for " + name + ": " + text);
    }
    return value;
}

void print_usage(const char* program) {
    std::cerr << "Usage: " << program << " [config.ini]\n"
              << "       " << program << " <width> <height> <num_pixels>\n";
}

int main(int argc, char* argv[]) {
    std::string config_file = "config/resize_calculator.ini";

    if (argc != 1 && argc != 2 && argc != 4) {
        print_usage(argv[0]);
        return 1;
    }

    std::cout << "========================================\n";
    std::cout << "PixelBudget: Image Resize Calculator\n";
    std::cout << "========================================\n";

    try {
        CalculatorConfig config;

        if (argc == 4) {
            config.inputs.width = parse_int_argument("width", argv[1]);
            config.inputs.height = parse_int_argument("height", argv[2]);
            config.inputs.num_pixels = parse_int_argument("num_pixels", argv[3]);
        } else {
            if (argc == 2) {
                config_file = argv[1];
            }
            std::cout << "Loading configuration from: " << config_file << std::endl;
            config = load_calculator_config(config_file);
        }

        config.validate();
        apply_logging_config(config.logging);
        print_config_summary(std::cout, config);

        MaxSizeResult result = compute_max_size(
            config.inputs.width, config.inputs.height, config.inputs.num_pixels);

        std::cout << "\n--- Result ---" << std::endl;
        std::cout << "  width_max  = " << result.width_max << std::endl;
        std::cout << "  height_max = " << result.height_max << std::endl;
        std::cout << "  pixels     = " << result.pixel_count()
                  << " (limit " << config.inputs.num_pixels << ")" << std::endl;
        std::cout << "  ratio      = " << std::fixed << std::setprecision(4)
                  << static_cast<double>(config.inputs.width) / config.inputs.height
                  << " -> "
                  << static_cast<double>(result.width_max) / result.height_max << std::endl;
        std::cout << "  status     = " << size_status_to_string(result.status) << std::endl;
        std::cout << "  cache key  = " << ResizeCalculatorNode::cache_key(config.inputs) << std::endl;

        Logger::get().flush();
        return 0;

    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        return 1;
    }
}
