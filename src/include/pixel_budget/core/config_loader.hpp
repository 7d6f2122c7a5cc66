#pragma once
#include "pixel_budget/core/calculator_config.hpp"
#include <string>
#include <unordered_map>
#include <fstream>
#include <ostream>
#include <algorithm>
#include <stdexcept>
#include <cctype>

namespace pixel_budget {

/**
 * @brief Configuration section holding key-value pairs
 */
struct ConfigSection {
    std::unordered_map<std::string, std::string> values;

    std::string get(const std::string& key, const std::string& default_val = "") const {
        auto it = values.find(key);
        return (it != values.end()) ? it->second : default_val;
    }

    int get_int(const std::string& key, int default_val = 0) const {
        auto it = values.find(key);
        if (it != values.end()) {
            try {
                return std::stoi(it->second);
            } catch (const std::logic_error&) {
                return default_val;
            }
        }
        return default_val;
    }

    bool get_bool(const std::string& key, bool default_val = false) const {
        auto it = values.find(key);
        if (it != values.end()) {
            std::string val = it->second;
            std::transform(val.begin(), val.end(), val.begin(),
                           [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
            return (val == "true" || val == "1" || val == "yes" || val == "on");
        }
        return default_val;
    }

    bool has(const std::string& key) const {
        return values.find(key) != values.end();
    }
};

/**
 * @brief Simple key-value configuration file parser
 *
 * INI-style: `[section]` headers, `key = value` lines, `#` or `;` comments,
 * optional single or double quotes around values. Keys before the first
 * header land in section "default".
 */
class ConfigLoader {
public:
    std::unordered_map<std::string, ConfigSection> sections;

    bool load(const std::string& filename) {
        std::ifstream file(filename);
        if (!file.is_open()) {
            return false;
        }

        sections.clear();
        std::string current_section = "default";

        std::string line;
        while (std::getline(file, line)) {
            line = trim(line);

            if (line.empty() || line[0] == '#' || line[0] == ';') {
                continue;
            }

            if (line[0] == '[' && line.back() == ']') {
                current_section = trim(line.substr(1, line.length() - 2));
                continue;
            }

            size_t pos = line.find('=');
            if (pos != std::string::npos) {
                std::string key = trim(line.substr(0, pos));
                std::string value = trim(line.substr(pos + 1));

                if (value.size() >= 2 &&
                    ((value.front() == '"' && value.back() == '"') ||
                     (value.front() == '\'' && value.back() == '\''))) {
                    value = value.substr(1, value.length() - 2);
                }

                sections[current_section].values[key] = value;
            }
        }

        return true;
    }

    ConfigSection get_section(const std::string& name) const {
        auto it = sections.find(name);
        if (it != sections.end()) {
            return it->second;
        }
        return ConfigSection{};
    }

    bool has_section(const std::string& name) const {
        return sections.find(name) != sections.end();
    }

private:
    static std::string trim(const std::string& str) {
        size_t start = 0;
        while (start < str.length() && std::isspace(static_cast<unsigned char>(str[start]))) {
            ++start;
        }
        if (start == str.length()) {
            return "";
        }

        size_t end = str.length() - 1;
        while (end > start && std::isspace(static_cast<unsigned char>(str[end]))) {
            --end;
        }

        return str.substr(start, end - start + 1);
    }
};

/**
 * @brief Load CalculatorConfig from file
 *
 * Missing keys keep their defaults. Throws std::runtime_error if the file
 * cannot be opened; range checks are left to CalculatorConfig::validate().
 */
inline CalculatorConfig load_calculator_config(const std::string& filename) {
    ConfigLoader loader;
    if (!loader.load(filename)) {
        throw std::runtime_error("Failed to load configuration file: " + filename);
    }

    CalculatorConfig config;

    // [inputs] section
    ConfigSection inputs_sec = loader.get_section("inputs");
    config.inputs.width = inputs_sec.get_int("width", config.inputs.width);
    config.inputs.height = inputs_sec.get_int("height", config.inputs.height);
    config.inputs.num_pixels = inputs_sec.get_int("num_pixels", config.inputs.num_pixels);

    // [logging] section
    ConfigSection logging_sec = loader.get_section("logging");
    if (logging_sec.has("level")) {
        std::string level = logging_sec.get("level");
        std::transform(level.begin(), level.end(), level.begin(),
                       [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
        config.logging.level = string_to_log_level(level, config.logging.level);
    }
    config.logging.colors = logging_sec.get_bool("colors", config.logging.colors);

    return config;
}

/**
 * @brief Save CalculatorConfig to file
 */
inline bool save_calculator_config(const std::string& filename, const CalculatorConfig& config) {
    std::ofstream file(filename);
    if (!file.is_open()) {
        return false;
    }

    file << "# Image Resize Calculator Configuration\n\n";

    file << "[inputs]\n";
    file << "width = " << config.inputs.width << "\n";
    file << "height = " << config.inputs.height << "\n";
    file << "num_pixels = " << config.inputs.num_pixels << "\n\n";

    file << "[logging]\n";
    file << "level = " << log_level_to_string(config.logging.level) << "\n";
    file << "colors = " << (config.logging.colors ? "true" : "false") << "\n";

    return true;
}

inline void print_config_summary(std::ostream& os, const CalculatorConfig& config) {
    os << "=== Image Resize Calculator Configuration ===\n";
    os << "Original Size: " << config.inputs.width << " x " << config.inputs.height << "\n";
    os << "Pixel Budget: " << config.inputs.num_pixels << "\n";
    os << "Log Level: " << log_level_to_string(config.logging.level)
       << " (colors " << (config.logging.colors ? "on" : "off") << ")\n";
    os << "=============================================\n";
}

} // namespace pixel_budget
