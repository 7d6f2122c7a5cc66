#include <gtest/gtest.h>
#include "pixel_budget/core/config_loader.hpp"
#include <fstream>
#include <filesystem>
#include <sstream>

namespace fs = std::filesystem;

TEST(CalculatorConfigTest, DefaultConfigIsValid) {
    pixel_budget::CalculatorConfig cfg;
    EXPECT_NO_THROW(cfg.validate());
    EXPECT_EQ(cfg.inputs.width, 1024);
    EXPECT_EQ(cfg.inputs.height, 1024);
    EXPECT_EQ(cfg.inputs.num_pixels, 1048576);
}

TEST(CalculatorConfigTest, ValidateRejectsNonPositiveInputs) {
    pixel_budget::CalculatorConfig cfg;
    cfg.inputs.width = 0;
    EXPECT_THROW(cfg.validate(), std::invalid_argument);

    cfg = pixel_budget::CalculatorConfig{};
    cfg.inputs.height = -3;
    EXPECT_THROW(cfg.validate(), std::invalid_argument);

    cfg = pixel_budget::CalculatorConfig{};
    cfg.inputs.num_pixels = 0;
    EXPECT_THROW(cfg.validate(), std::invalid_argument);
}

TEST(CalculatorConfigTest, LoadSectionsFromIni) {
    const fs::path tmp_path = fs::temp_directory_path() / "pixel_budget_config_test.ini";
    {
        std::ofstream out(tmp_path);
        ASSERT_TRUE(out.is_open());
        out << "# comment\n";
        out << "[inputs]\n";
        out << "width = 1920\n";
        out << "height = \"1080\"\n";
        out << "num_pixels = 500000\n\n";
        out << "; another comment\n";
        out << "[logging]\n";
        out << "level = warn\n";
        out << "colors = off\n";
    }

    pixel_budget::CalculatorConfig cfg;
    ASSERT_NO_THROW(cfg = pixel_budget::load_calculator_config(tmp_path.string()));
    EXPECT_EQ(cfg.inputs.width, 1920);
    EXPECT_EQ(cfg.inputs.height, 1080);
    EXPECT_EQ(cfg.inputs.num_pixels, 500000);
    EXPECT_EQ(cfg.logging.level, pixel_budget::LogLevel::WARN);
    EXPECT_FALSE(cfg.logging.colors);

    fs::remove(tmp_path);
}

TEST(CalculatorConfigTest, MissingKeysKeepDefaults) {
    const fs::path tmp_path = fs::temp_directory_path() / "pixel_budget_partial_test.ini";
    {
        std::ofstream out(tmp_path);
        ASSERT_TRUE(out.is_open());
        out << "[inputs]\n";
        out << "width = 640\n";
        out << "height = not_a_number\n";
    }

    pixel_budget::CalculatorConfig cfg = pixel_budget::load_calculator_config(tmp_path.string());
    EXPECT_EQ(cfg.inputs.width, 640);
    EXPECT_EQ(cfg.inputs.height, 1024);
    EXPECT_EQ(cfg.inputs.num_pixels, 1048576);
    EXPECT_EQ(cfg.logging.level, pixel_budget::LogLevel::INFO);
    EXPECT_TRUE(cfg.logging.colors);

    fs::remove(tmp_path);
}

TEST(CalculatorConfigTest, MissingFileThrows) {
    EXPECT_THROW(pixel_budget::load_calculator_config("/nonexistent/pixel_budget.ini"),
                 std::runtime_error);
}

TEST(CalculatorConfigTest, SaveThenLoadPreservesValues) {
    const fs::path tmp_path = fs::temp_directory_path() / "pixel_budget_save_test.ini";

    pixel_budget::CalculatorConfig original;
    original.inputs.width = 4000;
    original.inputs.height = 3000;
    original.inputs.num_pixels = 1000000;
    original.logging.level = pixel_budget::LogLevel::DEBUG;
    original.logging.colors = false;

    ASSERT_TRUE(pixel_budget::save_calculator_config(tmp_path.string(), original));
    pixel_budget::CalculatorConfig loaded = pixel_budget::load_calculator_config(tmp_path.string());

    EXPECT_EQ(loaded.inputs.width, 4000);
    EXPECT_EQ(loaded.inputs.height, 3000);
    EXPECT_EQ(loaded.inputs.num_pixels, 1000000);
    EXPECT_EQ(loaded.logging.level, pixel_budget::LogLevel::DEBUG);
    EXPECT_FALSE(loaded.logging.colors);

    fs::remove(tmp_path);
}

TEST(CalculatorConfigTest, SummaryMentionsInputs) {
    pixel_budget::CalculatorConfig cfg;
    cfg.inputs.width = 1920;
    cfg.inputs.height = 1080;

    std::ostringstream oss;
    pixel_budget::print_config_summary(oss, cfg);
    std::string summary = oss.str();
    EXPECT_NE(summary.find("1920 x 1080"), std::string::npos);
    EXPECT_NE(summary.find("Pixel Budget: 1048576"), std::string::npos);
}

TEST(CalculatorConfigTest, ApplyLoggingConfigSetsLevel) {
    pixel_budget::LoggingConfig logging;
    logging.level = pixel_budget::LogLevel::ERROR;
    pixel_budget::apply_logging_config(logging);
    EXPECT_EQ(pixel_budget::Logger::get().get_level(), pixel_budget::LogLevel::ERROR);

    logging.level = pixel_budget::LogLevel::INFO;
    pixel_budget::apply_logging_config(logging);
}
