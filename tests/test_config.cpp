#include <gtest/gtest.h>
#include <cstdlib>
#include <fstream>
#include <filesystem>
#include <memory>
#include "../src/core/config.hpp"

class ConfigTest : public ::testing::Test {
protected:
    void SetUp() override {
        // Create a temporary directory for test files
        test_dir = std::filesystem::temp_directory_path() / "crush_config_test";
        std::filesystem::create_directories(test_dir);
    }

    void TearDown() override {
        // Clean up test files
        if (std::filesystem::exists(test_dir)) {
            std::filesystem::remove_all(test_dir);
        }
        unsetenv("CRUSH_COMPRESSION_LEVEL");
        unsetenv("CRUSH_OUTPUT_JSON");
        unsetenv("CRUSH_LOGGING_PLUGIN_REGISTRY");
    }

    std::string createTestConfigFile(const std::string& content) {
        auto config_path = test_dir / "test_config.ini";
        std::ofstream file(config_path);
        file << content;
        file.close();
        return config_path.string();
    }

    std::filesystem::path test_dir;
};

TEST_F(ConfigTest, DefaultsWithoutFile) {
    Config::AppConfig config;
    EXPECT_EQ(config.compression.default_plugin, "auto");
    EXPECT_EQ(config.compression.level, "default");
    EXPECT_EQ(config.compression.timeout_seconds, 30u);
    EXPECT_TRUE(config.compression.preserve_metadata);
    EXPECT_FALSE(config.output.quiet);
    EXPECT_TRUE(config.output.cancel_hint);
    EXPECT_FALSE(config.output.json);

    auto weights = config.compression.resolved_weights();
    EXPECT_DOUBLE_EQ(weights.first, 0.7);
    EXPECT_DOUBLE_EQ(weights.second, 0.3);
}

TEST_F(ConfigTest, CompressionSectionParsing) {
    std::string config_content = R"(
# comment
[Compression]
default_plugin = deflate-fast
level = best
timeout_seconds = 5
preserve_metadata = false

[Output]
quiet = yes
cancel_hint = off
json = true
)";

    std::string config_file = createTestConfigFile(config_content);
    Config::ConfigManager manager;
    ASSERT_TRUE(manager.load_configuration(config_file));

    auto config = manager.get_config();
    EXPECT_EQ(config->compression.default_plugin, "deflate-fast");
    EXPECT_EQ(config->compression.level, "best");
    EXPECT_EQ(config->compression.timeout_seconds, 5u);
    EXPECT_FALSE(config->compression.preserve_metadata);
    EXPECT_TRUE(config->output.quiet);
    EXPECT_FALSE(config->output.cancel_hint);
    EXPECT_TRUE(config->output.json);

    auto weights = config->compression.resolved_weights();
    EXPECT_DOUBLE_EQ(weights.first, 0.1);
    EXPECT_DOUBLE_EQ(weights.second, 0.9);
}

TEST_F(ConfigTest, ExplicitWeightsOverrideLevel) {
    std::string config_file = createTestConfigFile(R"(
[Compression]
level = fast
ratio_weight = 0.6
)");
    Config::ConfigManager manager;
    ASSERT_TRUE(manager.load_configuration(config_file));

    auto weights = manager.get_config()->compression.resolved_weights();
    EXPECT_DOUBLE_EQ(weights.first, 0.9);
    EXPECT_DOUBLE_EQ(weights.second, 0.6);
}

TEST_F(ConfigTest, LevelPresets) {
    ASSERT_TRUE(Config::level_weights("fast").has_value());
    EXPECT_DOUBLE_EQ(Config::level_weights("fast")->first, 0.9);
    EXPECT_DOUBLE_EQ(Config::level_weights("balanced")->second, 0.5);
    EXPECT_DOUBLE_EQ(Config::level_weights("BEST")->second, 0.9);
    EXPECT_DOUBLE_EQ(Config::level_weights("default")->first, 0.7);
    EXPECT_FALSE(Config::level_weights("ultra").has_value());
}

TEST_F(ConfigTest, InvalidConfigKeepsPreviousSettings) {
    Config::ConfigManager manager;
    ASSERT_TRUE(manager.load_configuration(createTestConfigFile(R"(
[Compression]
level = balanced
)")));

    std::string bad_file = createTestConfigFile(R"(
[Compression]
throughput_weight = 0
ratio_weight = 0
)");
    EXPECT_FALSE(manager.load_configuration(bad_file));
    EXPECT_EQ(manager.get_config()->compression.level, "balanced");
}

TEST_F(ConfigTest, ValidationRejectsBadValues) {
    Config::AppConfig config;
    std::vector<std::string> errors;
    EXPECT_TRUE(Config::validate_app_config(config, errors));
    EXPECT_TRUE(errors.empty());

    config.compression.throughput_weight = -1.0;
    config.compression.timeout_seconds = Config::MAX_TIMEOUT_SECONDS + 1;
    config.logging.default_level = "chatty";
    EXPECT_FALSE(Config::validate_app_config(config, errors));
    EXPECT_EQ(errors.size(), 3u);
}

TEST_F(ConfigTest, MalformedLinesAreSkipped) {
    std::string config_file = createTestConfigFile(R"(
[Compression]
this line has no delimiter
level = nonsense
timeout_seconds = ten
unknown_key = 1
default_plugin = deflate
)");
    Config::ConfigManager manager;
    ASSERT_TRUE(manager.load_configuration(config_file));

    auto config = manager.get_config();
    EXPECT_EQ(config->compression.level, "default");
    EXPECT_EQ(config->compression.timeout_seconds, 30u);
    EXPECT_EQ(config->compression.default_plugin, "deflate");
}

TEST_F(ConfigTest, MissingFile) {
    Config::ConfigManager manager;
    std::string missing = (test_dir / "missing.ini").string();
    EXPECT_FALSE(manager.load_configuration(missing));
    EXPECT_TRUE(manager.load_configuration(missing, true));
    EXPECT_EQ(manager.config_filepath(), missing);
}

TEST_F(ConfigTest, LoggingComponentLevels) {
    std::string config_file = createTestConfigFile(R"(
[Logging]
default_level = error
plugin.* = debug
plugin.registry = trace
)");
    Config::ConfigManager manager;
    ASSERT_TRUE(manager.load_configuration(config_file));

    auto levels = Config::resolve_log_levels(manager.get_config()->logging);
    EXPECT_EQ(levels[crush::LogComponent::CORE], crush::LogLevel::ERROR);
    EXPECT_EQ(levels[crush::LogComponent::PLUGIN_SELECTOR],
              crush::LogLevel::DEBUG);
    EXPECT_EQ(levels[crush::LogComponent::PLUGIN_REGISTRY],
              crush::LogLevel::TRACE);
    EXPECT_EQ(levels[crush::LogComponent::ENGINE_COMPRESS],
              crush::LogLevel::ERROR);
}

TEST_F(ConfigTest, DefaultLogLevels) {
    auto levels = Config::resolve_log_levels(Config::LoggingConfig{});
    EXPECT_EQ(levels[crush::LogComponent::CORE], crush::LogLevel::INFO);
    EXPECT_EQ(levels[crush::LogComponent::CLI], crush::LogLevel::INFO);
    EXPECT_EQ(levels[crush::LogComponent::FORMAT], crush::LogLevel::WARN);
    EXPECT_EQ(Config::string_to_log_level("bogus"), crush::LogLevel::INFO);
    EXPECT_FALSE(Config::parse_log_level("bogus").has_value());
}

TEST_F(ConfigTest, EnvironmentOverridesFile) {
    std::string config_file = createTestConfigFile(R"(
[Compression]
level = fast
[Output]
json = false
)");
    setenv("CRUSH_COMPRESSION_LEVEL", "best", 1);
    setenv("CRUSH_OUTPUT_JSON", "true", 1);
    setenv("CRUSH_LOGGING_PLUGIN_REGISTRY", "debug", 1);

    Config::ConfigManager manager;
    ASSERT_TRUE(manager.load_configuration(config_file));
    auto config = manager.get_config();
    EXPECT_EQ(config->compression.level, "best");
    EXPECT_TRUE(config->output.json);
    EXPECT_EQ(config->logging.component_levels.at("plugin.registry"), "debug");

    // Not applied when the result is meant to be saved
    ASSERT_TRUE(manager.load_configuration(config_file, false, false));
    EXPECT_EQ(manager.get_config()->compression.level, "fast");
}

TEST_F(ConfigTest, InvalidEnvironmentValueFailsLoad) {
    setenv("CRUSH_COMPRESSION_LEVEL", "turbo", 1);
    Config::ConfigManager manager;
    EXPECT_FALSE(manager.load_configuration(createTestConfigFile("")));
}

TEST_F(ConfigTest, DottedKeys) {
    Config::AppConfig config;
    std::string error;
    EXPECT_TRUE(Config::apply_dotted_setting(config, "compression.level",
                                             "balanced", error));
    EXPECT_EQ(config.compression.level, "balanced");
    EXPECT_TRUE(Config::apply_dotted_setting(config, "output.json", "on", error));
    EXPECT_TRUE(config.output.json);
    EXPECT_TRUE(Config::apply_dotted_setting(config, "logging.plugin.selector",
                                             "debug", error));

    EXPECT_EQ(Config::get_dotted_setting(config, "compression.level").value(),
              "balanced");
    EXPECT_EQ(
        Config::get_dotted_setting(config, "logging.plugin.selector").value(),
        "debug");
    EXPECT_FALSE(Config::get_dotted_setting(config, "compression.nope"));
    EXPECT_FALSE(Config::get_dotted_setting(config, "nosection"));

    EXPECT_FALSE(Config::apply_dotted_setting(config, "compression.level",
                                              "ultra", error));
    EXPECT_NE(error.find("ultra"), std::string::npos);
    EXPECT_FALSE(
        Config::apply_dotted_setting(config, "logging.nothing", "debug", error));
    EXPECT_FALSE(Config::apply_dotted_setting(config, "level", "fast", error));
}

TEST_F(ConfigTest, SetValueValidates) {
    Config::ConfigManager manager;
    std::vector<std::string> errors;
    EXPECT_TRUE(manager.set_value("compression.timeout_seconds", "60", errors));
    EXPECT_EQ(manager.get_config()->compression.timeout_seconds, 60u);

    EXPECT_FALSE(manager.set_value("compression.timeout_seconds", "999999",
                                   errors));
    EXPECT_FALSE(errors.empty());
    EXPECT_EQ(manager.get_config()->compression.timeout_seconds, 60u);

    manager.reset_to_defaults();
    EXPECT_EQ(manager.get_config()->compression.timeout_seconds, 30u);
}

TEST_F(ConfigTest, SaveAndReload) {
    Config::ConfigManager manager;
    std::vector<std::string> errors;
    ASSERT_TRUE(manager.set_value("compression.level", "best", errors));
    ASSERT_TRUE(manager.set_value("compression.throughput_weight", "0.25",
                                  errors));
    ASSERT_TRUE(manager.set_value("output.cancel_hint", "false", errors));
    ASSERT_TRUE(manager.set_value("logging.engine.*", "debug", errors));

    std::string path = (test_dir / "nested" / "crush.ini").string();
    ASSERT_TRUE(manager.save(path));

    Config::ConfigManager reloaded;
    ASSERT_TRUE(reloaded.load_configuration(path));
    auto config = reloaded.get_config();
    EXPECT_EQ(config->compression.level, "best");
    ASSERT_TRUE(config->compression.throughput_weight.has_value());
    EXPECT_DOUBLE_EQ(*config->compression.throughput_weight, 0.25);
    EXPECT_FALSE(config->compression.ratio_weight.has_value());
    EXPECT_FALSE(config->output.cancel_hint);
    EXPECT_EQ(config->logging.component_levels.at("engine.*"), "debug");
}

TEST_F(ConfigTest, ListSettingsCoversEverySection) {
    Config::AppConfig config;
    config.logging.component_levels["format"] = "trace";
    auto settings = Config::list_settings(config);

    ASSERT_FALSE(settings.empty());
    EXPECT_EQ(settings.front().first, "compression.default_plugin");
    EXPECT_EQ(settings.front().second, "auto");
    EXPECT_EQ(settings.back().first, "logging.format");
    EXPECT_EQ(settings.back().second, "trace");
}

TEST_F(ConfigTest, DefaultPathHonoursEnvironment) {
    setenv(Config::CONFIG_FILE_ENV, "/tmp/explicit-crush.ini", 1);
    EXPECT_EQ(Config::default_config_path(), "/tmp/explicit-crush.ini");
    unsetenv(Config::CONFIG_FILE_ENV);
    EXPECT_NE(Config::default_config_path().find("crush.ini"),
              std::string::npos);
}
