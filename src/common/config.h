#pragma once

/// @file config.h
/// @brief evalkit configuration management

#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <absl/strings/string_view.h>
#include <unordered_map>
#include <variant>
#include <vector>

#include <absl/status/statusor.h>
#include <nlohmann/json.hpp>
#include <yaml-cpp/yaml.h>

namespace evalkit {

/// @brief Configuration value that can hold different types
using ConfigValue = std::variant<
    bool,
    int64_t,
    double,
    std::string,
    std::vector<std::string>,
    std::unordered_map<std::string, std::string>
>;

/// @brief Configuration manager for loading and accessing configuration
///
/// Recognised keys:
///   evaluation.concurrency   int, worker count for batch evaluation
///   evaluation.metrics       sequence of metric specs (see metric_factory.h)
///   dataset.path             records file used by evalkit-run
///   dataset.input_key        record field mapped to MetricInput::input
///   dataset.output_key       record field mapped to MetricInput::output
///   dataset.expected_key     record field mapped to MetricInput::expected
///   logging.level            trace|debug|info|warn|error
class Config {
public:
    /// @brief Default constructor creates empty configuration
    Config();

    /// @brief Load configuration from a YAML file
    /// @param path Path to the YAML configuration file
    /// @return Status indicating success or failure
    static absl::StatusOr<Config> LoadFromFile(const std::filesystem::path& path);

    /// @brief Load configuration from a YAML string
    /// @param yaml_content YAML content as a string
    /// @return Status indicating success or failure
    static absl::StatusOr<Config> LoadFromString(absl::string_view yaml_content);

    /// @brief Load configuration from environment variables with a prefix
    /// @param prefix Environment variable prefix (e.g., "EVALKIT_")
    /// @return Configuration loaded from environment
    static Config LoadFromEnvironment(absl::string_view prefix = "EVALKIT_");

    /// @brief Merge another configuration into this one (other takes precedence)
    /// @param other Configuration to merge
    void Merge(const Config& other);

    /// @brief Get a string value
    /// @param key Configuration key (supports dot notation, e.g., "evaluation.concurrency")
    /// @param default_value Default value if key not found
    std::string GetString(absl::string_view key, absl::string_view default_value = "") const;

    /// @brief Get an integer value
    int64_t GetInt(absl::string_view key, int64_t default_value = 0) const;

    /// @brief Get a double value
    double GetDouble(absl::string_view key, double default_value = 0.0) const;

    /// @brief Get a boolean value
    bool GetBool(absl::string_view key, bool default_value = false) const;

    /// @brief Get a list of strings
    /// @return List of strings or empty vector if not found
    std::vector<std::string> GetStringList(absl::string_view key) const;

    /// @brief Get the node at a dotted key, if present and non-null
    std::optional<YAML::Node> GetNode(absl::string_view key) const;

    /// @brief Check if a key exists
    bool HasKey(absl::string_view key) const;

    /// @brief Set a configuration value, creating intermediate maps
    void Set(absl::string_view key, ConfigValue value);

    /// @brief Get the underlying YAML node for advanced access
    const YAML::Node& Root() const { return root_; }

    /// @brief Export configuration to JSON
    nlohmann::json ToJson() const;

private:
    YAML::Node root_;
};

/// @brief Global configuration instance
Config& GlobalConfig();

/// @brief Initialize global configuration from file and environment
/// @param config_path Path to configuration file (optional)
/// @param env_prefix Environment variable prefix
absl::Status InitGlobalConfig(
    const std::optional<std::filesystem::path>& config_path = std::nullopt,
    absl::string_view env_prefix = "EVALKIT_"
);

}  // namespace evalkit
