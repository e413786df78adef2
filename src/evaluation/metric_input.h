#pragma once

/// @file metric_input.h
/// @brief Immutable input record scored by metrics

#include <memory>
#include <optional>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

namespace evalkit::eval {

/// @brief One item to evaluate: model input, model output, reference, context
///
/// MetricInput is an immutable value. The With* methods return a modified
/// copy and leave the original untouched, so one instance can be read from
/// any number of threads. Metadata is a JSON object shared between copies
/// and copied on write.
class MetricInput {
public:
    MetricInput() = default;
    MetricInput(std::string input, std::string output);

    const std::string& Input() const { return input_; }
    const std::string& Output() const { return output_; }
    const std::string& Expected() const { return expected_; }
    const std::string& Context() const { return context_; }

    /// @brief Metadata object (empty object when none was set)
    const nlohmann::json& Metadata() const;

    MetricInput WithInput(std::string input) const;
    MetricInput WithOutput(std::string output) const;
    MetricInput WithExpected(std::string expected) const;
    MetricInput WithContext(std::string context) const;

    /// @brief Copy with one metadata entry added or replaced
    MetricInput WithMetadata(const std::string& key, nlohmann::json value) const;

    /// @brief Copy whose metadata is replaced by the given object
    /// @param metadata JSON object; any other JSON type clears the metadata
    MetricInput WithMetadataObject(nlohmann::json metadata) const;

    /// @brief Metadata value at key, if present
    std::optional<nlohmann::json> Get(const std::string& key) const;

    /// @brief Metadata string at key; empty if absent or not a string
    std::string GetString(const std::string& key) const;

    /// @brief String elements of the metadata array at key
    ///
    /// Non-string elements are skipped; returns empty if the key is absent
    /// or does not hold an array.
    std::vector<std::string> GetStringList(const std::string& key) const;

private:
    std::string input_;
    std::string output_;
    std::string expected_;
    std::string context_;
    std::shared_ptr<const nlohmann::json> metadata_;
};

}  // namespace evalkit::eval
