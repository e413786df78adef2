#pragma once

/// @file dataset.h
/// @brief Mapping raw dataset records onto MetricInput and evaluating them

#include <filesystem>
#include <functional>
#include <string>
#include <vector>

#include <absl/status/statusor.h>
#include <nlohmann/json.hpp>

#include "evaluation/context.h"
#include "evaluation/engine.h"
#include "evaluation/metric_input.h"

namespace evalkit::eval {

/// @brief Turns one raw record (a JSON object) into a MetricInput
using InputMapper = std::function<MetricInput(const nlohmann::json& record)>;

/// @brief Mapper reading string fields at the given keys
///
/// Missing or non-string fields become empty strings. The whole record is
/// kept as the input's metadata.
InputMapper DefaultInputMapper(std::string input_key,
                               std::string output_key,
                               std::string expected_key);

/// @brief Evaluates dataset records through an Engine
class DatasetEvaluator {
public:
    /// @param engine Engine to delegate to; must outlive the evaluator
    /// @param mapper Record to input conversion
    DatasetEvaluator(const Engine& engine, InputMapper mapper);
    DatasetEvaluator(Engine&& engine, InputMapper mapper) = delete;

    /// @brief Map every record, then run Engine::EvaluateMany on the inputs
    EvaluationResults Evaluate(const EvalContext& ctx,
                               const std::vector<nlohmann::json>& records) const;

private:
    const Engine& engine_;
    InputMapper mapper_;
};

/// @brief Read dataset records from a JSON array file or a JSON-lines file
///
/// Every record must be a JSON object. Blank lines in JSON-lines input are
/// skipped.
absl::StatusOr<std::vector<nlohmann::json>> LoadRecords(const std::filesystem::path& path);

/// @brief Same as LoadRecords() for in-memory content
absl::StatusOr<std::vector<nlohmann::json>> ParseRecords(const std::string& content);

}  // namespace evalkit::eval
