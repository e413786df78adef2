#pragma once

/// @file parsing.h
/// @brief Structural checks on the output: JSON, XML, numbers and booleans

#include <map>
#include <string>
#include <vector>

#include "evaluation/metric.h"

namespace evalkit::eval::heuristic {

/// @brief 1.0 when the output parses as any JSON value ("is_json")
class IsJson : public NamedMetric {
public:
    IsJson();
    ScoreResult Score(const EvalContext& ctx, const MetricInput& input) const override;
};

/// @brief 1.0 when the output is a JSON object ("is_json_object")
class IsJsonObject : public NamedMetric {
public:
    IsJsonObject();
    ScoreResult Score(const EvalContext& ctx, const MetricInput& input) const override;
};

/// @brief 1.0 when the output is a JSON array ("is_json_array")
class IsJsonArray : public NamedMetric {
public:
    IsJsonArray();
    ScoreResult Score(const EvalContext& ctx, const MetricInput& input) const override;
};

/// @brief 1.0 when the output is well-formed XML ("is_xml")
///
/// Accepts a complete document, or a fragment of text and sibling elements
/// with balanced tags. Empty output counts as valid.
class IsXml : public NamedMetric {
public:
    IsXml();
    ScoreResult Score(const EvalContext& ctx, const MetricInput& input) const override;
};

/// @brief Fraction of required keys present in a JSON object output
///        ("json_has_keys")
class JsonHasKeys : public NamedMetric {
public:
    explicit JsonHasKeys(std::vector<std::string> keys);
    ScoreResult Score(const EvalContext& ctx, const MetricInput& input) const override;

private:
    std::vector<std::string> keys_;
};

/// @brief Fraction of keys present with the expected JSON type
///        ("json_schema_valid")
///
/// Types are "string", "number", "boolean", "array", "object" and "null".
/// Problems are reported in key order, joined by "; ".
class JsonSchemaValid : public NamedMetric {
public:
    explicit JsonSchemaValid(std::map<std::string, std::string> required);
    ScoreResult Score(const EvalContext& ctx, const MetricInput& input) const override;

private:
    std::map<std::string, std::string> required_;
};

/// @brief Pulls JSON out of surrounding prose and scores it with an inner
///        metric ("extract_json")
///
/// Looks in a fenced code block first, then at the whole trimmed text, then
/// for the first flat object or array. The inner result is returned as is.
class ExtractJson : public NamedMetric {
public:
    explicit ExtractJson(MetricPtr inner);
    ScoreResult Score(const EvalContext& ctx, const MetricInput& input) const override;

private:
    MetricPtr inner_;
};

/// @brief JSON text found in output, or "" if there is none
std::string ExtractJsonText(const std::string& text);

/// @brief 1.0 when the output is a JSON number ("is_number")
class IsNumber : public NamedMetric {
public:
    IsNumber();
    ScoreResult Score(const EvalContext& ctx, const MetricInput& input) const override;
};

/// @brief 1.0 for true/false/yes/no/1/0 in any case ("is_boolean")
class IsBoolean : public NamedMetric {
public:
    IsBoolean();
    ScoreResult Score(const EvalContext& ctx, const MetricInput& input) const override;
};

}  // namespace evalkit::eval::heuristic
