#include "evaluation/heuristic/parsing.h"

#include <limits>
#include <memory>
#include <optional>
#include <utility>

#include <absl/strings/ascii.h>
#include <absl/strings/match.h>
#include <absl/strings/str_cat.h>
#include <absl/strings/str_join.h>
#include <absl/strings/strip.h>
#include <expat.h>
#include <nlohmann/json.hpp>

#include "evaluation/heuristic/text.h"

namespace evalkit::eval::heuristic {

namespace {

using json = nlohmann::json;

// Parses text strictly; no exceptions escape.
std::optional<json> ParseJson(const std::string& text, std::string* error = nullptr) {
    try {
        return json::parse(text);
    } catch (const json::exception& e) {
        if (error != nullptr) {
            *error = e.what();
        }
        return std::nullopt;
    }
}

constexpr absl::string_view kFence = "```";
constexpr absl::string_view kFragmentOpen = "<evalkit-fragment>";
constexpr absl::string_view kFragmentClose = "</evalkit-fragment>";

using XmlParserPtr = std::unique_ptr<XML_ParserStruct, decltype(&XML_ParserFree)>;

// Runs expat over the whole text; on failure fills *error and returns false.
bool ParseXml(const std::string& text, std::string* error) {
    if (text.size() > static_cast<size_t>(std::numeric_limits<int>::max())) {
        *error = "document too large";
        return false;
    }
    XmlParserPtr parser(XML_ParserCreate(nullptr), &XML_ParserFree);
    if (!parser) {
        *error = "could not allocate parser";
        return false;
    }
    if (XML_Parse(parser.get(), text.data(), static_cast<int>(text.size()), XML_TRUE) ==
        XML_STATUS_ERROR) {
        *error = absl::StrCat(XML_ErrorString(XML_GetErrorCode(parser.get())), " at line ",
                              XML_GetCurrentLineNumber(parser.get()));
        return false;
    }
    return true;
}

// First open..close span with no nested open or close inside it.
std::optional<absl::string_view> FindFlatSpan(absl::string_view text, char open, char close) {
    const char pair[] = {open, close};
    const absl::string_view delimiters(pair, sizeof(pair));
    size_t begin = text.find(open);
    while (begin != absl::string_view::npos) {
        const size_t next = text.find_first_of(delimiters, begin + 1);
        if (next == absl::string_view::npos) {
            return std::nullopt;
        }
        if (text[next] == close) {
            return text.substr(begin, next - begin + 1);
        }
        begin = next;
    }
    return std::nullopt;
}

std::string JsonTypeName(const json& value) {
    switch (value.type()) {
        case json::value_t::string:
            return "string";
        case json::value_t::number_integer:
        case json::value_t::number_unsigned:
        case json::value_t::number_float:
            return "number";
        case json::value_t::boolean:
            return "boolean";
        case json::value_t::array:
            return "array";
        case json::value_t::object:
            return "object";
        case json::value_t::null:
            return "null";
        default:
            return "unknown";
    }
}

}  // namespace

IsJson::IsJson() : NamedMetric("is_json") {}

ScoreResult IsJson::Score(const EvalContext& /*ctx*/, const MetricInput& input) const {
    std::string error;
    if (!ParseJson(input.Output(), &error)) {
        return ScoreResult::WithReason(Name(), 0.0, absl::StrCat("invalid JSON: ", error));
    }
    return ScoreResult::WithReason(Name(), 1.0, "valid JSON");
}

IsJsonObject::IsJsonObject() : NamedMetric("is_json_object") {}

ScoreResult IsJsonObject::Score(const EvalContext& /*ctx*/, const MetricInput& input) const {
    auto parsed = ParseJson(input.Output());
    if (!parsed || !parsed->is_object()) {
        return ScoreResult::WithReason(Name(), 0.0, "not a valid JSON object");
    }
    return ScoreResult::WithReason(Name(), 1.0, "valid JSON object");
}

IsJsonArray::IsJsonArray() : NamedMetric("is_json_array") {}

ScoreResult IsJsonArray::Score(const EvalContext& /*ctx*/, const MetricInput& input) const {
    auto parsed = ParseJson(input.Output());
    if (!parsed || !parsed->is_array()) {
        return ScoreResult::WithReason(Name(), 0.0, "not a valid JSON array");
    }
    return ScoreResult::WithReason(Name(), 1.0, "valid JSON array");
}

IsXml::IsXml() : NamedMetric("is_xml") {}

ScoreResult IsXml::Score(const EvalContext& /*ctx*/, const MetricInput& input) const {
    const std::string& output = input.Output();
    std::string error;
    if (ParseXml(output, &error)) {
        return ScoreResult::WithReason(Name(), 1.0, "valid XML");
    }

    // Not a document on its own; accept it as content of a single element.
    std::string fragment_error;
    if (ParseXml(absl::StrCat(kFragmentOpen, output, kFragmentClose), &fragment_error)) {
        return ScoreResult::WithReason(Name(), 1.0, "valid XML");
    }
    return ScoreResult::WithReason(Name(), 0.0, absl::StrCat("invalid XML: ", error));
}

JsonHasKeys::JsonHasKeys(std::vector<std::string> keys)
    : NamedMetric("json_has_keys"), keys_(std::move(keys)) {}

ScoreResult JsonHasKeys::Score(const EvalContext& /*ctx*/, const MetricInput& input) const {
    auto parsed = ParseJson(input.Output());
    if (!parsed || !parsed->is_object()) {
        return ScoreResult::WithReason(Name(), 0.0, "not a valid JSON object");
    }

    std::vector<std::string> missing;
    for (const auto& key : keys_) {
        if (!parsed->contains(key)) {
            missing.push_back(key);
        }
    }
    if (missing.empty()) {
        return ScoreResult::WithReason(Name(), 1.0, "has all required keys");
    }

    const double found = static_cast<double>(keys_.size() - missing.size());
    return ScoreResult::WithReason(Name(), found / static_cast<double>(keys_.size()),
                                   absl::StrCat("missing keys: ", absl::StrJoin(missing, ", ")));
}

JsonSchemaValid::JsonSchemaValid(std::map<std::string, std::string> required)
    : NamedMetric("json_schema_valid"), required_(std::move(required)) {}

ScoreResult JsonSchemaValid::Score(const EvalContext& /*ctx*/, const MetricInput& input) const {
    auto parsed = ParseJson(input.Output());
    if (!parsed || !parsed->is_object()) {
        return ScoreResult::WithReason(Name(), 0.0, "not a valid JSON object");
    }

    std::vector<std::string> errors;
    for (const auto& [key, expected_type] : required_) {
        auto it = parsed->find(key);
        if (it == parsed->end()) {
            errors.push_back(absl::StrCat(key, ": missing"));
            continue;
        }
        const std::string actual_type = JsonTypeName(*it);
        if (actual_type != expected_type) {
            errors.push_back(
                absl::StrCat(key, ": expected ", expected_type, ", got ", actual_type));
        }
    }
    if (errors.empty()) {
        return ScoreResult::WithReason(Name(), 1.0, "valid schema");
    }

    const double valid = static_cast<double>(required_.size() - errors.size());
    return ScoreResult::WithReason(Name(), valid / static_cast<double>(required_.size()),
                                   absl::StrJoin(errors, "; "));
}

std::string ExtractJsonText(const std::string& text) {
    const absl::string_view view(text);

    // Fenced block: ``` with an optional json tag, body up to the next fence.
    const size_t open = view.find(kFence);
    if (open != absl::string_view::npos) {
        absl::string_view body = view.substr(open + kFence.size());
        absl::ConsumePrefix(&body, "json");
        body = absl::StripLeadingAsciiWhitespace(body);
        const size_t close = body.find(kFence);
        if (close != absl::string_view::npos) {
            return TrimSpace(body.substr(0, close));
        }
    }

    const std::string trimmed = TrimSpace(text);
    if ((absl::StartsWith(trimmed, "{") && absl::EndsWith(trimmed, "}")) ||
        (absl::StartsWith(trimmed, "[") && absl::EndsWith(trimmed, "]"))) {
        return trimmed;
    }

    if (auto object = FindFlatSpan(trimmed, '{', '}')) {
        return std::string(*object);
    }
    if (auto array = FindFlatSpan(trimmed, '[', ']')) {
        return std::string(*array);
    }
    return "";
}

ExtractJson::ExtractJson(MetricPtr inner)
    : NamedMetric("extract_json"), inner_(std::move(inner)) {}

ScoreResult ExtractJson::Score(const EvalContext& ctx, const MetricInput& input) const {
    std::string extracted = ExtractJsonText(input.Output());
    if (extracted.empty()) {
        return ScoreResult::WithReason(Name(), 0.0, "no JSON found in output");
    }
    return inner_->Score(ctx, input.WithOutput(std::move(extracted)));
}

IsNumber::IsNumber() : NamedMetric("is_number") {}

ScoreResult IsNumber::Score(const EvalContext& /*ctx*/, const MetricInput& input) const {
    auto parsed = ParseJson(input.Output());
    if (!parsed || !parsed->is_number()) {
        return ScoreResult::WithReason(Name(), 0.0, "not a valid number");
    }
    return ScoreResult::WithReason(Name(), 1.0, "valid number");
}

IsBoolean::IsBoolean() : NamedMetric("is_boolean") {}

ScoreResult IsBoolean::Score(const EvalContext& /*ctx*/, const MetricInput& input) const {
    const std::string lower = ToLower(TrimSpace(input.Output()));
    if (lower == "true" || lower == "false" || lower == "yes" || lower == "no" ||
        lower == "1" || lower == "0") {
        return ScoreResult::WithReason(Name(), 1.0, absl::StrCat("valid boolean: ", lower));
    }
    return ScoreResult::WithReason(Name(), 0.0, "not a valid boolean");
}

}  // namespace evalkit::eval::heuristic
