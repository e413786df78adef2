#include "evaluation/metric_factory.h"

#include <cstdint>
#include <functional>
#include <map>
#include <memory>
#include <utility>

#include <absl/strings/str_cat.h>

#include "common/error.h"
#include "common/logging.h"
#include "evaluation/heuristic/parsing.h"
#include "evaluation/heuristic/pattern.h"
#include "evaluation/heuristic/similarity.h"
#include "evaluation/heuristic/string_metrics.h"

namespace evalkit::eval {

namespace {

using Builder = std::function<absl::StatusOr<MetricPtr>(const YAML::Node&)>;

template <typename T>
absl::StatusOr<T> Param(const YAML::Node& spec, const std::string& key, T default_value) {
    const YAML::Node node = spec[key];
    if (!node.IsDefined() || node.IsNull()) {
        return default_value;
    }
    try {
        return node.as<T>();
    } catch (const YAML::BadConversion& e) {
        return InvalidArgumentError(
            absl::StrCat("invalid value for parameter '", key, "': ", e.what()));
    }
}

template <typename T>
absl::StatusOr<T> RequiredParam(const YAML::Node& spec, const std::string& key) {
    const YAML::Node node = spec[key];
    if (!node.IsDefined() || node.IsNull()) {
        return InvalidArgumentError(absl::StrCat("missing required parameter '", key, "'"));
    }
    return Param<T>(spec, key, T{});
}

absl::StatusOr<size_t> SizeParam(const YAML::Node& spec, const std::string& key,
                                 int64_t default_value) {
    EVALKIT_ASSIGN_OR_RETURN(int64_t value, Param<int64_t>(spec, key, default_value));
    if (value < 0) {
        return InvalidArgumentError(absl::StrCat("parameter '", key, "' must not be negative"));
    }
    return static_cast<size_t>(value);
}

template <typename M>
absl::StatusOr<MetricPtr> Upcast(absl::StatusOr<std::shared_ptr<M>> metric) {
    if (!metric.ok()) {
        return metric.status();
    }
    return MetricPtr(std::move(*metric));
}

// Metric types that take only a case_sensitive flag.
template <typename M>
Builder CaseSensitiveBuilder(bool default_case_sensitive) {
    return [default_case_sensitive](const YAML::Node& spec) -> absl::StatusOr<MetricPtr> {
        EVALKIT_ASSIGN_OR_RETURN(bool case_sensitive,
                                 Param<bool>(spec, "case_sensitive", default_case_sensitive));
        return std::make_shared<M>(case_sensitive);
    };
}

template <typename M>
Builder ValuesBuilder() {
    return [](const YAML::Node& spec) -> absl::StatusOr<MetricPtr> {
        EVALKIT_ASSIGN_OR_RETURN(auto values,
                                 RequiredParam<std::vector<std::string>>(spec, "values"));
        EVALKIT_ASSIGN_OR_RETURN(bool case_sensitive,
                                 Param<bool>(spec, "case_sensitive", true));
        return std::make_shared<M>(std::move(values), case_sensitive);
    };
}

template <typename M>
Builder DefaultBuilder() {
    return [](const YAML::Node& /*spec*/) -> absl::StatusOr<MetricPtr> {
        return std::make_shared<M>();
    };
}

absl::StatusOr<MetricPtr> BuildLevenshtein(const YAML::Node& spec) {
    return CaseSensitiveBuilder<heuristic::LevenshteinSimilarity>(false)(spec);
}

absl::StatusOr<MetricPtr> BuildJaccard(const YAML::Node& spec) {
    EVALKIT_ASSIGN_OR_RETURN(bool case_sensitive, Param<bool>(spec, "case_sensitive", false));
    EVALKIT_ASSIGN_OR_RETURN(bool use_words, Param<bool>(spec, "use_words", true));
    return std::make_shared<heuristic::JaccardSimilarity>(case_sensitive, use_words);
}

absl::StatusOr<MetricPtr> BuildBleu(const YAML::Node& spec) {
    EVALKIT_ASSIGN_OR_RETURN(int max_n, Param<int>(spec, "max_n", heuristic::Bleu::kDefaultMaxN));
    if (max_n < 1) {
        return InvalidArgumentError("parameter 'max_n' must be at least 1");
    }
    return std::make_shared<heuristic::Bleu>(max_n);
}

absl::StatusOr<MetricPtr> BuildRougeL(const YAML::Node& spec) {
    EVALKIT_ASSIGN_OR_RETURN(double beta, Param<double>(spec, "beta", 1.0));
    if (beta <= 0.0) {
        return InvalidArgumentError("parameter 'beta' must be positive");
    }
    return std::make_shared<heuristic::RougeL>(beta);
}

absl::StatusOr<MetricPtr> BuildFuzzyMatch(const YAML::Node& spec) {
    EVALKIT_ASSIGN_OR_RETURN(double threshold, Param<double>(spec, "threshold", 0.8));
    EVALKIT_ASSIGN_OR_RETURN(bool case_sensitive, Param<bool>(spec, "case_sensitive", false));
    return std::make_shared<heuristic::FuzzyMatch>(threshold, case_sensitive);
}

absl::StatusOr<MetricPtr> BuildLengthBetween(const YAML::Node& spec) {
    EVALKIT_ASSIGN_OR_RETURN(size_t min_length, SizeParam(spec, "min", 0));
    EVALKIT_ASSIGN_OR_RETURN(size_t max_length, SizeParam(spec, "max", INT64_MAX));
    return std::make_shared<heuristic::LengthBetween>(min_length, max_length);
}

absl::StatusOr<MetricPtr> BuildWordCount(const YAML::Node& spec) {
    EVALKIT_ASSIGN_OR_RETURN(size_t min_words, SizeParam(spec, "min", 0));
    EVALKIT_ASSIGN_OR_RETURN(size_t max_words, SizeParam(spec, "max", INT64_MAX));
    return std::make_shared<heuristic::WordCount>(min_words, max_words);
}

absl::StatusOr<MetricPtr> BuildNoOffensiveLanguage(const YAML::Node& spec) {
    EVALKIT_ASSIGN_OR_RETURN(auto patterns,
                             RequiredParam<std::vector<std::string>>(spec, "patterns"));
    return std::make_shared<heuristic::NoOffensiveLanguage>(std::move(patterns));
}

absl::StatusOr<MetricPtr> BuildRegexMatch(const YAML::Node& spec) {
    EVALKIT_ASSIGN_OR_RETURN(auto pattern, RequiredParam<std::string>(spec, "pattern"));
    return Upcast(heuristic::RegexMatch::Create(pattern));
}

absl::StatusOr<MetricPtr> BuildRegexNotMatch(const YAML::Node& spec) {
    EVALKIT_ASSIGN_OR_RETURN(auto pattern, RequiredParam<std::string>(spec, "pattern"));
    return Upcast(heuristic::RegexNotMatch::Create(pattern));
}

absl::StatusOr<MetricPtr> BuildRegexFindAll(const YAML::Node& spec) {
    EVALKIT_ASSIGN_OR_RETURN(auto pattern, RequiredParam<std::string>(spec, "pattern"));
    EVALKIT_ASSIGN_OR_RETURN(size_t min_matches, SizeParam(spec, "min", 1));
    // max <= 0 means no upper bound
    EVALKIT_ASSIGN_OR_RETURN(int64_t max_matches, Param<int64_t>(spec, "max", 0));
    return Upcast(heuristic::RegexFindAll::Create(
        pattern, min_matches, max_matches > 0 ? static_cast<size_t>(max_matches) : 0));
}

absl::StatusOr<MetricPtr> BuildDateFormat(const YAML::Node& spec) {
    EVALKIT_ASSIGN_OR_RETURN(auto pattern, Param<std::string>(spec, "pattern", ""));
    if (pattern.empty()) {
        return std::make_shared<heuristic::DateFormat>();
    }
    return Upcast(heuristic::DateFormat::WithPattern(pattern));
}

absl::StatusOr<MetricPtr> BuildJsonHasKeys(const YAML::Node& spec) {
    EVALKIT_ASSIGN_OR_RETURN(auto keys, RequiredParam<std::vector<std::string>>(spec, "keys"));
    return std::make_shared<heuristic::JsonHasKeys>(std::move(keys));
}

absl::StatusOr<MetricPtr> BuildJsonSchemaValid(const YAML::Node& spec) {
    using Schema = std::map<std::string, std::string>;
    EVALKIT_ASSIGN_OR_RETURN(Schema schema, RequiredParam<Schema>(spec, "schema"));
    return std::make_shared<heuristic::JsonSchemaValid>(std::move(schema));
}

absl::StatusOr<MetricPtr> BuildExtractJson(const YAML::Node& spec) {
    const YAML::Node inner = spec["metric"];
    if (!inner.IsDefined() || !inner.IsMap()) {
        return InvalidArgumentError("extract_json requires a 'metric' map");
    }
    EVALKIT_ASSIGN_OR_RETURN(MetricPtr metric, CreateMetric(inner));
    return std::make_shared<heuristic::ExtractJson>(std::move(metric));
}

absl::StatusOr<MetricPtr> BuildComposite(const YAML::Node& spec) {
    EVALKIT_ASSIGN_OR_RETURN(auto name, Param<std::string>(spec, "name", "composite"));
    const YAML::Node children = spec["metrics"];
    if (!children.IsDefined() || !children.IsSequence()) {
        return InvalidArgumentError("composite requires a 'metrics' sequence");
    }

    std::vector<MetricPtr> metrics;
    metrics.reserve(children.size());
    for (size_t i = 0; i < children.size(); ++i) {
        auto metric = CreateMetric(children[i]);
        if (!metric.ok()) {
            return InvalidArgumentError(
                absl::StrCat(name, ".metrics[", i, "]: ", metric.status().message()));
        }
        metrics.push_back(std::move(*metric));
    }
    return std::make_shared<CompositeMetric>(std::move(name), std::move(metrics));
}

absl::StatusOr<MetricPtr> BuildWeighted(const YAML::Node& spec) {
    EVALKIT_ASSIGN_OR_RETURN(double weight, RequiredParam<double>(spec, "weight"));
    const YAML::Node inner = spec["metric"];
    if (!inner.IsDefined() || !inner.IsMap()) {
        return InvalidArgumentError("weighted requires a 'metric' map");
    }
    EVALKIT_ASSIGN_OR_RETURN(MetricPtr metric, CreateMetric(inner));
    return std::make_shared<WeightedMetric>(std::move(metric), weight);
}

const std::map<std::string, Builder>& Builders() {
    static const std::map<std::string, Builder> builders = {
        // Similarity
        {"levenshtein", BuildLevenshtein},
        {"levenshtein_similarity", BuildLevenshtein},
        {"jaccard", BuildJaccard},
        {"jaccard_similarity", BuildJaccard},
        {"cosine", CaseSensitiveBuilder<heuristic::CosineSimilarity>(false)},
        {"cosine_similarity", CaseSensitiveBuilder<heuristic::CosineSimilarity>(false)},
        {"bleu", BuildBleu},
        {"rouge_l", BuildRougeL},
        {"fuzzy_match", BuildFuzzyMatch},
        {"semantic_similarity", DefaultBuilder<heuristic::SemanticSimilarity>()},

        // String
        {"equals", CaseSensitiveBuilder<heuristic::Equals>(true)},
        {"contains", CaseSensitiveBuilder<heuristic::Contains>(true)},
        {"starts_with", CaseSensitiveBuilder<heuristic::StartsWith>(true)},
        {"ends_with", CaseSensitiveBuilder<heuristic::EndsWith>(true)},
        {"contains_any", ValuesBuilder<heuristic::ContainsAny>()},
        {"contains_all", ValuesBuilder<heuristic::ContainsAll>()},
        {"not_empty", DefaultBuilder<heuristic::NotEmpty>()},
        {"length_between", BuildLengthBetween},
        {"word_count", BuildWordCount},
        {"no_offensive_language", BuildNoOffensiveLanguage},

        // Pattern
        {"regex_match", BuildRegexMatch},
        {"regex_not_match", BuildRegexNotMatch},
        {"regex_find_all", BuildRegexFindAll},
        {"email_format", DefaultBuilder<heuristic::EmailFormat>()},
        {"url_format", DefaultBuilder<heuristic::UrlFormat>()},
        {"phone_format", DefaultBuilder<heuristic::PhoneFormat>()},
        {"date_format", BuildDateFormat},
        {"uuid_format", DefaultBuilder<heuristic::UuidFormat>()},

        // Parsing
        {"is_json", DefaultBuilder<heuristic::IsJson>()},
        {"is_json_object", DefaultBuilder<heuristic::IsJsonObject>()},
        {"is_json_array", DefaultBuilder<heuristic::IsJsonArray>()},
        {"is_xml", DefaultBuilder<heuristic::IsXml>()},
        {"json_has_keys", BuildJsonHasKeys},
        {"json_schema_valid", BuildJsonSchemaValid},
        {"extract_json", BuildExtractJson},
        {"is_number", DefaultBuilder<heuristic::IsNumber>()},
        {"is_boolean", DefaultBuilder<heuristic::IsBoolean>()},

        // Combinators
        {"composite", BuildComposite},
        {"weighted", BuildWeighted},
    };
    return builders;
}

}  // namespace

absl::StatusOr<MetricPtr> CreateMetric(const YAML::Node& spec) {
    if (!spec.IsMap()) {
        return InvalidArgumentError("metric spec must be a map");
    }
    EVALKIT_ASSIGN_OR_RETURN(auto type, RequiredParam<std::string>(spec, "type"));

    const auto& builders = Builders();
    auto it = builders.find(type);
    if (it == builders.end()) {
        return InvalidArgumentError(absl::StrCat("unknown metric type '", type, "'"));
    }

    auto metric = it->second(spec);
    if (!metric.ok()) {
        return InvalidArgumentError(absl::StrCat(type, ": ", metric.status().message()));
    }
    EVALKIT_LOG_DEBUG("Created metric '{}' from type '{}'", (*metric)->Name(), type);
    return metric;
}

absl::StatusOr<std::vector<MetricPtr>> CreateMetrics(const Config& config) {
    auto node = config.GetNode("evaluation.metrics");
    if (!node || node->IsNull()) {
        return std::vector<MetricPtr>{};
    }
    if (!node->IsSequence()) {
        return InvalidArgumentError("evaluation.metrics must be a sequence");
    }

    std::vector<MetricPtr> metrics;
    metrics.reserve(node->size());
    for (size_t i = 0; i < node->size(); ++i) {
        auto metric = CreateMetric((*node)[i]);
        if (!metric.ok()) {
            return InvalidArgumentError(absl::StrCat(
                "evaluation.metrics[", i, "]: ", metric.status().message()));
        }
        metrics.push_back(std::move(*metric));
    }
    EVALKIT_LOG_INFO("Configured {} metrics", metrics.size());
    return metrics;
}

std::vector<std::string> SupportedMetricTypes() {
    std::vector<std::string> types;
    for (const auto& [type, builder] : Builders()) {
        types.push_back(type);
    }
    return types;
}

}  // namespace evalkit::eval
