/// @file parsing_test.cpp
/// @brief Tests for JSON, XML, number and boolean checks

#include <gtest/gtest.h>

#include <memory>
#include <string>

#include "evaluation/heuristic/parsing.h"

namespace evalkit::eval::heuristic {
namespace {

ScoreResult RunMetric(const Metric& metric, const std::string& output) {
    return metric.Score(*EvalContext::Background(), MetricInput("", output));
}

TEST(IsJsonTest, AcceptsAnyValue) {
    IsJson metric;
    EXPECT_DOUBLE_EQ(RunMetric(metric, R"({"a": 1})").value, 1.0);
    EXPECT_DOUBLE_EQ(RunMetric(metric, "[1, 2]").value, 1.0);
    EXPECT_DOUBLE_EQ(RunMetric(metric, " 42 ").value, 1.0);
    EXPECT_DOUBLE_EQ(RunMetric(metric, "\"text\"").value, 1.0);

    auto invalid = RunMetric(metric, "{a: 1}");
    EXPECT_DOUBLE_EQ(invalid.value, 0.0);
    EXPECT_EQ(invalid.reason->rfind("invalid JSON: ", 0), 0u);
}

TEST(IsJsonTest, ObjectAndArray) {
    IsJsonObject object;
    EXPECT_DOUBLE_EQ(RunMetric(object, R"({"a": 1})").value, 1.0);
    EXPECT_DOUBLE_EQ(RunMetric(object, "[1]").value, 0.0);
    EXPECT_EQ(*RunMetric(object, "[1]").reason, "not a valid JSON object");

    IsJsonArray array;
    EXPECT_DOUBLE_EQ(RunMetric(array, "[]").value, 1.0);
    EXPECT_DOUBLE_EQ(RunMetric(array, "{}").value, 0.0);
}

TEST(JsonHasKeysTest, PartialScore) {
    JsonHasKeys metric({"name", "age", "email"});

    auto all = RunMetric(metric, R"({"name": "Ada", "age": 36, "email": "ada@example.com"})");
    EXPECT_DOUBLE_EQ(all.value, 1.0);
    EXPECT_EQ(*all.reason, "has all required keys");

    auto partial = RunMetric(metric, R"({"name": "Ada"})");
    EXPECT_NEAR(partial.value, 1.0 / 3.0, 1e-9);
    EXPECT_EQ(*partial.reason, "missing keys: age, email");

    EXPECT_DOUBLE_EQ(RunMetric(metric, "[]").value, 0.0);
}

TEST(JsonSchemaValidTest, ChecksTypes) {
    JsonSchemaValid metric({{"name", "string"},
                            {"age", "number"},
                            {"admin", "boolean"},
                            {"tags", "array"}});

    EXPECT_DOUBLE_EQ(
        RunMetric(metric, R"({"name": "Ada", "age": 36.5, "admin": false, "tags": []})").value, 1.0);

    auto partial = RunMetric(metric, R"({"name": 1, "age": 36, "tags": {}})");
    EXPECT_DOUBLE_EQ(partial.value, 0.25);
    EXPECT_EQ(*partial.reason,
              "admin: missing; name: expected string, got number; "
              "tags: expected array, got object");
}

TEST(JsonSchemaValidTest, NullAndObjectTypes) {
    JsonSchemaValid metric({{"parent", "null"}, {"meta", "object"}});
    EXPECT_DOUBLE_EQ(RunMetric(metric, R"({"parent": null, "meta": {}})").value, 1.0);
    EXPECT_DOUBLE_EQ(RunMetric(metric, "not json").value, 0.0);
}

TEST(ExtractJsonTextTest, Sources) {
    EXPECT_EQ(ExtractJsonText("Here:\n```json\n{\"a\": 1}\n```\nDone"), "{\"a\": 1}");
    EXPECT_EQ(ExtractJsonText("```\n[1, 2]\n```"), "[1, 2]");
    EXPECT_EQ(ExtractJsonText("  {\"outer\": {\"inner\": 1}}  "), "{\"outer\": {\"inner\": 1}}");
    EXPECT_EQ(ExtractJsonText("The result is {\"a\": 1} as requested"), "{\"a\": 1}");
    EXPECT_EQ(ExtractJsonText("Values [1, 2, 3] follow"), "[1, 2, 3]");
    EXPECT_EQ(ExtractJsonText("no structure here"), "");
}

TEST(ExtractJsonTextTest, UnterminatedFenceFallsThrough) {
    EXPECT_EQ(ExtractJsonText("```json\n{\"a\": 1}"), "{\"a\": 1}");
    EXPECT_EQ(ExtractJsonText("``` no closing fence [1]"), "[1]");
    EXPECT_EQ(ExtractJsonText("```json```"), "");
}

TEST(ExtractJsonTextTest, NestedBracesPickInnermostFlatSpan) {
    EXPECT_EQ(ExtractJsonText("note: {\"a\": {\"b\": 1}} end"), "{\"b\": 1}");
    EXPECT_EQ(ExtractJsonText("list [[1], [2]] end"), "[1]");
}

TEST(ExtractJsonTextTest, LargeFencedBlock) {
    const std::string payload = "{\"a\": \"" + std::string(100000, 'x') + "\"}";
    EXPECT_EQ(ExtractJsonText("```json\n" + payload + "\n```"), payload);

    const std::string unfenced = "prefix " + std::string(100000, '{') + "[" +
                                 std::string(100000, 'y') + "]";
    EXPECT_EQ(ExtractJsonText(unfenced).size(), 100002u);
}

TEST(ExtractJsonTest, DelegatesToInnerMetric) {
    ExtractJson metric(std::make_shared<IsJsonObject>());

    auto score = RunMetric(metric, "Sure! ```json\n{\"answer\": 42}\n```");
    EXPECT_DOUBLE_EQ(score.value, 1.0);
    EXPECT_EQ(score.name, "is_json_object");
}

TEST(ExtractJsonTest, NothingFound) {
    ExtractJson metric(std::make_shared<IsJsonObject>());

    auto score = RunMetric(metric, "I cannot answer that.");
    EXPECT_EQ(score.name, "extract_json");
    EXPECT_DOUBLE_EQ(score.value, 0.0);
    EXPECT_EQ(*score.reason, "no JSON found in output");
}

TEST(IsNumberTest, JsonNumbersOnly) {
    IsNumber metric;
    EXPECT_DOUBLE_EQ(RunMetric(metric, "42").value, 1.0);
    EXPECT_DOUBLE_EQ(RunMetric(metric, "-3.5e2").value, 1.0);
    EXPECT_DOUBLE_EQ(RunMetric(metric, "\"42\"").value, 0.0);
    EXPECT_DOUBLE_EQ(RunMetric(metric, "forty-two").value, 0.0);
}

TEST(IsNumberTest, OverflowIsNotANumber) {
    auto score = RunMetric(IsNumber(), "1e400");
    EXPECT_TRUE(score.IsSuccess());
    EXPECT_DOUBLE_EQ(score.value, 0.0);
    EXPECT_EQ(*score.reason, "not a valid number");
}

TEST(IsJsonTest, OverflowIsReportedNotThrown) {
    auto score = RunMetric(IsJson(), "{\"n\": 1e400}");
    EXPECT_TRUE(score.IsSuccess());
    EXPECT_DOUBLE_EQ(score.value, 0.0);
    EXPECT_EQ(score.reason->rfind("invalid JSON: ", 0), 0u);

    JsonHasKeys has_keys({"n", "m"});
    EXPECT_DOUBLE_EQ(RunMetric(has_keys, "{\"n\": 1e400}").value, 0.0);

    JsonSchemaValid schema({{"n", "number"}, {"m", "string"}});
    EXPECT_DOUBLE_EQ(RunMetric(schema, "{\"n\": 1e400}").value, 0.0);
}

TEST(IsXmlTest, Documents) {
    IsXml metric;
    EXPECT_EQ(metric.Name(), "is_xml");

    auto valid = RunMetric(metric, "<?xml version=\"1.0\"?><root><child a=\"1\">text</child></root>");
    EXPECT_DOUBLE_EQ(valid.value, 1.0);
    EXPECT_EQ(*valid.reason, "valid XML");

    auto unclosed = RunMetric(metric, "<unclosed>");
    EXPECT_TRUE(unclosed.IsSuccess());
    EXPECT_DOUBLE_EQ(unclosed.value, 0.0);
    EXPECT_EQ(unclosed.reason->rfind("invalid XML: ", 0), 0u);

    EXPECT_DOUBLE_EQ(RunMetric(metric, "<a><b></a></b>").value, 0.0);
    EXPECT_DOUBLE_EQ(RunMetric(metric, "<a>&undefined;</a>").value, 0.0);
}

TEST(IsXmlTest, FragmentsAndText) {
    IsXml metric;
    EXPECT_DOUBLE_EQ(RunMetric(metric, "not xml").value, 1.0);
    EXPECT_DOUBLE_EQ(RunMetric(metric, "").value, 1.0);
    EXPECT_DOUBLE_EQ(RunMetric(metric, "<a/><b>two</b>").value, 1.0);
    EXPECT_DOUBLE_EQ(RunMetric(metric, "text <b>bold</b> text").value, 1.0);
}

TEST(IsBooleanTest, AcceptedSpellings) {
    IsBoolean metric;
    for (const char* text : {"true", "False", " YES ", "no", "1", "0"}) {
        EXPECT_DOUBLE_EQ(RunMetric(metric, text).value, 1.0) << text;
    }
    EXPECT_EQ(*RunMetric(metric, " YES ").reason, "valid boolean: yes");

    auto rejected = RunMetric(metric, "maybe");
    EXPECT_DOUBLE_EQ(rejected.value, 0.0);
    EXPECT_EQ(*rejected.reason, "not a valid boolean");
}

}  // namespace
}  // namespace evalkit::eval::heuristic
