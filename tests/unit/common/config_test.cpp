/// @file config_test.cpp
/// @brief Tests for evalkit configuration management

#include <gtest/gtest.h>

#include <cstdlib>

#include "common/config.h"

namespace evalkit {
namespace {

TEST(ConfigTest, LoadFromString) {
    const std::string yaml_content = R"(
evaluation:
  concurrency: 4
  metrics:
    - type: bleu
    - type: rouge_l
dataset:
  input_key: question
  tags:
    - smoke
    - nightly
logging:
  level: debug
)";

    auto result = Config::LoadFromString(yaml_content);
    ASSERT_TRUE(result.ok()) << result.status().message();

    Config config = std::move(*result);

    EXPECT_EQ(config.GetInt("evaluation.concurrency"), 4);
    EXPECT_EQ(config.GetString("dataset.input_key"), "question");
    EXPECT_EQ(config.GetString("logging.level"), "debug");

    auto tags = config.GetStringList("dataset.tags");
    ASSERT_EQ(tags.size(), 2);
    EXPECT_EQ(tags[0], "smoke");
    EXPECT_EQ(tags[1], "nightly");

    auto metrics = config.GetNode("evaluation.metrics");
    ASSERT_TRUE(metrics.has_value());
    EXPECT_TRUE(metrics->IsSequence());
    EXPECT_EQ(metrics->size(), 2u);
}

TEST(ConfigTest, DefaultValues) {
    Config config;

    EXPECT_EQ(config.GetString("nonexistent.key", "default"), "default");
    EXPECT_EQ(config.GetInt("nonexistent.key", 42), 42);
    EXPECT_EQ(config.GetDouble("nonexistent.key", 3.14), 3.14);
    EXPECT_EQ(config.GetBool("nonexistent.key", true), true);
    EXPECT_TRUE(config.GetStringList("nonexistent.key").empty());
}

TEST(ConfigTest, WrongTypeFallsBackToDefault) {
    auto result = Config::LoadFromString("evaluation:\n  concurrency: many\n");
    ASSERT_TRUE(result.ok());

    EXPECT_EQ(result->GetInt("evaluation.concurrency", 1), 1);
    EXPECT_EQ(result->GetString("evaluation.concurrency"), "many");
}

TEST(ConfigTest, SetValues) {
    Config config;

    config.Set("test.string", std::string("value"));
    config.Set("test.int", static_cast<int64_t>(123));
    config.Set("test.bool", true);
    config.Set("deeply.nested.list", std::vector<std::string>{"a", "b"});

    EXPECT_EQ(config.GetString("test.string"), "value");
    EXPECT_EQ(config.GetInt("test.int"), 123);
    EXPECT_EQ(config.GetBool("test.bool"), true);
    EXPECT_EQ(config.GetStringList("deeply.nested.list"),
              (std::vector<std::string>{"a", "b"}));
}

TEST(ConfigTest, SetOverwritesExistingValue) {
    auto result = Config::LoadFromString("evaluation:\n  concurrency: 2\n");
    ASSERT_TRUE(result.ok());
    Config config = std::move(*result);

    config.Set("evaluation.concurrency", static_cast<int64_t>(8));

    EXPECT_EQ(config.GetInt("evaluation.concurrency"), 8);
}

TEST(ConfigTest, HasKey) {
    const std::string yaml_content = R"(
existing:
  key: value
)";

    auto result = Config::LoadFromString(yaml_content);
    ASSERT_TRUE(result.ok());

    Config config = std::move(*result);

    EXPECT_TRUE(config.HasKey("existing.key"));
    EXPECT_FALSE(config.HasKey("nonexistent.key"));
    EXPECT_FALSE(config.HasKey("existing.key.deeper"));
}

TEST(ConfigTest, MergeConfigs) {
    const std::string base_yaml = R"(
key1: value1
nested:
  a: 1
  b: 2
)";

    const std::string overlay_yaml = R"(
key2: value2
nested:
  b: 20
  c: 3
)";

    auto base_result = Config::LoadFromString(base_yaml);
    auto overlay_result = Config::LoadFromString(overlay_yaml);
    ASSERT_TRUE(base_result.ok());
    ASSERT_TRUE(overlay_result.ok());

    Config base = std::move(*base_result);
    Config overlay = std::move(*overlay_result);

    base.Merge(overlay);

    EXPECT_EQ(base.GetString("key1"), "value1");
    EXPECT_EQ(base.GetString("key2"), "value2");
    EXPECT_EQ(base.GetInt("nested.a"), 1);
    EXPECT_EQ(base.GetInt("nested.b"), 20);  // Overwritten
    EXPECT_EQ(base.GetInt("nested.c"), 3);   // Added

    // The overlay is unaffected by the merge
    EXPECT_FALSE(overlay.HasKey("key1"));
}

TEST(ConfigTest, LoadFromEnvironment) {
    setenv("EVALKIT_TEST_CONCURRENCY", "6", 1);
    setenv("EVALKIT_TEST_DATASET_PATH", "/tmp/records.jsonl", 1);
    setenv("EVALKIT_TEST_LOG_LEVEL", "warn", 1);

    Config config = Config::LoadFromEnvironment("EVALKIT_TEST_");

    EXPECT_EQ(config.GetInt("evaluation.concurrency"), 6);
    EXPECT_EQ(config.GetString("dataset.path"), "/tmp/records.jsonl");
    EXPECT_EQ(config.GetString("logging.level"), "warn");

    unsetenv("EVALKIT_TEST_CONCURRENCY");
    unsetenv("EVALKIT_TEST_DATASET_PATH");
    unsetenv("EVALKIT_TEST_LOG_LEVEL");
}

TEST(ConfigTest, NonNumericConcurrencyIsIgnored) {
    setenv("EVALKIT_BAD_CONCURRENCY", "lots", 1);

    Config config = Config::LoadFromEnvironment("EVALKIT_BAD_");

    EXPECT_FALSE(config.HasKey("evaluation.concurrency"));
    unsetenv("EVALKIT_BAD_CONCURRENCY");
}

TEST(ConfigTest, ToJson) {
    const std::string yaml_content = R"(
evaluation:
  concurrency: 4
  threshold: 0.5
  enabled: true
  label: "42"
  metrics:
    - bleu
)";

    auto result = Config::LoadFromString(yaml_content);
    ASSERT_TRUE(result.ok());

    auto json = result->ToJson();
    EXPECT_EQ(json["evaluation"]["concurrency"], 4);
    EXPECT_DOUBLE_EQ(json["evaluation"]["threshold"].get<double>(), 0.5);
    EXPECT_EQ(json["evaluation"]["enabled"], true);
    EXPECT_EQ(json["evaluation"]["label"], "42");
    EXPECT_EQ(json["evaluation"]["metrics"][0], "bleu");
}

TEST(ConfigTest, InvalidYaml) {
    const std::string invalid_yaml = "{ invalid yaml [";

    auto result = Config::LoadFromString(invalid_yaml);
    EXPECT_FALSE(result.ok());
    EXPECT_EQ(result.status().code(), absl::StatusCode::kInvalidArgument);
}

TEST(ConfigTest, NonMapRootIsRejected) {
    auto result = Config::LoadFromString("- just\n- a list\n");
    EXPECT_FALSE(result.ok());
}

TEST(ConfigTest, MissingFile) {
    auto result = Config::LoadFromFile("/nonexistent/evalkit.yaml");
    EXPECT_FALSE(result.ok());
    EXPECT_EQ(result.status().code(), absl::StatusCode::kNotFound);
}

}  // namespace
}  // namespace evalkit
