/// @file metric_input_test.cpp
/// @brief Tests for the immutable metric input record

#include <gtest/gtest.h>

#include "evaluation/metric_input.h"

namespace evalkit::eval {
namespace {

TEST(MetricInputTest, ConstructorSetsInputAndOutput) {
    MetricInput input("What is 2+2?", "4");

    EXPECT_EQ(input.Input(), "What is 2+2?");
    EXPECT_EQ(input.Output(), "4");
    EXPECT_TRUE(input.Expected().empty());
    EXPECT_TRUE(input.Context().empty());
    EXPECT_TRUE(input.Metadata().is_object());
    EXPECT_TRUE(input.Metadata().empty());
}

TEST(MetricInputTest, WithMethodsLeaveOriginalUntouched) {
    const MetricInput original("question", "answer");

    MetricInput modified = original.WithExpected("reference")
                               .WithContext("retrieved passage")
                               .WithOutput("new answer")
                               .WithInput("new question");

    EXPECT_EQ(original.Input(), "question");
    EXPECT_EQ(original.Output(), "answer");
    EXPECT_TRUE(original.Expected().empty());
    EXPECT_TRUE(original.Context().empty());

    EXPECT_EQ(modified.Input(), "new question");
    EXPECT_EQ(modified.Output(), "new answer");
    EXPECT_EQ(modified.Expected(), "reference");
    EXPECT_EQ(modified.Context(), "retrieved passage");
}

TEST(MetricInputTest, MetadataIsCopiedOnWrite) {
    const MetricInput base = MetricInput("q", "a").WithMetadata("source", "unit-test");
    const MetricInput derived = base.WithMetadata("source", "override")
                                    .WithMetadata("attempt", 2);

    EXPECT_EQ(base.GetString("source"), "unit-test");
    EXPECT_FALSE(base.Get("attempt").has_value());

    EXPECT_EQ(derived.GetString("source"), "override");
    ASSERT_TRUE(derived.Get("attempt").has_value());
    EXPECT_EQ(*derived.Get("attempt"), 2);
}

TEST(MetricInputTest, GetStringIgnoresNonStrings) {
    const MetricInput input = MetricInput().WithMetadata("count", 3);

    EXPECT_EQ(input.GetString("count"), "");
    EXPECT_EQ(input.GetString("missing"), "");
}

TEST(MetricInputTest, GetStringListSkipsNonStrings) {
    const MetricInput input =
        MetricInput().WithMetadata("tags", nlohmann::json::array({"a", 1, "b", nullptr}));

    EXPECT_EQ(input.GetStringList("tags"), (std::vector<std::string>{"a", "b"}));
    EXPECT_TRUE(input.GetStringList("missing").empty());

    const MetricInput scalar = MetricInput().WithMetadata("tags", "a");
    EXPECT_TRUE(scalar.GetStringList("tags").empty());
}

TEST(MetricInputTest, WithMetadataObject) {
    const nlohmann::json record = {{"id", 7}, {"split", "test"}};
    const MetricInput input = MetricInput().WithMetadataObject(record);

    EXPECT_EQ(input.Metadata(), record);

    const MetricInput cleared = input.WithMetadataObject(nlohmann::json::array());
    EXPECT_TRUE(cleared.Metadata().empty());
    EXPECT_EQ(input.Metadata(), record);
}

}  // namespace
}  // namespace evalkit::eval
