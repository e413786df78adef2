/// @file string_metrics_test.cpp
/// @brief Tests for string and length heuristics

#include <gtest/gtest.h>

#include "evaluation/heuristic/string_metrics.h"

namespace evalkit::eval::heuristic {
namespace {

class StringMetricsTest : public ::testing::Test {
protected:
    ScoreResult Run(const Metric& metric, const std::string& output,
                    const std::string& expected = "") {
        return metric.Score(*EvalContext::Background(),
                            MetricInput("", output).WithExpected(expected));
    }
};

TEST_F(StringMetricsTest, Equals) {
    Equals strict;
    EXPECT_EQ(strict.Name(), "equals");
    EXPECT_DOUBLE_EQ(Run(strict, "Paris", "Paris").value, 1.0);
    EXPECT_DOUBLE_EQ(Run(strict, "Paris", "paris").value, 0.0);

    Equals relaxed(false);
    EXPECT_DOUBLE_EQ(Run(relaxed, "Paris", "paris").value, 1.0);
    // "ÉCOLE" vs "école"
    EXPECT_DOUBLE_EQ(Run(relaxed, "\xc3\x89" "COLE", "\xc3\xa9" "cole").value, 1.0);
}

TEST_F(StringMetricsTest, ContainsStartsEnds) {
    EXPECT_DOUBLE_EQ(Run(Contains(), "The answer is 42.", "42").value, 1.0);
    EXPECT_DOUBLE_EQ(Run(Contains(), "The answer is 42.", "43").value, 0.0);
    EXPECT_DOUBLE_EQ(Run(Contains(false), "HELLO there", "hello").value, 1.0);

    EXPECT_DOUBLE_EQ(Run(StartsWith(), "Yes, indeed", "Yes").value, 1.0);
    EXPECT_DOUBLE_EQ(Run(StartsWith(), "yes, indeed", "Yes").value, 0.0);
    EXPECT_DOUBLE_EQ(Run(StartsWith(false), "yes, indeed", "Yes").value, 1.0);

    EXPECT_DOUBLE_EQ(Run(EndsWith(), "Final answer: B", "B").value, 1.0);
    EXPECT_DOUBLE_EQ(Run(EndsWith(), "Final answer: B.", "B").value, 0.0);
}

TEST_F(StringMetricsTest, ContainsAny) {
    ContainsAny metric({"cat", "dog"});

    auto hit = Run(metric, "a dog barked");
    EXPECT_DOUBLE_EQ(hit.value, 1.0);
    EXPECT_EQ(*hit.reason, "contains: dog");

    EXPECT_DOUBLE_EQ(Run(metric, "a bird sang").value, 0.0);
    EXPECT_DOUBLE_EQ(Run(metric, "A DOG").value, 0.0);
    EXPECT_DOUBLE_EQ(Run(ContainsAny({"cat", "dog"}, false), "A DOG").value, 1.0);
}

TEST_F(StringMetricsTest, ContainsAllGivesPartialCredit) {
    ContainsAll metric({"alpha", "beta", "gamma", "delta"});

    auto partial = Run(metric, "alpha and gamma");
    EXPECT_DOUBLE_EQ(partial.value, 0.5);
    EXPECT_EQ(*partial.reason, "missing: beta, delta");

    auto full = Run(metric, "alpha beta gamma delta");
    EXPECT_DOUBLE_EQ(full.value, 1.0);
    EXPECT_EQ(*full.reason, "contains all expected values");
}

TEST_F(StringMetricsTest, NotEmpty) {
    NotEmpty metric;
    EXPECT_DOUBLE_EQ(Run(metric, "x").value, 1.0);
    EXPECT_DOUBLE_EQ(Run(metric, "").value, 0.0);
    EXPECT_DOUBLE_EQ(Run(metric, " \t\n").value, 0.0);
}

TEST_F(StringMetricsTest, LengthBetweenIsInclusive) {
    LengthBetween metric(3, 5);
    EXPECT_DOUBLE_EQ(Run(metric, "ab").value, 0.0);
    EXPECT_DOUBLE_EQ(Run(metric, "abc").value, 1.0);
    EXPECT_DOUBLE_EQ(Run(metric, "abcde").value, 1.0);

    auto too_long = Run(metric, "abcdef");
    EXPECT_DOUBLE_EQ(too_long.value, 0.0);
    EXPECT_EQ(*too_long.reason, "length out of range: 6");
}

TEST_F(StringMetricsTest, WordCount) {
    WordCount metric(2, 3);
    EXPECT_DOUBLE_EQ(Run(metric, "one").value, 0.0);
    EXPECT_DOUBLE_EQ(Run(metric, "  one   two ").value, 1.0);
    EXPECT_DOUBLE_EQ(Run(metric, "one two three").value, 1.0);
    EXPECT_DOUBLE_EQ(Run(metric, "one two three four").value, 0.0);
}

TEST_F(StringMetricsTest, NoOffensiveLanguage) {
    NoOffensiveLanguage metric({"idiot", "stupid"});

    EXPECT_DOUBLE_EQ(Run(metric, "Thanks for asking!").value, 1.0);

    auto flagged = Run(metric, "That is a STUPID question");
    EXPECT_DOUBLE_EQ(flagged.value, 0.0);
    EXPECT_EQ(*flagged.reason, "contains offensive pattern");
}

}  // namespace
}  // namespace evalkit::eval::heuristic
