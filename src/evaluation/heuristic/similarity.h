#pragma once

/// @file similarity.h
/// @brief Reference-based text similarity metrics
///
/// Every metric here compares MetricInput::Output() (the candidate) with
/// MetricInput::Expected() (the reference). None of them fails: degenerate
/// inputs map to fixed scores instead.
///
/// | Metric                 | Both empty | One empty |
/// |------------------------|-----------:|----------:|
/// | levenshtein_similarity |        1.0 |  computed |
/// | jaccard_similarity     |        1.0 |       0.0 |
/// | cosine_similarity      |        1.0 |       0.0 |
/// | bleu                   |        0.0 |  0.0 if candidate empty |
/// | rouge_l                |        1.0 |       0.0 |

#include <cstddef>
#include <string>
#include <vector>

#include "evaluation/metric.h"

namespace evalkit::eval::heuristic {

// ============================================================================
// Algorithms
// ============================================================================

/// @brief Edit distance over Unicode code points
size_t LevenshteinDistance(const std::string& a, const std::string& b);

/// @brief 1 - distance / max(len_a, len_b) in code points; 1.0 if both empty
double LevenshteinRatio(const std::string& a, const std::string& b);

/// @brief |A ∩ B| / |A ∪ B| over deduplicated tokens; 1.0 if both are empty
double JaccardIndex(const std::vector<std::string>& a, const std::vector<std::string>& b);

/// @brief Cosine of word-frequency vectors; words are trimmed of
///        non-alphanumeric edges
double WordCosine(const std::string& a, const std::string& b);

/// @brief Simplified sentence BLEU over pre-tokenized text
///
/// Brevity penalty times the geometric mean of clipped n-gram precisions
/// for n = 1..max_n, with zero precisions floored at 0.01.
double BleuScore(const std::vector<std::string>& candidate,
                 const std::vector<std::string>& reference,
                 int max_n);

/// @brief Length of the longest common token subsequence
size_t LcsLength(const std::vector<std::string>& a, const std::vector<std::string>& b);

/// @brief LCS-based F-score with recall weighted by beta
double RougeLScore(const std::vector<std::string>& candidate,
                   const std::vector<std::string>& reference,
                   double beta);

// ============================================================================
// Metrics
// ============================================================================

/// @brief Normalized edit-distance similarity ("levenshtein_similarity")
class LevenshteinSimilarity : public NamedMetric {
public:
    explicit LevenshteinSimilarity(bool case_sensitive = false);

    ScoreResult Score(const EvalContext& ctx, const MetricInput& input) const override;

private:
    bool case_sensitive_;
};

/// @brief Token-set overlap ("jaccard_similarity")
class JaccardSimilarity : public NamedMetric {
public:
    /// @param use_words Whitespace words when true, single code points when false
    explicit JaccardSimilarity(bool case_sensitive = false, bool use_words = true);

    ScoreResult Score(const EvalContext& ctx, const MetricInput& input) const override;

private:
    bool case_sensitive_;
    bool use_words_;
};

/// @brief Word-frequency cosine ("cosine_similarity")
class CosineSimilarity : public NamedMetric {
public:
    explicit CosineSimilarity(bool case_sensitive = false);

    ScoreResult Score(const EvalContext& ctx, const MetricInput& input) const override;

private:
    bool case_sensitive_;
};

/// @brief Simplified BLEU on lower-cased words ("bleu")
class Bleu : public NamedMetric {
public:
    static constexpr int kDefaultMaxN = 4;

    /// @param max_n Highest n-gram order; values <= 0 select kDefaultMaxN
    explicit Bleu(int max_n = kDefaultMaxN);

    ScoreResult Score(const EvalContext& ctx, const MetricInput& input) const override;

    int MaxN() const { return max_n_; }

private:
    int max_n_;
};

/// @brief Simplified ROUGE-L on lower-cased words ("rouge_l")
class RougeL : public NamedMetric {
public:
    /// @param beta Recall weight; values <= 0 select 1.0
    explicit RougeL(double beta = 1.0);

    ScoreResult Score(const EvalContext& ctx, const MetricInput& input) const override;

    double Beta() const { return beta_; }

private:
    double beta_;
};

/// @brief Mean of Levenshtein and word Jaccard similarity ("fuzzy_match")
///
/// The threshold only selects the reason text; a low score is still a
/// successful score.
class FuzzyMatch : public NamedMetric {
public:
    explicit FuzzyMatch(double threshold = 0.8, bool case_sensitive = false);

    ScoreResult Score(const EvalContext& ctx, const MetricInput& input) const override;

private:
    double threshold_;
    bool case_sensitive_;
};

/// @brief Semantic similarity ("semantic_similarity")
///
/// Without an embedding backend this falls back to case-insensitive word
/// cosine and says so in the reason.
class SemanticSimilarity : public NamedMetric {
public:
    SemanticSimilarity();

    ScoreResult Score(const EvalContext& ctx, const MetricInput& input) const override;
};

}  // namespace evalkit::eval::heuristic
