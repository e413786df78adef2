#include "evaluation/heuristic/similarity.h"

#include <algorithm>
#include <cmath>
#include <unordered_map>
#include <unordered_set>

#include <absl/strings/str_join.h>

#include "evaluation/heuristic/text.h"

namespace evalkit::eval::heuristic {

namespace {

// Floor applied to a zero n-gram precision before taking its log
constexpr double kBleuSmoothing = 0.01;

std::vector<std::string> CodePointTokens(const std::string& text) {
    std::vector<std::string> tokens;
    for (char32_t cp : DecodeUtf8(text)) {
        tokens.push_back(EncodeUtf8(cp));
    }
    return tokens;
}

std::unordered_map<std::string, int> WordFrequency(const std::string& text) {
    std::unordered_map<std::string, int> freq;
    for (const auto& field : Fields(text)) {
        std::string word = TrimNonAlphanumeric(field);
        if (!word.empty()) {
            ++freq[word];
        }
    }
    return freq;
}

std::unordered_map<std::string, int> NgramCounts(const std::vector<std::string>& words, size_t n) {
    std::unordered_map<std::string, int> counts;
    for (size_t i = 0; i + n <= words.size(); ++i) {
        ++counts[absl::StrJoin(words.begin() + i, words.begin() + i + n, " ")];
    }
    return counts;
}

double BrevityPenalty(size_t candidate_len, size_t reference_len) {
    if (candidate_len >= reference_len) {
        return 1.0;
    }
    return std::exp(1.0 - static_cast<double>(reference_len) /
                              static_cast<double>(candidate_len));
}

double NgramPrecision(const std::vector<std::string>& candidate,
                      const std::vector<std::string>& reference,
                      size_t n) {
    if (candidate.size() < n || reference.size() < n) {
        return 0.0;
    }

    const auto candidate_ngrams = NgramCounts(candidate, n);
    const auto reference_ngrams = NgramCounts(reference, n);

    // Clip each candidate n-gram count by its count in the reference
    int matches = 0;
    for (const auto& [ngram, count] : candidate_ngrams) {
        auto it = reference_ngrams.find(ngram);
        if (it != reference_ngrams.end()) {
            matches += std::min(count, it->second);
        }
    }

    const size_t total = candidate.size() - n + 1;
    return static_cast<double>(matches) / static_cast<double>(total);
}

}  // namespace

// ============================================================================
// Algorithms
// ============================================================================

size_t LevenshteinDistance(const std::string& a, const std::string& b) {
    const std::u32string s1 = DecodeUtf8(a);
    const std::u32string s2 = DecodeUtf8(b);
    if (s1.empty()) {
        return s2.size();
    }
    if (s2.empty()) {
        return s1.size();
    }

    std::vector<size_t> previous(s2.size() + 1);
    std::vector<size_t> current(s2.size() + 1);
    for (size_t j = 0; j <= s2.size(); ++j) {
        previous[j] = j;
    }

    for (size_t i = 1; i <= s1.size(); ++i) {
        current[0] = i;
        for (size_t j = 1; j <= s2.size(); ++j) {
            const size_t cost = s1[i - 1] == s2[j - 1] ? 0 : 1;
            current[j] = std::min({
                previous[j] + 1,         // deletion
                current[j - 1] + 1,      // insertion
                previous[j - 1] + cost,  // substitution
            });
        }
        std::swap(previous, current);
    }

    return previous[s2.size()];
}

double LevenshteinRatio(const std::string& a, const std::string& b) {
    const size_t max_len = std::max(DecodeUtf8(a).size(), DecodeUtf8(b).size());
    if (max_len == 0) {
        return 1.0;
    }
    return 1.0 - static_cast<double>(LevenshteinDistance(a, b)) /
                     static_cast<double>(max_len);
}

double JaccardIndex(const std::vector<std::string>& a, const std::vector<std::string>& b) {
    const std::unordered_set<std::string> set_a(a.begin(), a.end());
    const std::unordered_set<std::string> set_b(b.begin(), b.end());

    if (set_a.empty() && set_b.empty()) {
        return 1.0;
    }

    size_t intersection = 0;
    for (const auto& token : set_a) {
        if (set_b.count(token) > 0) {
            ++intersection;
        }
    }

    const size_t union_size = set_a.size() + set_b.size() - intersection;
    return static_cast<double>(intersection) / static_cast<double>(union_size);
}

double WordCosine(const std::string& a, const std::string& b) {
    const auto vec_a = WordFrequency(a);
    const auto vec_b = WordFrequency(b);

    if (vec_a.empty() || vec_b.empty()) {
        return vec_a.empty() && vec_b.empty() ? 1.0 : 0.0;
    }

    double dot_product = 0.0;
    for (const auto& [word, count_a] : vec_a) {
        auto it = vec_b.find(word);
        if (it != vec_b.end()) {
            dot_product += static_cast<double>(count_a) * it->second;
        }
    }

    double norm_a = 0.0;
    for (const auto& [word, count] : vec_a) {
        norm_a += static_cast<double>(count) * count;
    }
    double norm_b = 0.0;
    for (const auto& [word, count] : vec_b) {
        norm_b += static_cast<double>(count) * count;
    }

    norm_a = std::sqrt(norm_a);
    norm_b = std::sqrt(norm_b);
    if (norm_a == 0.0 || norm_b == 0.0) {
        return 0.0;
    }

    return dot_product / (norm_a * norm_b);
}

double BleuScore(const std::vector<std::string>& candidate,
                 const std::vector<std::string>& reference,
                 int max_n) {
    if (candidate.empty()) {
        return 0.0;
    }
    if (max_n <= 0) {
        max_n = Bleu::kDefaultMaxN;
    }

    const double penalty = BrevityPenalty(candidate.size(), reference.size());

    double log_precision_sum = 0.0;
    for (int n = 1; n <= max_n; ++n) {
        double precision = NgramPrecision(candidate, reference, static_cast<size_t>(n));
        if (precision <= 0.0) {
            precision = kBleuSmoothing;
        }
        log_precision_sum += std::log(precision);
    }

    return penalty * std::exp(log_precision_sum / static_cast<double>(max_n));
}

size_t LcsLength(const std::vector<std::string>& a, const std::vector<std::string>& b) {
    std::vector<size_t> previous(b.size() + 1, 0);
    std::vector<size_t> current(b.size() + 1, 0);

    for (size_t i = 1; i <= a.size(); ++i) {
        current[0] = 0;
        for (size_t j = 1; j <= b.size(); ++j) {
            if (a[i - 1] == b[j - 1]) {
                current[j] = previous[j - 1] + 1;
            } else {
                current[j] = std::max(previous[j], current[j - 1]);
            }
        }
        std::swap(previous, current);
    }

    return previous[b.size()];
}

double RougeLScore(const std::vector<std::string>& candidate,
                   const std::vector<std::string>& reference,
                   double beta) {
    if (candidate.empty() || reference.empty()) {
        return candidate.empty() && reference.empty() ? 1.0 : 0.0;
    }
    if (beta <= 0.0) {
        beta = 1.0;
    }

    const auto lcs = static_cast<double>(LcsLength(candidate, reference));
    const double precision = lcs / static_cast<double>(candidate.size());
    const double recall = lcs / static_cast<double>(reference.size());

    if (precision + recall == 0.0) {
        return 0.0;
    }

    const double beta_sq = beta * beta;
    return ((1.0 + beta_sq) * precision * recall) / (beta_sq * precision + recall);
}

// ============================================================================
// Metrics
// ============================================================================

LevenshteinSimilarity::LevenshteinSimilarity(bool case_sensitive)
    : NamedMetric("levenshtein_similarity"), case_sensitive_(case_sensitive) {}

ScoreResult LevenshteinSimilarity::Score(const EvalContext& /*ctx*/,
                                         const MetricInput& input) const {
    if (case_sensitive_) {
        return ScoreResult::Success(Name(), LevenshteinRatio(input.Output(), input.Expected()));
    }
    return ScoreResult::Success(
        Name(), LevenshteinRatio(ToLower(input.Output()), ToLower(input.Expected())));
}

JaccardSimilarity::JaccardSimilarity(bool case_sensitive, bool use_words)
    : NamedMetric("jaccard_similarity"),
      case_sensitive_(case_sensitive),
      use_words_(use_words) {}

ScoreResult JaccardSimilarity::Score(const EvalContext& /*ctx*/,
                                     const MetricInput& input) const {
    std::string s1 = input.Output();
    std::string s2 = input.Expected();
    if (!case_sensitive_) {
        s1 = ToLower(s1);
        s2 = ToLower(s2);
    }

    if (use_words_) {
        return ScoreResult::Success(Name(), JaccardIndex(Fields(s1), Fields(s2)));
    }
    return ScoreResult::Success(Name(), JaccardIndex(CodePointTokens(s1), CodePointTokens(s2)));
}

CosineSimilarity::CosineSimilarity(bool case_sensitive)
    : NamedMetric("cosine_similarity"), case_sensitive_(case_sensitive) {}

ScoreResult CosineSimilarity::Score(const EvalContext& /*ctx*/,
                                    const MetricInput& input) const {
    if (case_sensitive_) {
        return ScoreResult::Success(Name(), WordCosine(input.Output(), input.Expected()));
    }
    return ScoreResult::Success(
        Name(), WordCosine(ToLower(input.Output()), ToLower(input.Expected())));
}

Bleu::Bleu(int max_n)
    : NamedMetric("bleu"), max_n_(max_n > 0 ? max_n : kDefaultMaxN) {}

ScoreResult Bleu::Score(const EvalContext& /*ctx*/, const MetricInput& input) const {
    return ScoreResult::Success(
        Name(),
        BleuScore(Fields(ToLower(input.Output())), Fields(ToLower(input.Expected())), max_n_));
}

RougeL::RougeL(double beta)
    : NamedMetric("rouge_l"), beta_(beta > 0.0 ? beta : 1.0) {}

ScoreResult RougeL::Score(const EvalContext& /*ctx*/, const MetricInput& input) const {
    return ScoreResult::Success(
        Name(),
        RougeLScore(Fields(ToLower(input.Output())), Fields(ToLower(input.Expected())), beta_));
}

FuzzyMatch::FuzzyMatch(double threshold, bool case_sensitive)
    : NamedMetric("fuzzy_match"), threshold_(threshold), case_sensitive_(case_sensitive) {}

ScoreResult FuzzyMatch::Score(const EvalContext& /*ctx*/, const MetricInput& input) const {
    std::string s1 = input.Output();
    std::string s2 = input.Expected();
    if (!case_sensitive_) {
        s1 = ToLower(s1);
        s2 = ToLower(s2);
    }

    const double score = (LevenshteinRatio(s1, s2) + JaccardIndex(Fields(s1), Fields(s2))) / 2.0;

    if (score >= threshold_) {
        return ScoreResult::WithReason(Name(), score, "fuzzy match above threshold");
    }
    return ScoreResult::WithReason(Name(), score, "fuzzy match below threshold");
}

SemanticSimilarity::SemanticSimilarity() : NamedMetric("semantic_similarity") {}

ScoreResult SemanticSimilarity::Score(const EvalContext& /*ctx*/,
                                      const MetricInput& input) const {
    // TODO: route through an embedding backend once one can be injected
    const double score = WordCosine(ToLower(input.Output()), ToLower(input.Expected()));
    return ScoreResult::WithReason(
        Name(), score, "using word-based approximation (no embedding provider)");
}

}  // namespace evalkit::eval::heuristic
