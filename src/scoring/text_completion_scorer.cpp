/**
 * @file text_completion_scorer.cpp
 * @brief Heuristic transition-relevance scorer implementation
 */

#include "scoring/text_completion_scorer.h"
#include "logger.h"
#include "utils.h"
#include <iomanip>
#include <regex>
#include <sstream>
#include <vector>

namespace turnkeeper {
namespace scoring {

/**
 * @brief Compiled patterns; input is always trimmed lowercase text
 */
class TextCompletionScorer::Impl {
public:
    Impl()
        : incomplete_{
              std::regex(R"(\.\.\.$)"),
              std::regex(R"(\b(to|at|in|from|with|and|or|but)\s*$)"),
              std::regex(R"(^(so|and|but|however|because)\s+\w+\s*$)"),
              std::regex(R"(,\s*$)")}
        , complete_{
              std::regex(R"([.!?]$)"),
              std::regex(R"(\b(done|finished|complete|that's all|okay)\s*$)")}
        , wh_start_(R"(^(who|what|when|where|why|how|which|whose|whom)\b)")
        , opinion_start_(R"(^(i think|i believe|it seems|it appears|in my opinion)\b)")
        , directive_start_(R"(^(please|could you|can you|would you|let's)\b)")
        , acknowledgment_(R"(^(yes|no|okay|sure|right|exactly|definitely|absolutely)$)")
        , yes_no_start_(R"(^(do|does|did|is|are|was|were|can|could|will|would|should|may|might)\b)")
        , wh_question_(R"(\b(who|what|when|where|why|how)\b.*\?)")
        , tag_question_(R"((isn't it|don't you|right|correct)\?$)")
    {}

    float syntactic(const std::string& text, size_t word_count) const {
        for (const auto& pattern : incomplete_) {
            if (std::regex_search(text, pattern)) return 0.2f;
        }
        for (const auto& pattern : complete_) {
            if (std::regex_search(text, pattern)) return 0.9f;
        }
        return word_count >= 5 ? 0.7f : 0.5f;
    }

    float pragmatic(const std::string& text) const {
        if (std::regex_search(text, wh_start_)) {
            return text.find('?') != std::string::npos ? 0.95f : 0.6f;
        }
        if (std::regex_search(text, opinion_start_)) return 0.8f;
        if (std::regex_search(text, directive_start_)) return 0.85f;
        if (std::regex_match(text, acknowledgment_)) return 0.95f;
        return 0.6f;
    }

    static float length(size_t word_count) {
        if (word_count <= 2) return 0.4f;
        if (word_count <= 10) return 0.8f;
        if (word_count <= 25) return 0.75f;
        return 0.6f;
    }

    float question(const std::string& text) const {
        if (std::regex_search(text, yes_no_start_)) {
            return text.find('?') != std::string::npos ? 0.9f : 0.7f;
        }
        if (std::regex_search(text, wh_question_)) return 0.9f;
        if (std::regex_search(text, tag_question_)) return 0.95f;
        return 0.5f;
    }

private:
    std::vector<std::regex> incomplete_;
    std::vector<std::regex> complete_;
    std::regex wh_start_;
    std::regex opinion_start_;
    std::regex directive_start_;
    std::regex acknowledgment_;
    std::regex yes_no_start_;
    std::regex wh_question_;
    std::regex tag_question_;
};

TextCompletionScorer::TextCompletionScorer()
    : impl_(std::make_unique<Impl>()) {}

TextCompletionScorer::~TextCompletionScorer() = default;

TextScoreBreakdown TextCompletionScorer::analyze(const std::string& transcript) const {
    TextScoreBreakdown result;
    std::string text = utils::clean_copy(transcript);
    if (text.empty()) {
        return result;
    }

    size_t word_count = utils::count_words(text);
    result.syntactic = impl_->syntactic(text, word_count);
    result.pragmatic = impl_->pragmatic(text);
    result.length = Impl::length(word_count);
    result.question = impl_->question(text);
    result.trp = result.syntactic * SYNTACTIC_WEIGHT +
                 result.pragmatic * PRAGMATIC_WEIGHT +
                 result.length * LENGTH_WEIGHT +
                 result.question * QUESTION_WEIGHT;
    return result;
}

float TextCompletionScorer::score(const std::string& transcript) {
    TextScoreBreakdown b = analyze(transcript);

    std::ostringstream oss;
    oss << std::fixed << std::setprecision(2)
        << "TRP=" << b.trp
        << " (syntactic=" << b.syntactic
        << " pragmatic=" << b.pragmatic
        << " length=" << b.length
        << " question=" << b.question << ") \""
        << transcript.substr(0, 50) << "\"";
    LOG_SCORE(oss.str());

    return b.trp;
}

} // namespace scoring
} // namespace turnkeeper
