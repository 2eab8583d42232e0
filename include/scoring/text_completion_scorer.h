#pragma once

/**
 * @file text_completion_scorer.h
 * @brief Heuristic transition-relevance scorer
 *
 * Weighted sum of four cues: syntactic completeness (0.4), pragmatic
 * completeness (0.3), length bucket (0.2) and question form (0.1).
 */

#include "scoring/scorer_interface.h"
#include <memory>

namespace turnkeeper {
namespace scoring {

/**
 * @brief Per-cue scores behind one TRP value
 */
struct TextScoreBreakdown {
    float syntactic = 0.5f;
    float pragmatic = 0.5f;
    float length = 0.5f;
    float question = 0.5f;
    float trp = 0.5f;
};

class TextCompletionScorer : public ITextScorer {
public:
    TextCompletionScorer();
    ~TextCompletionScorer() override;

    float score(const std::string& transcript) override;
    const char* name() const override { return "heuristic-trp"; }

    /**
     * @brief Score with the individual cue values
     */
    TextScoreBreakdown analyze(const std::string& transcript) const;

    static constexpr float SYNTACTIC_WEIGHT = 0.4f;
    static constexpr float PRAGMATIC_WEIGHT = 0.3f;
    static constexpr float LENGTH_WEIGHT = 0.2f;
    static constexpr float QUESTION_WEIGHT = 0.1f;

private:
    class Impl;
    std::unique_ptr<Impl> impl_;
};

} // namespace scoring
} // namespace turnkeeper
