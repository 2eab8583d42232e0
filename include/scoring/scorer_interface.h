#pragma once

/**
 * @file scorer_interface.h
 * @brief Scoring strategies consumed by the fusion engine
 *
 * Heuristic scorers ship with the engine; a trained model slots in behind the
 * same interface. A scorer that reports itself unavailable sends the engine
 * down the silence-threshold fallback path for that tick.
 */

#include "core/types.h"
#include <string>

namespace turnkeeper {
namespace scoring {

/**
 * @brief Transition-relevance score of a (partial) transcript
 */
class ITextScorer {
public:
    virtual ~ITextScorer() = default;

    /**
     * @brief Score how complete the utterance sounds
     * @return [0,1]; 0.5 for an empty transcript
     */
    virtual float score(const std::string& transcript) = 0;

    virtual bool is_available() const { return true; }

    virtual const char* name() const = 0;
};

/**
 * @brief Hold/shift projection from prosodic features
 */
class IProsodyScorer {
public:
    virtual ~IProsodyScorer() = default;

    /**
     * @return hold + shift == 1
     */
    virtual ProsodyPrediction score(const AudioFeatures& features) = 0;

    virtual bool is_available() const { return true; }

    virtual const char* name() const = 0;
};

} // namespace scoring
} // namespace turnkeeper
