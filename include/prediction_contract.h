#pragma once

/**
 * @file prediction_contract.h
 * @brief JSON wire format of the turn-prediction endpoint
 *
 * Request:
 *   {"transcript": "...", "audioFeatures": {...}, "silenceDurationMs": 600,
 *    "fallbackThresholdMs": 800}
 * Response:
 *   {"takeTurn": true, "fusedScore": 0.71, "confidence": 0.9,
 *    "breakdown": {"trp", "vapShift", "vapHold", "textWeight", "audioWeight"},
 *    "method": "fusion" | "simple_threshold"}
 *
 * A fallback response's breakdown carries "silenceDurationMs"/"thresholdMs".
 */

#include "errors.h"
#include "fusion_engine.h"
#include <string>

namespace turnkeeper {
namespace contract {

std::string encode_request(const DecisionInput& input);

Result<DecisionInput> decode_request(const std::string& body);

std::string encode_decision(const TurnDecision& decision);

/**
 * @return ParseError for malformed JSON or missing required fields
 */
Result<TurnDecision> decode_decision(const std::string& body);

} // namespace contract
} // namespace turnkeeper
