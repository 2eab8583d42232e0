#pragma once

/**
 * @file wav.h
 * @brief WAV encode/decode for the speech backend
 */

#include "common.h"
#include "errors.h"
#include <string>

namespace turnkeeper {
namespace wav {

/**
 * @brief 16-bit mono PCM RIFF file in memory
 */
std::string encode(const AudioBuffer& audio, int sample_rate = DEFAULT_SAMPLE_RATE);

/**
 * @brief Decode 16-bit PCM or 32-bit float WAV to mono 16-bit at target_rate
 *
 * Channels are averaged; other rates are linearly resampled.
 * @return ParseError for anything that is not a supported RIFF/WAVE file
 */
Result<AudioBuffer> decode(const std::string& bytes, int target_rate = DEFAULT_SAMPLE_RATE);

/// Linear interpolation resampler
AudioBuffer resample(const AudioBuffer& input, int from_rate, int to_rate);

/**
 * @brief Decode base64, tolerating a "data:...;base64," prefix
 */
Result<std::string> base64_decode(const std::string& input);

} // namespace wav
} // namespace turnkeeper
