#pragma once

/**
 * @file speech_chunker.h
 * @brief Splits streaming reply text into speakable chunks
 *
 * Boundaries, in order of preference:
 * - last '.', '!' or '?' at or after min_chars, followed by whitespace or end
 * - when forced (force_after_ms since the last chunk): last ':', ',' or ';'
 *   at or after min_chars / 2
 * - at max_chars: the last space
 * Abbreviations, decimals and initials never end a chunk.
 */

#include "core/config.h"
#include "core/types.h"
#include <string>
#include <vector>

namespace turnkeeper {

class SpeechChunker {
public:
    explicit SpeechChunker(const config::ChunkerConfig& config = {}, TimePoint now = Clock::now());

    /**
     * @brief Append reply text and emit every chunk that became ready
     */
    std::vector<SpeechChunk> add(const std::string& text, TimePoint now = Clock::now());

    /**
     * @brief Emit the trimmed remainder as the final chunk
     * @return Empty vector if nothing but whitespace remains
     */
    std::vector<SpeechChunk> flush();

    void reset(TimePoint now = Clock::now());

    /// Text received but not yet emitted
    const std::string& pending() const { return buffer_; }

    uint32_t next_index() const { return next_index_; }

private:
    bool try_emit(bool force, SpeechChunk& out);
    int find_strong_boundary() const;
    int find_weak_boundary() const;
    int find_last_space() const;
    bool is_false_boundary(size_t index) const;

    config::ChunkerConfig config_;
    std::string buffer_;
    uint32_t next_index_ = 0;
    TimePoint last_chunk_time_;
};

} // namespace turnkeeper
