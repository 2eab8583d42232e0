#pragma once

#include <cstdint>
#include <vector>
#include <string>
#include <chrono>
#include <memory>

namespace turnkeeper {

// Audio types
using Sample = int16_t;
using AudioFrame = std::vector<Sample>;
using AudioBuffer = std::vector<Sample>;

// Timing
using Clock = std::chrono::steady_clock;
using TimePoint = Clock::time_point;
using Duration = std::chrono::milliseconds;

inline int64_t ms_since(TimePoint start) {
    return std::chrono::duration_cast<Duration>(Clock::now() - start).count();
}

inline int64_t ms_between(TimePoint earlier, TimePoint later) {
    return std::chrono::duration_cast<Duration>(later - earlier).count();
}

// Audio format constants
constexpr int DEFAULT_SAMPLE_RATE = 16000;
constexpr int FRAME_SIZE_MS = 20;
constexpr int SAMPLES_PER_FRAME = (DEFAULT_SAMPLE_RATE * FRAME_SIZE_MS) / 1000; // 320 samples @ 16kHz

inline size_t ms_to_samples(int ms, int sample_rate = DEFAULT_SAMPLE_RATE) {
    return (static_cast<size_t>(ms) * static_cast<size_t>(sample_rate)) / 1000;
}

} // namespace turnkeeper
