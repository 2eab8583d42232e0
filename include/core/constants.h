#pragma once

/**
 * @file constants.h
 * @brief Default tuning parameters
 *
 * The thresholds below were tuned by ear on real conversations. Every one of
 * them is exposed through EngineConfig; these are only the defaults.
 */

#include <cstdint>

namespace turnkeeper {
namespace constants {

// =============================================================================
// Feature extraction / VAD
// =============================================================================

namespace features {
    /// Analysis tick cadence (ms)
    constexpr int TICK_MS = 50;

    /// Base RMS speaking threshold (normalized 0-1)
    constexpr float SPEAKING_THRESHOLD = 0.025f;

    /// Threshold multiplier while assistant audio is playing (speaker -> mic leakage)
    constexpr float PLAYBACK_THRESHOLD_MULTIPLIER = 1.5f;

    /// Window used for the energy-slope pitch proxy (samples)
    constexpr int PITCH_WINDOW_SAMPLES = 2048;

    /// Divisor mapping half zero-crossings per second to syllables per second
    constexpr float RATE_SCALE = 100.0f;

    constexpr float MIN_SPEAKING_RATE_HZ = 1.0f;
    constexpr float MAX_SPEAKING_RATE_HZ = 6.0f;
}

// =============================================================================
// Scoring / fusion
// =============================================================================

namespace fusion {
    constexpr float TEXT_WEIGHT = 0.6f;
    constexpr float THRESHOLD = 0.7f;
    constexpr int FALLBACK_THRESHOLD_MS = 800;

    /// Online weight adaptation step and bounds
    constexpr float ADAPT_STEP = 0.05f;
    constexpr float MIN_TEXT_WEIGHT = 0.3f;
    constexpr float MAX_TEXT_WEIGHT = 0.8f;

    /// Context-aware fallback threshold clamp
    constexpr int MIN_FALLBACK_THRESHOLD_MS = 500;
    constexpr int MAX_FALLBACK_THRESHOLD_MS = 5000;
}

// =============================================================================
// Interruption classification / barge-in
// =============================================================================

namespace interruption {
    /// Sustained speech required before a burst can abort playback (ms)
    constexpr int BARGE_IN_THRESHOLD_MS = 300;

    /// Bursts shorter than this can be backchannels (ms)
    constexpr int BACKCHANNEL_MAX_MS = 1000;

    /// Quieter than this counts as low intensity
    constexpr float BACKCHANNEL_MAX_INTENSITY = 0.04f;

    /// Louder than this counts as moderate-or-higher intensity
    constexpr float INTERRUPTION_MIN_INTENSITY = 0.03f;

    /// Nasal band for "mm-hmm" style acknowledgments (Hz)
    constexpr float NASAL_MIN_HZ = 80.0f;
    constexpr float NASAL_MAX_HZ = 350.0f;

    /// IMPATIENCE: this many interruptions inside the rolling window
    constexpr int IMPATIENCE_COUNT = 3;
    constexpr int IMPATIENCE_WINDOW_MS = 10000;

    /// Minimum user utterance kept for transcription (ms)
    constexpr int MIN_UTTERANCE_MS = 900;

    /// Minimum utterance while paused so "continue" is not discarded (ms)
    constexpr int PAUSED_MIN_UTTERANCE_MS = 300;
}

// =============================================================================
// Chunking / playback
// =============================================================================

namespace chunker {
    constexpr int MIN_CHARS = 60;
    constexpr int MAX_CHARS = 220;
    constexpr int FORCE_AFTER_MS = 1800;
}

namespace playback {
    /// Requests older than this are failed as CollaboratorTimeout (ms)
    constexpr int COLLABORATOR_TIMEOUT_MS = 8000;
}

// =============================================================================
// Ducking
// =============================================================================

namespace ducking {
    constexpr float SILENCE_VOLUME = 1.0f;
    constexpr float BACKCHANNEL_VOLUME = 0.80f;
    constexpr float TENTATIVE_VOLUME = 0.50f;
    constexpr float CLEAR_VOLUME = 0.20f;

    /// Maximum volume change per tick
    constexpr float STEP_PER_TICK = 0.05f;

    /// Speech shorter than this is tentative (ms)
    constexpr int CLEAR_MIN_MS = 300;
}

// =============================================================================
// Backchannel scheduling
// =============================================================================

namespace backchannel {
    constexpr int MIN_USER_SPEECH_MS = 1800;
    constexpr int MIN_INTERVAL_MS = 8000;
    constexpr int INHIBIT_MS = 500;
}

// =============================================================================
// Remote turn predictor
// =============================================================================

namespace remote {
    constexpr int TIMEOUT_MS = 300;
    constexpr int CONNECT_TIMEOUT_MS = 100;
    constexpr int RETRY_BACKOFF_MS = 2000;     // Local decisions only after a failure
}

} // namespace constants
} // namespace turnkeeper
