#pragma once

#include "collaborators.h"
#include "errors.h"
#include <memory>
#include <string>

namespace turnkeeper {

/**
 * @brief Microphone and speaker through PortAudio
 *
 * Capture: the input callback writes into a lock-free ring buffer that
 * read_frame() drains. Playback: one chunk at a time, a software gain stage
 * for ducking, pause/resume by holding the playback cursor, and a cue voice
 * mixed on top for backchannels.
 *
 * Thread Safety:
 * - The PortAudio callbacks run on PortAudio's thread
 * - read_frame() must be called from a single consumer thread
 * - Playback control methods are safe from any thread
 */
class AudioIO : public ICaptureDevice, public IPlaybackDevice {
public:
    AudioIO();
    ~AudioIO() override;

    // Non-copyable
    AudioIO(const AudioIO&) = delete;
    AudioIO& operator=(const AudioIO&) = delete;

    /**
     * @brief Open and start both streams
     * @param input_device Device name, index, or "default"
     * @param output_device Device name, index, or "default"
     * @return DeviceError if either device cannot be opened
     */
    Result<void> start(const std::string& input_device,
                       const std::string& output_device,
                       int sample_rate);

    /**
     * @brief Where PlaybackFinished is posted; must outlive playback
     */
    void set_event_sink(IEventSink* sink);

    /**
     * @brief Audio played for a backchannel phrase (a soft tone otherwise)
     */
    void register_cue(const std::string& phrase, const AudioBuffer& audio);

    // ICaptureDevice
    bool read_frame(AudioFrame& frame) override;

    // IPlaybackDevice
    void play(SessionId session, const SpeechChunk& chunk) override;
    void pause() override;
    void resume() override;
    void stop() override;
    void set_volume(float volume) override;
    void play_cue(const std::string& phrase) override;

    /**
     * @brief Close both streams
     */
    void close();

    /**
     * @brief List all available audio devices to console
     */
    static void list_devices();

private:
    class Impl;
    std::unique_ptr<Impl> pimpl_;
};

} // namespace turnkeeper
