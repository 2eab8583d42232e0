#include "audio_io.h"
#include "core/ring_buffer.h"
#include "logger.h"
#include <portaudio.h>
#include <algorithm>
#include <atomic>
#include <cmath>
#include <cstring>
#include <map>
#include <mutex>
#include <optional>
#include <sstream>

namespace turnkeeper {

namespace {

/// Seconds of captured audio buffered between callback and tick loop
constexpr int CAPTURE_BUFFER_SECONDS = 2;

/// Fallback cue: short soft tone
constexpr float CUE_TONE_HZ = 220.0f;
constexpr int CUE_TONE_MS = 180;
constexpr float CUE_TONE_LEVEL = 0.08f;

AudioBuffer make_tone(int sample_rate) {
    size_t count = ms_to_samples(CUE_TONE_MS, sample_rate);
    AudioBuffer tone(count);
    for (size_t i = 0; i < count; ++i) {
        float t = static_cast<float>(i) / static_cast<float>(sample_rate);
        // Raised-cosine envelope avoids clicks
        float env = 0.5f * (1.0f - std::cos(2.0f * 3.14159265f * static_cast<float>(i) / count));
        float v = std::sin(2.0f * 3.14159265f * CUE_TONE_HZ * t) * env * CUE_TONE_LEVEL;
        tone[i] = static_cast<Sample>(v * 32767.0f);
    }
    return tone;
}

} // anonymous namespace

class AudioIO::Impl {
public:
    Impl()
        : input_stream_(nullptr), output_stream_(nullptr), sample_rate_(DEFAULT_SAMPLE_RATE),
          volume_(1.0f) {}

    ~Impl() {
        close();
    }

    Result<void> start(const std::string& input_device, const std::string& output_device,
                       int sample_rate) {
        sample_rate_ = sample_rate;
        capture_ = std::make_unique<AudioRingBuffer>(
            ms_to_samples(CAPTURE_BUFFER_SECONDS * 1000, sample_rate));
        cue_tone_ = make_tone(sample_rate);

        PaError err = Pa_Initialize();
        if (err != paNoError) {
            return make_device_error("PortAudio init error: " + std::string(Pa_GetErrorText(err)));
        }
        initialized_ = true;

        int input_idx = find_device(input_device, true);
        if (input_idx < 0) {
            close();
            return make_device_error("Input device not found: " + input_device);
        }
        int output_idx = find_device(output_device, false);
        if (output_idx < 0) {
            close();
            return make_device_error("Output device not found: " + output_device);
        }

        const PaDeviceInfo* input_info = Pa_GetDeviceInfo(input_idx);
        const PaDeviceInfo* output_info = Pa_GetDeviceInfo(output_idx);
        if (!input_info || input_info->maxInputChannels == 0) {
            close();
            return make_device_error("Device '" + input_device + "' has no input channels");
        }
        if (!output_info || output_info->maxOutputChannels == 0) {
            close();
            return make_device_error("Device '" + output_device + "' has no output channels");
        }

        std::ostringstream dev_oss;
        dev_oss << "Using input device: [" << input_idx << "] " << input_info->name
                << ", output device: [" << output_idx << "] " << output_info->name;
        Logger::info(dev_oss.str());

        PaStreamParameters input_params;
        input_params.device = input_idx;
        input_params.channelCount = 1;
        input_params.sampleFormat = paInt16;
        input_params.suggestedLatency = input_info->defaultLowInputLatency;
        input_params.hostApiSpecificStreamInfo = nullptr;

        err = Pa_OpenStream(&input_stream_, &input_params, nullptr, sample_rate_,
                            SAMPLES_PER_FRAME, paClipOff, input_callback, this);
        if (err != paNoError) {
            close();
            return make_device_error("Failed to open input stream: " + std::string(Pa_GetErrorText(err)));
        }

        PaStreamParameters output_params;
        output_params.device = output_idx;
        output_params.channelCount = 1;
        output_params.sampleFormat = paInt16;
        output_params.suggestedLatency = output_info->defaultLowOutputLatency;
        output_params.hostApiSpecificStreamInfo = nullptr;

        err = Pa_OpenStream(&output_stream_, nullptr, &output_params, sample_rate_,
                            SAMPLES_PER_FRAME, paClipOff, output_callback, this);
        if (err != paNoError) {
            close();
            return make_device_error("Failed to open output stream: " + std::string(Pa_GetErrorText(err)));
        }

        err = Pa_StartStream(input_stream_);
        if (err != paNoError) {
            std::ostringstream err_oss;
            err_oss << "Failed to start input stream: " << Pa_GetErrorText(err)
                    << " (Error code: " << err << ")";
            if (err == paUnanticipatedHostError) {
                err_oss << "; check microphone permissions";
            }
            close();
            return make_device_error(err_oss.str());
        }
        err = Pa_StartStream(output_stream_);
        if (err != paNoError) {
            close();
            return make_device_error("Failed to start output stream: " + std::string(Pa_GetErrorText(err)));
        }

        LOG_AUDIO("Streams started at " + std::to_string(sample_rate_) + " Hz");
        return Result<void>();
    }

    void set_event_sink(IEventSink* sink) {
        std::lock_guard<std::mutex> lock(playback_mutex_);
        sink_ = sink;
    }

    void register_cue(const std::string& phrase, const AudioBuffer& audio) {
        std::lock_guard<std::mutex> lock(playback_mutex_);
        cues_[phrase] = audio;
    }

    bool read_frame(AudioFrame& frame) {
        if (!capture_ || !input_stream_ || Pa_IsStreamActive(input_stream_) != 1) {
            return false;
        }
        frame = capture_->read_all();
        return true;
    }

    void play(SessionId session, const SpeechChunk& chunk) {
        std::lock_guard<std::mutex> lock(playback_mutex_);
        current_.reset();
        if (!chunk.audio || chunk.audio->empty()) {
            // Nothing to play: complete right away
            post_finished(session, chunk.index);
            return;
        }
        current_ = Playing{session, chunk.index, chunk.audio, 0};
        paused_ = false;
    }

    void pause() {
        std::lock_guard<std::mutex> lock(playback_mutex_);
        paused_ = true;
    }

    void resume() {
        std::lock_guard<std::mutex> lock(playback_mutex_);
        paused_ = false;
    }

    void stop() {
        std::lock_guard<std::mutex> lock(playback_mutex_);
        current_.reset();
        paused_ = false;
    }

    void set_volume(float volume) {
        volume_ = std::max(0.0f, std::min(1.0f, volume));
    }

    void play_cue(const std::string& phrase) {
        std::lock_guard<std::mutex> lock(playback_mutex_);
        auto it = cues_.find(phrase);
        cue_ = (it != cues_.end()) ? it->second : cue_tone_;
        cue_pos_ = 0;
    }

    void close() {
        if (input_stream_) {
            Pa_StopStream(input_stream_);
            Pa_CloseStream(input_stream_);
            input_stream_ = nullptr;
        }
        if (output_stream_) {
            Pa_StopStream(output_stream_);
            Pa_CloseStream(output_stream_);
            output_stream_ = nullptr;
        }
        if (initialized_) {
            Pa_Terminate();
            initialized_ = false;
        }
    }

    static void list_devices() {
        PaError err = Pa_Initialize();
        if (err != paNoError) {
            Logger::error("PortAudio init error: " + std::string(Pa_GetErrorText(err)));
            return;
        }
        int num_devices = Pa_GetDeviceCount();
        Logger::info("Available audio devices:");
        for (int i = 0; i < num_devices; i++) {
            const PaDeviceInfo* info = Pa_GetDeviceInfo(i);
            if (!info) continue;
            std::ostringstream oss;
            oss << "  [" << i << "] " << info->name;
            if (info->maxInputChannels > 0) oss << " (IN:" << info->maxInputChannels << ")";
            if (info->maxOutputChannels > 0) oss << " (OUT:" << info->maxOutputChannels << ")";
            Logger::info(oss.str());
        }
        Pa_Terminate();
    }

private:
    struct Playing {
        SessionId session;
        uint32_t chunk_index;
        AudioHandle audio;
        size_t cursor;
    };

    int find_device(const std::string& name, bool is_input) {
        int num_devices = Pa_GetDeviceCount();

        if (name == "default" || name.empty()) {
            int default_idx = is_input ? Pa_GetDefaultInputDevice() : Pa_GetDefaultOutputDevice();
            return default_idx == paNoDevice ? -1 : default_idx;
        }

        // Numeric device index
        try {
            size_t consumed = 0;
            int device_idx = std::stoi(name, &consumed);
            if (consumed == name.size() && device_idx >= 0 && device_idx < num_devices) {
                return device_idx;
            }
        } catch (const std::exception&) {
            // Not a number, continue to name matching
        }

        // Exact name, then substring
        for (int i = 0; i < num_devices; i++) {
            const PaDeviceInfo* info = Pa_GetDeviceInfo(i);
            if (info && info->name == name) return i;
        }
        for (int i = 0; i < num_devices; i++) {
            const PaDeviceInfo* info = Pa_GetDeviceInfo(i);
            if (!info) continue;
            bool has_channels = is_input ? info->maxInputChannels > 0 : info->maxOutputChannels > 0;
            if (has_channels && std::string(info->name).find(name) != std::string::npos) {
                return i;
            }
        }
        return -1;
    }

    // Called with playback_mutex_ held
    void post_finished(SessionId session, uint32_t chunk_index) {
        if (!sink_) return;
        PlaybackFinished finished;
        finished.session = session;
        finished.chunk_index = chunk_index;
        sink_->post(finished);
    }

    static int input_callback(const void* input, void*, unsigned long frame_count,
                              const PaStreamCallbackTimeInfo*, PaStreamCallbackFlags status_flags,
                              void* user_data) {
        Impl* self = static_cast<Impl*>(user_data);
        if (!input) {
            return paContinue;
        }
        if (status_flags & paInputOverflow) {
            LOG_AUDIO("Input overflow");
        }
        const Sample* in = static_cast<const Sample*>(input);
        // A full buffer drops audio until the tick loop catches up
        self->capture_->write(in, frame_count);
        return paContinue;
    }

    static int output_callback(const void*, void* output, unsigned long frame_count,
                               const PaStreamCallbackTimeInfo*, PaStreamCallbackFlags,
                               void* user_data) {
        Impl* self = static_cast<Impl*>(user_data);
        Sample* out = static_cast<Sample*>(output);
        std::memset(out, 0, frame_count * sizeof(Sample));

        std::lock_guard<std::mutex> lock(self->playback_mutex_);
        float gain = self->volume_.load();

        if (self->current_ && !self->paused_) {
            Playing& p = *self->current_;
            size_t remaining = p.audio->size() - p.cursor;
            size_t count = std::min(remaining, static_cast<size_t>(frame_count));
            for (size_t i = 0; i < count; ++i) {
                out[i] = static_cast<Sample>((*p.audio)[p.cursor + i] * gain);
            }
            p.cursor += count;
            if (p.cursor >= p.audio->size()) {
                SessionId session = p.session;
                uint32_t index = p.chunk_index;
                self->current_.reset();
                self->post_finished(session, index);
            }
        }

        // Cue voice mixed on top at full level
        if (self->cue_pos_ < self->cue_.size()) {
            size_t count = std::min(self->cue_.size() - self->cue_pos_, static_cast<size_t>(frame_count));
            for (size_t i = 0; i < count; ++i) {
                int mixed = out[i] + self->cue_[self->cue_pos_ + i];
                out[i] = static_cast<Sample>(std::max(-32768, std::min(32767, mixed)));
            }
            self->cue_pos_ += count;
        }
        return paContinue;
    }

    PaStream* input_stream_;
    PaStream* output_stream_;
    bool initialized_ = false;
    int sample_rate_;

    std::unique_ptr<AudioRingBuffer> capture_;

    std::mutex playback_mutex_;
    IEventSink* sink_ = nullptr;
    std::optional<Playing> current_;
    bool paused_ = false;
    std::atomic<float> volume_;

    std::map<std::string, AudioBuffer> cues_;
    AudioBuffer cue_tone_;
    AudioBuffer cue_;
    size_t cue_pos_ = 0;
};

AudioIO::AudioIO() : pimpl_(std::make_unique<Impl>()) {}

AudioIO::~AudioIO() = default;

Result<void> AudioIO::start(const std::string& input_device, const std::string& output_device,
                            int sample_rate) {
    return pimpl_->start(input_device, output_device, sample_rate);
}

void AudioIO::set_event_sink(IEventSink* sink) {
    pimpl_->set_event_sink(sink);
}

void AudioIO::register_cue(const std::string& phrase, const AudioBuffer& audio) {
    pimpl_->register_cue(phrase, audio);
}

bool AudioIO::read_frame(AudioFrame& frame) {
    return pimpl_->read_frame(frame);
}

void AudioIO::play(SessionId session, const SpeechChunk& chunk) {
    pimpl_->play(session, chunk);
}

void AudioIO::pause() {
    pimpl_->pause();
}

void AudioIO::resume() {
    pimpl_->resume();
}

void AudioIO::stop() {
    pimpl_->stop();
}

void AudioIO::set_volume(float volume) {
    pimpl_->set_volume(volume);
}

void AudioIO::play_cue(const std::string& phrase) {
    pimpl_->play_cue(phrase);
}

void AudioIO::close() {
    pimpl_->close();
}

void AudioIO::list_devices() {
    Impl::list_devices();
}

} // namespace turnkeeper
