#include "wav.h"
#include <algorithm>
#include <cmath>
#include <cstring>

namespace turnkeeper {
namespace wav {

namespace {

void put_u32(std::string& out, uint32_t v) {
    for (int i = 0; i < 4; ++i) out.push_back(static_cast<char>((v >> (8 * i)) & 0xFF));
}

void put_u16(std::string& out, uint16_t v) {
    out.push_back(static_cast<char>(v & 0xFF));
    out.push_back(static_cast<char>((v >> 8) & 0xFF));
}

uint32_t get_u32(const std::string& in, size_t pos) {
    uint32_t v = 0;
    for (int i = 3; i >= 0; --i) v = (v << 8) | static_cast<unsigned char>(in[pos + i]);
    return v;
}

uint16_t get_u16(const std::string& in, size_t pos) {
    return static_cast<uint16_t>(static_cast<unsigned char>(in[pos]) |
                                 (static_cast<unsigned char>(in[pos + 1]) << 8));
}

int base64_value(char c) {
    if (c >= 'A' && c <= 'Z') return c - 'A';
    if (c >= 'a' && c <= 'z') return c - 'a' + 26;
    if (c >= '0' && c <= '9') return c - '0' + 52;
    if (c == '+' || c == '-') return 62;
    if (c == '/' || c == '_') return 63;
    return -1;
}

constexpr uint16_t FORMAT_PCM = 1;
constexpr uint16_t FORMAT_FLOAT = 3;
constexpr uint16_t FORMAT_EXTENSIBLE = 0xFFFE;

} // anonymous namespace

std::string encode(const AudioBuffer& audio, int sample_rate) {
    const uint16_t channels = 1;
    const uint16_t bits = 16;
    uint32_t data_size = static_cast<uint32_t>(audio.size() * sizeof(Sample));

    std::string out;
    out.reserve(44 + data_size);

    // RIFF header
    out.append("RIFF", 4);
    put_u32(out, 36 + data_size);
    out.append("WAVE", 4);

    // fmt chunk
    out.append("fmt ", 4);
    put_u32(out, 16);
    put_u16(out, FORMAT_PCM);
    put_u16(out, channels);
    put_u32(out, static_cast<uint32_t>(sample_rate));
    put_u32(out, static_cast<uint32_t>(sample_rate) * channels * bits / 8);
    put_u16(out, channels * bits / 8);
    put_u16(out, bits);

    // data chunk
    out.append("data", 4);
    put_u32(out, data_size);
    for (Sample s : audio) {
        put_u16(out, static_cast<uint16_t>(s));
    }
    return out;
}

Result<AudioBuffer> decode(const std::string& bytes, int target_rate) {
    if (bytes.size() < 12 || bytes.compare(0, 4, "RIFF") != 0 || bytes.compare(8, 4, "WAVE") != 0) {
        return make_parse_error("not a RIFF/WAVE file");
    }

    uint16_t format = 0;
    uint16_t channels = 0;
    uint32_t sample_rate = 0;
    uint16_t bits = 0;
    size_t data_pos = 0;
    size_t data_size = 0;

    size_t pos = 12;
    while (pos + 8 <= bytes.size()) {
        std::string id = bytes.substr(pos, 4);
        size_t size = get_u32(bytes, pos + 4);
        size_t body = pos + 8;
        if (id == "fmt " && body + 16 <= bytes.size()) {
            format = get_u16(bytes, body);
            channels = get_u16(bytes, body + 2);
            sample_rate = get_u32(bytes, body + 4);
            bits = get_u16(bytes, body + 14);
            if (format == FORMAT_EXTENSIBLE && size >= 26 && body + 26 <= bytes.size()) {
                format = get_u16(bytes, body + 24);
            }
        } else if (id == "data") {
            data_pos = body;
            // Streamed WAVs may carry 0 or 0xFFFFFFFF as the data size
            data_size = std::min(size, bytes.size() - body);
            if (size == 0) data_size = bytes.size() - body;
            break;
        }
        pos = body + size + (size & 1);
    }

    if (channels == 0 || sample_rate == 0 || data_pos == 0) {
        return make_parse_error("WAV is missing its fmt or data chunk");
    }

    AudioBuffer mono;
    if (format == FORMAT_PCM && bits == 16) {
        size_t frames = data_size / (2 * channels);
        mono.reserve(frames);
        for (size_t f = 0; f < frames; ++f) {
            int sum = 0;
            for (uint16_t c = 0; c < channels; ++c) {
                sum += static_cast<int16_t>(get_u16(bytes, data_pos + (f * channels + c) * 2));
            }
            mono.push_back(static_cast<Sample>(sum / channels));
        }
    } else if (format == FORMAT_FLOAT && bits == 32) {
        size_t frames = data_size / (4 * channels);
        mono.reserve(frames);
        for (size_t f = 0; f < frames; ++f) {
            float sum = 0.0f;
            for (uint16_t c = 0; c < channels; ++c) {
                uint32_t raw = get_u32(bytes, data_pos + (f * channels + c) * 4);
                float value;
                std::memcpy(&value, &raw, sizeof(value));
                sum += value;
            }
            float v = std::max(-1.0f, std::min(1.0f, sum / channels));
            mono.push_back(static_cast<Sample>(std::lround(v * 32767.0f)));
        }
    } else {
        return make_parse_error("unsupported WAV encoding (format " + std::to_string(format) +
                                ", " + std::to_string(bits) + " bits)");
    }

    return resample(mono, static_cast<int>(sample_rate), target_rate);
}

AudioBuffer resample(const AudioBuffer& input, int from_rate, int to_rate) {
    if (from_rate == to_rate || input.empty() || from_rate <= 0 || to_rate <= 0) {
        return input;
    }
    size_t out_size = static_cast<size_t>(
        static_cast<double>(input.size()) * to_rate / from_rate);
    AudioBuffer out(out_size);
    double step = static_cast<double>(from_rate) / to_rate;
    for (size_t i = 0; i < out_size; ++i) {
        double src = i * step;
        size_t i0 = static_cast<size_t>(src);
        size_t i1 = std::min(i0 + 1, input.size() - 1);
        double frac = src - static_cast<double>(i0);
        double v = input[i0] * (1.0 - frac) + input[i1] * frac;
        out[i] = static_cast<Sample>(std::lround(v));
    }
    return out;
}

Result<std::string> base64_decode(const std::string& input) {
    size_t start = 0;
    size_t comma = input.find(',');
    if (input.compare(0, 5, "data:") == 0 && comma != std::string::npos) {
        start = comma + 1;
    }

    std::string out;
    out.reserve((input.size() - start) * 3 / 4);
    uint32_t acc = 0;
    int bits = 0;
    for (size_t i = start; i < input.size(); ++i) {
        char c = input[i];
        if (c == '=') break;
        if (c == '\n' || c == '\r' || c == ' ') continue;
        int v = base64_value(c);
        if (v < 0) {
            return make_parse_error("invalid base64 character at " + std::to_string(i));
        }
        acc = (acc << 6) | static_cast<uint32_t>(v);
        bits += 6;
        if (bits >= 8) {
            bits -= 8;
            out.push_back(static_cast<char>((acc >> bits) & 0xFF));
        }
    }
    return out;
}

} // namespace wav
} // namespace turnkeeper
