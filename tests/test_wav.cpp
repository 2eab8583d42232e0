/**
 * Tests for WAV and base64 handling used by the speech backend.
 * Asserts:
 * - Encoded PCM decodes back unchanged at the same rate.
 * - Stereo is averaged, float WAVs are scaled, other rates are resampled.
 * - Non-WAV input and bad base64 are ParseErrors.
 *
 * Run from build dir: ./test_wav
 */

#include "logger.h"
#include "wav.h"
#include <cstdint>
#include <cstring>
#include <iostream>
#include <string>

using namespace turnkeeper;

static int failed = 0;

#define ASSERT(cond) do { if (!(cond)) { std::cerr << "FAIL: " << #cond << " (line " << __LINE__ << ")\n"; failed++; } } while(0)

static void put_u32(std::string& out, uint32_t v) {
    for (int i = 0; i < 4; ++i) out.push_back(static_cast<char>((v >> (8 * i)) & 0xFF));
}

static void put_u16(std::string& out, uint16_t v) {
    out.push_back(static_cast<char>(v & 0xFF));
    out.push_back(static_cast<char>((v >> 8) & 0xFF));
}

/// Hand-built header; body appended by the caller
static std::string header(uint16_t format, uint16_t channels, uint32_t rate, uint16_t bits,
                          uint32_t data_size) {
    std::string out("RIFF", 4);
    put_u32(out, 36 + data_size);
    out.append("WAVE", 4);
    out.append("fmt ", 4);
    put_u32(out, 16);
    put_u16(out, format);
    put_u16(out, channels);
    put_u32(out, rate);
    put_u32(out, rate * channels * bits / 8);
    put_u16(out, static_cast<uint16_t>(channels * bits / 8));
    put_u16(out, bits);
    out.append("data", 4);
    put_u32(out, data_size);
    return out;
}

int main() {
    Logger::initialize(LogLevel::ERROR);

    // --- PCM16 mono ---
    {
        AudioBuffer audio = {0, 1000, -1000, 32767, -32768, 12};
        std::string bytes = wav::encode(audio, 16000);
        ASSERT(bytes.size() == 44 + audio.size() * 2);
        ASSERT(bytes.compare(0, 4, "RIFF") == 0);

        Result<AudioBuffer> decoded = wav::decode(bytes, 16000);
        ASSERT(decoded.is_ok());
        ASSERT(decoded.value() == audio);
    }

    // --- Stereo is averaged to mono ---
    {
        std::string bytes = header(1, 2, 16000, 16, 8);
        put_u16(bytes, static_cast<uint16_t>(1000));
        put_u16(bytes, static_cast<uint16_t>(3000));
        put_u16(bytes, static_cast<uint16_t>(static_cast<int16_t>(-200)));
        put_u16(bytes, static_cast<uint16_t>(static_cast<int16_t>(-400)));
        Result<AudioBuffer> decoded = wav::decode(bytes, 16000);
        ASSERT(decoded.is_ok());
        ASSERT(decoded.value().size() == 2);
        ASSERT(decoded.value()[0] == 2000);
        ASSERT(decoded.value()[1] == -300);
    }

    // --- 32-bit float ---
    {
        std::string bytes = header(3, 1, 16000, 32, 12);
        for (float v : {0.5f, -1.0f, 2.0f}) {
            uint32_t raw;
            std::memcpy(&raw, &v, sizeof(raw));
            put_u32(bytes, raw);
        }
        Result<AudioBuffer> decoded = wav::decode(bytes, 16000);
        ASSERT(decoded.is_ok());
        ASSERT(decoded.value().size() == 3);
        ASSERT(decoded.value()[0] == 16384);
        ASSERT(decoded.value()[1] == -32767);
        ASSERT(decoded.value()[2] == 32767);   // clipped
    }

    // --- Resampling ---
    {
        AudioBuffer audio(2400, 500);
        Result<AudioBuffer> decoded = wav::decode(wav::encode(audio, 24000), 16000);
        ASSERT(decoded.is_ok());
        ASSERT(decoded.value().size() == 1600);
        ASSERT(decoded.value()[800] == 500);

        AudioBuffer ramp = {0, 100, 200, 300};
        AudioBuffer up = wav::resample(ramp, 8000, 16000);
        ASSERT(up.size() == 8);
        ASSERT(up[1] == 50 && up[2] == 100);
        ASSERT(wav::resample(ramp, 16000, 16000) == ramp);
    }

    // --- Streamed WAV with an unknown data size ---
    {
        std::string bytes = header(1, 1, 16000, 16, 0);
        put_u16(bytes, 7);
        put_u16(bytes, 9);
        Result<AudioBuffer> decoded = wav::decode(bytes, 16000);
        ASSERT(decoded.is_ok());
        ASSERT(decoded.value().size() == 2);
    }

    // --- Rejected input ---
    {
        Result<AudioBuffer> text = wav::decode("{\"error\": \"model not loaded\"}");
        ASSERT(!text && text.error().type == ErrorType::ParseError);

        std::string no_data("RIFF\0\0\0\0WAVE", 12);
        Result<AudioBuffer> empty = wav::decode(no_data);
        ASSERT(!empty && empty.error().type == ErrorType::ParseError);

        Result<AudioBuffer> mulaw = wav::decode(header(7, 1, 8000, 8, 0));
        ASSERT(!mulaw && mulaw.error().type == ErrorType::ParseError);
    }

    // --- base64 ---
    {
        Result<std::string> plain = wav::base64_decode("aGVsbG8=");
        ASSERT(plain.is_ok() && plain.value() == "hello");

        Result<std::string> uri = wav::base64_decode("data:audio/wav;base64,aGVsbG8=");
        ASSERT(uri.is_ok() && uri.value() == "hello");

        Result<std::string> wrapped = wav::base64_decode("aGVs\nbG8=");
        ASSERT(wrapped.is_ok() && wrapped.value() == "hello");

        Result<std::string> bad = wav::base64_decode("aGV*bG8=");
        ASSERT(!bad && bad.error().type == ErrorType::ParseError);
    }

    if (failed) {
        std::cerr << failed << " assertion(s) failed.\n";
        return 1;
    }
    std::cout << "All wav tests passed.\n";
    return 0;
}
