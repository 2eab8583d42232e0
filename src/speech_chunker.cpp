#include "speech_chunker.h"
#include "logger.h"
#include "utils.h"
#include <cctype>
#include <set>

namespace turnkeeper {

namespace {

const std::set<std::string>& abbreviations() {
    static const std::set<std::string> words = {
        "dr", "mr", "mrs", "ms", "prof", "sr", "jr",
        "etc", "e.g", "i.e", "vs", "inc", "ltd", "co",
        "st", "ave", "rd", "blvd", "dept", "approx"
    };
    return words;
}

bool is_break_char(char c) {
    return c == ' ' || c == '\n' || c == '\r';
}

bool is_digit(char c) {
    return std::isdigit(static_cast<unsigned char>(c)) != 0;
}

bool is_upper(char c) {
    return std::isupper(static_cast<unsigned char>(c)) != 0;
}

} // anonymous namespace

SpeechChunker::SpeechChunker(const config::ChunkerConfig& config, TimePoint now)
    : config_(config), last_chunk_time_(now) {}

std::vector<SpeechChunk> SpeechChunker::add(const std::string& text, TimePoint now) {
    buffer_ += text;

    std::vector<SpeechChunk> chunks;
    SpeechChunk chunk;
    bool force = ms_between(last_chunk_time_, now) >= config_.force_after_ms;
    while (try_emit(force, chunk)) {
        last_chunk_time_ = now;
        force = false;
        if (!chunk.text.empty()) {
            chunks.push_back(chunk);
        }
    }
    return chunks;
}

std::vector<SpeechChunk> SpeechChunker::flush() {
    std::vector<SpeechChunk> chunks;
    std::string rest = utils::trim_copy(buffer_);
    buffer_.clear();
    if (rest.empty()) {
        return chunks;
    }

    SpeechChunk chunk;
    chunk.index = next_index_++;
    chunk.text = rest;
    chunk.is_final = true;
    chunks.push_back(chunk);
    return chunks;
}

void SpeechChunker::reset(TimePoint now) {
    buffer_.clear();
    next_index_ = 0;
    last_chunk_time_ = now;
}

bool SpeechChunker::try_emit(bool force, SpeechChunk& out) {
    int length = static_cast<int>(buffer_.size());
    if (!force && length < config_.min_chars) {
        return false;
    }

    int boundary = find_strong_boundary();
    if (boundary == -1 && force) {
        boundary = find_weak_boundary();
    }
    if (boundary == -1 && length >= config_.max_chars) {
        boundary = find_last_space();
    }
    if (boundary == -1) {
        return false;
    }

    std::string text = utils::trim_copy(buffer_.substr(0, boundary + 1));
    buffer_.erase(0, boundary + 1);

    out = SpeechChunk{};
    out.text = text;
    out.is_final = false;
    if (!text.empty()) {
        out.index = next_index_++;
        LOG_QUEUE("Chunk " + std::to_string(out.index) + " ready (" +
                  std::to_string(text.size()) + " chars" + (force ? ", forced)" : ")"));
    }
    return true;
}

int SpeechChunker::find_strong_boundary() const {
    int last_valid = -1;
    for (size_t i = static_cast<size_t>(config_.min_chars); i < buffer_.size(); ++i) {
        char c = buffer_[i];
        if (c != '.' && c != '!' && c != '?') continue;
        if (is_false_boundary(i)) continue;
        if (i + 1 == buffer_.size() || is_break_char(buffer_[i + 1])) {
            last_valid = static_cast<int>(i);
        }
    }
    return last_valid;
}

int SpeechChunker::find_weak_boundary() const {
    int last_valid = -1;
    for (size_t i = static_cast<size_t>(config_.min_chars / 2); i < buffer_.size(); ++i) {
        char c = buffer_[i];
        if (c != ':' && c != ',' && c != ';') continue;
        if (i + 1 == buffer_.size() || is_break_char(buffer_[i + 1])) {
            last_valid = static_cast<int>(i);
        }
    }
    return last_valid;
}

int SpeechChunker::find_last_space() const {
    size_t pos = buffer_.rfind(' ');
    return pos == std::string::npos ? -1 : static_cast<int>(pos);
}

bool SpeechChunker::is_false_boundary(size_t index) const {
    if (buffer_[index] != '.') return false;

    // Word before the period; inner dots kept so "e.g." reads as "e.g"
    size_t start = index;
    while (start > 0 && (std::isalpha(static_cast<unsigned char>(buffer_[start - 1])) ||
                         buffer_[start - 1] == '.')) {
        --start;
    }
    while (start < index && buffer_[start] == '.') ++start;
    if (start < index) {
        std::string word = utils::normalize_copy(buffer_.substr(start, index - start));
        if (abbreviations().count(word)) return true;
    }

    char prev = index > 0 ? buffer_[index - 1] : '\0';
    char next = index + 1 < buffer_.size() ? buffer_[index + 1] : '\0';

    // 3.14
    if (is_digit(prev) && is_digit(next)) return true;

    // "J. K. Rowling": single capital, then "." or " " + capital
    if (is_upper(prev)) {
        bool word_start = index < 2 || buffer_[index - 2] == ' ' || buffer_[index - 2] == '\n';
        if (word_start) {
            char after_space = index + 2 < buffer_.size() ? buffer_[index + 2] : '\0';
            if (next == '.' || (next == ' ' && is_upper(after_space))) return true;
        }
    }
    return false;
}

} // namespace turnkeeper
