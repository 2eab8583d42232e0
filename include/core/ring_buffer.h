#pragma once

/**
 * @file ring_buffer.h
 * @brief Fixed-capacity ring buffer for audio samples
 *
 * Used for:
 * - Handing captured audio from the device callback to the tick loop
 * - The rolling analysis window of the feature extractor
 */

#include "common.h"
#include <vector>
#include <atomic>
#include <algorithm>

namespace turnkeeper {

/**
 * @brief Ring buffer with bulk read/write
 *
 * Thread-safe for single-producer single-consumer usage. write_overwrite()
 * moves the read side and must only be used when one thread owns both ends.
 */
template<typename T>
class RingBuffer {
public:
    explicit RingBuffer(size_t capacity)
        : buffer_(capacity)
        , capacity_(capacity)
        , write_pos_(0)
        , read_pos_(0)
        , size_(0) {}

    size_t capacity() const { return capacity_; }
    size_t size() const { return size_.load(std::memory_order_acquire); }
    bool empty() const { return size() == 0; }
    bool full() const { return size() == capacity_; }
    size_t available() const { return capacity_ - size(); }

    /**
     * @brief Write items, dropping whatever does not fit
     * @return Number of items actually written
     */
    size_t write(const T* data, size_t count) {
        size_t to_write = std::min(count, available());
        if (to_write == 0) return 0;

        size_t write_idx = write_pos_.load(std::memory_order_relaxed);
        size_t first_chunk = std::min(to_write, capacity_ - write_idx);
        std::copy(data, data + first_chunk, buffer_.begin() + write_idx);
        if (to_write > first_chunk) {
            std::copy(data + first_chunk, data + to_write, buffer_.begin());
        }

        write_pos_.store((write_idx + to_write) % capacity_, std::memory_order_relaxed);
        size_.fetch_add(to_write, std::memory_order_release);
        return to_write;
    }

    size_t write(const std::vector<T>& data) {
        return write(data.data(), data.size());
    }

    /**
     * @brief Write items, discarding the oldest content to make room
     *
     * Only the newest capacity() items of an oversized input are kept.
     */
    void write_overwrite(const std::vector<T>& data) {
        if (capacity_ == 0 || data.empty()) return;
        const T* src = data.data();
        size_t count = data.size();
        if (count > capacity_) {
            src += count - capacity_;
            count = capacity_;
        }
        if (count > available()) {
            skip(count - available());
        }
        write(src, count);
    }

    /**
     * @brief Read (consume) up to count items
     * @return Number of items actually read
     */
    size_t read(T* data, size_t count) {
        size_t to_read = peek(data, count);
        if (to_read == 0) return 0;

        size_t read_idx = read_pos_.load(std::memory_order_relaxed);
        read_pos_.store((read_idx + to_read) % capacity_, std::memory_order_relaxed);
        size_.fetch_sub(to_read, std::memory_order_release);
        return to_read;
    }

    /// Drain everything currently buffered
    std::vector<T> read_all() {
        std::vector<T> result(size());
        result.resize(read(result.data(), result.size()));
        return result;
    }

    size_t peek(T* data, size_t count) const {
        size_t to_peek = std::min(count, size());
        if (to_peek == 0) return 0;

        size_t read_idx = read_pos_.load(std::memory_order_relaxed);
        size_t first_chunk = std::min(to_peek, capacity_ - read_idx);
        std::copy(buffer_.begin() + read_idx, buffer_.begin() + read_idx + first_chunk, data);
        if (to_peek > first_chunk) {
            std::copy(buffer_.begin(), buffer_.begin() + (to_peek - first_chunk), data + first_chunk);
        }
        return to_peek;
    }

    std::vector<T> peek_all() const {
        std::vector<T> result(size());
        peek(result.data(), result.size());
        return result;
    }

    size_t skip(size_t count) {
        size_t to_skip = std::min(count, size());
        if (to_skip == 0) return 0;

        size_t read_idx = read_pos_.load(std::memory_order_relaxed);
        read_pos_.store((read_idx + to_skip) % capacity_, std::memory_order_relaxed);
        size_.fetch_sub(to_skip, std::memory_order_release);
        return to_skip;
    }

    void clear() {
        read_pos_.store(0, std::memory_order_relaxed);
        write_pos_.store(0, std::memory_order_relaxed);
        size_.store(0, std::memory_order_release);
    }

private:
    std::vector<T> buffer_;
    size_t capacity_;
    std::atomic<size_t> write_pos_;
    std::atomic<size_t> read_pos_;
    std::atomic<size_t> size_;
};

using AudioRingBuffer = RingBuffer<Sample>;

} // namespace turnkeeper
