#pragma once

#include <algorithm>
#include <atomic>
#include <cstddef>
#include <cstdint>
#include <cstring>
#include <span>
#include <vector>

// Lock-free single-producer single-consumer ring of S16 samples.
// Producer (PipeWire RT thread) calls write(). Consumer (capture thread) calls read().
class SampleRing {
public:
    explicit SampleRing(size_t capacity_samples)
        : buf_(capacity_samples), capacity_(capacity_samples) {}

    // Producer: returns samples actually stored. Samples that do not fit are
    // counted as dropped; the consumer is never blocked by the producer.
    size_t write(std::span<const int16_t> samples) {
        size_t w = write_pos_.load(std::memory_order_relaxed);
        size_t r = read_pos_.load(std::memory_order_acquire);

        size_t free_space = capacity_ - (w - r);
        size_t n = std::min(samples.size(), free_space);
        if (n < samples.size()) {
            dropped_.fetch_add(samples.size() - n, std::memory_order_relaxed);
        }
        if (n == 0) return 0;

        size_t offset = w % capacity_;
        size_t first = std::min(n, capacity_ - offset);
        std::memcpy(buf_.data() + offset, samples.data(), first * sizeof(int16_t));
        if (first < n) {
            std::memcpy(buf_.data(), samples.data() + first, (n - first) * sizeof(int16_t));
        }

        write_pos_.store(w + n, std::memory_order_release);
        return n;
    }

    // Consumer: reads up to out.size() samples.
    size_t read(std::span<int16_t> out) {
        size_t r = read_pos_.load(std::memory_order_relaxed);
        size_t w = write_pos_.load(std::memory_order_acquire);

        size_t n = std::min(out.size(), w - r);
        if (n == 0) return 0;

        size_t offset = r % capacity_;
        size_t first = std::min(n, capacity_ - offset);
        std::memcpy(out.data(), buf_.data() + offset, first * sizeof(int16_t));
        if (first < n) {
            std::memcpy(out.data() + first, buf_.data(), (n - first) * sizeof(int16_t));
        }

        read_pos_.store(r + n, std::memory_order_release);
        return n;
    }

    // Consumer: takes exactly `count` samples, or nothing if fewer are buffered.
    std::vector<int16_t> take(size_t count) {
        if (available() < count) return {};
        std::vector<int16_t> out(count);
        read(out);
        return out;
    }

    size_t available() const {
        size_t w = write_pos_.load(std::memory_order_acquire);
        size_t r = read_pos_.load(std::memory_order_acquire);
        return w - r;
    }

    size_t capacity() const { return capacity_; }
    size_t dropped() const { return dropped_.load(std::memory_order_relaxed); }

    // Only valid while the producer is not running.
    void reset() {
        read_pos_.store(0, std::memory_order_relaxed);
        write_pos_.store(0, std::memory_order_relaxed);
        dropped_.store(0, std::memory_order_relaxed);
    }

private:
    std::vector<int16_t> buf_;
    size_t capacity_;
    alignas(64) std::atomic<size_t> write_pos_{0};
    alignas(64) std::atomic<size_t> read_pos_{0};
    std::atomic<size_t> dropped_{0};
};
