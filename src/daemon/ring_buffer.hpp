#pragma once

#include <algorithm>
#include <atomic>
#include <cstddef>
#include <span>
#include <vector>

// Lock-free single-producer single-consumer ring of float samples.
// Producer (PipeWire thread) calls write(). Consumer (main thread) calls drain_all().
class RingBuffer {
public:
    explicit RingBuffer(size_t capacity_samples)
        : buf_(capacity_samples), capacity_(capacity_samples) {}

    // Producer: returns samples actually written. The remainder is counted as dropped.
    size_t write(std::span<const float> samples) {
        size_t w = write_pos_.load(std::memory_order_relaxed);
        size_t r = read_pos_.load(std::memory_order_acquire);

        size_t avail = capacity_ - (w - r);
        size_t to_write = std::min(samples.size(), avail);
        if (to_write < samples.size()) {
            dropped_.fetch_add(samples.size() - to_write, std::memory_order_relaxed);
        }
        if (to_write == 0) return 0;

        size_t offset = w % capacity_;
        size_t first = std::min(to_write, capacity_ - offset);
        std::copy_n(samples.begin(), first, buf_.begin() + offset);
        if (first < to_write) {
            std::copy_n(samples.begin() + first, to_write - first, buf_.begin());
        }

        write_pos_.store(w + to_write, std::memory_order_release);
        return to_write;
    }

    // Consumer: read up to out.size() samples. Returns samples actually read.
    size_t read(std::span<float> out) {
        size_t r = read_pos_.load(std::memory_order_relaxed);
        size_t w = write_pos_.load(std::memory_order_acquire);

        size_t to_read = std::min(out.size(), w - r);
        if (to_read == 0) return 0;

        size_t offset = r % capacity_;
        size_t first = std::min(to_read, capacity_ - offset);
        std::copy_n(buf_.begin() + offset, first, out.begin());
        if (first < to_read) {
            std::copy_n(buf_.begin(), to_read - first, out.begin() + first);
        }

        read_pos_.store(r + to_read, std::memory_order_release);
        return to_read;
    }

    // Consumer: drain whole frames only; a trailing partial frame stays buffered.
    std::vector<float> drain_all(size_t frame_size = 1) {
        size_t avail = available();
        if (frame_size > 1) avail -= avail % frame_size;
        if (avail == 0) return {};

        std::vector<float> samples(avail);
        read(samples);
        return samples;
    }

    size_t available() const {
        size_t w = write_pos_.load(std::memory_order_acquire);
        size_t r = read_pos_.load(std::memory_order_acquire);
        return w - r;
    }

    size_t capacity() const { return capacity_; }
    size_t dropped() const { return dropped_.load(std::memory_order_relaxed); }

    void reset() {
        read_pos_.store(0, std::memory_order_relaxed);
        write_pos_.store(0, std::memory_order_relaxed);
        dropped_.store(0, std::memory_order_relaxed);
    }

private:
    std::vector<float> buf_;
    size_t capacity_;
    alignas(64) std::atomic<size_t> write_pos_{0};
    alignas(64) std::atomic<size_t> read_pos_{0};
    std::atomic<size_t> dropped_{0};
};
