#pragma once

#include <algorithm>
#include <atomic>
#include <cstddef>
#include <cstdint>
#include <cstring>
#include <span>
#include <vector>

// Lock-free single-producer single-consumer ring of int16 PCM samples.
// Producer (PipeWire process callback) calls push(). Consumer (the capture
// accumulation thread) calls pop(). Capacity is counted in samples.
class SampleRing {
public:
    explicit SampleRing(size_t capacity_samples)
        : buf_(capacity_samples), capacity_(capacity_samples) {}

    // Producer: copy samples in. Samples that do not fit are dropped and
    // counted in overruns().
    size_t push(std::span<const int16_t> samples) {
        size_t w = write_pos_.load(std::memory_order_relaxed);
        size_t r = read_pos_.load(std::memory_order_acquire);

        size_t free_slots = capacity_ - (w - r);
        size_t n = std::min(samples.size(), free_slots);
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

    // Producer: raw S16 bytes as delivered by the audio server. A trailing
    // odd byte is ignored.
    size_t push_bytes(const void* data, size_t len) {
        size_t count = len / sizeof(int16_t);
        if (count == 0) return 0;
        // PipeWire buffers are at least 2-byte aligned for S16 streams.
        return push({static_cast<const int16_t*>(data), count});
    }

    // Consumer: move up to out.size() samples into out.
    size_t pop(std::span<int16_t> out) {
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

    // Consumer: take everything currently queued.
    std::vector<int16_t> pop_all() {
        std::vector<int16_t> out(available());
        out.resize(pop(out));
        return out;
    }

    // Consumer: throw away queued samples (used while paused).
    size_t discard() {
        size_t r = read_pos_.load(std::memory_order_relaxed);
        size_t w = write_pos_.load(std::memory_order_acquire);
        read_pos_.store(w, std::memory_order_release);
        return w - r;
    }

    size_t available() const {
        size_t w = write_pos_.load(std::memory_order_acquire);
        size_t r = read_pos_.load(std::memory_order_acquire);
        return w - r;
    }

    size_t capacity() const { return capacity_; }
    size_t overruns() const { return dropped_.load(std::memory_order_relaxed); }

    // Only valid while neither side is running.
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
