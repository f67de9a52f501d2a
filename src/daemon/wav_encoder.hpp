#pragma once

#include <cstddef>
#include <cstdint>
#include <cstring>
#include <optional>
#include <span>
#include <vector>

// In-memory RIFF/WAVE (PCM s16le) encoding for provider uploads.
namespace wav {

constexpr size_t kHeaderSize = 44;

constexpr size_t encoded_size(size_t sample_count) {
    return kHeaderSize + sample_count * sizeof(int16_t);
}

// Largest whole-frame sample count whose encoding fits in max_bytes,
// or 0 when not even one frame fits.
constexpr size_t max_samples_within(size_t max_bytes, uint16_t channels = 1) {
    if (max_bytes <= kHeaderSize || channels == 0) return 0;
    size_t samples = (max_bytes - kHeaderSize) / sizeof(int16_t);
    return samples - samples % channels;
}

inline std::vector<uint8_t> encode(std::span<const int16_t> samples, uint32_t sample_rate,
                                   uint16_t channels = 1) {
    constexpr uint16_t bits_per_sample = 16;
    uint32_t byte_rate = sample_rate * channels * bits_per_sample / 8;
    uint16_t block_align = channels * bits_per_sample / 8;
    uint32_t data_size = static_cast<uint32_t>(samples.size() * sizeof(int16_t));

    std::vector<uint8_t> out(kHeaderSize + data_size);
    size_t pos = 0;
    auto put = [&out, &pos](const void* data, size_t len) {
        std::memcpy(out.data() + pos, data, len);
        pos += len;
    };
    auto put16 = [&put](uint16_t v) { put(&v, 2); };
    auto put32 = [&put](uint32_t v) { put(&v, 4); };

    put("RIFF", 4);
    put32(36 + data_size);
    put("WAVE", 4);
    put("fmt ", 4);
    put32(16);
    put16(1);               // PCM
    put16(channels);
    put32(sample_rate);
    put32(byte_rate);
    put16(block_align);
    put16(bits_per_sample);
    put("data", 4);
    put32(data_size);
    if (data_size > 0) {
        std::memcpy(out.data() + kHeaderSize, samples.data(), data_size);
    }

    return out;
}

struct Header {
    uint16_t channels = 0;
    uint32_t sample_rate = 0;
    uint16_t bits_per_sample = 0;
    uint32_t data_size = 0;
};

// Parses the canonical 44-byte header written by encode().
inline std::optional<Header> parse_header(std::span<const uint8_t> bytes) {
    if (bytes.size() < kHeaderSize) return std::nullopt;
    if (std::memcmp(bytes.data(), "RIFF", 4) != 0 ||
        std::memcmp(bytes.data() + 8, "WAVE", 4) != 0 ||
        std::memcmp(bytes.data() + 36, "data", 4) != 0) {
        return std::nullopt;
    }

    Header h;
    std::memcpy(&h.channels, bytes.data() + 22, 2);
    std::memcpy(&h.sample_rate, bytes.data() + 24, 4);
    std::memcpy(&h.bits_per_sample, bytes.data() + 34, 2);
    std::memcpy(&h.data_size, bytes.data() + 40, 4);
    if (kHeaderSize + h.data_size > bytes.size()) return std::nullopt;
    return h;
}

} // namespace wav
