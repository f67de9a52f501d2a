#pragma once

#include <cstdint>
#include <expected>
#include <span>
#include <stop_token>
#include <string>
#include <vector>

struct CompressedAudio {
    std::vector<uint8_t> bytes;
    std::string filename;
    std::string mime_type;
};

// Lossy re-encoding of a WAV upload. An error means compression is not
// available or failed; callers fall back to splitting the raw audio unless
// stop was requested.
class AudioCompressor {
public:
    virtual ~AudioCompressor() = default;
    virtual std::expected<CompressedAudio, std::string>
        compress(std::span<const uint8_t> wav, std::stop_token stop) = 0;
};
