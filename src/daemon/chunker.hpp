#pragma once

#include "audio/audio_buffer.hpp"
#include "pipeline_error.hpp"
#include "platform/audio_compressor.hpp"

#include <cstddef>
#include <cstdint>
#include <expected>
#include <stop_token>
#include <string>
#include <vector>

// Upload-ready slice of a recording. Segment i always covers an earlier
// time range than segment i+1.
struct AudioSegment {
    size_t index = 0;
    size_t first_frame = 0;
    size_t frame_count = 0;
    uint32_t sample_rate = 0;
    std::vector<uint8_t> bytes;
    std::string filename;
    std::string mime_type;

    double duration_s() const {
        return sample_rate ? static_cast<double>(frame_count) / sample_rate : 0.0;
    }
};

struct ChunkerOptions {
    size_t max_segment_bytes = 25 * 1024 * 1024;
    bool compress = true;
};

class Chunker {
public:
    explicit Chunker(ChunkerOptions options, AudioCompressor* compressor = nullptr);

    // An empty buffer yields no segments. A stop request during compression
    // fails with Cancelled.
    std::expected<std::vector<AudioSegment>, PipelineError>
        split(AudioBuffer buffer, std::stop_token stop = {}) const;

    const ChunkerOptions& options() const { return options_; }

private:
    std::expected<std::vector<AudioSegment>, PipelineError>
        split_raw(const std::vector<int16_t>& samples, uint32_t sample_rate,
                  uint16_t channels) const;

    ChunkerOptions options_;
    AudioCompressor* compressor_;
};
