#include "chunker.hpp"
#include "wav_encoder.hpp"

#include <algorithm>
#include <format>
#include <print>
#include <span>

Chunker::Chunker(ChunkerOptions options, AudioCompressor* compressor)
    : options_(options), compressor_(compressor) {}

std::expected<std::vector<AudioSegment>, PipelineError>
Chunker::split(AudioBuffer buffer, std::stop_token stop) const {
    const uint16_t channels = buffer.channels ? buffer.channels : 1;
    const uint32_t rate = buffer.sample_rate;
    auto samples = buffer.flatten();
    buffer.blocks.clear();

    std::vector<AudioSegment> segments;
    if (samples.empty()) return segments;

    const size_t frames = samples.size() / channels;
    auto whole = wav::encode(samples, rate, channels);

    if (whole.size() <= options_.max_segment_bytes) {
        segments.push_back(AudioSegment{
            .index = 0,
            .first_frame = 0,
            .frame_count = frames,
            .sample_rate = rate,
            .bytes = std::move(whole),
            .filename = "recording.wav",
            .mime_type = "audio/wav",
        });
        return segments;
    }

    if (compressor_ && options_.compress) {
        auto compressed = compressor_->compress(whole, stop);
        if (stop.stop_requested()) {
            return std::unexpected(PipelineError{ErrorKind::Cancelled, "cancelled"});
        }
        if (compressed && compressed->bytes.size() <= options_.max_segment_bytes) {
            std::println(stderr, "chunker: compressed {} KB WAV to {} KB, single upload",
                         whole.size() / 1024, compressed->bytes.size() / 1024);
            segments.push_back(AudioSegment{
                .index = 0,
                .first_frame = 0,
                .frame_count = frames,
                .sample_rate = rate,
                .bytes = std::move(compressed->bytes),
                .filename = std::move(compressed->filename),
                .mime_type = std::move(compressed->mime_type),
            });
            return segments;
        }
        if (compressed) {
            std::println(stderr, "chunker: compressed audio still {} KB, splitting WAV",
                         compressed->bytes.size() / 1024);
        } else {
            std::println(stderr, "chunker: compression unavailable ({}), splitting WAV",
                         compressed.error());
        }
    }

    return split_raw(samples, rate, channels);
}

std::expected<std::vector<AudioSegment>, PipelineError>
Chunker::split_raw(const std::vector<int16_t>& samples, uint32_t sample_rate,
                   uint16_t channels) const {
    size_t per_segment = wav::max_samples_within(options_.max_segment_bytes, channels);
    if (per_segment == 0) {
        return std::unexpected(PipelineError{
            ErrorKind::SegmentSizeExceeded,
            std::format("segment ceiling of {} bytes cannot hold a single frame",
                        options_.max_segment_bytes)});
    }

    std::vector<AudioSegment> segments;
    std::span<const int16_t> all(samples);
    for (size_t offset = 0; offset < all.size(); offset += per_segment) {
        auto slice = all.subspan(offset, std::min(per_segment, all.size() - offset));
        segments.push_back(AudioSegment{
            .index = segments.size(),
            .first_frame = offset / channels,
            .frame_count = slice.size() / channels,
            .sample_rate = sample_rate,
            .bytes = wav::encode(slice, sample_rate, channels),
            .filename = "recording.wav",
            .mime_type = "audio/wav",
        });
    }

    std::println(stderr, "chunker: split {:.1f}s audio into {} segments",
                 static_cast<double>(samples.size() / channels) / sample_rate, segments.size());
    return segments;
}
