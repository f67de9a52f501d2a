#pragma once

#include "platform/audio_compressor.hpp"

#include <string>

// WAV to MP3 through an ffmpeg child process reading stdin and writing
// stdout. A missing ffmpeg binary is reported as an error, which the chunker
// treats as "compression unavailable".
class FfmpegCompressor : public AudioCompressor {
public:
    explicit FfmpegCompressor(std::string bitrate = "64k", std::string program = "ffmpeg");

    std::expected<CompressedAudio, std::string>
        compress(std::span<const uint8_t> wav, std::stop_token stop) override;

private:
    std::string bitrate_;
    std::string program_;
};
