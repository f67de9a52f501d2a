#include "platform/linux/ffmpeg_compressor.hpp"

#include "platform/linux/subprocess.hpp"

FfmpegCompressor::FfmpegCompressor(std::string bitrate, std::string program)
    : bitrate_(std::move(bitrate)), program_(std::move(program)) {}

std::expected<CompressedAudio, std::string>
FfmpegCompressor::compress(std::span<const uint8_t> wav, std::stop_token stop) {
    std::string_view input(reinterpret_cast<const char*>(wav.data()), wav.size());

    auto res = subprocess::run({program_, "-hide_banner", "-loglevel", "error", "-nostdin",
                                "-f", "wav", "-i", "pipe:0",
                                "-vn", "-codec:a", "libmp3lame", "-b:a", bitrate_,
                                "-f", "mp3", "pipe:1"},
                               input, true, stop);
    if (!res) return std::unexpected(res.error());

    if (res->exit_code == subprocess::kExecFailed) {
        return std::unexpected(program_ + " not available");
    }
    if (res->exit_code != 0) {
        return std::unexpected(program_ + " exited with code " + std::to_string(res->exit_code));
    }
    if (res->output.empty()) {
        return std::unexpected(program_ + " produced no output");
    }

    return CompressedAudio{
        .bytes = std::vector<uint8_t>(res->output.begin(), res->output.end()),
        .filename = "recording.mp3",
        .mime_type = "audio/mpeg",
    };
}
