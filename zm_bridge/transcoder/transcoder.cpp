// Standard Library
#include <cstdio>
#include <filesystem>
#include <iostream>

// Project headers
#include "transcoder.h"
#include "bridge_errors.h"

namespace fs = std::filesystem;

Transcoder::Transcoder(ProcessRunner& runner, const std::string& ffmpeg_binary, bool keep_failed_clips)
    : runner(runner),
    ffmpeg_binary(ffmpeg_binary),
    keep_failed_clips(keep_failed_clips)
{
}

std::string Transcoder::formatOffset(int seconds)
{
    if (seconds < 0) seconds = 0;

    char buffer[32];
    std::snprintf(buffer, sizeof(buffer), "%02d:%02d:%02d", seconds / 3600, (seconds / 60) % 60, seconds % 60);
    return std::string(buffer);
}

std::string Transcoder::temporaryOutputPath(const std::string& output_gif)
{
    return output_gif + ".partial";
}

std::vector<std::string> Transcoder::buildCommand(const TranscodeRequest& request) const
{
    // Output format is forced because the temporary file has no .gif extension.
    return {
        ffmpeg_binary,
        "-stats",
        "-i", request.input_video,
        "-vf", "fps=" + std::to_string(k_output_fps) + ",scale=" + std::to_string(request.scale) + ":-1:flags=lanczos",
        "-ss", formatOffset(request.skip_first_n_secs),
        "-t", std::to_string(request.max_length_secs),
        "-f", "gif",
        "-y",
        temporaryOutputPath(request.output_gif)
    };
}

int Transcoder::convert(const TranscodeRequest& request)
{
    std::cout << "[FFMPEG] Converting to gif scale " << request.scale
        << " skip_first_n_secs " << request.skip_first_n_secs
        << " max_length_secs " << request.max_length_secs
        << " input_video " << request.input_video
        << " output_gif " << request.output_gif << std::endl;

    const std::string partial_gif = temporaryOutputPath(request.output_gif);
    int retcode = 0;
    try
    {
        retcode = runner.run(buildCommand(request));
    }
    catch (const TranscodeError&)
    {
        removeInput(request.input_video);
        throw;
    }

    std::error_code ec;
    if (retcode != 0)
    {
        fs::remove(partial_gif, ec);
        if (!keep_failed_clips)
        {
            removeInput(request.input_video);
        }
        else
        {
            std::cerr << "[FFMPEG WARN] Keeping clip of failed conversion: " << request.input_video << std::endl;
        }
        std::cerr << "[FFMPEG ERROR] ffmpeg exited with " << retcode << " for " << request.input_video << std::endl;
        return retcode;
    }

    removeInput(request.input_video);

    fs::rename(partial_gif, request.output_gif, ec);
    if (ec)
    {
        const std::string reason = ec.message();
        fs::remove(partial_gif, ec);
        throw TranscodeError("cannot move " + partial_gif + " to " + request.output_gif + ": " + reason);
    }

    std::cout << "[FFMPEG] Done: " << request.output_gif << std::endl;
    return retcode;
}

void Transcoder::removeInput(const std::string& input_video) const
{
    std::error_code ec;
    if (!fs::remove(input_video, ec) && ec)
    {
        std::cerr << "[FS ERROR] Failed to delete " << input_video << ": " << ec.message() << std::endl;
    }
}
