#ifndef TRANSCODER_H
#define TRANSCODER_H

// Standard Library
#include <string>
#include <vector>

// Project headers
#include "process_runner.h"

/**
 * @brief Input of one clip-to-GIF conversion.
 */
struct TranscodeRequest
{
    std::string input_video;    ///< Working copy made by VideoFetcher, removed after conversion
    std::string output_gif;     ///< Final artifact path
    int scale = 0;              ///< Width in pixels
    int skip_first_n_secs = 0;  ///< Seek offset
    int max_length_secs = 0;    ///< Duration cap
};

/**
 * @brief Converts an event clip into a looping GIF with ffmpeg.
 */
class Transcoder
{
public:
    static constexpr int k_output_fps = 15;

    /**
     * @brief Constructs a transcoder.
     * @param Runner that launches ffmpeg.
     * @param ffmpeg executable name or path.
     * @param Keep the working clip when the conversion fails.
     */
    Transcoder(ProcessRunner& runner, const std::string& ffmpeg_binary, bool keep_failed_clips);

    /**
     * @brief Runs ffmpeg for a request.
     *
     * ffmpeg writes to a temporary file that is renamed onto output_gif only when
     * it exits with 0, so output_gif is always either absent, the previous GIF or
     * the complete new one. The input clip is removed afterwards.
     *
     * @param Conversion request.
     * @return ffmpeg exit status.
     * @throws TranscodeError when ffmpeg cannot be launched or the output cannot be renamed.
     */
    int convert(const TranscodeRequest& request);

    /**
     * @brief ffmpeg command line for a request, program name first.
     * @param Conversion request.
     * @return Argument vector.
     */
    std::vector<std::string> buildCommand(const TranscodeRequest& request) const;

    /**
     * @brief Formats seconds as HH:MM:SS for ffmpeg's -ss.
     * @param Seconds, negative values are treated as 0.
     * @return Formatted offset.
     */
    static std::string formatOffset(int seconds);

    static std::string temporaryOutputPath(const std::string& output_gif);

private:
    void removeInput(const std::string& input_video) const;

    // === Members ===
    ProcessRunner& runner;
    std::string ffmpeg_binary;
    bool keep_failed_clips;
};

#endif // TRANSCODER_H
