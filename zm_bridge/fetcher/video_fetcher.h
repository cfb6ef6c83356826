#ifndef VIDEO_FETCHER_H
#define VIDEO_FETCHER_H

// Standard Library
#include <chrono>
#include <string>

/**
 * @brief Copies the recorded clip of a ZoneMinder event into the ffmpeg working folder.
 *
 * ZoneMinder stores clips as <events_video_folder>/<YYYY-MM-DD>/<prefix><event_id>.mp4.
 */
class VideoFetcher
{
public:
    using Clock = std::chrono::system_clock;

    /**
     * @brief Constructs a fetcher.
     * @param ZoneMinder events video folder.
     * @param ffmpeg working folder the clip is copied into.
     * @param Number of previous days searched when the clip is not in the receipt day's folder.
     */
    VideoFetcher(const std::string& source_root, const std::string& working_folder, int date_lookback_days);

    /**
     * @brief Copies the clip of an event into the working folder.
     * @param Camera's event video prefix.
     * @param Event id.
     * @param Time the event notification was received; selects the date folder.
     * @return Path of the local copy, <working_folder>/<event_id>.mp4
     * @throws SourceVideoNotFoundError when no date folder holds the clip.
     * @throws EventProcessingError when the copy fails.
     */
    std::string fetch(const std::string& event_video_prefix, const std::string& event_id, Clock::time_point received_at) const;

    std::string sourcePathFor(const std::string& event_video_prefix, const std::string& event_id, Clock::time_point day) const;
    std::string localPathFor(const std::string& event_id) const;

    /**
     * @brief Local calendar date of a time point.
     * @param Time point.
     * @return Date as YYYY-MM-DD
     */
    static std::string formatDate(Clock::time_point time);

private:
    // === Members ===
    std::string source_root;
    std::string working_folder;
    int date_lookback_days;
};

#endif // VIDEO_FETCHER_H
