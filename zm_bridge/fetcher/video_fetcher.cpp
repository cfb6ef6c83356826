// Standard Library
#include <ctime>
#include <filesystem>
#include <iostream>

// Project headers
#include "video_fetcher.h"
#include "bridge_errors.h"

namespace fs = std::filesystem;

namespace {
    constexpr const char* k_video_extension = ".mp4";

    // Noon of the local calendar day _days_back days before _time; DST shifts never skip a day.
    VideoFetcher::Clock::time_point calendarDaysBefore(VideoFetcher::Clock::time_point _time, int _days_back)
    {
        if (_days_back == 0) return _time;

        std::time_t t = VideoFetcher::Clock::to_time_t(_time);
        std::tm local_tm{};
        localtime_r(&t, &local_tm);
        local_tm.tm_mday -= _days_back;
        local_tm.tm_hour = 12;
        local_tm.tm_min = 0;
        local_tm.tm_sec = 0;
        local_tm.tm_isdst = -1;
        return VideoFetcher::Clock::from_time_t(std::mktime(&local_tm));
    }
}

VideoFetcher::VideoFetcher(const std::string& source_root, const std::string& working_folder, int date_lookback_days)
    : source_root(source_root),
    working_folder(working_folder),
    date_lookback_days(date_lookback_days < 0 ? 0 : date_lookback_days)
{
}

std::string VideoFetcher::formatDate(Clock::time_point time)
{
    std::time_t t = Clock::to_time_t(time);
    std::tm local_tm{};
    localtime_r(&t, &local_tm);

    char buffer[16];
    std::strftime(buffer, sizeof(buffer), "%Y-%m-%d", &local_tm);
    return std::string(buffer);
}

std::string VideoFetcher::sourcePathFor(const std::string& event_video_prefix, const std::string& event_id, Clock::time_point day) const
{
    fs::path path = fs::path(source_root) / formatDate(day) / (event_video_prefix + event_id + k_video_extension);
    return path.string();
}

std::string VideoFetcher::localPathFor(const std::string& event_id) const
{
    return (fs::path(working_folder) / (event_id + k_video_extension)).string();
}

std::string VideoFetcher::fetch(const std::string& event_video_prefix, const std::string& event_id, Clock::time_point received_at) const
{
    std::string source_video;
    for (int day_offset = 0; day_offset <= date_lookback_days; ++day_offset)
    {
        std::string candidate = sourcePathFor(event_video_prefix, event_id, calendarDaysBefore(received_at, day_offset));
        std::error_code ec;
        if (fs::is_regular_file(candidate, ec))
        {
            source_video = candidate;
            break;
        }
        if (day_offset == 0)
        {
            std::cout << "[FETCH] Not in the receipt day folder: " << candidate << std::endl;
        }
    }

    if (source_video.empty())
    {
        throw SourceVideoNotFoundError("no clip for event " + event_id + " at " +
            sourcePathFor(event_video_prefix, event_id, received_at) +
            " (searched " + std::to_string(date_lookback_days + 1) + " day folder(s))");
    }

    std::string outfile_video = localPathFor(event_id);
    std::cout << "[FETCH] Copying video for event id " << event_id << " from " << source_video << " to " << outfile_video << std::endl;

    std::error_code ec;
    fs::copy_file(source_video, outfile_video, fs::copy_options::overwrite_existing, ec);
    if (ec)
    {
        throw EventProcessingError("copy " + source_video + " -> " + outfile_video + " failed: " + ec.message());
    }

    std::cout << "[FETCH] Done: " << outfile_video << std::endl;
    return outfile_video;
}
