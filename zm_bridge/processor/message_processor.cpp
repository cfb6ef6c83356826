// Standard Library
#include <filesystem>
#include <iostream>

// Project headers
#include "message_processor.h"
#include "bridge_errors.h"

namespace fs = std::filesystem;

namespace {

    bool isValidUtf8(const std::string& _text)
    {
        std::size_t i = 0;
        while (i < _text.size())
        {
            unsigned char lead = static_cast<unsigned char>(_text[i]);
            std::size_t extra = 0;
            if (lead < 0x80) extra = 0;
            else if ((lead & 0xE0) == 0xC0 && lead >= 0xC2) extra = 1;
            else if ((lead & 0xF0) == 0xE0) extra = 2;
            else if ((lead & 0xF8) == 0xF0 && lead <= 0xF4) extra = 3;
            else return false;

            if (i + extra >= _text.size()) return false;
            for (std::size_t k = 1; k <= extra; ++k)
            {
                if ((static_cast<unsigned char>(_text[i + k]) & 0xC0) != 0x80) return false;
            }
            i += extra + 1;
        }
        return true;
    }

    // The event id becomes part of file names in two folders.
    void checkEventId(const std::string& _event_id)
    {
        if (_event_id.empty())
        {
            throw MalformedEventError("empty event id payload");
        }
        if (!isValidUtf8(_event_id))
        {
            throw MalformedEventError("event id payload is not valid UTF-8");
        }
        if (_event_id == "." || _event_id == "..")
        {
            throw MalformedEventError("event id '" + _event_id + "' is not a file name");
        }
        for (char c : _event_id)
        {
            unsigned char uc = static_cast<unsigned char>(c);
            if (c == '/' || c == '\\' || uc < 0x20 || uc == 0x7F)
            {
                throw MalformedEventError("event id '" + _event_id + "' contains a path separator or control character");
            }
        }
    }

    template <typename Release>
    class ScopeRelease
    {
    public:
        explicit ScopeRelease(Release release) : release(release) {}
        ~ScopeRelease() { release(); }

        ScopeRelease(const ScopeRelease&) = delete;
        ScopeRelease& operator=(const ScopeRelease&) = delete;

    private:
        Release release;
    };
}

const char* processOutcomeName(ProcessOutcome outcome)
{
    switch (outcome)
    {
    case ProcessOutcome::Published: return "published";
    case ProcessOutcome::TranscodeFailed: return "transcode failed";
    case ProcessOutcome::PublishFailed: return "publish failed";
    case ProcessOutcome::Dropped: return "dropped";
    case ProcessOutcome::Duplicate: return "duplicate";
    case ProcessOutcome::ConnectionReset: return "connection reset";
    }
    return "unknown";
}

MessageProcessor::MessageProcessor(const BridgeConfig& config,
    const VideoFetcher& fetcher,
    Transcoder& transcoder,
    GifPublisher& publisher,
    ConnectionManager& connection)
    : config(config),
    fetcher(fetcher),
    transcoder(transcoder),
    publisher(publisher),
    connection(connection)
{
}

std::string MessageProcessor::gifFilenameFor(const std::string& event_id) const
{
    return event_id + ".gif";
}

std::string MessageProcessor::gifPathFor(const std::string& event_id) const
{
    return (fs::path(config.ffmpeg_working_folder) / gifFilenameFor(event_id)).string();
}

EventNotification MessageProcessor::parseNotification(const InboundMessage& message) const
{
    EventNotification notification;
    notification.event_id = message.payload;
    notification.received_at = message.received_at;
    checkEventId(notification.event_id);

    // A topic outside the events base keeps its full name and fails the camera lookup.
    const std::string prefix = config.mqtt_base_events_topic + "/";
    if (message.topic.compare(0, prefix.size(), prefix) == 0)
    {
        notification.camera_id = message.topic.substr(prefix.size());
    }
    else
    {
        notification.camera_id = message.topic;
    }
    return notification;
}

ProcessOutcome MessageProcessor::process(const InboundMessage& message)
{
    try
    {
        EventNotification notification = parseNotification(message);

        if (!claimEvent(notification.event_id))
        {
            std::cerr << "[EVENT WARN] Event id " << notification.event_id << " is already being processed, skipping" << std::endl;
            return ProcessOutcome::Duplicate;
        }
        auto release = [this, &notification] { releaseEvent(notification.event_id); };
        ScopeRelease<decltype(release)> in_flight(release);

        const CameraProfile* camera = config.findCamera(notification.camera_id);
        if (!camera)
        {
            throw UnknownCameraError(notification.camera_id);
        }

        std::cout << "[EVENT] Getting event video " << notification.event_id << " for camera " << camera->id
            << " from base directory " << config.zoneminder_events_video_folder
            << " with event prefix " << camera->event_video_prefix << std::endl;

        std::string outfile_video = fetcher.fetch(camera->event_video_prefix, notification.event_id, notification.received_at);

        TranscodeRequest request;
        request.input_video = outfile_video;
        request.output_gif = gifPathFor(notification.event_id);
        request.scale = camera->scale;
        request.skip_first_n_secs = camera->skip_first_n_secs;
        request.max_length_secs = camera->max_length_secs;

        int convert_retcode = transcoder.convert(request);
        if (convert_retcode != 0)
        {
            std::cerr << "[EVENT ERROR] Invalid return code " << convert_retcode << " from ffmpeg for event id " << notification.event_id << std::endl;
            return ProcessOutcome::TranscodeFailed;
        }

        if (!publisher.publish(camera->id, gifFilenameFor(notification.event_id)))
        {
            std::cerr << "[EVENT ERROR] Publish failed for event id " << notification.event_id << " camera " << camera->id << std::endl;
            connection.forceDisconnect("publish of event " + notification.event_id + " failed");
            return ProcessOutcome::PublishFailed;
        }

        std::cout << "[EVENT] Done processing event_id " << notification.event_id << " for camera " << camera->id << std::endl;
        return ProcessOutcome::Published;
    }
    catch (const EventProcessingError& ex)
    {
        return handleEventFailure(ex.what());
    }
    catch (const std::exception& ex)
    {
        std::cerr << "[EVENT ERROR] Processing " << message.topic << " failed: " << ex.what() << std::endl;
        connection.forceDisconnect(ex.what());
        return ProcessOutcome::ConnectionReset;
    }
}

bool MessageProcessor::claimEvent(const std::string& event_id)
{
    std::lock_guard<std::mutex> lock(in_flight_mutex);
    return in_flight_events.insert(event_id).second;
}

void MessageProcessor::releaseEvent(const std::string& event_id)
{
    std::lock_guard<std::mutex> lock(in_flight_mutex);
    in_flight_events.erase(event_id);
}

ProcessOutcome MessageProcessor::handleEventFailure(const std::string& what)
{
    std::cerr << "[EVENT ERROR] " << what << std::endl;
    if (config.failure_policy == FailurePolicy::DropEvent)
    {
        std::cerr << "[EVENT WARN] Event dropped, connection kept" << std::endl;
        return ProcessOutcome::Dropped;
    }

    connection.forceDisconnect(what);
    return ProcessOutcome::ConnectionReset;
}
