#ifndef MESSAGE_PROCESSOR_H
#define MESSAGE_PROCESSOR_H

// Standard Library
#include <mutex>
#include <set>
#include <string>

// Project headers
#include "bridge_config.h"
#include "connection_manager.h"
#include "event_notification.h"
#include "gif_publisher.h"
#include "transcoder.h"
#include "video_fetcher.h"

/**
 * @brief Result of processing one event notification.
 */
enum class ProcessOutcome
{
    Published,        ///< GIF produced and announced
    TranscodeFailed,  ///< ffmpeg exited non-zero, nothing published
    PublishFailed,    ///< Publish call failed, connection reset
    Dropped,          ///< Per-event failure under FailurePolicy::DropEvent
    Duplicate,        ///< Same event id already being processed by another job
    ConnectionReset   ///< Failure escalated to a forced disconnect
};

const char* processOutcomeName(ProcessOutcome outcome);

/**
 * @brief Runs fetch -> transcode -> publish for one ZoneMinder event.
 */
class MessageProcessor
{
public:
    MessageProcessor(const BridgeConfig& config,
        const VideoFetcher& fetcher,
        Transcoder& transcoder,
        GifPublisher& publisher,
        ConnectionManager& connection);

    /**
     * @brief Processes one inbound message. Never throws.
     *
     * Failures are logged. Per-event failures follow the configured FailurePolicy,
     * a failed publish call always resets the connection, a non-zero ffmpeg exit
     * status only skips the publish. An event id that is already in flight on
     * another worker is skipped, since both jobs would share working files.
     *
     * @param Message from an event topic.
     * @return What happened to the event.
     */
    ProcessOutcome process(const InboundMessage& message);

    /**
     * @brief Decodes camera id and event id from a message.
     * @param Message from an event topic.
     * @return The notification.
     * @throws MalformedEventError when the payload is not a usable event id.
     */
    EventNotification parseNotification(const InboundMessage& message) const;

    std::string gifFilenameFor(const std::string& event_id) const;
    std::string gifPathFor(const std::string& event_id) const;

private:
    ProcessOutcome handleEventFailure(const std::string& what);
    bool claimEvent(const std::string& event_id);
    void releaseEvent(const std::string& event_id);

    // === Members ===
    const BridgeConfig& config;
    const VideoFetcher& fetcher;
    Transcoder& transcoder;
    GifPublisher& publisher;
    ConnectionManager& connection;

    std::mutex in_flight_mutex;
    std::set<std::string> in_flight_events;
};

#endif // MESSAGE_PROCESSOR_H
