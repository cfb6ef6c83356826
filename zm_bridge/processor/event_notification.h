#ifndef EVENT_NOTIFICATION_H
#define EVENT_NOTIFICATION_H

// Standard Library
#include <chrono>
#include <string>

/**
 * @brief A message as delivered by the broker, stamped with its receipt time.
 */
struct InboundMessage
{
    std::string topic;
    std::string payload;
    bool retained = false;
    std::chrono::system_clock::time_point received_at;
};

/**
 * @brief One ZoneMinder motion event, decoded from an InboundMessage.
 */
struct EventNotification
{
    std::string camera_id;   ///< Event topic suffix
    std::string event_id;    ///< Payload, assigned by ZoneMinder
    std::chrono::system_clock::time_point received_at;
};

#endif // EVENT_NOTIFICATION_H
