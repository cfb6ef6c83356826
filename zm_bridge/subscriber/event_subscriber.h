#ifndef EVENT_SUBSCRIBER_H
#define EVENT_SUBSCRIBER_H

// Standard Library
#include <string>

// Project headers
#include "broker_client.h"
#include "bridge_config.h"

/**
 * @brief Subscribes the event topic of every configured camera.
 */
class EventSubscriber
{
public:
    EventSubscriber(BrokerClient& client, const BridgeConfig& config);

    /**
     * @brief Subscribes <mqtt_base_events_topic>/<camera id> for each camera, in configuration order.
     *
     * Stops at the first failure and rethrows it; the remaining cameras are not attempted.
     *
     * @throws BrokerError when a subscribe call fails.
     */
    void subscribeAll();

    std::string topicFor(const CameraProfile& camera) const;

private:
    // === Members ===
    BrokerClient& client;
    const BridgeConfig& config;
};

#endif // EVENT_SUBSCRIBER_H
