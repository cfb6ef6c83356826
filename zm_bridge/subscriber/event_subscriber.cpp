// Standard Library
#include <iostream>

// Project headers
#include "event_subscriber.h"

EventSubscriber::EventSubscriber(BrokerClient& client, const BridgeConfig& config)
    : client(client),
    config(config)
{
}

std::string EventSubscriber::topicFor(const CameraProfile& camera) const
{
    return config.mqtt_base_events_topic + "/" + camera.id;
}

void EventSubscriber::subscribeAll()
{
    for (const auto& camera : config.zoneminder_cameras)
    {
        std::string topic = topicFor(camera);
        std::cout << "[MQTT] Subscribing topic " << topic << " for camera " << camera.id << std::endl;
        client.subscribe(topic, config.mqtt_qos);
    }
}
