// Standard Library
#include <iostream>

// Project headers
#include "gif_publisher.h"
#include "bridge_errors.h"

GifPublisher::GifPublisher(BrokerClient& client, const BridgeConfig& config)
    : client(client),
    config(config)
{
}

std::string GifPublisher::topicFor(const std::string& camera_id) const
{
    return config.mqtt_base_gifs_topic + "/" + camera_id;
}

bool GifPublisher::publish(const std::string& camera_id, const std::string& gif_filename)
{
    const std::string topic = topicFor(camera_id);
    try
    {
        int message_id = client.publish(topic, gif_filename, config.mqtt_qos);
        std::cout << "[MQTT] Published " << gif_filename << " to topic: " << topic << " (mid " << message_id << ")" << std::endl;
        return true;
    }
    catch (const BrokerError& ex)
    {
        std::cerr << "[MQTT ERROR] Publish failed on " << topic << ": " << ex.what() << std::endl;
        return false;
    }
}
