#ifndef GIF_PUBLISHER_H
#define GIF_PUBLISHER_H

// Standard Library
#include <string>

// Project headers
#include "broker_client.h"
#include "bridge_config.h"

/**
 * @brief Announces a finished GIF on the camera's preview topic.
 *
 * Only the file name is sent; consumers read the GIF from the shared working folder.
 */
class GifPublisher
{
public:
    GifPublisher(BrokerClient& client, const BridgeConfig& config);

    /**
     * @brief Publishes the artifact file name on <mqtt_base_gifs_topic>/<camera id>.
     * @param Camera id.
     * @param GIF file name, e.g. "123.gif".
     * @return true if the publish call was accepted by the client. Delivery is not awaited.
     */
    bool publish(const std::string& camera_id, const std::string& gif_filename);

    std::string topicFor(const std::string& camera_id) const;

private:
    // === Members ===
    BrokerClient& client;
    const BridgeConfig& config;
};

#endif // GIF_PUBLISHER_H
