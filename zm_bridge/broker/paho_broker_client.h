#ifndef PAHO_BROKER_CLIENT_H
#define PAHO_BROKER_CLIENT_H

// Standard Library
#include <atomic>
#include <string>

// MQTT
#include <mqtt/async_client.h>

// Project headers
#include "broker_client.h"
#include "bridge_config.h"

/**
 * @brief BrokerClient over the Eclipse Paho MQTT C++ async client.
 *
 * Paho runs its own network thread; every callback below is invoked from it.
 * Automatic reconnect is disabled, reconnecting is the ConnectionManager's job.
 */
class PahoBrokerClient : public BrokerClient, public virtual mqtt::callback
{
public:
    /**
     * @brief Creates the paho client for the configured broker. Does not connect.
     * @param Bridge configuration.
     */
    explicit PahoBrokerClient(const BridgeConfig& config);

    /**
     * @brief Disconnects if still connected.
     */
    ~PahoBrokerClient() override;

    void setEventHandler(BrokerEventHandler* handler) override;

    void connect() override;
    void disconnect() override;
    void subscribe(const std::string& topic, int qos) override;
    int publish(const std::string& topic, const std::string& payload, int qos) override;

    // === mqtt::callback ===
    void connected(const std::string& cause) override;
    void connection_lost(const std::string& cause) override;
    void message_arrived(mqtt::const_message_ptr message) override;
    void delivery_complete(mqtt::delivery_token_ptr token) override;

private:
    /**
     * @brief Reports asynchronous connect failures.
     */
    class ConnectListener : public virtual mqtt::iaction_listener
    {
    public:
        explicit ConnectListener(PahoBrokerClient& owner) : owner_(owner) {}
        void on_failure(const mqtt::token& token) override;
        void on_success(const mqtt::token& token) override;

    private:
        PahoBrokerClient& owner_;
    };

    /**
     * @brief Reports subscription acknowledgments and rejections.
     */
    class SubscribeListener : public virtual mqtt::iaction_listener
    {
    public:
        explicit SubscribeListener(PahoBrokerClient& owner) : owner_(owner) {}
        void on_failure(const mqtt::token& token) override;
        void on_success(const mqtt::token& token) override;

    private:
        PahoBrokerClient& owner_;
    };

    static std::string firstTopic(const mqtt::token& token);

    // === Members ===
    mqtt::async_client client_;
    mqtt::connect_options connect_options_;
    ConnectListener connect_listener_;
    SubscribeListener subscribe_listener_;
    std::atomic<BrokerEventHandler*> handler_;
    std::atomic<bool> disconnect_requested_;
};

#endif // PAHO_BROKER_CLIENT_H
