#ifndef CONNECTION_MANAGER_H
#define CONNECTION_MANAGER_H

// Standard Library
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <functional>
#include <mutex>
#include <string>

// Project headers
#include "broker_client.h"
#include "bridge_config.h"
#include "event_subscriber.h"
#include "event_notification.h"

/**
 * @brief Broker connection state. Ordered: a state "at least Connected" is Connected or Subscribed.
 */
enum class ConnectionState
{
    Disconnected,
    Connecting,
    Connected,
    Subscribed
};

const char* connectionStateName(ConnectionState state);

/**
 * @brief Owns the broker connection state machine and the reconnect loop.
 *
 * Disconnected -> Connecting -> Connected -> Subscribed; any failure returns to
 * Disconnected. Broker callbacks arrive on the client's threads, the reconnect
 * loop runs on the caller's thread; the state lives in an atomic cell and every
 * change is signalled on a condition variable.
 */
class ConnectionManager : public BrokerEventHandler
{
public:
    using MessageHandler = std::function<void(const InboundMessage&)>;

    /**
     * @brief Registers itself as the client's event handler.
     * @param Broker client.
     * @param Subscriber run after every successful connect.
     * @param Bridge configuration, supplies the reconnect interval.
     */
    ConnectionManager(BrokerClient& client, EventSubscriber& subscriber, const BridgeConfig& config);

    ~ConnectionManager() override;

    /**
     * @brief Sets the receiver of inbound messages. Must be called before connect().
     * @param Handler invoked on the broker client's thread for every message.
     */
    void setMessageHandler(MessageHandler handler);

    void setReconnectInterval(std::chrono::milliseconds interval);

    /**
     * @brief Starts an asynchronous connection attempt. Failures are logged, never thrown.
     */
    void connect();

    /**
     * @brief Tears the connection down and sets Disconnected. Failures are logged, never thrown.
     */
    void disconnect();

    /**
     * @brief Escalation path for pipeline failures: logs the reason and disconnects.
     * @param Why the connection is reset.
     */
    void forceDisconnect(const std::string& reason);

    ConnectionState state() const;
    bool isConnected() const;
    int connectAttempts() const;

    /**
     * @brief Calls connect() whenever the state is below Connected, at most once per reconnect interval.
     *
     * Sleeps on state changes while connected. Returns after requestStop().
     */
    void runReconnectLoop();

    /**
     * @brief Makes runReconnectLoop() return. Safe from any thread.
     */
    void requestStop();

    // === BrokerEventHandler ===
    void onConnect() override;
    void onConnectFailure(const std::string& reason) override;
    void onDisconnect(const std::string& cause, bool unexpected) override;
    void onMessage(const std::string& topic, const std::string& payload, bool retained) override;
    void onSubscribeAck(const std::string& topic) override;
    void onSubscribeFailure(const std::string& topic, const std::string& reason) override;
    void onPublishAck(int message_id) override;

private:
    void setState(ConnectionState next);

    // === Members ===
    BrokerClient& client_;
    EventSubscriber& subscriber_;
    const BridgeConfig& config_;
    MessageHandler message_handler_;
    std::chrono::milliseconds reconnect_interval_;

    std::atomic<ConnectionState> state_;
    std::atomic<bool> stop_requested_;
    std::atomic<int> connect_attempts_;
    mutable std::mutex state_mutex_;
    std::condition_variable state_cv_;
};

#endif // CONNECTION_MANAGER_H
