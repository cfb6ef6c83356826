// Standard Library
#include <iostream>
#include <utility>

// Project headers
#include "connection_manager.h"

const char* connectionStateName(ConnectionState state)
{
    switch (state)
    {
    case ConnectionState::Disconnected: return "Disconnected";
    case ConnectionState::Connecting: return "Connecting";
    case ConnectionState::Connected: return "Connected";
    case ConnectionState::Subscribed: return "Subscribed";
    }
    return "Unknown";
}

// === Constructor ===
ConnectionManager::ConnectionManager(BrokerClient& client, EventSubscriber& subscriber, const BridgeConfig& config)
    : client_(client),
    subscriber_(subscriber),
    config_(config),
    reconnect_interval_(std::chrono::seconds(config.reconnect_interval_secs)),
    state_(ConnectionState::Disconnected),
    stop_requested_(false),
    connect_attempts_(0)
{
    client_.setEventHandler(this);
}

// === Destructor ===
ConnectionManager::~ConnectionManager()
{
    client_.setEventHandler(nullptr);
}

void ConnectionManager::setMessageHandler(MessageHandler handler)
{
    message_handler_ = std::move(handler);
}

void ConnectionManager::setReconnectInterval(std::chrono::milliseconds interval)
{
    reconnect_interval_ = interval;
}

ConnectionState ConnectionManager::state() const
{
    return state_.load();
}

bool ConnectionManager::isConnected() const
{
    ConnectionState current = state_.load();
    return current == ConnectionState::Connected || current == ConnectionState::Subscribed;
}

int ConnectionManager::connectAttempts() const
{
    return connect_attempts_.load();
}

void ConnectionManager::setState(ConnectionState next)
{
    ConnectionState previous;
    {
        std::lock_guard<std::mutex> lock(state_mutex_);
        previous = state_.exchange(next);
    }
    state_cv_.notify_all();

    if (previous != next)
    {
        std::cout << "[MQTT] State " << connectionStateName(previous) << " -> " << connectionStateName(next) << std::endl;
    }
}

// === Connection control ===
void ConnectionManager::connect()
{
    ++connect_attempts_;
    std::cout << "[MQTT] Connecting to mqtt_server " << config_.mqtt_server << " mqtt_port " << config_.mqtt_port << std::endl;
    setState(ConnectionState::Connecting);
    try
    {
        client_.connect();
    }
    catch (const std::exception& ex)
    {
        std::cerr << "[MQTT ERROR] Connect failed: " << ex.what() << std::endl;
        disconnect();
    }
}

void ConnectionManager::disconnect()
{
    std::cout << "[MQTT] Disconnecting from mqtt_server " << config_.mqtt_server << " mqtt_port " << config_.mqtt_port << std::endl;
    try
    {
        client_.disconnect();
    }
    catch (const std::exception& ex)
    {
        std::cerr << "[MQTT ERROR] Disconnect failed: " << ex.what() << std::endl;
    }
    setState(ConnectionState::Disconnected);
}

void ConnectionManager::forceDisconnect(const std::string& reason)
{
    std::cerr << "[MQTT WARN] Resetting connection: " << reason << std::endl;
    disconnect();
}

// === Reconnect loop ===
void ConnectionManager::runReconnectLoop()
{
    std::unique_lock<std::mutex> lock(state_mutex_);
    while (!stop_requested_)
    {
        if (!isConnected())
        {
            lock.unlock();
            connect();
            lock.lock();

            // Keep attempts at least one interval apart, whatever the state does meanwhile.
            auto next_attempt = std::chrono::steady_clock::now() + reconnect_interval_;
            state_cv_.wait_until(lock, next_attempt, [this] { return stop_requested_.load(); });
        }

        state_cv_.wait(lock, [this] { return stop_requested_.load() || !isConnected(); });
    }
    std::cout << "[MQTT] Reconnect loop stopped" << std::endl;
}

void ConnectionManager::requestStop()
{
    {
        std::lock_guard<std::mutex> lock(state_mutex_);
        stop_requested_ = true;
    }
    state_cv_.notify_all();
}

// === BrokerEventHandler ===
void ConnectionManager::onConnect()
{
    std::cout << "[MQTT] Connected to mqtt_server " << config_.mqtt_server << " mqtt_port " << config_.mqtt_port << std::endl;
    setState(ConnectionState::Connected);

    try
    {
        subscriber_.subscribeAll();
    }
    catch (const std::exception& ex)
    {
        std::cerr << "[MQTT ERROR] Subscription failed: " << ex.what() << std::endl;
        disconnect();
    }
}

void ConnectionManager::onConnectFailure(const std::string& reason)
{
    std::cerr << "[MQTT ERROR] Connection attempt failed: " << reason << std::endl;
    setState(ConnectionState::Disconnected);
}

void ConnectionManager::onDisconnect(const std::string& cause, bool unexpected)
{
    std::cout << "[MQTT] Disconnected " << cause << std::endl;
    if (unexpected)
    {
        std::cerr << "[MQTT WARN] Unexpected disconnection." << std::endl;
    }
    setState(ConnectionState::Disconnected);
}

void ConnectionManager::onMessage(const std::string& topic, const std::string& payload, bool retained)
{
    std::cout << "[MQTT] Message received " << payload << " topic " << topic << " retained " << retained << std::endl;

    if (!message_handler_)
    {
        std::cerr << "[MQTT WARN] No message handler, dropping message on " << topic << std::endl;
        return;
    }

    InboundMessage message;
    message.topic = topic;
    message.payload = payload;
    message.retained = retained;
    message.received_at = std::chrono::system_clock::now();

    try
    {
        message_handler_(message);
    }
    catch (const std::exception& ex)
    {
        std::cerr << "[MQTT ERROR] Message handler failed for " << topic << ": " << ex.what() << std::endl;
    }
}

void ConnectionManager::onSubscribeAck(const std::string& topic)
{
    std::cout << "[MQTT] Subscribed topic " << topic << std::endl;

    bool advanced = false;
    {
        std::lock_guard<std::mutex> lock(state_mutex_);
        ConnectionState expected = ConnectionState::Connected;
        advanced = state_.compare_exchange_strong(expected, ConnectionState::Subscribed);
    }
    if (advanced)
    {
        state_cv_.notify_all();
        std::cout << "[MQTT] State Connected -> Subscribed" << std::endl;
    }
}

void ConnectionManager::onSubscribeFailure(const std::string& topic, const std::string& reason)
{
    std::cerr << "[MQTT ERROR] Broker rejected subscription " << topic << ": " << reason << std::endl;
    disconnect();
}

void ConnectionManager::onPublishAck(int message_id)
{
    std::cout << "[MQTT] Published message " << message_id << std::endl;
}
