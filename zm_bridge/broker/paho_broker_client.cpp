// Standard Library
#include <chrono>
#include <iostream>

// Project headers
#include "paho_broker_client.h"
#include "bridge_errors.h"

namespace {
    constexpr int k_shutdown_disconnect_timeout_ms = 2000;
}

PahoBrokerClient::PahoBrokerClient(const BridgeConfig& config)
    : client_(config.brokerUri(), config.mqtt_client_id),
    connect_listener_(*this),
    subscribe_listener_(*this),
    handler_(nullptr),
    disconnect_requested_(false)
{
    connect_options_ = mqtt::connect_options_builder()
        .clean_session(true)
        .automatic_reconnect(false)
        .keep_alive_interval(std::chrono::seconds(config.mqtt_keep_alive_secs))
        .finalize();

    if (!config.mqtt_user.empty())
    {
        connect_options_.set_user_name(config.mqtt_user);
        connect_options_.set_password(config.mqtt_pwd);
    }

    client_.set_callback(*this);
}

PahoBrokerClient::~PahoBrokerClient()
{
    handler_ = nullptr;
    try
    {
        if (client_.is_connected())
        {
            disconnect_requested_ = true;
            client_.disconnect()->wait_for(std::chrono::milliseconds(k_shutdown_disconnect_timeout_ms));
        }
    }
    catch (const mqtt::exception& ex)
    {
        std::cerr << "[MQTT ERROR] Disconnect on shutdown failed: " << ex.what() << std::endl;
    }
}

void PahoBrokerClient::setEventHandler(BrokerEventHandler* handler)
{
    handler_ = handler;
}

void PahoBrokerClient::connect()
{
    disconnect_requested_ = false;
    try
    {
        client_.connect(connect_options_, nullptr, connect_listener_);
    }
    catch (const mqtt::exception& ex)
    {
        throw BrokerError(std::string("connect to ") + client_.get_server_uri() + " failed: " + ex.what());
    }
}

void PahoBrokerClient::disconnect()
{
    if (!client_.is_connected())
    {
        return;
    }

    disconnect_requested_ = true;
    try
    {
        client_.disconnect();
    }
    catch (const mqtt::exception& ex)
    {
        throw BrokerError(std::string("disconnect failed: ") + ex.what());
    }
}

void PahoBrokerClient::subscribe(const std::string& topic, int qos)
{
    try
    {
        client_.subscribe(topic, qos, nullptr, subscribe_listener_);
    }
    catch (const mqtt::exception& ex)
    {
        throw BrokerError("subscribe " + topic + " failed: " + ex.what());
    }
}

int PahoBrokerClient::publish(const std::string& topic, const std::string& payload, int qos)
{
    try
    {
        auto message = mqtt::make_message(topic, payload);
        message->set_qos(qos);
        message->set_retained(false);
        mqtt::delivery_token_ptr token = client_.publish(message);
        return token ? token->get_message_id() : 0;
    }
    catch (const mqtt::exception& ex)
    {
        throw BrokerError("publish on " + topic + " failed: " + ex.what());
    }
}

void PahoBrokerClient::connected(const std::string& /*cause*/)
{
    if (BrokerEventHandler* handler = handler_.load()) handler->onConnect();
}

void PahoBrokerClient::connection_lost(const std::string& cause)
{
    if (BrokerEventHandler* handler = handler_.load()) handler->onDisconnect(cause, !disconnect_requested_.load());
}

void PahoBrokerClient::message_arrived(mqtt::const_message_ptr message)
{
    if (!message) return;
    if (BrokerEventHandler* handler = handler_.load())
    {
        handler->onMessage(message->get_topic(), message->to_string(), message->is_retained());
    }
}

void PahoBrokerClient::delivery_complete(mqtt::delivery_token_ptr token)
{
    if (BrokerEventHandler* handler = handler_.load())
    {
        handler->onPublishAck(token ? token->get_message_id() : -1);
    }
}

std::string PahoBrokerClient::firstTopic(const mqtt::token& token)
{
    auto topics = token.get_topics();
    if (topics && topics->size() > 0) return (*topics)[0];
    return std::string();
}

void PahoBrokerClient::ConnectListener::on_failure(const mqtt::token& token)
{
    if (BrokerEventHandler* handler = owner_.handler_.load())
    {
        handler->onConnectFailure("return code " + std::to_string(token.get_return_code()));
    }
}

void PahoBrokerClient::ConnectListener::on_success(const mqtt::token& /*token*/)
{
    // connected() reports the new session
}

void PahoBrokerClient::SubscribeListener::on_failure(const mqtt::token& token)
{
    if (BrokerEventHandler* handler = owner_.handler_.load())
    {
        handler->onSubscribeFailure(firstTopic(token), "return code " + std::to_string(token.get_return_code()));
    }
}

void PahoBrokerClient::SubscribeListener::on_success(const mqtt::token& token)
{
    if (BrokerEventHandler* handler = owner_.handler_.load())
    {
        handler->onSubscribeAck(firstTopic(token));
    }
}
