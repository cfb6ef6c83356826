#ifndef BROKER_CLIENT_H
#define BROKER_CLIENT_H

// Standard Library
#include <string>

/**
 * @brief Receives connection lifecycle and message callbacks from a BrokerClient.
 *
 * Callbacks arrive on the broker client's own threads.
 */
class BrokerEventHandler
{
public:
    virtual ~BrokerEventHandler() = default;

    virtual void onConnect() = 0;
    virtual void onConnectFailure(const std::string& reason) = 0;

    /**
     * @brief The connection is gone.
     * @param Cause reported by the client, may be empty.
     * @param false when the disconnect was requested by us.
     */
    virtual void onDisconnect(const std::string& cause, bool unexpected) = 0;

    virtual void onMessage(const std::string& topic, const std::string& payload, bool retained) = 0;
    virtual void onSubscribeAck(const std::string& topic) = 0;
    virtual void onSubscribeFailure(const std::string& topic, const std::string& reason) = 0;
    virtual void onPublishAck(int message_id) = 0;
};

/**
 * @brief Publish/subscribe broker connection.
 *
 * All calls are asynchronous: they start the operation and return, results
 * come back through the BrokerEventHandler. Failures to start an operation
 * throw BrokerError.
 */
class BrokerClient
{
public:
    virtual ~BrokerClient() = default;

    virtual void setEventHandler(BrokerEventHandler* handler) = 0;

    virtual void connect() = 0;
    virtual void disconnect() = 0;
    virtual void subscribe(const std::string& topic, int qos) = 0;

    /**
     * @brief Sends a message, does not wait for delivery.
     * @param Topic.
     * @param Payload.
     * @param QoS.
     * @return Message id of the publish, 0 for QoS 0.
     */
    virtual int publish(const std::string& topic, const std::string& payload, int qos) = 0;
};

#endif // BROKER_CLIENT_H
