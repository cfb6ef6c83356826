#ifndef BRIDGE_ERRORS_H
#define BRIDGE_ERRORS_H

// Standard Library
#include <stdexcept>
#include <string>

/**
 * @brief Raised when the configuration file cannot be read or fails validation.
 */
class ConfigError : public std::runtime_error
{
public:
    explicit ConfigError(const std::string& message)
        : std::runtime_error("config: " + message)
    {
    }
};

/**
 * @brief Base of every failure that only concerns a single motion event.
 */
class EventProcessingError : public std::runtime_error
{
public:
    using std::runtime_error::runtime_error;
};

/**
 * @brief The event payload cannot be used as an event identifier.
 */
class MalformedEventError : public EventProcessingError
{
public:
    using EventProcessingError::EventProcessingError;
};

/**
 * @brief The topic suffix does not name a configured camera.
 */
class UnknownCameraError : public EventProcessingError
{
public:
    explicit UnknownCameraError(const std::string& camera_id)
        : EventProcessingError("unknown camera id '" + camera_id + "'")
    {
    }
};

/**
 * @brief The recorded clip of an event is not where ZoneMinder should have put it.
 */
class SourceVideoNotFoundError : public EventProcessingError
{
public:
    using EventProcessingError::EventProcessingError;
};

/**
 * @brief ffmpeg could not be launched or its output could not be put in place.
 */
class TranscodeError : public EventProcessingError
{
public:
    using EventProcessingError::EventProcessingError;
};

/**
 * @brief A broker client call (connect, subscribe, publish, disconnect) failed.
 */
class BrokerError : public std::runtime_error
{
public:
    using std::runtime_error::runtime_error;
};

#endif // BRIDGE_ERRORS_H
