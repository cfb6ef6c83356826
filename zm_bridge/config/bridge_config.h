#ifndef BRIDGE_CONFIG_H
#define BRIDGE_CONFIG_H

// Standard Library
#include <string>
#include <vector>

// JSON
#include <nlohmann/json.hpp>

/**
 * @brief Per-camera path and preview settings.
 */
struct CameraProfile
{
    std::string id;                  ///< Topic suffix, unique among cameras
    std::string event_video_prefix;  ///< Prepended to the event id in the recording file name
    int scale = 0;                   ///< GIF width in pixels, height follows the aspect ratio
    int skip_first_n_secs = 0;       ///< Seconds skipped at the start of the clip
    int max_length_secs = 0;         ///< Maximum GIF duration in seconds
};

/**
 * @brief What happens to the broker connection when a single event fails.
 */
enum class FailurePolicy
{
    Reconnect,  ///< Log and force a full disconnect/reconnect
    DropEvent   ///< Log and drop the event, keep the connection
};

const char* failurePolicyName(FailurePolicy policy);

/**
 * @brief Validated bridge configuration, loaded once at startup.
 */
struct BridgeConfig
{
    // === Broker ===
    std::string mqtt_server;
    int mqtt_port = 1883;
    std::string mqtt_user;
    std::string mqtt_pwd;
    std::string mqtt_client_id = "zm_gif_bridge";
    int mqtt_qos = 0;
    int mqtt_keep_alive_secs = 60;
    std::string mqtt_base_events_topic;
    std::string mqtt_base_gifs_topic;
    int reconnect_interval_secs = 10;

    // === Files and ffmpeg ===
    std::string ffmpeg_working_folder;
    std::string zoneminder_events_video_folder;
    std::string ffmpeg_binary = "ffmpeg";
    int date_lookback_days = 1;
    bool keep_failed_clips = false;

    // === Processing ===
    int worker_count = 1;
    int job_queue_capacity = 16;
    FailurePolicy failure_policy = FailurePolicy::Reconnect;

    std::vector<CameraProfile> zoneminder_cameras;

    /**
     * @brief Looks up a camera by exact id.
     * @param Camera id.
     * @return The profile, or nullptr when no camera has that id.
     */
    const CameraProfile* findCamera(const std::string& camera_id) const;

    /**
     * @brief Broker URI in paho form.
     * @return "tcp://<mqtt_server>:<mqtt_port>"
     */
    std::string brokerUri() const;
};

/**
 * @brief Builds and validates a configuration from a parsed JSON document.
 * @param Parsed configuration document.
 * @return The validated configuration.
 * @throws ConfigError on a missing or mistyped key or an out-of-range value.
 */
BridgeConfig parseBridgeConfig(const nlohmann::json& document);

/**
 * @brief Reads, parses and validates a configuration file.
 * @param Path of the JSON configuration file.
 * @return The validated configuration.
 * @throws ConfigError when the file cannot be read or is invalid.
 */
BridgeConfig loadBridgeConfig(const std::string& config_path);

#endif // BRIDGE_CONFIG_H
