// Standard Library
#include <cstdint>
#include <fstream>
#include <limits>
#include <set>

// Project headers
#include "bridge_config.h"
#include "bridge_errors.h"

using json = nlohmann::json;

namespace {

    const json& requireKey(const json& _object, const std::string& _key, const std::string& _where)
    {
        auto it = _object.find(_key);
        if (it == _object.end() || it->is_null())
        {
            throw ConfigError("missing required key '" + _key + "' in " + _where);
        }
        return *it;
    }

    std::string requireString(const json& _object, const std::string& _key, const std::string& _where)
    {
        const json& value = requireKey(_object, _key, _where);
        if (!value.is_string())
        {
            throw ConfigError("'" + _key + "' in " + _where + " must be a string");
        }
        return value.get<std::string>();
    }

    int requireInt(const json& _object, const std::string& _key, const std::string& _where)
    {
        const json& value = requireKey(_object, _key, _where);
        if (!value.is_number_integer())
        {
            throw ConfigError("'" + _key + "' in " + _where + " must be an integer");
        }

        // Narrowing a wider JSON integer would wrap into range.
        bool fits = value.is_number_unsigned()
            ? value.get<std::uint64_t>() <= static_cast<std::uint64_t>(std::numeric_limits<int>::max())
            : value.get<std::int64_t>() >= std::numeric_limits<int>::min() && value.get<std::int64_t>() <= std::numeric_limits<int>::max();
        if (!fits)
        {
            throw ConfigError("'" + _key + "' in " + _where + " does not fit in an int");
        }
        return static_cast<int>(value.get<std::int64_t>());
    }

    std::string optionalString(const json& _object, const std::string& _key, const std::string& _fallback)
    {
        if (!_object.contains(_key) || _object.at(_key).is_null()) return _fallback;
        return requireString(_object, _key, "configuration");
    }

    int optionalInt(const json& _object, const std::string& _key, int _fallback)
    {
        if (!_object.contains(_key) || _object.at(_key).is_null()) return _fallback;
        return requireInt(_object, _key, "configuration");
    }

    bool optionalBool(const json& _object, const std::string& _key, bool _fallback)
    {
        if (!_object.contains(_key) || _object.at(_key).is_null()) return _fallback;
        const json& value = _object.at(_key);
        if (!value.is_boolean())
        {
            throw ConfigError("'" + _key + "' must be true or false");
        }
        return value.get<bool>();
    }

    void requireNonEmpty(const std::string& _value, const std::string& _key)
    {
        if (_value.empty())
        {
            throw ConfigError("'" + _key + "' must not be empty");
        }
    }

    void requireRange(int _value, int _min, int _max, const std::string& _key)
    {
        if (_value < _min || _value > _max)
        {
            throw ConfigError("'" + _key + "' = " + std::to_string(_value) +
                " is out of range [" + std::to_string(_min) + ", " + std::to_string(_max) + "]");
        }
    }

    // Camera ids end up as a topic level.
    bool isValidCameraId(const std::string& _id)
    {
        if (_id.empty()) return false;
        return _id.find_first_of("/+#") == std::string::npos;
    }

    FailurePolicy parseFailurePolicy(const std::string& _name)
    {
        if (_name == "reconnect") return FailurePolicy::Reconnect;
        if (_name == "drop_event") return FailurePolicy::DropEvent;
        throw ConfigError("'failure_policy' must be \"reconnect\" or \"drop_event\", got \"" + _name + "\"");
    }

    CameraProfile parseCamera(const json& _camera, std::size_t _index)
    {
        const std::string where = "zoneminder_cameras[" + std::to_string(_index) + "]";
        if (!_camera.is_object())
        {
            throw ConfigError(where + " must be an object");
        }

        CameraProfile profile;
        profile.id = requireString(_camera, "id", where);
        profile.event_video_prefix = requireString(_camera, "event_video_prefix", where);
        profile.scale = requireInt(_camera, "scale", where);
        profile.skip_first_n_secs = requireInt(_camera, "skip_first_n_secs", where);
        profile.max_length_secs = requireInt(_camera, "max_length_secs", where);

        if (!isValidCameraId(profile.id))
        {
            throw ConfigError(where + ".id '" + profile.id + "' must be non-empty and must not contain '/', '+' or '#'");
        }
        if (profile.scale <= 0)
        {
            throw ConfigError(where + ".scale must be a positive pixel width");
        }
        if (profile.skip_first_n_secs < 0)
        {
            throw ConfigError(where + ".skip_first_n_secs must not be negative");
        }
        if (profile.max_length_secs <= 0)
        {
            throw ConfigError(where + ".max_length_secs must be positive");
        }
        return profile;
    }

    std::string stripTrailingSlashes(std::string _topic)
    {
        while (_topic.size() > 1 && _topic.back() == '/')
        {
            _topic.pop_back();
        }
        return _topic;
    }
}

const char* failurePolicyName(FailurePolicy policy)
{
    switch (policy)
    {
    case FailurePolicy::Reconnect: return "reconnect";
    case FailurePolicy::DropEvent: return "drop_event";
    }
    return "reconnect";
}

const CameraProfile* BridgeConfig::findCamera(const std::string& camera_id) const
{
    for (const auto& camera : zoneminder_cameras)
    {
        if (camera.id == camera_id) return &camera;
    }
    return nullptr;
}

std::string BridgeConfig::brokerUri() const
{
    return "tcp://" + mqtt_server + ":" + std::to_string(mqtt_port);
}

BridgeConfig parseBridgeConfig(const json& document)
{
    if (!document.is_object())
    {
        throw ConfigError("top level must be a JSON object");
    }

    const std::string where = "configuration";
    BridgeConfig config;

    config.mqtt_server = requireString(document, "mqtt_server", where);
    config.mqtt_port = requireInt(document, "mqtt_port", where);
    config.mqtt_user = requireString(document, "mqtt_user", where);
    config.mqtt_pwd = requireString(document, "mqtt_pwd", where);
    config.mqtt_base_events_topic = stripTrailingSlashes(requireString(document, "mqtt_base_events_topic", where));
    config.mqtt_base_gifs_topic = stripTrailingSlashes(requireString(document, "mqtt_base_gifs_topic", where));
    config.ffmpeg_working_folder = requireString(document, "ffmpeg_working_folder", where);
    config.zoneminder_events_video_folder = requireString(document, "zoneminder_events_video_folder", where);

    config.mqtt_client_id = optionalString(document, "mqtt_client_id", config.mqtt_client_id);
    config.mqtt_qos = optionalInt(document, "mqtt_qos", config.mqtt_qos);
    config.mqtt_keep_alive_secs = optionalInt(document, "mqtt_keep_alive_secs", config.mqtt_keep_alive_secs);
    config.reconnect_interval_secs = optionalInt(document, "reconnect_interval_secs", config.reconnect_interval_secs);
    config.ffmpeg_binary = optionalString(document, "ffmpeg_binary", config.ffmpeg_binary);
    config.date_lookback_days = optionalInt(document, "date_lookback_days", config.date_lookback_days);
    config.keep_failed_clips = optionalBool(document, "keep_failed_clips", config.keep_failed_clips);
    config.worker_count = optionalInt(document, "worker_count", config.worker_count);
    config.job_queue_capacity = optionalInt(document, "job_queue_capacity", config.job_queue_capacity);
    config.failure_policy = parseFailurePolicy(
        optionalString(document, "failure_policy", failurePolicyName(config.failure_policy)));

    requireNonEmpty(config.mqtt_server, "mqtt_server");
    requireNonEmpty(config.mqtt_client_id, "mqtt_client_id");
    requireNonEmpty(config.mqtt_base_events_topic, "mqtt_base_events_topic");
    requireNonEmpty(config.mqtt_base_gifs_topic, "mqtt_base_gifs_topic");
    requireNonEmpty(config.ffmpeg_working_folder, "ffmpeg_working_folder");
    requireNonEmpty(config.zoneminder_events_video_folder, "zoneminder_events_video_folder");
    requireNonEmpty(config.ffmpeg_binary, "ffmpeg_binary");

    requireRange(config.mqtt_port, 1, 65535, "mqtt_port");
    requireRange(config.mqtt_qos, 0, 2, "mqtt_qos");
    requireRange(config.mqtt_keep_alive_secs, 1, 65535, "mqtt_keep_alive_secs");
    requireRange(config.reconnect_interval_secs, 1, 3600, "reconnect_interval_secs");
    requireRange(config.date_lookback_days, 0, 31, "date_lookback_days");
    requireRange(config.worker_count, 1, 64, "worker_count");
    requireRange(config.job_queue_capacity, 1, 4096, "job_queue_capacity");

    const json& cameras = requireKey(document, "zoneminder_cameras", where);
    if (!cameras.is_array() || cameras.empty())
    {
        throw ConfigError("'zoneminder_cameras' must be a non-empty array");
    }

    std::set<std::string> seen_ids;
    for (std::size_t i = 0; i < cameras.size(); ++i)
    {
        CameraProfile profile = parseCamera(cameras[i], i);
        if (!seen_ids.insert(profile.id).second)
        {
            throw ConfigError("duplicate camera id '" + profile.id + "'");
        }
        config.zoneminder_cameras.push_back(profile);
    }

    return config;
}

BridgeConfig loadBridgeConfig(const std::string& config_path)
{
    std::ifstream config_file(config_path);
    if (!config_file)
    {
        throw ConfigError("unable to open " + config_path);
    }

    json document;
    try
    {
        document = json::parse(config_file);
    }
    catch (const json::parse_error& ex)
    {
        throw ConfigError(config_path + " is not valid JSON: " + ex.what());
    }

    return parseBridgeConfig(document);
}
