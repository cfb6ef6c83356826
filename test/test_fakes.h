#ifndef TEST_FAKES_H
#define TEST_FAKES_H

// Standard Library
#include <atomic>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <functional>
#include <iterator>
#include <mutex>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

// Project headers
#include "bridge_config.h"
#include "bridge_errors.h"
#include "broker_client.h"
#include "process_runner.h"

/**
 * @brief In-memory BrokerClient. Callbacks are driven by the test through handler().
 */
class FakeBrokerClient : public BrokerClient
{
public:
    void setEventHandler(BrokerEventHandler* handler) override
    {
        handler_ = handler;
    }

    BrokerEventHandler* handler() const { return handler_; }

    void connect() override
    {
        ++connect_calls;
        if (fail_connect) throw BrokerError("broker unreachable");
    }

    void disconnect() override
    {
        ++disconnect_calls;
    }

    void subscribe(const std::string& topic, int /*qos*/) override
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (static_cast<int>(subscribe_attempts_.size()) == fail_subscribe_at)
        {
            subscribe_attempts_.push_back(topic);
            throw BrokerError("subscribe rejected");
        }
        subscribe_attempts_.push_back(topic);
        if (on_subscribe) on_subscribe(topic);
        subscriptions_.push_back(topic);
    }

    int publish(const std::string& topic, const std::string& payload, int /*qos*/) override
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (fail_publish) throw BrokerError("not connected");
        published_.emplace_back(topic, payload);
        return static_cast<int>(published_.size());
    }

    std::vector<std::string> subscriptions() const
    {
        std::lock_guard<std::mutex> lock(mutex_);
        return subscriptions_;
    }

    std::vector<std::string> subscribeAttempts() const
    {
        std::lock_guard<std::mutex> lock(mutex_);
        return subscribe_attempts_;
    }

    std::vector<std::pair<std::string, std::string>> published() const
    {
        std::lock_guard<std::mutex> lock(mutex_);
        return published_;
    }

    // === Knobs and counters ===
    std::atomic<int> connect_calls{0};
    std::atomic<int> disconnect_calls{0};
    bool fail_connect = false;
    bool fail_publish = false;
    int fail_subscribe_at = -1;
    std::function<void(const std::string&)> on_subscribe;

private:
    BrokerEventHandler* handler_ = nullptr;
    mutable std::mutex mutex_;
    std::vector<std::string> subscriptions_;
    std::vector<std::string> subscribe_attempts_;
    std::vector<std::pair<std::string, std::string>> published_;
};

/**
 * @brief ProcessRunner that records command lines instead of running ffmpeg.
 *
 * On a zero exit code it writes a small file at the output path (last argument).
 */
class FakeProcessRunner : public ProcessRunner
{
public:
    int run(const std::vector<std::string>& command) override
    {
        commands.push_back(command);
        if (on_run) on_run();
        if (throw_on_run) throw TranscodeError("ffmpeg: not found");
        if (exit_code == 0 && write_output && !command.empty())
        {
            std::ofstream out(command.back(), std::ios::binary | std::ios::trunc);
            out << output_content;
        }
        return exit_code;
    }

    std::vector<std::vector<std::string>> commands;
    int exit_code = 0;
    bool write_output = true;
    bool throw_on_run = false;
    std::string output_content = "GIF89a";
    std::function<void()> on_run;
};

/**
 * @brief Unique scratch folder, removed with its content on destruction.
 */
class TempFolder
{
public:
    TempFolder()
    {
        std::string pattern = (std::filesystem::temp_directory_path() / "zm_gif_bridge_test_XXXXXX").string();
        std::vector<char> buffer(pattern.begin(), pattern.end());
        buffer.push_back('\0');
        if (!mkdtemp(buffer.data()))
        {
            throw std::runtime_error("mkdtemp failed");
        }
        path_ = buffer.data();
    }

    ~TempFolder()
    {
        std::error_code ec;
        std::filesystem::remove_all(path_, ec);
    }

    TempFolder(const TempFolder&) = delete;
    TempFolder& operator=(const TempFolder&) = delete;

    const std::filesystem::path& path() const { return path_; }

    std::filesystem::path sub(const std::string& name) const
    {
        std::filesystem::path folder = path_ / name;
        std::filesystem::create_directories(folder);
        return folder;
    }

private:
    std::filesystem::path path_;
};

inline void writeFile(const std::filesystem::path& path, const std::string& content)
{
    std::filesystem::create_directories(path.parent_path());
    std::ofstream out(path, std::ios::binary | std::ios::trunc);
    out << content;
}

inline std::string readFile(const std::filesystem::path& path)
{
    std::ifstream in(path, std::ios::binary);
    return std::string(std::istreambuf_iterator<char>(in), std::istreambuf_iterator<char>());
}

/**
 * @brief Two-camera configuration rooted in the given folders.
 */
inline BridgeConfig makeTestConfig(const std::string& source_root = "/zm/events", const std::string& working_folder = "/tmp/gifs")
{
    BridgeConfig config;
    config.mqtt_server = "localhost";
    config.mqtt_port = 1883;
    config.mqtt_base_events_topic = "zm/events";
    config.mqtt_base_gifs_topic = "zm/gifs";
    config.zoneminder_events_video_folder = source_root;
    config.ffmpeg_working_folder = working_folder;
    config.date_lookback_days = 0;

    CameraProfile cam1;
    cam1.id = "cam1";
    cam1.event_video_prefix = "cam1-";
    cam1.scale = 480;
    cam1.skip_first_n_secs = 2;
    cam1.max_length_secs = 8;

    CameraProfile cam2;
    cam2.id = "cam2";
    cam2.event_video_prefix = "2-";
    cam2.scale = 320;
    cam2.skip_first_n_secs = 0;
    cam2.max_length_secs = 5;

    config.zoneminder_cameras = { cam1, cam2 };
    return config;
}

#endif // TEST_FAKES_H
