// Standard Library
#include <csignal>
#include <filesystem>
#include <iostream>
#include <thread>

// System Library
#include <pthread.h>
#include <signal.h>

// Project headers
#include "bridge_config.h"
#include "bridge_errors.h"
#include "connection_manager.h"
#include "event_subscriber.h"
#include "gif_publisher.h"
#include "job_worker_pool.h"
#include "message_processor.h"
#include "paho_broker_client.h"
#include "process_runner.h"
#include "transcoder.h"
#include "video_fetcher.h"

namespace fs = std::filesystem;

void waitForShutdownSignal(const sigset_t& _signals, ConnectionManager& _connection);

int main(int argc, char* argv[])
{
    if (argc != 2)
    {
        std::cerr << "Usage: " << argv[0] << " <config.json>" << std::endl;
        return 1;
    }

    std::cout << "[MAIN] Starting" << std::endl;
    std::cout << "[CONFIG] Parsing " << argv[1] << std::endl;

    BridgeConfig config;
    try
    {
        config = loadBridgeConfig(argv[1]);
    }
    catch (const ConfigError& ex)
    {
        std::cerr << "[CONFIG ERROR] " << ex.what() << std::endl;
        return 1;
    }

    std::cout << "[CONFIG] mqtt_server " << config.brokerUri()
        << ", zoneminder_events_video_folder " << config.zoneminder_events_video_folder
        << ", ffmpeg_working_folder " << config.ffmpeg_working_folder
        << ", cameras " << config.zoneminder_cameras.size()
        << ", workers " << config.worker_count
        << ", failure_policy " << failurePolicyName(config.failure_policy) << std::endl;

    try
    {
        if (fs::create_directories(config.ffmpeg_working_folder))
            std::cout << "[FS] Created folder: " << config.ffmpeg_working_folder << std::endl;
    }
    catch (const fs::filesystem_error& ex)
    {
        std::cerr << "[FS ERROR] Failed to create working folder: " << ex.what() << std::endl;
        return 1;
    }

    // Block the shutdown signals before any thread starts so only the signal thread receives them.
    sigset_t shutdown_signals;
    sigemptyset(&shutdown_signals);
    sigaddset(&shutdown_signals, SIGINT);
    sigaddset(&shutdown_signals, SIGTERM);
    pthread_sigmask(SIG_BLOCK, &shutdown_signals, nullptr);

    PosixProcessRunner process_runner;
    Transcoder transcoder(process_runner, config.ffmpeg_binary, config.keep_failed_clips);
    VideoFetcher fetcher(config.zoneminder_events_video_folder, config.ffmpeg_working_folder, config.date_lookback_days);

    // Declared first so it outlives everything its jobs reference; stopped explicitly below.
    JobWorkerPool worker_pool(config.worker_count, config.job_queue_capacity);

    try
    {
        PahoBrokerClient mqtt_client(config);
        EventSubscriber subscriber(mqtt_client, config);
        GifPublisher publisher(mqtt_client, config);
        ConnectionManager connection(mqtt_client, subscriber, config);
        MessageProcessor processor(config, fetcher, transcoder, publisher, connection);

        connection.setMessageHandler([&worker_pool, &processor](const InboundMessage& message) {
            bool queued = worker_pool.trySubmit([&processor, message]() {
                ProcessOutcome outcome = processor.process(message);
                std::cout << "[EVENT] " << message.topic << " " << message.payload << ": " << processOutcomeName(outcome) << std::endl;
                });
            if (!queued)
            {
                std::cerr << "[WORKER ERROR] Job queue full or stopped, dropping event " << message.payload << " on " << message.topic << std::endl;
            }
            });

        worker_pool.start();

        std::thread signal_thread(waitForShutdownSignal, std::cref(shutdown_signals), std::ref(connection));

        std::cout << "[MAIN] System ready. Waiting for ZoneMinder events..." << std::endl;
        connection.runReconnectLoop();

        // Queued events still need the connection to publish their GIFs.
        signal_thread.join();
        worker_pool.stop();
        connection.disconnect();
    }
    catch (const BrokerError& ex)
    {
        std::cerr << "[FATAL] MQTT client error: " << ex.what() << std::endl;
        return 1;
    }
    catch (const mqtt::exception& ex)
    {
        std::cerr << "[FATAL] MQTT client creation failed: " << ex.what() << std::endl;
        return 1;
    }

    std::cout << "[MAIN] Ending" << std::endl;
    return 0;
}

void waitForShutdownSignal(const sigset_t& _signals, ConnectionManager& _connection)
{
    int signal_number = 0;
    if (sigwait(&_signals, &signal_number) != 0)
    {
        std::cerr << "[MAIN ERROR] sigwait failed, shutting down" << std::endl;
    }
    else
    {
        std::cout << "[MAIN] Received signal " << signal_number << ", shutting down" << std::endl;
    }
    _connection.requestStop();
}
