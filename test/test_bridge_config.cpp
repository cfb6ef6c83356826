// GoogleTest
#include <gtest/gtest.h>

// JSON
#include <nlohmann/json.hpp>

// Project headers
#include "bridge_config.h"
#include "bridge_errors.h"
#include "test_fakes.h"

using json = nlohmann::json;

namespace {

    json validDocument()
    {
        return json::parse(R"({
            "mqtt_server": "broker.local",
            "mqtt_port": 1884,
            "mqtt_user": "zm",
            "mqtt_pwd": "secret",
            "mqtt_base_events_topic": "zoneminder/events",
            "mqtt_base_gifs_topic": "zoneminder/gifs/",
            "ffmpeg_working_folder": "/var/lib/gifs",
            "zoneminder_events_video_folder": "/var/cache/zm",
            "zoneminder_cameras": [
                { "id": "cam1", "event_video_prefix": "cam1-", "scale": 480, "skip_first_n_secs": 2, "max_length_secs": 8 },
                { "id": "cam2", "event_video_prefix": "2-", "scale": 320, "skip_first_n_secs": 0, "max_length_secs": 5 }
            ]
        })");
    }
}

TEST(BridgeConfigTest, ParsesRequiredKeysAndAppliesDefaults)
{
    BridgeConfig config = parseBridgeConfig(validDocument());

    EXPECT_EQ(config.mqtt_server, "broker.local");
    EXPECT_EQ(config.mqtt_port, 1884);
    EXPECT_EQ(config.mqtt_user, "zm");
    EXPECT_EQ(config.mqtt_pwd, "secret");
    EXPECT_EQ(config.mqtt_base_events_topic, "zoneminder/events");
    EXPECT_EQ(config.mqtt_base_gifs_topic, "zoneminder/gifs");
    EXPECT_EQ(config.brokerUri(), "tcp://broker.local:1884");

    EXPECT_EQ(config.reconnect_interval_secs, 10);
    EXPECT_EQ(config.worker_count, 1);
    EXPECT_EQ(config.mqtt_qos, 0);
    EXPECT_EQ(config.ffmpeg_binary, "ffmpeg");
    EXPECT_EQ(config.failure_policy, FailurePolicy::Reconnect);
    EXPECT_FALSE(config.keep_failed_clips);

    ASSERT_EQ(config.zoneminder_cameras.size(), 2u);
    EXPECT_EQ(config.zoneminder_cameras[0].id, "cam1");
    EXPECT_EQ(config.zoneminder_cameras[0].event_video_prefix, "cam1-");
    EXPECT_EQ(config.zoneminder_cameras[0].scale, 480);
    EXPECT_EQ(config.zoneminder_cameras[0].skip_first_n_secs, 2);
    EXPECT_EQ(config.zoneminder_cameras[0].max_length_secs, 8);
    EXPECT_EQ(config.zoneminder_cameras[1].id, "cam2");
}

TEST(BridgeConfigTest, ReadsOptionalSettings)
{
    json document = validDocument();
    document["worker_count"] = 3;
    document["job_queue_capacity"] = 4;
    document["failure_policy"] = "drop_event";
    document["keep_failed_clips"] = true;
    document["date_lookback_days"] = 0;
    document["ffmpeg_binary"] = "/usr/local/bin/ffmpeg";
    document["mqtt_qos"] = 1;

    BridgeConfig config = parseBridgeConfig(document);

    EXPECT_EQ(config.worker_count, 3);
    EXPECT_EQ(config.job_queue_capacity, 4);
    EXPECT_EQ(config.failure_policy, FailurePolicy::DropEvent);
    EXPECT_TRUE(config.keep_failed_clips);
    EXPECT_EQ(config.date_lookback_days, 0);
    EXPECT_EQ(config.ffmpeg_binary, "/usr/local/bin/ffmpeg");
    EXPECT_EQ(config.mqtt_qos, 1);
}

TEST(BridgeConfigTest, FindCameraMatchesExactId)
{
    BridgeConfig config = parseBridgeConfig(validDocument());

    ASSERT_NE(config.findCamera("cam2"), nullptr);
    EXPECT_EQ(config.findCamera("cam2")->scale, 320);
    EXPECT_EQ(config.findCamera("cam"), nullptr);
    EXPECT_EQ(config.findCamera("CAM1"), nullptr);
}

TEST(BridgeConfigTest, RejectsMissingRequiredKey)
{
    json document = validDocument();
    document.erase("mqtt_base_gifs_topic");
    EXPECT_THROW(parseBridgeConfig(document), ConfigError);

    document = validDocument();
    document["zoneminder_cameras"][0].erase("scale");
    EXPECT_THROW(parseBridgeConfig(document), ConfigError);
}

TEST(BridgeConfigTest, RejectsMistypedValues)
{
    json document = validDocument();
    document["mqtt_port"] = "1883";
    EXPECT_THROW(parseBridgeConfig(document), ConfigError);

    document = validDocument();
    document["keep_failed_clips"] = "yes";
    EXPECT_THROW(parseBridgeConfig(document), ConfigError);
}

TEST(BridgeConfigTest, RejectsIntegersWiderThanInt)
{
    json document = validDocument();
    document["zoneminder_cameras"][0]["scale"] = 4294967776LL;
    EXPECT_THROW(parseBridgeConfig(document), ConfigError);

    document = validDocument();
    document["mqtt_port"] = 18446744073709551615ULL;
    EXPECT_THROW(parseBridgeConfig(document), ConfigError);

    document = validDocument();
    document["zoneminder_cameras"][0]["skip_first_n_secs"] = -4294967296LL;
    EXPECT_THROW(parseBridgeConfig(document), ConfigError);
}

TEST(BridgeConfigTest, RejectsDuplicateCameraIds)
{
    json document = validDocument();
    document["zoneminder_cameras"][1]["id"] = "cam1";

    EXPECT_THROW(parseBridgeConfig(document), ConfigError);
}

TEST(BridgeConfigTest, RejectsOutOfRangeNumbers)
{
    json document = validDocument();
    document["mqtt_port"] = 70000;
    EXPECT_THROW(parseBridgeConfig(document), ConfigError);

    document = validDocument();
    document["zoneminder_cameras"][0]["scale"] = 0;
    EXPECT_THROW(parseBridgeConfig(document), ConfigError);

    document = validDocument();
    document["zoneminder_cameras"][0]["skip_first_n_secs"] = -1;
    EXPECT_THROW(parseBridgeConfig(document), ConfigError);

    document = validDocument();
    document["zoneminder_cameras"][0]["max_length_secs"] = 0;
    EXPECT_THROW(parseBridgeConfig(document), ConfigError);

    document = validDocument();
    document["worker_count"] = 0;
    EXPECT_THROW(parseBridgeConfig(document), ConfigError);
}

TEST(BridgeConfigTest, RejectsCameraIdsThatBreakTopics)
{
    json document = validDocument();
    document["zoneminder_cameras"][0]["id"] = "front/door";
    EXPECT_THROW(parseBridgeConfig(document), ConfigError);

    document["zoneminder_cameras"][0]["id"] = "#";
    EXPECT_THROW(parseBridgeConfig(document), ConfigError);
}

TEST(BridgeConfigTest, RejectsEmptyCameraListAndUnknownPolicy)
{
    json document = validDocument();
    document["zoneminder_cameras"] = json::array();
    EXPECT_THROW(parseBridgeConfig(document), ConfigError);

    document = validDocument();
    document["failure_policy"] = "retry";
    EXPECT_THROW(parseBridgeConfig(document), ConfigError);
}

TEST(BridgeConfigTest, LoadsFromFile)
{
    TempFolder folder;
    writeFile(folder.path() / "config.json", validDocument().dump(2));

    BridgeConfig config = loadBridgeConfig((folder.path() / "config.json").string());

    EXPECT_EQ(config.zoneminder_cameras.size(), 2u);
}

TEST(BridgeConfigTest, LoadReportsMissingFileAndBadJson)
{
    TempFolder folder;
    EXPECT_THROW(loadBridgeConfig((folder.path() / "absent.json").string()), ConfigError);

    writeFile(folder.path() / "broken.json", "{ \"mqtt_server\": ");
    EXPECT_THROW(loadBridgeConfig((folder.path() / "broken.json").string()), ConfigError);
}
