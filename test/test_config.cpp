#include "dialcast/config.hpp"

#include <gtest/gtest.h>

#include <stdexcept>

using namespace dialcast;
using nlohmann::json;

TEST(Config, Defaults)
{
    receiver_config config = parse_receiver_config(json::object());
    EXPECT_EQ(config.server.port, 3000);
    EXPECT_EQ(config.server.prefix, "");
    EXPECT_EQ(config.server.max_content_length, min_content_length);
    EXPECT_TRUE(config.server.extra_headers.empty());
    EXPECT_EQ(config.peer.announce_interval, std::chrono::seconds {900});
    EXPECT_EQ(config.log_level, log::level::info);
    EXPECT_TRUE(config.apps.empty());
}

TEST(Config, Full)
{
    json doc = json::parse(R"({
        "port": 8008,
        "prefix": "/dial",
        "uuid": "abc",
        "friendlyName": "Living Room",
        "maxContentLength": "8192",
        "announceInterval": 60,
        "logLevel": "debug",
        "icon": {"url": "/img/custom.png"},
        "apps": {
            "YouTube": {"launchUrl": "http://www.youtube.com/tv?{}", "allowStop": true,
                        "additionalData": {"screenId": "s1"}, "namespaces": {"yt": "urn:example:yt"}},
            "Netflix": {"state": "running", "pid": "run"}
        }
    })");

    receiver_config config = parse_receiver_config(doc);
    EXPECT_EQ(config.server.port, 8008);
    EXPECT_EQ(config.server.prefix, "/dial");
    EXPECT_EQ(config.server.uuid, "abc");
    EXPECT_EQ(config.server.friendly_name, "Living Room");
    EXPECT_EQ(config.server.max_content_length, 8192u);
    EXPECT_EQ(config.peer.announce_interval, std::chrono::seconds {60});
    EXPECT_EQ(config.log_level, log::level::debug);
    ASSERT_EQ(config.server.icons.size(), 1u);
    EXPECT_EQ(config.server.icons[0].url, "/img/custom.png");
    EXPECT_EQ(config.server.icons[0].mimetype, "image/png");

    ASSERT_EQ(config.apps.size(), 2u);
    // json objects iterate in key order
    const registered_app& netflix = config.apps[0];
    EXPECT_EQ(netflix.info.name, "Netflix");
    EXPECT_EQ(netflix.info.state, app_state::running);
    EXPECT_EQ(netflix.info.pid, std::optional<std::string> {"run"});

    const registered_app& youtube = config.apps[1];
    EXPECT_EQ(youtube.info.name, "YouTube");
    EXPECT_TRUE(youtube.info.allow_stop);
    EXPECT_EQ(youtube.launch_url, "http://www.youtube.com/tv?{}");
    ASSERT_TRUE(youtube.info.additional_data);
    EXPECT_EQ(youtube.info.additional_data->at("screenId"), "s1");
    EXPECT_EQ(youtube.info.namespaces.at("yt"), "urn:example:yt");
}

TEST(Config, MaxContentLengthFloor)
{
    EXPECT_EQ(parse_max_content_length(json(100)), min_content_length);
    EXPECT_EQ(parse_max_content_length(json(-5)), min_content_length);
    EXPECT_EQ(parse_max_content_length(json("abc")), min_content_length);
    EXPECT_EQ(parse_max_content_length(json(nullptr)), min_content_length);
    EXPECT_EQ(parse_max_content_length(json(10000)), 10000u);
    EXPECT_EQ(parse_max_content_length(json("20000")), 20000u);
}

TEST(Config, ExtraHeaders)
{
    json doc = json::parse(R"({"x-friendly": "yes", "X-Count": 3, "X-On": true, "X-Obj": {"a": 1}, "X-Null": null})");
    discovery::ssdp_headers headers = parse_extra_headers(doc);

    EXPECT_EQ(headers.size(), 3u);
    EXPECT_EQ(headers.at("X-FRIENDLY"), "yes");
    EXPECT_EQ(headers.at("X-COUNT"), "3");
    EXPECT_EQ(headers.at("X-ON"), "true");
    EXPECT_TRUE(parse_extra_headers(json::array()).empty());
}

TEST(Config, Invalid)
{
    EXPECT_THROW(parse_receiver_config(json::array()), std::invalid_argument);
    EXPECT_THROW(parse_receiver_config(json::parse(R"({"port": 0})")), std::invalid_argument);
    EXPECT_THROW(parse_receiver_config(json::parse(R"({"announceInterval": 0})")), std::invalid_argument);
    EXPECT_THROW(parse_receiver_config(json::parse(R"({"logLevel": "loud"})")), std::invalid_argument);
    EXPECT_THROW(parse_receiver_config(json::parse(R"({"apps": {"X": {"state": "paused"}}})")), std::invalid_argument);
    EXPECT_THROW(load_receiver_config("/nonexistent/receiver.json"), std::invalid_argument);
}

TEST(Config, AppStateMustMatchPid)
{
    EXPECT_THROW(parse_receiver_config(json::parse(R"({"apps": {"X": {"state": "running"}}})")), std::invalid_argument);
    EXPECT_THROW(parse_receiver_config(json::parse(R"({"apps": {"X": {"state": "starting", "pid": ""}}})")), std::invalid_argument);
    EXPECT_THROW(parse_receiver_config(json::parse(R"({"apps": {"X": {"state": "stopped", "pid": "x"}}})")), std::invalid_argument);

    // without a state it is inferred from the pid
    receiver_config config = parse_receiver_config(json::parse(R"({"apps": {"X": {"pid": "x"}, "Y": {"state": "stopped"}}})"));
    ASSERT_EQ(config.apps.size(), 2u);
    EXPECT_EQ(infer_state(config.apps[0].info), app_state::running);
    EXPECT_EQ(infer_state(config.apps[1].info), app_state::stopped);
}

TEST(RegisteredApp, ExpandLaunchUrl)
{
    EXPECT_EQ(expand_launch_url("http://www.youtube.com/tv?{}", std::string {"v=abc"}), "http://www.youtube.com/tv?v=abc");
    EXPECT_EQ(expand_launch_url("http://www.youtube.com/tv?{}", std::nullopt), "http://www.youtube.com/tv?");
    EXPECT_EQ(expand_launch_url("http://example.com/", std::string {"x"}), "http://example.com/");
}
