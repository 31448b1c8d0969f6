#include "dialcast/description.hpp"
#include "dialcast/error.hpp"

#include <gtest/gtest.h>

#include <stdexcept>

using namespace dialcast;

TEST(DeviceDescription, RenderAndParse)
{
    device_description desc;
    desc.url_base = "http://192.168.1.5:3000";
    desc.uuid = "abc";
    desc.friendly_name = "R";
    desc.manufacturer = "M";
    desc.model_name = "X";
    desc.icons = {default_icon()};

    const std::string xml = render_device_description(desc);
    EXPECT_NE(xml.find("<UDN>uuid:abc</UDN>"), std::string::npos);
    EXPECT_NE(xml.find(dial_service_type), std::string::npos);

    device_description parsed = parse_device_description(xml);
    EXPECT_EQ(parsed.url_base, desc.url_base);
    EXPECT_EQ(parsed.uuid, "abc");
    EXPECT_EQ(parsed.friendly_name, "R");
    EXPECT_EQ(parsed.manufacturer, "M");
    EXPECT_EQ(parsed.model_name, "X");
    EXPECT_EQ(parsed.device_type, dial_device_type);
    ASSERT_EQ(parsed.icons.size(), 1u);
    EXPECT_EQ(parsed.icons[0].mimetype, "image/png");
    EXPECT_EQ(parsed.icons[0].width, "144");
    EXPECT_EQ(parsed.icons[0].depth, "32");
}

TEST(DeviceDescription, EscapesText)
{
    device_description desc;
    desc.uuid = "abc";
    desc.friendly_name = "Tom & Jerry's <TV>";

    device_description parsed = parse_device_description(render_device_description(desc));
    EXPECT_EQ(parsed.friendly_name, "Tom & Jerry's <TV>");
}

TEST(DeviceDescription, MultipleIcons)
{
    const char* xml =
        "<root><device>"
        "<UDN>abc</UDN>"
        "<iconList>"
        "<icon><mimetype>image/png</mimetype><url>/a.png</url></icon>"
        "<icon><mimetype>image/jpeg</mimetype><url>/b.jpg</url></icon>"
        "</iconList>"
        "</device></root>";

    device_description parsed = parse_device_description(xml);
    EXPECT_EQ(parsed.uuid, "abc");
    ASSERT_EQ(parsed.icons.size(), 2u);
    EXPECT_EQ(parsed.icons[0].url, "/a.png");
    EXPECT_EQ(parsed.icons[1].mimetype, "image/jpeg");
}

TEST(DeviceDescription, Malformed)
{
    EXPECT_THROW(parse_device_description("<root><device>"), document_error);
    EXPECT_THROW(parse_device_description("<other/>"), document_error);
    EXPECT_THROW(parse_device_description("<root></root>"), document_error);
    EXPECT_THROW(parse_device_description("not xml"), document_error);
}

TEST(AppDescription, RenderWithoutLink)
{
    app_description desc;
    desc.name = "YouTube";
    desc.allow_stop = true;
    desc.rel = "run";

    const std::string xml = render_app_description(desc);
    EXPECT_EQ(xml.find("<link"), std::string::npos);
    EXPECT_EQ(xml.find("additionalData"), std::string::npos);
    EXPECT_NE(xml.find("dialVer=\"1.7\""), std::string::npos);

    nlohmann::json doc = parse_app_description(xml);
    EXPECT_EQ(doc["name"], "YouTube");
    EXPECT_EQ(doc["state"], "stopped");
    EXPECT_EQ(doc["options"]["allowStop"], "true");
    EXPECT_EQ(doc["dialVer"], "1.7");
}

TEST(AppDescription, RenderWithLinkAndData)
{
    app_description desc;
    desc.name = "YouTube";
    desc.state = app_state::running;
    desc.rel = "run";
    desc.href = "42";
    desc.additional_data = std::map<std::string, std::string> {{"screenId", "s1"}, {"theme", "a<b"}};
    desc.namespaces = {{"yt", "urn:example:youtube"}};

    const std::string xml = render_app_description(desc);
    EXPECT_NE(xml.find("<link rel=\"run\" href=\"42\" />"), std::string::npos);
    EXPECT_NE(xml.find("xmlns:yt=\"urn:example:youtube\""), std::string::npos);

    nlohmann::json doc = parse_app_description(xml);
    EXPECT_EQ(doc["state"], "running");
    EXPECT_EQ(doc["link"]["rel"], "run");
    EXPECT_EQ(doc["link"]["href"], "42");
    EXPECT_EQ(doc["additionalData"]["screenId"], "s1");
    EXPECT_EQ(doc["additionalData"]["theme"], "a<b");
}

TEST(AppDescription, EmptyAdditionalData)
{
    app_description desc;
    desc.name = "X";
    desc.additional_data = std::map<std::string, std::string> {};

    EXPECT_NE(render_app_description(desc).find("<additionalData>"), std::string::npos);
}

TEST(AppDescription, InvalidDataKeysAreSkipped)
{
    app_description desc;
    desc.name = "X";
    desc.additional_data = std::map<std::string, std::string> {
        {"bad key", "1"}, {"a<b", "2"}, {"1st", "3"}, {"", "4"}, {"good", "5"}, {"_x-1.y", "6"}
    };

    const std::string xml = render_app_description(desc);
    EXPECT_EQ(xml.find("bad key"), std::string::npos);
    EXPECT_EQ(xml.find("a<b"), std::string::npos);
    EXPECT_EQ(xml.find("<1st>"), std::string::npos);
    EXPECT_EQ(xml.find("<>"), std::string::npos);

    nlohmann::json doc = parse_app_description(xml);
    ASSERT_TRUE(doc["additionalData"].is_object());
    EXPECT_EQ(doc["additionalData"].size(), 2u);
    EXPECT_EQ(doc["additionalData"]["good"], "5");
    EXPECT_EQ(doc["additionalData"]["_x-1.y"], "6");
}

TEST(AppDescription, PrefixesAreStripped)
{
    const char* plain =
        "<service xmlns=\"urn:dial-multiscreen-org:schemas:dial\">"
        "<name>Netflix</name><state>running</state>"
        "<additionalData><data>1</data></additionalData>"
        "</service>";
    const char* prefixed =
        "<d:service xmlns:d=\"urn:dial-multiscreen-org:schemas:dial\">"
        "<d:name>Netflix</d:name><d:state>running</d:state>"
        "<d:additionalData><d:data>1</d:data></d:additionalData>"
        "</d:service>";

    nlohmann::json a = parse_app_description(plain);
    nlohmann::json b = parse_app_description(prefixed);
    EXPECT_EQ(a["name"], b["name"]);
    EXPECT_EQ(a["state"], b["state"]);
    EXPECT_EQ(a["additionalData"], b["additionalData"]);
    EXPECT_EQ(b["additionalData"]["data"], "1");
}

TEST(AppDescription, RepeatedElementsBecomeArrays)
{
    nlohmann::json doc = parse_app_description(
        "<service><name>X</name><tag>a</tag><tag>b</tag><note lang=\"en\">hi</note></service>");
    ASSERT_TRUE(doc["tag"].is_array());
    EXPECT_EQ(doc["tag"].size(), 2u);
    EXPECT_EQ(doc["tag"][1], "b");
    EXPECT_EQ(doc["note"]["lang"], "en");
    EXPECT_EQ(doc["note"]["_"], "hi");
}

TEST(AppDescription, Malformed)
{
    EXPECT_THROW(parse_app_description("<service><name>"), document_error);
    EXPECT_THROW(parse_app_description(""), document_error);
}

TEST(AppState, Names)
{
    EXPECT_STREQ(to_string(app_state::starting), "starting");
    EXPECT_EQ(parse_app_state("running"), app_state::running);
    EXPECT_THROW(parse_app_state("paused"), std::invalid_argument);
}
