#include "dialcast/dial_client.hpp"
#include "dialcast/description.hpp"

#include "fake_ssdp_peer.hpp"

#include <gtest/gtest.h>

#include <algorithm>
#include <string>
#include <thread>

using namespace dialcast;
using dialcast::discovery::ssdp_headers;

namespace
{

class DialClientTest : public ::testing::Test
{
protected:

    void SetUp() override
    {
        auto peer = std::make_unique<fake_ssdp_peer>();
        m_peer = peer.get();
        client = std::make_unique<dial_client>(std::move(peer));
        client->on_found([this](const std::string& location, const ssdp_headers&) { found.push_back(location); });
        client->on_disappear([this](const std::string& location, const ssdp_headers&) { gone.push_back(location); });
    }

    fake_ssdp_peer& peer()
    {
        return *m_peer;
    }

    static ssdp_headers response_for(const std::string& st, const std::string& location)
    {
        return {{"ST", st}, {"LOCATION", location}, {"USN", "uuid:abc::" + st}};
    }

    static ssdp_headers notify_for(const std::string& nt, const std::string& nts, const std::string& location)
    {
        return {{"NT", nt}, {"NTS", nts}, {"LOCATION", location}};
    }

    std::unique_ptr<dial_client> client;
    std::vector<std::string> found;
    std::vector<std::string> gone;

private:

    fake_ssdp_peer* m_peer = nullptr;

};

} // namespace

TEST_F(DialClientTest, SearchesOnReady)
{
    bool ready = false;
    client->on_ready([&]() { ready = true; });
    client->start();

    EXPECT_TRUE(ready);
    ASSERT_EQ(peer().searches.size(), 2u);
    EXPECT_EQ(peer().searches[0].at("ST"), dial_device_type);
    EXPECT_EQ(peer().searches[1].at("ST"), dial_service_type);
}

TEST_F(DialClientTest, FoundOncePerLocation)
{
    client->start();
    peer().fire_found(response_for(dial_service_type, "http://10.0.0.3:3000/ssdp/device-desc.xml"));
    peer().fire_found(response_for(dial_device_type, "http://10.0.0.3:3000/ssdp/device-desc.xml"));
    peer().fire_notify(notify_for(dial_service_type, "ssdp:alive", "http://10.0.0.3:3000/ssdp/device-desc.xml"));
    peer().fire_found(response_for(dial_service_type, "http://10.0.0.4:3000/ssdp/device-desc.xml"));

    const std::vector<std::string> expected {
        "http://10.0.0.3:3000/ssdp/device-desc.xml",
        "http://10.0.0.4:3000/ssdp/device-desc.xml"
    };
    EXPECT_EQ(found, expected);
    EXPECT_EQ(client->locations(), expected);
}

TEST_F(DialClientTest, UnrelatedTypesAreIgnored)
{
    client->start();
    peer().fire_found(response_for("urn:schemas-upnp-org:device:MediaRenderer:1", "http://10.0.0.5/desc.xml"));
    peer().fire_notify(notify_for(root_device_type, "ssdp:alive", "http://10.0.0.5/desc.xml"));
    peer().fire_found({{"ST", dial_service_type}});

    EXPECT_TRUE(found.empty());
    EXPECT_TRUE(client->locations().empty());
}

TEST_F(DialClientTest, ByebyeForTrackedLocation)
{
    client->start();
    peer().fire_notify(notify_for(dial_device_type, "ssdp:alive", "http://10.0.0.3/desc.xml"));
    peer().fire_notify(notify_for(dial_device_type, "ssdp:byebye", "http://10.0.0.3/desc.xml"));

    ASSERT_EQ(gone.size(), 1u);
    EXPECT_EQ(gone.front(), "http://10.0.0.3/desc.xml");
    EXPECT_TRUE(client->locations().empty());

    // announced again after leaving
    peer().fire_notify(notify_for(dial_device_type, "ssdp:alive", "http://10.0.0.3/desc.xml"));
    EXPECT_EQ(found.size(), 2u);
}

TEST_F(DialClientTest, ByebyeForUnknownLocation)
{
    client->start();
    peer().fire_notify(notify_for(dial_service_type, "ssdp:byebye", "http://10.0.0.9/desc.xml"));
    EXPECT_TRUE(gone.empty());
}

TEST_F(DialClientTest, RefreshForgetsAndSearchesAgain)
{
    client->start();
    peer().fire_found(response_for(dial_service_type, "http://10.0.0.3/desc.xml"));
    client->refresh();

    EXPECT_TRUE(gone.empty());
    EXPECT_TRUE(client->locations().empty());
    EXPECT_EQ(peer().searches.size(), 4u);

    peer().fire_found(response_for(dial_service_type, "http://10.0.0.3/desc.xml"));
    EXPECT_EQ(found.size(), 2u);
}

TEST_F(DialClientTest, StopClosesPeer)
{
    bool stopped = false;
    client->on_stop([&]() { stopped = true; });
    client->start();
    client->stop();
    EXPECT_EQ(peer().closed, 1);
    EXPECT_TRUE(stopped);
}

TEST_F(DialClientTest, RefreshWhileTransportDeliversEvents)
{
    client->start();

    // the udp peer delivers from its own receive thread
    std::thread transport_thread {[this]() {
        for(int i = 0; i < 20000; ++i)
        {
            const std::string location = "http://10.0.0." + std::to_string(i % 16) + "/desc.xml";
            peer().fire_notify(notify_for(dial_service_type, (i % 3 == 2) ? "ssdp:byebye" : "ssdp:alive", location));
        }
    }};

    size_t max_known = 0;
    for(int i = 0; i < 2000; ++i)
    {
        client->refresh();
        max_known = std::max(max_known, client->locations().size());
    }
    transport_thread.join();

    EXPECT_LE(max_known, 16u);
    EXPECT_LE(client->locations().size(), 16u);
    EXPECT_LE(gone.size(), found.size());
    EXPECT_EQ(peer().searches.size(), 2u + 2u * 2000u);
}

namespace
{

// Records how many copies of itself were alive when it got called
struct stop_listener
{
    stop_listener(int* calls, int* live_at_call)
        : m_calls {calls}, m_live_at_call {live_at_call}
    {
        ++live;
    }

    stop_listener(const stop_listener& other)
        : m_calls {other.m_calls}, m_live_at_call {other.m_live_at_call}
    {
        ++live;
    }

    ~stop_listener()
    {
        --live;
    }

    void operator()() const
    {
        ++*m_calls;
        *m_live_at_call = live;
    }

    static int live;

    int* m_calls;
    int* m_live_at_call;
};

int stop_listener::live = 0;

} // namespace

TEST_F(DialClientTest, DestroyWithoutStopClosesTransportFirst)
{
    int calls = 0;
    int live_at_call = 0;
    client->on_stop(stop_listener {&calls, &live_at_call});
    client->start();
    client.reset();

    EXPECT_EQ(calls, 1);
    EXPECT_GT(live_at_call, 0);
    EXPECT_EQ(stop_listener::live, 0);
}
