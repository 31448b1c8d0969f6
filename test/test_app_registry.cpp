#include "dialcast/app_registry.hpp"

#include <gtest/gtest.h>

#include <stdexcept>

using namespace dialcast;

namespace
{

class AppRegistryTest : public ::testing::Test
{
protected:

    void SetUp() override
    {
        req.set_remote_addr("192.168.1.20");

        // no launch url, nothing gets opened
        registered_app youtube;
        youtube.info.name = "YouTube";
        youtube.info.allow_stop = true;
        registry.add(std::move(youtube));
    }

    app_info info(const std::string& name)
    {
        std::optional<app_info> app = registry.get_app(ctx, name);
        if(!app)
            throw std::runtime_error {"missing app " + name};
        return *app;
    }

    http::request req {"POST", "/apps/YouTube"};
    request_context ctx {req, "http://192.168.1.5:3000"};
    app_registry registry;

};

} // namespace

TEST_F(AppRegistryTest, UnknownApp)
{
    EXPECT_FALSE(registry.get_app(ctx, "Netflix").has_value());

    auto launched = registry.launch_app(ctx, "Netflix", std::nullopt);
    EXPECT_THROW(launched.get(), std::runtime_error);
    EXPECT_FALSE(registry.stop_app(ctx, "Netflix", "run").get());
}

TEST_F(AppRegistryTest, LaunchSetsPidAndState)
{
    EXPECT_EQ(infer_state(info("YouTube")), app_state::stopped);

    auto launched = registry.launch_app(ctx, "YouTube", std::string {"v=abc"});
    EXPECT_EQ(launched.get(), std::optional<std::string> {"run"});

    app_info app = info("YouTube");
    EXPECT_EQ(app.state, app_state::running);
    EXPECT_EQ(app.pid, std::optional<std::string> {"run"});
    EXPECT_NO_THROW(check_app_state(app));
}

TEST_F(AppRegistryTest, StopNeedsMatchingPid)
{
    registry.launch_app(ctx, "YouTube", std::nullopt).get();

    EXPECT_FALSE(registry.stop_app(ctx, "YouTube", "other").get());
    EXPECT_EQ(info("YouTube").state, app_state::running);

    EXPECT_TRUE(registry.stop_app(ctx, "YouTube", "run").get());
    app_info app = info("YouTube");
    EXPECT_EQ(app.state, app_state::stopped);
    EXPECT_FALSE(app.pid.has_value());

    // already stopped
    EXPECT_FALSE(registry.stop_app(ctx, "YouTube", "run").get());
}

TEST_F(AppRegistryTest, AddRejectsStateWithoutPid)
{
    registered_app running;
    running.info.name = "Netflix";
    running.info.state = app_state::running;
    EXPECT_THROW(registry.add(running), std::invalid_argument);

    registered_app stopped;
    stopped.info.name = "Netflix";
    stopped.info.state = app_state::stopped;
    stopped.info.pid = "run";
    EXPECT_THROW(registry.add(stopped), std::invalid_argument);

    EXPECT_FALSE(registry.get_app(ctx, "Netflix").has_value());
}

TEST(AppState, PidMatchesState)
{
    app_info app;
    app.name = "X";
    EXPECT_NO_THROW(check_app_state(app));

    app.pid = "1";
    EXPECT_NO_THROW(check_app_state(app));
    app.state = app_state::starting;
    EXPECT_NO_THROW(check_app_state(app));
    app.state = app_state::stopped;
    EXPECT_THROW(check_app_state(app), std::invalid_argument);

    app.pid.reset();
    EXPECT_NO_THROW(check_app_state(app));
    app.state = app_state::running;
    EXPECT_THROW(check_app_state(app), std::invalid_argument);
}
