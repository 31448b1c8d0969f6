#include "dialcast/app_registry.hpp"
#include "dialcast/log.hpp"

#include <cerrno>
#include <cstring>
#include <stdexcept>
#include <spawn.h>
#include <sys/wait.h>

extern char** environ;

namespace dialcast
{

// Pid reported for a running app, as a DIAL pid it only has to be stable
static constexpr const char* running_pid = "run";

std::string expand_launch_url(const std::string& url_template, const std::optional<std::string>& launch_data)
{
    std::string url = url_template;
    size_t pos = url.find("{}");
    if(pos != std::string::npos)
        url.replace(pos, 2, launch_data.value_or(""));
    return url;
}

void check_app_state(const app_info& info)
{
    if(!info.state)
        return;

    const bool has_pid = info.pid && !info.pid->empty();
    if(has_pid != (*info.state != app_state::stopped))
    {
        throw std::invalid_argument {"App \"" + info.name + "\" is " + to_string(*info.state)
            + (has_pid ? " but has a pid" : " without a pid")};
    }
}

static void open_url(const std::string& url)
{
    // No shell involved, the launch data can not inject commands
    pid_t child;
    char* const argv[] = {const_cast<char*>("xdg-open"), const_cast<char*>(url.c_str()), nullptr};
    int rc = posix_spawnp(&child, "xdg-open", nullptr, nullptr, argv, environ);
    if(rc != 0)
        throw std::runtime_error {std::string {"Unable to run xdg-open: "} + std::strerror(rc)};

    int status = 0;
    waitpid(child, &status, 0);
    if(!WIFEXITED(status) || WEXITSTATUS(status) != 0)
        throw std::runtime_error {"xdg-open failed for " + url};
}

void app_registry::add(registered_app app)
{
    check_app_state(app.info);

    std::lock_guard<std::mutex> lock {m_mutex};
    std::string name = app.info.name;
    m_apps[name] = std::move(app);
}

std::optional<app_info> app_registry::get_app(const request_context&, const std::string& name)
{
    std::lock_guard<std::mutex> lock {m_mutex};
    auto it = m_apps.find(name);
    if(it == m_apps.end())
        return std::nullopt;
    return it->second.info;
}

std::future<std::optional<std::string>> app_registry::launch_app(const request_context& ctx,
    const std::string& name, const std::optional<std::string>& launch_data)
{
    std::promise<std::optional<std::string>> result;
    std::string launch_url;
    {
        std::lock_guard<std::mutex> lock {m_mutex};
        auto it = m_apps.find(name);
        if(it == m_apps.end())
        {
            result.set_exception(std::make_exception_ptr(std::runtime_error {"Unknown app " + name}));
            return result.get_future();
        }

        it->second.info.pid = running_pid;
        it->second.info.state = app_state::starting;
        launch_url = it->second.launch_url;
    }

    log::info("Request from {} to launch {} with launch data: {}", ctx.req.get_remote_addr(), name, launch_data.value_or(""));
    try {
        if(!launch_url.empty())
            open_url(expand_launch_url(launch_url, launch_data));
    } catch(const std::runtime_error&) {
        std::lock_guard<std::mutex> lock {m_mutex};
        app_info& info = m_apps[name].info;
        info.pid.reset();
        info.state = app_state::stopped;
        result.set_exception(std::current_exception());
        return result.get_future();
    }

    {
        std::lock_guard<std::mutex> lock {m_mutex};
        m_apps[name].info.state = app_state::running;
    }

    result.set_value(std::string {running_pid});
    return result.get_future();
}

std::future<bool> app_registry::stop_app(const request_context& ctx, const std::string& name, const std::string& pid)
{
    log::info("Request from {} to stop {} with pid: {}", ctx.req.get_remote_addr(), name, pid);

    std::promise<bool> result;
    std::lock_guard<std::mutex> lock {m_mutex};
    auto it = m_apps.find(name);
    if(it == m_apps.end() || !it->second.info.pid || *it->second.info.pid != pid)
    {
        result.set_value(false);
        return result.get_future();
    }

    it->second.info.pid.reset();
    it->second.info.state = app_state::stopped;
    result.set_value(true);
    return result.get_future();
}

} // namespace dialcast
