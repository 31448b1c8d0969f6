#ifndef DIALCAST_DIAL_SERVER_HPP
#define DIALCAST_DIAL_SERVER_HPP

#include <atomic>
#include <cstdint>
#include <functional>
#include <memory>
#include <string>
#include <vector>

#include "dialcast/app_provider.hpp"
#include "dialcast/description.hpp"
#include "dialcast/ssdp_peer.hpp"
#include "dialcast/http/router.hpp"

namespace dialcast
{

constexpr size_t min_content_length = 4096;

struct server_options
{
    std::string prefix;             // path prefix of all routes, e.g. "/dial"
    uint16_t port = 3000;           // port the webserver listens on
    std::string host;               // fallback host for generated urls; also used in LOCATION if set
    std::string uuid;               // random if empty
    std::string friendly_name;      // host name if empty
    std::string manufacturer = "unknown manufacturer";
    std::string model_name = "unknown model";
    size_t max_content_length = min_content_length;
    discovery::ssdp_headers extra_headers;
    std::vector<icon> icons {default_icon()};
};

// Receiver side of DIAL: advertises one device through SSDP and serves its
// description and the app control routes.
class dial_server
{
public:

    dial_server() = delete;
    dial_server(const dial_server&) = delete;
    dial_server& operator=(const dial_server&) = delete;
    dial_server(dial_server&&) = delete;
    dial_server& operator=(dial_server&&) = delete;
    ~dial_server();

    dial_server(server_options options, std::unique_ptr<discovery::ssdp_peer> peer, app_provider& provider);

    void start();

    // Withdraws all advertisements and closes the transport once every byebye was sent
    void stop();

    // Called after the first alive batch went out
    void on_ready(std::function<void()> fn)
    {
        m_on_ready = std::move(fn);
    }

    // Called after the transport closed
    void on_stop(std::function<void()> fn)
    {
        m_on_stop = std::move(fn);
    }

    void register_routes(http::router& router);

    const server_options& options() const
    {
        return m_options;
    }

    const std::vector<std::string>& service_types() const
    {
        return m_service_types;
    }

    const std::string& location() const
    {
        return m_location;
    }

private:

    void announce();

    void handle_search(const discovery::ssdp_headers& headers, const discovery::ssdp_address& sender);

    discovery::ssdp_headers advertisement(const std::string& service_type) const;

    std::string base_url(const http::request& req) const;

    http::response get_app(const http::request& req, const std::string& name);

    http::response launch_app(const http::request& req, const std::string& name);

    http::response post_dial_data(const http::request& req, const std::string& name);

    http::response stop_app(const http::request& req, const std::string& name, const std::string& pid);

    http::response get_device_description(const http::request& req) const;

    bool exceeds_max_content_length(const http::request& req) const;

    server_options m_options;

    std::unique_ptr<discovery::ssdp_peer> m_peer;

    app_provider& m_provider;

    std::vector<std::string> m_service_types;

    std::string m_server;

    std::string m_location;

    std::atomic<bool> m_started = ATOMIC_VAR_INIT(false);

    std::atomic<bool> m_stopping = ATOMIC_VAR_INIT(false);

    size_t m_pending_byebye = 0;    // only touched by byebye completions on the transport thread

    std::function<void()> m_on_ready;

    std::function<void()> m_on_stop;

};

} // namespace dialcast

#endif
