#ifndef DIALCAST_HTTP_WEBSERVER_HPP
#define DIALCAST_HTTP_WEBSERVER_HPP

#include <atomic>
#include <cstdint>
#include <functional>
#include <future>
#include <list>
#include <optional>
#include <string>

#include <socketwrapper.hpp>

#include "dialcast/http/router.hpp"

namespace dialcast::http
{

// Returns the next chunk received on a connection, an empty string once it is closed
using read_fn = std::function<std::string()>;

// Reads the head and at most max_body + 1 body bytes.
// Throws std::invalid_argument for malformed or truncated heads.
request read_request(const read_fn& read, size_t max_body);

// Reads and dispatches one request. Malformed requests are answered with 400,
// std::nullopt means the connection failed and nothing should be sent.
std::optional<response> handle_request(const router& routes, const read_fn& read, size_t max_body,
    const std::string& remote_addr);

class webserver
{
public:
    webserver() = delete;
    webserver(const webserver&) = delete;
    webserver& operator=(const webserver&) = delete;
    webserver(webserver&&) = delete;
    webserver& operator=(webserver&&) = delete;
    ~webserver() = default;

    // Bodies are read up to max_body + 1 bytes so that handlers can still detect oversized requests
    webserver(uint16_t port, const router& routes, size_t max_body = 4096)
        : m_acceptor {"0.0.0.0", port}, m_router {routes}, m_max_body {max_body}
    {}

    // Accepts connections until run_condition turns false. Every connection is served
    // on its own task; serve() returns after all of them finished.
    void serve(std::atomic<bool>& run_condition);

private:

    void handle_connection(net::tcp_connection<net::ip_version::v4>&& conn) const;

    net::tcp_acceptor<net::ip_version::v4> m_acceptor;

    const router& m_router;

    size_t m_max_body;

    std::list<std::future<void>> m_tasks;

};

} // namespace dialcast::http

#endif
