#include "dialcast/http/webserver.hpp"
#include "dialcast/http/request.hpp"
#include "dialcast/http/response.hpp"
#include "dialcast/log.hpp"

#include <algorithm>
#include <array>
#include <chrono>
#include <stdexcept>
#include <string>
#include <string_view>
#include <sys/socket.h>
#include <netinet/in.h>
#include <arpa/inet.h>

namespace dialcast::http
{

static std::string peer_address(int fd)
{
    sockaddr_in addr {};
    socklen_t len = sizeof(addr);
    if(getpeername(fd, reinterpret_cast<sockaddr*>(&addr), &len) != 0)
        return {};

    std::array<char, INET_ADDRSTRLEN> buffer;
    if(inet_ntop(AF_INET, &addr.sin_addr, buffer.data(), buffer.size()) == nullptr)
        return {};
    return buffer.data();
}

request read_request(const read_fn& read, size_t max_body)
{
    const std::string_view header_termination {"\r\n\r\n"};
    std::string raw;

    size_t head_end = std::string::npos;
    while(head_end == std::string::npos)
    {
        std::string chunk = read();
        if(chunk.empty())
            throw std::invalid_argument {"connection closed before end of header"};
        raw.append(chunk);
        head_end = raw.find(header_termination);

        if(head_end == std::string::npos && raw.size() > 64 * 1024)
            throw std::invalid_argument {"header too large"};
    }

    request req {std::string_view {raw}.substr(0, head_end + 2)};

    // Anything beyond max_body + 1 bytes is not needed to reject the request
    size_t wanted = std::min(req.content_length(), max_body + 1);
    std::string body = raw.substr(head_end + header_termination.size());
    while(body.size() < wanted)
    {
        std::string chunk = read();
        if(chunk.empty())
            break;
        body.append(chunk);
    }
    if(body.size() > wanted)
        body.resize(wanted);

    req.set_body(std::move(body));
    return req;
}

std::optional<response> handle_request(const router& routes, const read_fn& read, size_t max_body,
    const std::string& remote_addr)
{
    try {
        request req = read_request(read, max_body);
        req.set_remote_addr(remote_addr);
        log::debug("{} {} from {}", req.get_method(), req.get_resource(), req.get_remote_addr());

        return routes.dispatch(req);
    } catch(const std::invalid_argument& e) {
        log::warn("Rejecting malformed request from {}: {}", remote_addr, e.what());
        return response {400};
    } catch(const std::runtime_error& e) {
        log::warn("Connection to {} failed: {}", remote_addr, e.what());
        return std::nullopt;
    }
}

void webserver::handle_connection(net::tcp_connection<net::ip_version::v4>&& conn) const
{
    std::array<char, 4096> buffer;
    auto read = [&conn, &buffer]() {
        size_t br = conn.read(net::span {buffer});
        return std::string {buffer.data(), br};
    };

    std::optional<response> handled = handle_request(m_router, read, m_max_body, peer_address(conn.get()));
    if(!handled)
        return;

    response& res = *handled;
    res.set_header("Connection", "close");
    try {
        std::string res_str = res.to_string();
        conn.send(net::span {res_str});
    } catch(const std::runtime_error& e) {
        log::warn("Sending response failed: {}", e.what());
    }
}

void webserver::serve(std::atomic<bool>& run_condition)
{
    log::info("Webserver serving ...");
    while(run_condition.load())
    {
        try {
            auto conn = m_acceptor.accept();
            if(!run_condition.load())
                break;

            m_tasks.push_back(std::async(std::launch::async, [this, c = std::move(conn)]() mutable {
                handle_connection(std::move(c));
            }));
        } catch(const std::runtime_error& e) {
            log::warn("Accepting connection failed: {}", e.what());
        }

        m_tasks.remove_if([](const std::future<void>& task) {
            return task.wait_for(std::chrono::seconds {0}) == std::future_status::ready;
        });
    }

    for(auto& task : m_tasks)
        task.wait();
    m_tasks.clear();

    log::info("Webserver closing");
}

} // namespace dialcast::http
