#include "dialcast/udp_ssdp_peer.hpp"
#include "dialcast/log.hpp"
#include "dialcast/utils.hpp"

#include <cerrno>
#include <cstring>
#include <stdexcept>
#include <string_view>
#include <poll.h>
#include <sys/socket.h>
#include <netinet/in.h>
#include <arpa/inet.h>

namespace dialcast::discovery
{

static constexpr int poll_timeout_ms = 100;

udp_ssdp_peer::udp_ssdp_peer(udp_peer_options options)
    : m_options {std::move(options)}
{
    if(m_options.interface_address.empty())
        m_options.interface_address = utils::get_local_ipaddr();
}

udp_ssdp_peer::~udp_ssdp_peer()
{
    close();
}

void udp_ssdp_peer::set_events(ssdp_events events)
{
    m_events = std::move(events);
}

void udp_ssdp_peer::start()
{
    if(m_keep.load())
        return;

    m_sock = std::make_unique<net::udp_socket<net::ip_version::v4>>("0.0.0.0", m_options.port);

    ip_mreq group {};
    inet_pton(AF_INET, DIALCAST_SSDP_IP, &group.imr_multiaddr);
    inet_pton(AF_INET, m_options.interface_address.c_str(), &group.imr_interface);
    if(setsockopt(m_sock->get(), IPPROTO_IP, IP_ADD_MEMBERSHIP, &group, sizeof(group)) != 0)
        throw std::runtime_error {std::string {"Joining SSDP multicast group failed: "} + std::strerror(errno)};

    in_addr outgoing {};
    inet_pton(AF_INET, m_options.interface_address.c_str(), &outgoing);
    if(setsockopt(m_sock->get(), IPPROTO_IP, IP_MULTICAST_IF, &outgoing, sizeof(outgoing)) != 0)
        log::warn("Unable to select multicast interface {}: {}", m_options.interface_address, std::strerror(errno));

    m_keep = true;
    m_receiver = std::async(std::launch::async, [this]() { receive_loop(); });
}

void udp_ssdp_peer::close()
{
    m_keep = false;

    // Called from inside an event: the loop ends after the current callback returns
    if(m_loop_id.load() == std::this_thread::get_id())
        return;

    if(m_receiver.valid())
        m_receiver.get();
}

void udp_ssdp_peer::search(const ssdp_headers& headers)
{
    send_to(DIALCAST_SSDP_IP, DIALCAST_SSDP_PORT, ssdp_method::search, merge(headers, {
        {"HOST", "239.255.255.250:1900"},
        {"MAN", "\"ssdp:discover\""},
        {"MX", "3"}
    }));
}

void udp_ssdp_peer::alive(const ssdp_headers& headers)
{
    send_to(DIALCAST_SSDP_IP, DIALCAST_SSDP_PORT, ssdp_method::notify, merge(headers, {
        {"HOST", "239.255.255.250:1900"},
        {"NTS", nts_alive},
        {"CACHE-CONTROL", "max-age=" + m_options.max_age}
    }));
}

void udp_ssdp_peer::byebye(const ssdp_headers& headers, std::function<void()> on_sent)
{
    send_to(DIALCAST_SSDP_IP, DIALCAST_SSDP_PORT, ssdp_method::notify, merge(headers, {
        {"HOST", "239.255.255.250:1900"},
        {"NTS", nts_byebye}
    }));

    if(on_sent)
        m_pending.post(std::move(on_sent));
}

void udp_ssdp_peer::reply(const ssdp_headers& headers, const ssdp_address& destination)
{
    send_to(destination.addr, destination.port, ssdp_method::response, merge(headers, {
        {"EXT", ""},
        {"CACHE-CONTROL", "max-age=" + m_options.max_age}
    }));
}

void udp_ssdp_peer::send_to(const std::string& addr, uint16_t port, ssdp_method method, ssdp_headers headers)
{
    std::string msg = render_message(method, substitute_interface_address(std::move(headers), m_options.interface_address));

    std::lock_guard<std::mutex> lock {m_send_mutex};
    if(!m_sock)
    {
        log::warn("SSDP peer not started, dropping message to {}:{}", addr, port);
        return;
    }

    try {
        m_sock->send(addr, port, net::span {msg});
    } catch(const std::runtime_error& e) {
        log::warn("Sending SSDP message to {}:{} failed: {}", addr, port, e.what());
    }
}

void completion_queue::post(std::function<void()> fn)
{
    std::lock_guard<std::mutex> lock {m_mutex};
    m_pending.push_back(std::move(fn));
}

size_t completion_queue::run_pending()
{
    std::deque<std::function<void()>> pending;
    {
        std::lock_guard<std::mutex> lock {m_mutex};
        pending.swap(m_pending);
    }

    for(auto& fn : pending)
        fn();
    return pending.size();
}

void udp_ssdp_peer::dispatch(std::string_view datagram, const ssdp_address& sender) const
{
    ssdp_message msg;
    try {
        msg = parse_message(datagram);
    } catch(const std::invalid_argument& e) {
        log::debug("Ignoring datagram from {}:{}: {}", sender.addr, sender.port, e.what());
        return;
    }

    switch(msg.method)
    {
        case ssdp_method::search:
            if(m_events.on_search)
                m_events.on_search(msg.headers, sender);
            break;
        case ssdp_method::notify:
            if(m_events.on_notify)
                m_events.on_notify(msg.headers, sender);
            break;
        case ssdp_method::response:
            if(m_events.on_found)
                m_events.on_found(msg.headers, sender);
            break;
    }
}

void udp_ssdp_peer::receive_loop()
{
    using clock = std::chrono::steady_clock;

    m_loop_id = std::this_thread::get_id();
    if(m_events.on_ready)
        m_events.on_ready();

    auto next_tick = clock::now() + m_options.announce_interval;
    while(m_keep.load())
    {
        m_pending.run_pending();

        if(!m_keep.load())
            break;

        if(clock::now() >= next_tick)
        {
            next_tick = clock::now() + m_options.announce_interval;
            if(m_events.on_tick)
                m_events.on_tick();
        }

        pollfd pfd {m_sock->get(), POLLIN, 0};
        int ready = poll(&pfd, 1, poll_timeout_ms);
        if(ready <= 0 || !(pfd.revents & POLLIN))
            continue;

        try {
            auto [buffer, peer] = m_sock->read<char>(4096);
            dispatch(std::string_view {buffer.data(), buffer.size()}, ssdp_address {peer.addr, peer.port});
        } catch(const std::runtime_error& e) {
            log::warn("Reading SSDP datagram failed: {}", e.what());
        }
    }

    {
        std::lock_guard<std::mutex> lock {m_send_mutex};
        m_sock.reset();
    }
    m_loop_id = std::thread::id {};

    if(m_events.on_close)
        m_events.on_close();
}

} // namespace dialcast::discovery
