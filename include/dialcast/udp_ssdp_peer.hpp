#ifndef DIALCAST_UDP_SSDP_PEER_HPP
#define DIALCAST_UDP_SSDP_PEER_HPP

#include <atomic>
#include <chrono>
#include <deque>
#include <functional>
#include <future>
#include <memory>
#include <mutex>
#include <string>
#include <string_view>
#include <thread>

#include <socketwrapper.hpp>

#include "dialcast/ssdp_peer.hpp"

namespace dialcast::discovery
{

struct udp_peer_options
{
    // Substituted for {{networkInterfaceAddress}}; empty means utils::get_local_ipaddr()
    std::string interface_address;
    uint16_t port = DIALCAST_SSDP_PORT;
    std::chrono::seconds announce_interval {900};
    std::string max_age = "1800";
};

// Functions posted from any thread, run later by the thread calling run_pending()
class completion_queue
{
public:

    // Runs what was posted before the call in posting order. Functions posted
    // while running wait for the next call. Returns the number run.
    size_t run_pending();

private:

    std::mutex m_mutex;

    std::deque<std::function<void()>> m_pending;

};

// SSDP over IPv4 multicast. One receive thread delivers every event.
class udp_ssdp_peer : public ssdp_peer
{
public:

    udp_ssdp_peer() = delete;
    udp_ssdp_peer(const udp_ssdp_peer&) = delete;
    udp_ssdp_peer& operator=(const udp_ssdp_peer&) = delete;
    udp_ssdp_peer(udp_ssdp_peer&&) = delete;
    udp_ssdp_peer& operator=(udp_ssdp_peer&&) = delete;
    ~udp_ssdp_peer() override;

    explicit udp_ssdp_peer(udp_peer_options options);

    void set_events(ssdp_events events) override;

    void start() override;

    void close() override;

    void search(const ssdp_headers& headers) override;

    void alive(const ssdp_headers& headers) override;

    void byebye(const ssdp_headers& headers, std::function<void()> on_sent) override;

    void reply(const ssdp_headers& headers, const ssdp_address& destination) override;

private:

    void receive_loop();

    void dispatch(std::string_view datagram, const ssdp_address& sender) const;

    void send_to(const std::string& addr, uint16_t port, ssdp_method method, ssdp_headers headers);

    void post(std::function<void()> fn);

    udp_peer_options m_options;

    ssdp_events m_events;

    std::unique_ptr<net::udp_socket<net::ip_version::v4>> m_sock {nullptr};

    std::mutex m_send_mutex;

    completion_queue m_pending;     // byebye completions, run on the receive thread

    std::atomic<bool> m_keep = ATOMIC_VAR_INIT(false);

    std::atomic<std::thread::id> m_loop_id {std::thread::id {}};

    std::future<void> m_receiver;

};

} // namespace dialcast::discovery

#endif
