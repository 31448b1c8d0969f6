#ifndef DIALCAST_SSDP_PEER_HPP
#define DIALCAST_SSDP_PEER_HPP

#include <functional>

#include "dialcast/ssdp.hpp"

namespace dialcast::discovery
{

using header_event = std::function<void(const ssdp_headers&, const ssdp_address&)>;

// Callbacks of a peer. All of them run on the transport's own thread,
// never two at the same time.
struct ssdp_events
{
    std::function<void()> on_ready;
    header_event on_search;     // M-SEARCH received
    header_event on_found;      // response to one of our searches
    header_event on_notify;     // NOTIFY (alive or byebye) received
    std::function<void()> on_tick;  // periodic, time to renew announcements
    std::function<void()> on_close;
};

// Multicast discovery transport
class ssdp_peer
{
public:
    virtual ~ssdp_peer() = default;

    // A peer has exactly one listener; set_events replaces the previous one
    virtual void set_events(ssdp_events events) = 0;

    // Fires on_ready once the peer is able to send and receive
    virtual void start() = 0;

    // Fires on_close once the peer stopped; nothing fires afterwards.
    // Further calls, and calls on a peer that never started, do nothing.
    virtual void close() = 0;

    virtual void search(const ssdp_headers& headers) = 0;

    virtual void alive(const ssdp_headers& headers) = 0;

    // on_sent runs on the transport thread after the datagram left
    virtual void byebye(const ssdp_headers& headers, std::function<void()> on_sent) = 0;

    // Unicast answer to a search
    virtual void reply(const ssdp_headers& headers, const ssdp_address& destination) = 0;
};

} // namespace dialcast::discovery

#endif
