#ifndef DIALCAST_DIAL_CLIENT_HPP
#define DIALCAST_DIAL_CLIENT_HPP

#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

#include "dialcast/ssdp_peer.hpp"

namespace dialcast
{

using location_event = std::function<void(const std::string& location, const discovery::ssdp_headers& headers)>;

// Controller side of DIAL: keeps the set of receivers currently advertised,
// one entry per description location.
class dial_client
{
public:

    dial_client() = delete;
    dial_client(const dial_client&) = delete;
    dial_client& operator=(const dial_client&) = delete;
    dial_client(dial_client&&) = delete;
    dial_client& operator=(dial_client&&) = delete;
    ~dial_client();

    explicit dial_client(std::unique_ptr<discovery::ssdp_peer> peer);

    void start();

    // Forgets every known location and searches again. No disappear events are sent for the forgotten ones.
    void refresh();

    void stop();

    void on_ready(std::function<void()> fn)
    {
        m_on_ready = std::move(fn);
    }

    void on_found(location_event fn)
    {
        m_on_found = std::move(fn);
    }

    void on_disappear(location_event fn)
    {
        m_on_disappear = std::move(fn);
    }

    void on_stop(std::function<void()> fn)
    {
        m_on_stop = std::move(fn);
    }

    // Snapshot of the known locations
    std::vector<std::string> locations() const;

private:

    void search_all();

    void handle_found(const discovery::ssdp_headers& headers);

    void handle_notify(const discovery::ssdp_headers& headers);

    void record(const std::string& location, const discovery::ssdp_headers& headers);

    static bool tracked_type(const discovery::ssdp_headers& headers, const char* key);

    std::unique_ptr<discovery::ssdp_peer> m_peer;

    mutable std::mutex m_services_mutex;

    std::map<std::string, discovery::ssdp_headers> m_services;     // location -> last advertisement

    std::function<void()> m_on_ready;

    location_event m_on_found;

    location_event m_on_disappear;

    std::function<void()> m_on_stop;

};

} // namespace dialcast

#endif
