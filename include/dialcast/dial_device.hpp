#ifndef DIALCAST_DIAL_DEVICE_HPP
#define DIALCAST_DIAL_DEVICE_HPP

#include <memory>
#include <optional>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "dialcast/description.hpp"
#include "dialcast/error.hpp"
#include "dialcast/http/client.hpp"

namespace dialcast
{

constexpr const char* default_launch_content_type = "text/plain; charset=\"utf-8\"";

// A discovered receiver. Every call is one blocking HTTP request without timeout or retry.
class dial_device
{
public:

    dial_device() = delete;
    dial_device(const dial_device&) = default;
    dial_device& operator=(const dial_device&) = default;
    dial_device(dial_device&&) = default;
    dial_device& operator=(dial_device&&) = default;
    ~dial_device() = default;

    dial_device(device_description desc, std::string description_url, std::string application_url,
        std::shared_ptr<http::transport> transport);

    // Raw app description XML of GET {application_url}/{app_name}
    outcome<std::string> app_info_xml(const std::string& app_name) const;

    // Parsed app description, see parse_app_description()
    outcome<nlohmann::json> app_info(const std::string& app_name) const;

    // Returns the response body on any status below 400
    outcome<std::string> launch_app(const std::string& app_name, const std::optional<std::string>& payload = std::nullopt,
        const std::optional<std::string>& content_type = std::nullopt) const;

    // Returns the status code the receiver answered with
    outcome<int> stop_app(const std::string& app_name, const std::string& pid) const;

    const std::string& description_url() const { return m_description_url; }

    const std::string& application_url() const { return m_application_url; }

    const std::string& device_type() const { return m_desc.device_type; }

    const std::string& friendly_name() const { return m_desc.friendly_name; }

    const std::string& manufacturer() const { return m_desc.manufacturer; }

    const std::string& model_name() const { return m_desc.model_name; }

    // Unique device name, "uuid:" followed by the device uuid
    std::string udn() const { return "uuid:" + m_desc.uuid; }

    const std::vector<icon>& icons() const { return m_desc.icons; }

private:

    outcome<http::response> perform(http::client_request req) const;

    device_description m_desc;

    std::string m_description_url;

    std::string m_application_url;     // without trailing slash

    std::shared_ptr<http::transport> m_transport;

};

// Fetches and parses the device description behind an SSDP LOCATION
outcome<dial_device> fetch_device(const std::string& description_url, std::shared_ptr<http::transport> transport);

} // namespace dialcast

#endif
