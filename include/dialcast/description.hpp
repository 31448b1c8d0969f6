#ifndef DIALCAST_DESCRIPTION_HPP
#define DIALCAST_DESCRIPTION_HPP

#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include <nlohmann/json.hpp>

namespace dialcast
{

constexpr const char* dial_service_type = "urn:dial-multiscreen-org:service:dial:1";
constexpr const char* dial_device_type = "urn:dial-multiscreen-org:device:dial:1";
constexpr const char* root_device_type = "upnp:rootdevice";
constexpr const char* all_service_type = "ssdp:all";

struct icon
{
    std::string mimetype;
    std::string width;
    std::string height;
    std::string depth;
    std::string url;
};

// The icon every receiver advertises unless configured otherwise
icon default_icon();

struct device_description
{
    std::string url_base;
    std::string device_type = dial_device_type;
    std::string friendly_name;
    std::string manufacturer;
    std::string model_name;
    std::string uuid;           // without the "uuid:" prefix of the UDN
    std::vector<icon> icons;
};

enum class app_state
{
    stopped,
    starting,
    running
};

const char* to_string(app_state state);

// Throws std::invalid_argument for anything but "stopped", "starting" and "running"
app_state parse_app_state(std::string_view name);

struct app_description
{
    std::string name;
    app_state state = app_state::stopped;
    bool allow_stop = false;
    std::string rel;            // <link> is rendered only if rel and href are both non-empty
    std::string href;
    std::optional<std::map<std::string, std::string>> additional_data;
    std::map<std::string, std::string> namespaces; // prefix -> uri, declared on the root element
};

std::string render_device_description(const device_description& desc);

std::string render_app_description(const app_description& desc);

// Throws document_error if the text is not a device description
device_description parse_device_description(std::string_view text);

// Converts an app description into a json object: attributes are merged into
// their element, single children become scalars, repeated children arrays and
// namespace prefixes are stripped from all names. Throws document_error.
nlohmann::json parse_app_description(std::string_view text);

} // namespace dialcast

#endif
