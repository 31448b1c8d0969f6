#include "dialcast/config.hpp"
#include "dialcast/utils.hpp"

#include <algorithm>
#include <charconv>
#include <fstream>
#include <stdexcept>

using nlohmann::json;

namespace dialcast
{

template<typename T>
static T value_or(const json& obj, const char* key, T fallback)
{
    auto it = obj.find(key);
    if(it == obj.end() || it->is_null())
        return fallback;
    return it->get<T>();
}

size_t parse_max_content_length(const json& value)
{
    size_t length = 0;
    if(value.is_number_unsigned())
    {
        length = value.get<size_t>();
    }
    else if(value.is_number_integer())
    {
        length = static_cast<size_t>(std::max<int64_t>(value.get<int64_t>(), 0));
    }
    else if(value.is_number_float())
    {
        length = static_cast<size_t>(std::max(value.get<double>(), 0.0));
    }
    else if(value.is_string())
    {
        // Leading digits count, anything else falls back to the minimum
        const std::string str = value.get<std::string>();
        std::from_chars(str.data(), str.data() + str.size(), length);
    }

    return std::max(length, min_content_length);
}

discovery::ssdp_headers parse_extra_headers(const json& value)
{
    discovery::ssdp_headers headers;
    if(!value.is_object())
        return headers;

    for(const auto& it : value.items())
    {
        const json& v = it.value();
        if(v.is_string())
            headers[utils::to_upper(it.key())] = v.get<std::string>();
        else if(v.is_boolean())
            headers[utils::to_upper(it.key())] = v.get<bool>() ? "true" : "false";
        else if(v.is_number())
            headers[utils::to_upper(it.key())] = v.dump();
    }
    return headers;
}

static std::map<std::string, std::string> parse_string_map(const json& value, const char* what)
{
    if(!value.is_object())
        throw std::invalid_argument {std::string {what} + " must be an object"};

    std::map<std::string, std::string> result;
    for(const auto& it : value.items())
        result[it.key()] = it.value().is_string() ? it.value().get<std::string>() : it.value().dump();
    return result;
}

static registered_app parse_app(const std::string& name, const json& app)
{
    if(!app.is_object())
        throw std::invalid_argument {"App \"" + name + "\" must be an object"};

    registered_app result;
    result.info.name = name;
    result.info.allow_stop = value_or<bool>(app, "allowStop", false);
    result.launch_url = value_or<std::string>(app, "launchUrl", "");

    if(app.contains("state") && !app["state"].is_null())
        result.info.state = parse_app_state(app["state"].get<std::string>());
    if(app.contains("pid") && app["pid"].is_string())
        result.info.pid = app["pid"].get<std::string>();
    if(app.contains("additionalData"))
        result.info.additional_data = parse_string_map(app["additionalData"], "additionalData");
    if(app.contains("namespaces"))
        result.info.namespaces = parse_string_map(app["namespaces"], "namespaces");

    check_app_state(result.info);

    return result;
}

receiver_config parse_receiver_config(const json& config)
{
    if(!config.is_object())
        throw std::invalid_argument {"Configuration must be a json object"};

    receiver_config result;
    server_options& server = result.server;

    int port = value_or<int>(config, "port", server.port);
    if(port <= 0 || port > 65535)
        throw std::invalid_argument {"Invalid port " + std::to_string(port)};
    server.port = static_cast<uint16_t>(port);

    server.prefix = value_or<std::string>(config, "prefix", "");
    server.host = value_or<std::string>(config, "host", "");
    server.uuid = value_or<std::string>(config, "uuid", "");
    server.friendly_name = value_or<std::string>(config, "friendlyName", "");
    server.manufacturer = value_or<std::string>(config, "manufacturer", server.manufacturer);
    server.model_name = value_or<std::string>(config, "modelName", server.model_name);

    if(config.contains("maxContentLength"))
        server.max_content_length = parse_max_content_length(config["maxContentLength"]);
    if(config.contains("extraHeaders"))
        server.extra_headers = parse_extra_headers(config["extraHeaders"]);

    if(config.contains("icon") && config["icon"].is_object())
    {
        const json& i = config["icon"];
        icon custom = default_icon();
        custom.mimetype = value_or<std::string>(i, "mimetype", custom.mimetype);
        custom.width = value_or<std::string>(i, "width", custom.width);
        custom.height = value_or<std::string>(i, "height", custom.height);
        custom.depth = value_or<std::string>(i, "depth", custom.depth);
        custom.url = value_or<std::string>(i, "url", custom.url);
        server.icons = {custom};
    }

    result.peer.interface_address = value_or<std::string>(config, "interfaceAddress", "");
    int interval = value_or<int>(config, "announceInterval", static_cast<int>(result.peer.announce_interval.count()));
    if(interval <= 0)
        throw std::invalid_argument {"announceInterval must be positive"};
    result.peer.announce_interval = std::chrono::seconds {interval};

    result.log_level = log::parse_level(value_or<std::string>(config, "logLevel", "info"));

    if(config.contains("apps"))
    {
        if(!config["apps"].is_object())
            throw std::invalid_argument {"apps must be an object"};
        for(const auto& it : config["apps"].items())
            result.apps.push_back(parse_app(it.key(), it.value()));
    }

    return result;
}

receiver_config load_receiver_config(const std::string& path)
{
    std::ifstream ifs {path};
    if(!ifs.good())
        throw std::invalid_argument {"Unable to open configuration file " + path};

    json config = json::parse(ifs);
    return parse_receiver_config(config);
}

} // namespace dialcast
