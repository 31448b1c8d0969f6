#include "dialcast/dial_device.hpp"
#include "dialcast/log.hpp"

#include <stdexcept>

#include <fmt/format.h>

namespace dialcast
{

static std::string strip_trailing_slash(std::string url)
{
    if(!url.empty() && url.back() == '/')
        url.pop_back();
    return url;
}

dial_device::dial_device(device_description desc, std::string description_url, std::string application_url,
    std::shared_ptr<http::transport> transport)
    : m_desc {std::move(desc)},
      m_description_url {std::move(description_url)},
      m_application_url {strip_trailing_slash(std::move(application_url))},
      m_transport {std::move(transport)}
{}

outcome<http::response> dial_device::perform(http::client_request req) const
{
    if(!m_transport)
        return dial_error {errc::transport, 0, "No transport set"};

    try {
        return m_transport->perform(req);
    } catch(const std::runtime_error& e) {
        return dial_error {errc::transport, 0, e.what()};
    }
}

outcome<std::string> dial_device::app_info_xml(const std::string& app_name) const
{
    if(m_application_url.empty() || app_name.empty())
        return dial_error {errc::invalid_argument, 0, "DIAL app name and Application-URL must not be empty"};

    const std::string app_url = fmt::format("{}/{}", m_application_url, app_name);
    outcome<http::response> res = perform(http::client_request {"GET", app_url, {}, {}});
    if(!res)
        return res.error();

    if(res.value().get_code() != 200)
    {
        return dial_error {errc::remote_protocol, res.value().get_code(),
            fmt::format("Cannot get app info from {}", app_url)};
    }

    return res.value().get_body();
}

outcome<nlohmann::json> dial_device::app_info(const std::string& app_name) const
{
    outcome<std::string> xml = app_info_xml(app_name);
    if(!xml)
        return xml.error();

    try {
        return parse_app_description(xml.value());
    } catch(const document_error& e) {
        return dial_error {errc::document_parse, 0, e.what()};
    }
}

outcome<std::string> dial_device::launch_app(const std::string& app_name, const std::optional<std::string>& payload,
    const std::optional<std::string>& content_type) const
{
    if(m_application_url.empty() || app_name.empty())
        return dial_error {errc::invalid_argument, 0, "DIAL app name and Application-URL must not be empty"};

    http::client_request req;
    req.method = "POST";
    req.target = fmt::format("{}/{}", m_application_url, app_name);
    req.body = payload.value_or("");
    req.headers["CONTENT-TYPE"] = content_type.value_or(default_launch_content_type);
    // std::string holds UTF-8 bytes, so size() is the byte length
    req.headers["CONTENT-LENGTH"] = std::to_string(req.body.size());

    outcome<http::response> res = perform(req);
    if(!res)
        return res.error();

    if(res.value().get_code() >= 400)
    {
        return dial_error {errc::remote_protocol, res.value().get_code(),
            fmt::format("Cannot launch app at {}", req.target)};
    }

    return res.value().get_body();
}

outcome<int> dial_device::stop_app(const std::string& app_name, const std::string& pid) const
{
    if(m_application_url.empty() || app_name.empty() || pid.empty())
        return dial_error {errc::invalid_argument, 0, "DIAL app name, pid and Application-URL must not be empty"};

    outcome<http::response> res = perform(http::client_request {"DELETE",
        fmt::format("{}/{}/{}", m_application_url, app_name, pid), {}, {}});
    if(!res)
        return res.error();

    return res.value().get_code();
}

outcome<dial_device> fetch_device(const std::string& description_url, std::shared_ptr<http::transport> transport)
{
    if(!transport)
        return dial_error {errc::transport, 0, "No transport set"};

    http::response res;
    try {
        res = transport->perform(http::client_request {"GET", description_url, {}, {}});
    } catch(const std::runtime_error& e) {
        return dial_error {errc::transport, 0, e.what()};
    }

    std::string application_url = res.get_header("Application-URL");
    if(res.get_code() != 200 || application_url.empty())
    {
        return dial_error {errc::remote_protocol, res.get_code(), fmt::format(
            "Cannot get device description from {} or Application-URL header is not set", description_url)};
    }

    try {
        device_description desc = parse_device_description(res.get_body());
        log::debug("Fetched description of \"{}\" from {}", desc.friendly_name, description_url);
        return dial_device {std::move(desc), description_url, std::move(application_url), std::move(transport)};
    } catch(const document_error& e) {
        return dial_error {errc::document_parse, 0, e.what()};
    }
}

} // namespace dialcast
