#include "dialcast/http/request.hpp"
#include "dialcast/utils.hpp"

#include <algorithm>
#include <cctype>
#include <charconv>
#include <stdexcept>

namespace dialcast::http
{

bool ci_less::operator()(const std::string& lhs, const std::string& rhs) const
{
    return std::lexicographical_compare(lhs.begin(), lhs.end(), rhs.begin(), rhs.end(), [](char a, char b) {
        return std::tolower(static_cast<unsigned char>(a)) < std::tolower(static_cast<unsigned char>(b));
    });
}

request::request(std::string method, std::string resource)
    : m_method {std::move(method)}, m_resource {std::move(resource)}
{
    parse_resource();
}

request::request(std::string_view head)
{
    parse(head);
}

void request::parse(std::string_view head)
{
    size_t pos = head.find("\r\n");
    if(pos == std::string_view::npos)
        throw std::invalid_argument {"invalid_request"};
    parse_requestline(head.substr(0, pos));
    parse_resource();

    /* Read and parse request headers */
    std::string_view headerlines = head.substr(pos + 2);
    while(!headerlines.empty())
    {
        size_t end_pos = headerlines.find("\r\n");
        std::string_view line = headerlines.substr(0, end_pos);
        if(line.empty())
            break;

        size_t mid_pos = line.find(':');
        if(mid_pos == std::string_view::npos || mid_pos == 0)
            throw std::invalid_argument {"invalid_request"};

        m_headers[std::string {line.substr(0, mid_pos)}] = std::string {utils::trim(line.substr(mid_pos + 1))};

        if(end_pos == std::string_view::npos)
            break;
        headerlines.remove_prefix(end_pos + 2);
    }
}

std::string request::to_string() const
{
    std::string request = m_method + " " + m_resource + " " + m_protocol + "\r\n";

    for(const auto& it : m_headers)
        (((request += it.first) += ": ") += it.second) += "\r\n";

    request += "\r\n";
    request += m_body;

    return request;
}

void request::parse_requestline(std::string_view requestline)
{
    std::string_view tmp_store[3];
    size_t vec_index = 0;
    while(vec_index < 3 && !requestline.empty())
    {
        size_t sep = requestline.find(' ');
        tmp_store[vec_index++] = requestline.substr(0, sep);
        if(sep == std::string_view::npos)
            requestline = {};
        else
            requestline.remove_prefix(sep + 1);
    }

    if(vec_index != 3 || tmp_store[0].empty() || tmp_store[1].empty())
        throw std::invalid_argument {"invalid_requestline"};

    m_method = std::string {tmp_store[0]};
    m_resource = std::string {tmp_store[1]};
    m_protocol = std::string {tmp_store[2]};
}

void request::parse_resource()
{
    m_query_params.clear();

    /* Parse resource to path and params */
    size_t pos_q = m_resource.find('?');
    if(pos_q == std::string::npos)
    {
        m_path = m_resource;
    }
    else
    {
        m_path = m_resource.substr(0, pos_q);
        request::parse_params(std::string_view {m_resource}.substr(pos_q + 1), m_query_params);
    }

    size_t pos_f = m_path.find('#');
    if(pos_f != std::string::npos)
        m_path.erase(pos_f);
}

void request::parse_params(std::string_view param_string, std::map<std::string, std::string>& param_container)
{
    size_t pos_f = param_string.find('#');
    if(pos_f != std::string_view::npos)
        param_string = param_string.substr(0, pos_f);

    while(!param_string.empty())
    {
        size_t amp = param_string.find('&');
        std::string_view param = param_string.substr(0, amp);
        size_t pos = param.find('=');
        if(pos != std::string_view::npos)
            param_container[utils::url_decode(param.substr(0, pos))] = utils::url_decode(param.substr(pos + 1));
        else if(!param.empty())
            param_container[utils::url_decode(param)] = "";

        if(amp == std::string_view::npos)
            break;
        param_string.remove_prefix(amp + 1);
    }
}

bool request::check_header(const std::string& key) const
{
    return m_headers.find(key) != m_headers.end();
}

std::string request::get_header(const std::string& key) const
{
    auto it = m_headers.find(key);
    return (it != m_headers.end()) ? it->second : std::string {};
}

void request::set_header(const std::string& key, std::string value)
{
    m_headers[key] = std::move(value);
}

std::string request::get_param(const std::string& key) const
{
    auto it = m_query_params.find(key);
    return (it != m_query_params.end()) ? it->second : std::string {};
}

size_t request::content_length() const
{
    auto it = m_headers.find("Content-Length");
    if(it == m_headers.end())
        return 0;

    size_t length = 0;
    const std::string& hdr = it->second;
    auto res = std::from_chars(hdr.data(), hdr.data() + hdr.size(), length);
    if(res.ec != std::errc {} || res.ptr != hdr.data() + hdr.size())
        throw std::invalid_argument {"invalid_content_length"};

    return length;
}

} // namespace dialcast::http
