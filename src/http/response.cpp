#include "dialcast/http/response.hpp"
#include "dialcast/utils.hpp"

#include <array>
#include <charconv>
#include <chrono>
#include <ctime>
#include <stdexcept>

namespace dialcast::http
{

const char* get_http_phrase(int status_code)
{
    switch(status_code)
    {
        case 200: return "OK";
        case 201: return "Created";
        case 204: return "No Content";
        case 400: return "Bad Request";
        case 404: return "Not Found";
        case 405: return "Method Not Allowed";
        case 413: return "Payload Too Large";
        case 500: return "Internal Server Error";
        case 501: return "Not Implemented";
        case 503: return "Service Unavailable";
        default: return (status_code < 400) ? "OK" : "Error";
    }
}

static std::string http_date()
{
    std::time_t now = std::chrono::system_clock::to_time_t(std::chrono::system_clock::now());
    std::tm tm;
    gmtime_r(&now, &tm);

    std::array<char, 64> buffer;
    size_t len = std::strftime(buffer.data(), buffer.size(), "%a, %d %b %Y %H:%M:%S GMT", &tm);
    return std::string {buffer.data(), len};
}

std::string response::to_string() const
{
    std::string response;

    /* Begin with response line */
    response.append("HTTP/1.1 " + std::to_string(m_code) + " ");
    response.append(m_phrase.empty() ? get_http_phrase(m_code) : m_phrase);
    response.append("\r\n");

    if(m_headers.find("Date") == m_headers.end())
        response.append("Date: " + http_date() + "\r\n");

    /* Append all headers to response */
    for(const auto& it : m_headers)
        response.append(it.first + ": " + it.second + "\r\n");

    if(m_headers.find("Content-Length") == m_headers.end())
        response.append("Content-Length: " + std::to_string(m_body.size()) + "\r\n");

    /* Append body */
    response.append("\r\n");
    response.append(m_body);

    return response;
}

void response::parse(std::string_view raw)
{
    size_t head_end = raw.find("\r\n\r\n");
    if(head_end == std::string_view::npos)
        throw std::invalid_argument {"invalid_response"};

    std::string_view head = raw.substr(0, head_end);
    size_t line_end = head.find("\r\n");
    std::string_view status_line = head.substr(0, line_end);

    // HTTP/1.1 200 OK
    size_t sp1 = status_line.find(' ');
    if(sp1 == std::string_view::npos || status_line.substr(0, 5) != "HTTP/")
        throw std::invalid_argument {"invalid_statusline"};

    std::string_view code_view = status_line.substr(sp1 + 1, 3);
    int code = 0;
    auto res = std::from_chars(code_view.data(), code_view.data() + code_view.size(), code);
    if(res.ec != std::errc {})
        throw std::invalid_argument {"invalid_statusline"};
    m_code = code;

    m_phrase.clear();
    if(sp1 + 5 < status_line.size())
        m_phrase = std::string {status_line.substr(sp1 + 5)};

    m_headers.clear();
    std::string_view headerlines = (line_end == std::string_view::npos) ? std::string_view {} : head.substr(line_end + 2);
    while(!headerlines.empty())
    {
        size_t end_pos = headerlines.find("\r\n");
        std::string_view line = headerlines.substr(0, end_pos);
        size_t sep = line.find(':');
        if(sep != std::string_view::npos)
            m_headers[std::string {line.substr(0, sep)}] = std::string {utils::trim(line.substr(sep + 1))};

        if(end_pos == std::string_view::npos)
            break;
        headerlines.remove_prefix(end_pos + 2);
    }

    std::string_view body = raw.substr(head_end + 4);
    auto it = m_headers.find("Content-Length");
    if(it != m_headers.end())
    {
        size_t length = 0;
        auto len_res = std::from_chars(it->second.data(), it->second.data() + it->second.size(), length);
        if(len_res.ec == std::errc {} && length < body.size())
            body = body.substr(0, length);
    }
    m_body = std::string {body};
}

void response::set_body(const std::string& body)
{
    m_body = body;
    set_header("Content-Length", std::to_string(m_body.size()));
}

void response::set_body(std::string&& body)
{
    m_body = std::move(body);
    set_header("Content-Length", std::to_string(m_body.size()));
}

void response::set_header(const std::string& key, const std::string& value)
{
    m_headers[key] = value;
}

void response::set_header(const std::string& key, std::string&& value)
{
    m_headers[key] = std::move(value);
}

bool response::check_header(const std::string& key) const
{
    return m_headers.find(key) != m_headers.end();
}

std::string response::get_header(const std::string& key) const
{
    auto it = m_headers.find(key);
    return (it != m_headers.end()) ? it->second : std::string {};
}

} // namespace dialcast::http
