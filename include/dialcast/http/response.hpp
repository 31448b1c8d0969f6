#ifndef DIALCAST_HTTP_RESPONSE_HPP
#define DIALCAST_HTTP_RESPONSE_HPP

#include <string>
#include <string_view>

#include "dialcast/http/request.hpp"

namespace dialcast::http
{

class response
{
public:

    response() = default;

    explicit response(int code)
        : m_code {code}
    {}

    // Serializes status line, headers and body. Content-Length and Date are filled in.
    std::string to_string() const;

    // Parses a complete response as received by a client
    void parse(std::string_view raw);

    void set_header(const std::string& key, const std::string& value);

    void set_header(const std::string& key, std::string&& value);

    bool check_header(const std::string& key) const;

    std::string get_header(const std::string& key) const;

    const header_map& get_headers() const
    {
        return m_headers;
    }

    void set_body(const std::string& body);

    void set_body(std::string&& body);

    int get_code() const
    {
        return m_code;
    }

    const std::string& get_body() const
    {
        return m_body;
    }

private:

    int m_code = 200;
    std::string m_phrase;
    std::string m_body;

    header_map m_headers;

};

const char* get_http_phrase(int status_code);

} // namespace dialcast::http

#endif
