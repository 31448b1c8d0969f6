#ifndef DIALCAST_HTTP_REQUEST_HPP
#define DIALCAST_HTTP_REQUEST_HPP

#include <string>
#include <string_view>
#include <map>

namespace dialcast::http
{

// Header names compare case insensitive
struct ci_less
{
    bool operator()(const std::string& lhs, const std::string& rhs) const;
};

using header_map = std::map<std::string, std::string, ci_less>;

class request {

public:

    request() = default;
    request(const request& other) = default;
    request(request&& other) noexcept = default;
    request& operator=(const request& other) = default;
    request& operator=(request&& other) noexcept = default;

    request(std::string method, std::string resource);

    // Parses request line and headers. The body is set separately once it has been read.
    explicit request(std::string_view head);

    void parse(std::string_view head);

    std::string to_string() const;

    bool check_header(const std::string& key) const;

    const header_map& get_headers() const { return m_headers; }

    std::string get_header(const std::string& key) const;

    void set_header(const std::string& key, std::string value);

    const std::string& get_method() const { return m_method; }

    const std::string& get_resource() const { return m_resource; }

    const std::string& get_protocol() const { return m_protocol; }

    const std::string& get_path() const { return m_path; }

    const std::map<std::string, std::string>& get_params() const { return m_query_params; }

    std::string get_param(const std::string& key) const;

    // Value of the Content-Length header, 0 if there is none
    size_t content_length() const;

    const std::string& get_body() const { return m_body; }

    void set_body(std::string body) { m_body = std::move(body); }

    const std::string& get_remote_addr() const { return m_remote_addr; }

    void set_remote_addr(std::string addr) { m_remote_addr = std::move(addr); }

private:

    void parse_requestline(std::string_view requestline);

    void parse_resource();

    static void parse_params(std::string_view param_string, std::map<std::string, std::string>& param_container);

    std::string m_method;      /// http method used by this request (e.g. post, get, ...)
    std::string m_protocol = "HTTP/1.1";
    std::string m_resource;    /// resource addressed by this request
    std::string m_path;        /// path of the resource addressed by this request, without query string
    std::string m_body;
    std::string m_remote_addr; /// numeric address of the peer that sent this request

    std::map<std::string, std::string> m_query_params; /// contains names and values of the query string
    header_map m_headers;      /// contains names and values of the http request headers

};

} // namespace dialcast::http

#endif
