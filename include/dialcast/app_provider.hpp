#ifndef DIALCAST_APP_PROVIDER_HPP
#define DIALCAST_APP_PROVIDER_HPP

#include <future>
#include <map>
#include <optional>
#include <string>

#include "dialcast/description.hpp"
#include "dialcast/http/request.hpp"

namespace dialcast
{

struct app_info
{
    std::string name;
    std::optional<app_state> state;     // inferred from pid when not set
    std::optional<std::string> pid;     // opaque token of the running instance, not an OS pid
    bool allow_stop = false;
    std::optional<std::map<std::string, std::string>> additional_data;
    std::map<std::string, std::string> namespaces;
};

// Explicit state if there is one, else running if a non-empty pid is set, else stopped
app_state infer_state(const app_info& info);

// Request an app hook is called for
struct request_context
{
    const http::request& req;
    std::string base_url;   // http://host:port/prefix of this receiver as seen by the client
};

// Owner of the actual application state. The server only reaches it through
// these hooks; implementations must be safe to call from concurrent requests.
class app_provider
{
public:
    virtual ~app_provider() = default;

    // std::nullopt for apps this receiver does not know
    virtual std::optional<app_info> get_app(const request_context& ctx, const std::string& name) = 0;

    // Resolves to the pid of the launched instance, std::nullopt if there is none.
    // A launch failure is reported by storing an exception in the future.
    virtual std::future<std::optional<std::string>> launch_app(const request_context& ctx,
        const std::string& name, const std::optional<std::string>& launch_data) = 0;

    // Resolves to true if the instance identified by pid was stopped
    virtual std::future<bool> stop_app(const request_context& ctx, const std::string& name, const std::string& pid) = 0;
};

} // namespace dialcast

#endif
