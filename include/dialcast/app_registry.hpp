#ifndef DIALCAST_APP_REGISTRY_HPP
#define DIALCAST_APP_REGISTRY_HPP

#include <map>
#include <mutex>
#include <string>

#include "dialcast/app_provider.hpp"

namespace dialcast
{

struct registered_app
{
    app_info info;
    std::string launch_url;     // opened with xdg-open on launch, "{}" is replaced by the launch data
};

// In memory app provider used by the receiver tool
class app_registry : public app_provider
{
public:

    app_registry() = default;
    app_registry(const app_registry&) = delete;
    app_registry& operator=(const app_registry&) = delete;
    app_registry(app_registry&&) = delete;
    app_registry& operator=(app_registry&&) = delete;
    ~app_registry() override = default;

    // Throws std::invalid_argument for apps failing check_app_state()
    void add(registered_app app);

    std::optional<app_info> get_app(const request_context& ctx, const std::string& name) override;

    std::future<std::optional<std::string>> launch_app(const request_context& ctx,
        const std::string& name, const std::optional<std::string>& launch_data) override;

    std::future<bool> stop_app(const request_context& ctx, const std::string& name, const std::string& pid) override;

private:

    mutable std::mutex m_mutex;

    std::map<std::string, registered_app> m_apps;

};

// Throws std::invalid_argument unless a pid is set exactly when the app is not stopped
void check_app_state(const app_info& info);

// Substitutes "{}" in url_template with launch_data (empty if there is none)
std::string expand_launch_url(const std::string& url_template, const std::optional<std::string>& launch_data);

} // namespace dialcast

#endif
