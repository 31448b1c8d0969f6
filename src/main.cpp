#include <atomic>
#include <chrono>
#include <csignal>
#include <cstdlib>
#include <future>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <vector>

#include <fmt/format.h>
#include <socketwrapper.hpp>

#include "dialcast/config.hpp"
#include "dialcast/dial_client.hpp"
#include "dialcast/dial_device.hpp"
#include "dialcast/dial_server.hpp"
#include "dialcast/log.hpp"
#include "dialcast/udp_ssdp_peer.hpp"
#include "dialcast/http/client.hpp"
#include "dialcast/http/router.hpp"
#include "dialcast/http/webserver.hpp"

using namespace dialcast;

static void print_usage()
{
    fmt::print(
        "Usage:\n"
        "  dialcastctl serve <config.json>\n"
        "  dialcastctl discover [milliseconds]\n"
        "  dialcastctl info <description-url> <app>\n"
        "  dialcastctl launch <description-url> <app> [payload]\n"
        "  dialcastctl stop <description-url> <app> <pid>\n");
}

static void block_signals(sigset_t* sigset)
{
    sigemptyset(sigset);
    sigaddset(sigset, SIGINT);
    sigaddset(sigset, SIGTERM);
    pthread_sigmask(SIG_BLOCK, sigset, nullptr);
}

static void print_error(const dial_error& err)
{
    if(err.code == errc::remote_protocol)
        fmt::print(stderr, "Error: {} (status {}): {}\n", to_string(err.code), err.status, err.message);
    else
        fmt::print(stderr, "Error: {}: {}\n", to_string(err.code), err.message);
}

static int run_server(const std::string& config_path)
{
    receiver_config config = load_receiver_config(config_path);
    log::set_level(config.log_level);

    app_registry registry;
    for(auto& app : config.apps)
        registry.add(std::move(app));

    sigset_t sigset;
    block_signals(&sigset);

    std::atomic<bool> run_condition {true};
    const uint16_t port = config.server.port;

    std::promise<void> stopped;
    dial_server server {config.server, std::make_unique<discovery::udp_ssdp_peer>(config.peer), registry};
    http::router router;
    server.register_routes(router);

    server.on_stop([&stopped]() { stopped.set_value(); });

    http::webserver web {port, router, server.options().max_content_length};
    std::thread worker {[&web, &run_condition]() {
        web.serve(run_condition);
    }};

    server.start();
    fmt::print("DIAL receiver is running on port {}\n", port);

    int signum = 0;
    sigwait(&sigset, &signum);
    fmt::print("Shutting down...\n");

    server.stop();
    if(stopped.get_future().wait_for(std::chrono::seconds {5}) != std::future_status::ready)
        log::warn("Withdrawing advertisements timed out");

    // Wake up the acceptor so the webserver notices the changed run condition
    run_condition.store(false);
    try {
        net::tcp_connection<net::ip_version::v4> sock {"127.0.0.1", port};
    } catch(std::runtime_error&) {}

    worker.join();
    return EXIT_SUCCESS;
}

static int run_discovery(std::chrono::milliseconds duration)
{
    auto transport = std::make_shared<http::tcp_transport>();
    std::vector<std::string> found;
    std::mutex found_mutex;

    dial_client client {std::make_unique<discovery::udp_ssdp_peer>(discovery::udp_peer_options {})};
    client.on_found([&found, &found_mutex](const std::string& location, const discovery::ssdp_headers&) {
        std::lock_guard<std::mutex> lock {found_mutex};
        found.push_back(location);
    });
    client.on_disappear([](const std::string& location, const discovery::ssdp_headers&) {
        fmt::print("Disappeared: {}\n", location);
    });

    fmt::print("Scanning network for DIAL devices...\n");
    client.start();
    std::this_thread::sleep_for(duration);
    client.stop();

    std::lock_guard<std::mutex> lock {found_mutex};
    fmt::print("Detected {} device(s) in your local network.\n-------------------------------\n", found.size());
    for(const auto& location : found)
    {
        outcome<dial_device> device = fetch_device(location, transport);
        if(!device)
        {
            fmt::print("{} | unavailable\n", location);
            print_error(device.error());
            continue;
        }
        fmt::print("{} | {} ({} {}) apps at {}\n", location, device.value().friendly_name(),
            device.value().manufacturer(), device.value().model_name(), device.value().application_url());
    }

    return EXIT_SUCCESS;
}

static int run_device_command(const std::vector<std::string>& args)
{
    const std::string& command = args[0];
    outcome<dial_device> device = fetch_device(args[1], std::make_shared<http::tcp_transport>());
    if(!device)
    {
        print_error(device.error());
        return EXIT_FAILURE;
    }

    const std::string& app = args[2];
    if(command == "info")
    {
        outcome<nlohmann::json> info = device.value().app_info(app);
        if(!info)
        {
            print_error(info.error());
            return EXIT_FAILURE;
        }
        fmt::print("{}\n", info.value().dump(2));
    }
    else if(command == "launch")
    {
        std::optional<std::string> payload;
        if(args.size() > 3)
            payload = args[3];

        outcome<std::string> res = device.value().launch_app(app, payload);
        if(!res)
        {
            print_error(res.error());
            return EXIT_FAILURE;
        }
        fmt::print("Launched {}\n{}", app, res.value());
    }
    else if(command == "stop")
    {
        outcome<int> status = device.value().stop_app(app, args[3]);
        if(!status)
        {
            print_error(status.error());
            return EXIT_FAILURE;
        }
        fmt::print("Stop answered with status {}\n", status.value());
        return (status.value() == 200) ? EXIT_SUCCESS : EXIT_FAILURE;
    }

    return EXIT_SUCCESS;
}

int main(int argc, char** argv)
{
    std::vector<std::string> args {argv + 1, argv + argc};
    if(args.empty())
    {
        print_usage();
        return EXIT_FAILURE;
    }

    try {
        const std::string& command = args[0];
        if(command == "serve" && args.size() == 2)
            return run_server(args[1]);
        else if(command == "discover" && args.size() <= 2)
            return run_discovery(std::chrono::milliseconds {(args.size() == 2) ? std::stoi(args[1]) : 5000});
        else if((command == "info" && args.size() == 3) || (command == "launch" && (args.size() == 3 || args.size() == 4))
            || (command == "stop" && args.size() == 4))
            return run_device_command(args);
    } catch(const std::exception& e) {
        fmt::print(stderr, "Error: {}\n", e.what());
        return EXIT_FAILURE;
    }

    print_usage();
    return EXIT_FAILURE;
}
