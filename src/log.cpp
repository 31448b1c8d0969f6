#include "dialcast/log.hpp"

#include <atomic>
#include <mutex>
#include <stdexcept>
#include <string>
#include <cstdio>

namespace dialcast::log
{

static std::atomic<level> c_level {level::info};
static std::mutex c_write_mutex;

static const char* level_tag(level lvl)
{
    switch(lvl)
    {
        case level::debug: return "DEBUG";
        case level::info: return "INFO";
        case level::warn: return "WARN";
        case level::error: return "ERROR";
    }
    return "?";
}

void set_level(level lvl)
{
    c_level.store(lvl);
}

level get_level()
{
    return c_level.load();
}

level parse_level(std::string_view name)
{
    if(name == "debug")
        return level::debug;
    else if(name == "info")
        return level::info;
    else if(name == "warn")
        return level::warn;
    else if(name == "error")
        return level::error;

    throw std::invalid_argument {"Unknown log level: " + std::string {name}};
}

void write(level lvl, std::string_view msg)
{
    std::lock_guard<std::mutex> lock {c_write_mutex};
    fmt::print(stderr, "[{}] {}\n", level_tag(lvl), msg);
}

} // namespace dialcast::log
