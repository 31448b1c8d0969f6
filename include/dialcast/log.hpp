#ifndef DIALCAST_LOG_HPP
#define DIALCAST_LOG_HPP

#include <string_view>
#include <utility>

#include <fmt/format.h>

namespace dialcast::log
{

enum class level
{
    debug,
    info,
    warn,
    error
};

void set_level(level lvl);

level get_level();

// Accepts "debug", "info", "warn" and "error"
level parse_level(std::string_view name);

void write(level lvl, std::string_view msg);

template<typename... Args>
inline void debug(fmt::format_string<Args...> format, Args&&... args)
{
    if(get_level() <= level::debug)
        write(level::debug, fmt::format(format, std::forward<Args>(args)...));
}

template<typename... Args>
inline void info(fmt::format_string<Args...> format, Args&&... args)
{
    if(get_level() <= level::info)
        write(level::info, fmt::format(format, std::forward<Args>(args)...));
}

template<typename... Args>
inline void warn(fmt::format_string<Args...> format, Args&&... args)
{
    if(get_level() <= level::warn)
        write(level::warn, fmt::format(format, std::forward<Args>(args)...));
}

template<typename... Args>
inline void error(fmt::format_string<Args...> format, Args&&... args)
{
    write(level::error, fmt::format(format, std::forward<Args>(args)...));
}

} // namespace dialcast::log

#endif
