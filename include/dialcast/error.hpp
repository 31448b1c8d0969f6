#ifndef DIALCAST_ERROR_HPP
#define DIALCAST_ERROR_HPP

#include <stdexcept>
#include <string>
#include <utility>
#include <variant>

namespace dialcast
{

enum class errc
{
    not_found,
    payload_too_large,
    hook_failure,
    method_not_allowed,
    bad_request,
    not_implemented,
    transport,          // Network level failure while talking to a remote device
    remote_protocol,    // Remote device answered with an error status
    document_parse,     // Malformed device or app description
    invalid_argument
};

const char* to_string(errc code);

struct dial_error
{
    errc code;
    int status = 0;     // HTTP status received, only set for errc::remote_protocol
    std::string message;
};

// Thrown by the description codec on malformed documents
class document_error : public std::runtime_error
{
public:
    using std::runtime_error::runtime_error;
};

// Either a value or the dial_error explaining why there is none
template<typename T>
class outcome
{
public:

    outcome(T value)
        : m_value {std::move(value)}
    {}

    outcome(dial_error err)
        : m_value {std::move(err)}
    {}

    explicit operator bool() const
    {
        return std::holds_alternative<T>(m_value);
    }

    bool has_value() const
    {
        return std::holds_alternative<T>(m_value);
    }

    const T& value() const&
    {
        return std::get<T>(m_value);
    }

    T&& value() &&
    {
        return std::get<T>(std::move(m_value));
    }

    const dial_error& error() const
    {
        return std::get<dial_error>(m_value);
    }

private:

    std::variant<T, dial_error> m_value;

};

} // namespace dialcast

#endif
