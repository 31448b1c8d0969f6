#include "dialcast/error.hpp"

namespace dialcast
{

const char* to_string(errc code)
{
    switch(code)
    {
        case errc::not_found: return "not found";
        case errc::payload_too_large: return "payload too large";
        case errc::hook_failure: return "hook failure";
        case errc::method_not_allowed: return "method not allowed";
        case errc::bad_request: return "bad request";
        case errc::not_implemented: return "not implemented";
        case errc::transport: return "transport error";
        case errc::remote_protocol: return "remote protocol error";
        case errc::document_parse: return "document parse error";
        case errc::invalid_argument: return "invalid argument";
    }
    return "unknown error";
}

} // namespace dialcast
