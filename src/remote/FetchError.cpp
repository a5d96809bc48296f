#include "remote/FetchError.hpp"

std::string_view hs::remote::toString(const FetchError::Code code) noexcept {
    switch (code) {
    case FetchError::Code::AuthError:    return "auth_error";
    case FetchError::Code::RateLimited:  return "rate_limited";
    case FetchError::Code::NetworkError: return "network_error";
    case FetchError::Code::Timeout:      return "timeout";
    }
    return "unknown";
}
