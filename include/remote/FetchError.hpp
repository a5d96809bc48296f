#pragma once

#include <stdexcept>
#include <string>
#include <string_view>

namespace hs::remote {

struct FetchError : std::runtime_error {
    enum class Code { AuthError, RateLimited, NetworkError, Timeout };

    Code code;

    FetchError(const Code c, const std::string& message) : std::runtime_error(message), code(c) {}

    // AuthError is final for this cycle; the rest are retried by the next scheduled run.
    [[nodiscard]] bool retriable() const noexcept { return code != Code::AuthError; }
};

[[nodiscard]] std::string_view toString(FetchError::Code code) noexcept;

}
