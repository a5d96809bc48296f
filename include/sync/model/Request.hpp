#pragma once

#include "types/metric/Kind.hpp"

#include <cstdint>
#include <string_view>
#include <vector>

namespace hs::sync::model {

enum class Trigger : uint8_t {
    Schedule,
    Manual,
    Startup
};

std::string_view toString(Trigger t) noexcept;

// Returns false if unrecognized (and leaves out unchanged)
bool tryParseTrigger(std::string_view in, Trigger& out) noexcept;

struct Request {
    std::vector<types::metric::Kind> kinds{types::metric::ALL_KINDS.begin(), types::metric::ALL_KINDS.end()};
    Trigger trigger{Trigger::Schedule};
    bool force{false}; // bypass the minimum-interval skip
};

}
