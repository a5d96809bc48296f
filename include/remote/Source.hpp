#pragma once

#include "types/metric/Kind.hpp"
#include "types/metric/Record.hpp"
#include "util/timestamp.hpp"

#include <string>

namespace hs::remote {

// Remote Metric Source. fetch() returns the records of `kind` whose calendar date lies in
// [start, end], or throws FetchError. It may block; callers bound it with a timeout.
struct Source {
    virtual ~Source() = default;

    [[nodiscard]] virtual std::string name() const = 0;

    virtual types::metric::Records fetch(types::metric::Kind kind, util::Date start, util::Date end) = 0;
};

}
