#pragma once

#include "presentation/StatusSnapshot.hpp"

#include <ostream>

namespace hs::presentation {

// Rendering lives outside this library; sinks only receive snapshots.
struct Sink {
    virtual ~Sink() = default;
    virtual void publish(const StatusSnapshot& snapshot) = 0;
};

class JsonStreamSink final : public Sink {
public:
    explicit JsonStreamSink(std::ostream& out) : out_(out) {}

    void publish(const StatusSnapshot& snapshot) override;

private:
    std::ostream& out_;
};

}
