#pragma once

#include <future>

namespace hs::concurrency {

struct Task {
    virtual ~Task() = default;
    virtual void operator()() = 0;
};

// A task whose outcome, value or exception, is delivered through a future.
template <typename T>
struct PromisedTask : Task {
    std::promise<T> promise;

    PromisedTask() = default;

    [[nodiscard]] std::future<T> getFuture() { return promise.get_future(); }
};

}
