#pragma once

#include "concurrency/ThreadPool.hpp"
#include "types/metric/Kind.hpp"
#include "types/metric/Record.hpp"
#include "util/timestamp.hpp"

#include <chrono>
#include <future>
#include <memory>

namespace hs::remote { struct Source; }

namespace hs::sync {

// Runs remote fetches on a worker pool so each can be bounded by a deadline.
class FetchExecutor {
public:
    FetchExecutor(std::shared_ptr<remote::Source> source, unsigned int workers, std::chrono::milliseconds timeout);

    std::future<types::metric::Records> submit(types::metric::Kind kind, util::Date start, util::Date end);

    // Waits up to the timeout. Throws FetchError{Timeout} when it elapses (the late result
    // is discarded, and the pool gets a fresh worker if the stuck one was its last) and
    // FetchError{NetworkError} for anything the source throws that is not already a FetchError.
    types::metric::Records await(std::future<types::metric::Records>& pending, types::metric::Kind kind);

    types::metric::Records fetch(types::metric::Kind kind, util::Date start, util::Date end);

    [[nodiscard]] std::chrono::milliseconds timeout() const { return timeout_; }
    [[nodiscard]] unsigned int workerCount() const { return pool_.workerCount(); }

private:
    std::shared_ptr<remote::Source> source_;
    std::chrono::milliseconds timeout_;
    concurrency::ThreadPool pool_;
};

}
