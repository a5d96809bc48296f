#include "sync/FetchExecutor.hpp"
#include "remote/FetchError.hpp"
#include "remote/Source.hpp"
#include "logging/LogRegistry.hpp"

using namespace hs::sync;
using namespace hs::remote;
using namespace hs::types::metric;
using namespace hs::logging;
using namespace hs::util;

namespace {

struct FetchTask final : hs::concurrency::PromisedTask<Records> {
    std::shared_ptr<Source> source;
    Kind kind;
    Date start, end;

    FetchTask(std::shared_ptr<Source> s, const Kind k, const Date from, const Date to)
        : source(std::move(s)), kind(k), start(from), end(to) {}

    void operator()() override {
        try {
            promise.set_value(source->fetch(kind, start, end));
        } catch (...) {
            promise.set_exception(std::current_exception());
        }
    }
};

}

FetchExecutor::FetchExecutor(std::shared_ptr<Source> source, const unsigned int workers,
                             const std::chrono::milliseconds timeout)
    : source_(std::move(source)), timeout_(timeout), pool_(workers) {}

std::future<Records> FetchExecutor::submit(const Kind kind, const Date start, const Date end) {
    auto task = std::make_shared<FetchTask>(source_, kind, start, end);
    auto future = task->getFuture();
    pool_.submit(task);
    return future;
}

Records FetchExecutor::await(std::future<Records>& pending, const Kind kind) {
    if (pending.wait_for(timeout_) != std::future_status::ready) {
        LogRegistry::remote()->warn("[FetchExecutor] {} fetch exceeded {} ms", toString(kind), timeout_.count());
        pool_.ensureIdleWorker();
        throw FetchError(FetchError::Code::Timeout,
                         std::string(toString(kind)) + " fetch timed out after " + std::to_string(timeout_.count()) + " ms");
    }

    try {
        return pending.get();
    } catch (const FetchError&) {
        throw;
    } catch (const std::exception& e) {
        throw FetchError(FetchError::Code::NetworkError, e.what());
    }
}

Records FetchExecutor::fetch(const Kind kind, const Date start, const Date end) {
    auto pending = submit(kind, start, end);
    return await(pending, kind);
}
