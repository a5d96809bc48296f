#pragma once

#include "config/Config.hpp"
#include "sync/FetchExecutor.hpp"
#include "sync/Merger.hpp"
#include "sync/Planner.hpp"
#include "sync/model/Request.hpp"
#include "sync/model/Result.hpp"
#include "util/timestamp.hpp"

#include <atomic>
#include <memory>
#include <mutex>
#include <optional>
#include <stdexcept>
#include <vector>

namespace hs::storage { class LocalStore; }
namespace hs::remote { struct Source; }
namespace hs::presentation { class StatusBoard; }

namespace hs::sync {

// A run was rejected because another one holds the single-flight gate. The store is untouched.
struct SyncInProgress : std::runtime_error {
    using std::runtime_error::runtime_error;
};

class Coordinator {
public:
    Coordinator(std::shared_ptr<storage::LocalStore> store,
                std::shared_ptr<remote::Source> source,
                config::Config cnf,
                std::shared_ptr<const util::Clock> clock = std::make_shared<util::SystemClock>());

    // One invocation: Idle -> Planning -> Fetching -> Merging -> Done | Failed.
    // Throws SyncInProgress when a run is already active in this process, or when another
    // process holds <data_dir>/sync.lock. Per-kind failures are reported in the result.
    model::Result run(const model::Request& req = {});

    // Receives every result after it is persisted
    void attach(std::shared_ptr<presentation::StatusBoard> board);

    [[nodiscard]] model::Result::State state() const noexcept { return state_.load(); }
    [[nodiscard]] bool running() const noexcept { return inFlight_.load(); }
    [[nodiscard]] std::optional<model::Result> lastResult() const;

    // Steps changes are worth a notification only when some day moved by more than the
    // threshold and the local hour is inside the waking window.
    static bool stepsNotifiable(const std::vector<RecordChange>& changes,
                                const config::SyncConfig& cnf,
                                unsigned int localHour);

private:
    std::shared_ptr<storage::LocalStore> store_;
    std::shared_ptr<remote::Source> source_;
    config::Config cnf_;
    std::shared_ptr<const util::Clock> clock_;

    Planner planner_;
    Merger merger_;
    FetchExecutor fetcher_;

    std::shared_ptr<presentation::StatusBoard> board_;

    std::atomic<bool> inFlight_{false};
    std::atomic<model::Result::State> state_{model::Result::State::Idle};

    mutable std::mutex lastMutex_;
    std::optional<model::Result> last_;

    void fail(model::Result& result, types::metric::Kind kind, std::string code, const std::string& message) const;
    void publish(const model::Result& result);
};

}
