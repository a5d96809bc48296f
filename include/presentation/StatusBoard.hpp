#pragma once

#include "config/Config.hpp"
#include "presentation/StatusSnapshot.hpp"
#include "sync/model/Result.hpp"

#include <memory>
#include <mutex>
#include <optional>
#include <vector>

namespace hs::storage { class LocalStore; }
namespace hs::analytics { class Engine; }

namespace hs::presentation {

struct Sink;

// Builds what a display needs: per-kind freshness ages, goal progress and the latest sync result.
class StatusBoard {
public:
    StatusBoard(std::shared_ptr<const storage::LocalStore> store,
                std::shared_ptr<const analytics::Engine> analytics,
                config::PresentationConfig cnf,
                std::shared_ptr<const util::Clock> clock);

    void addSink(std::shared_ptr<Sink> sink);

    [[nodiscard]] StatusSnapshot snapshot(const std::optional<sync::model::Result>& last) const;

    // Uses <data_dir>/last_sync.json, so it also works from a process that did not sync.
    [[nodiscard]] StatusSnapshot current() const;

    // Pushes a fresh snapshot to every sink. A failing sink is logged and skipped.
    void publish(const sync::model::Result& result);

    static KindStatus describe(types::metric::Kind kind,
                               const std::optional<types::metric::Freshness>& freshness,
                               util::Timestamp now,
                               unsigned int warningMinutes);

private:
    std::shared_ptr<const storage::LocalStore> store_;
    std::shared_ptr<const analytics::Engine> analytics_;
    config::PresentationConfig cnf_;
    std::shared_ptr<const util::Clock> clock_;

    mutable std::mutex sinksMutex_;
    std::vector<std::shared_ptr<Sink>> sinks_;
};

}
