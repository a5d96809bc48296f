#pragma once

#include "sync/model/Plan.hpp"
#include "sync/model/Request.hpp"
#include "types/metric/Freshness.hpp"
#include "types/metric/Kind.hpp"
#include "util/timestamp.hpp"

#include <cstdint>
#include <filesystem>
#include <map>
#include <optional>
#include <set>
#include <string>
#include <string_view>
#include <nlohmann/json_fwd.hpp>

namespace hs::sync::model {

struct KindOutcome {
    enum class Status : uint8_t {
        Skipped,
        Unchanged,
        Changed,
        Failed
    };

    types::metric::Kind kind{types::metric::Kind::Steps};
    Status status{Status::Skipped};
    Plan::Reason reason{Plan::Reason::WithinInterval};

    size_t fetched_count{0};
    size_t changed_count{0};
    bool notifiable{false};

    // Stable identifier (auth_error, rate_limited, network_error, timeout, storage_error)
    std::string error_code;
    std::string error_message;

    std::optional<types::metric::Freshness> freshness;

    [[nodiscard]] bool failed() const noexcept { return status == Status::Failed; }

    static std::string_view toString(Status s) noexcept;
    static bool tryParseStatus(std::string_view in, Status& out) noexcept;
};

struct Result {
    enum class State : uint8_t {
        Idle,
        Planning,
        Fetching,
        Merging,
        Done,
        Failed
    };

    std::string run_uuid;
    Trigger trigger{Trigger::Schedule};
    util::Timestamp started_at{};
    util::Timestamp finished_at{};
    State state{State::Idle};

    std::map<types::metric::Kind, KindOutcome> outcomes;

    [[nodiscard]] std::set<types::metric::Kind> changed() const;
    [[nodiscard]] std::set<types::metric::Kind> notifiable() const;
    [[nodiscard]] std::set<types::metric::Kind> failed() const;

    [[nodiscard]] bool anyNotifiable() const { return !notifiable().empty(); }

    [[nodiscard]] const KindOutcome* outcome(types::metric::Kind kind) const noexcept;

    static std::string_view toString(State s) noexcept;
    static bool tryParseState(std::string_view in, State& out) noexcept;
};

void to_json(nlohmann::json& j, const KindOutcome& o);
void from_json(const nlohmann::json& j, KindOutcome& o);
void to_json(nlohmann::json& j, const Result& r);
void from_json(const nlohmann::json& j, Result& r);

// <data_dir>/last_sync.json, replaced atomically
std::filesystem::path lastResultPath(const std::filesystem::path& dataDir);
void persistLastResult(const std::filesystem::path& dataDir, const Result& r);

// nullopt when absent or unreadable
std::optional<Result> loadLastResult(const std::filesystem::path& dataDir);

}
