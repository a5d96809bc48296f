#pragma once

#include "types/metric/Goals.hpp"

#include <filesystem>
#include <optional>

namespace hs::analytics {

// Read on every analytics call; nullopt means no goals are configured.
struct GoalSource {
    virtual ~GoalSource() = default;
    [[nodiscard]] virtual std::optional<types::metric::GoalSet> load() const = 0;
};

// goals.json: {"weight_kg", "daily_steps", "sleep_hours", "workouts_per_week"}; missing keys
// take defaults. A missing file is "no goals"; a malformed one is too, with a warning.
class FileGoalSource final : public GoalSource {
public:
    explicit FileGoalSource(std::filesystem::path path);

    [[nodiscard]] std::optional<types::metric::GoalSet> load() const override;

    [[nodiscard]] const std::filesystem::path& path() const { return path_; }

private:
    std::filesystem::path path_;
};

}
