#pragma once

#include "remote/Source.hpp"

#include <filesystem>

namespace hs::remote {

// Reads a directory of Garmin export files (daily_stats.json, sleep.json, weight.json,
// activities.json, body_battery.json, stress.json).
class ExportDirSource final : public Source {
public:
    explicit ExportDirSource(std::filesystem::path dir);

    [[nodiscard]] std::string name() const override;

    types::metric::Records fetch(types::metric::Kind kind, util::Date start, util::Date end) override;

    [[nodiscard]] static std::string_view fileFor(types::metric::Kind kind) noexcept;

private:
    std::filesystem::path dir_;
};

}
