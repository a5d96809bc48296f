#pragma once

#include "analytics/model/DailySummary.hpp"

#include <filesystem>
#include <string>

namespace hs::report {

// Appends one "## <date>" section per day to a markdown log, writing a title header first
// when the file does not exist yet.
class MarkdownLog {
public:
    explicit MarkdownLog(std::filesystem::path path);

    void append(const analytics::model::DailySummary& summary) const;

    [[nodiscard]] static std::string render(const analytics::model::DailySummary& summary);
    [[nodiscard]] static std::string header();

    [[nodiscard]] const std::filesystem::path& path() const { return path_; }

private:
    std::filesystem::path path_;
};

}
