#include "report/MarkdownLog.hpp"
#include "logging/LogRegistry.hpp"

#include <format>
#include <fstream>
#include <stdexcept>

using namespace hs::report;
using namespace hs::analytics::model;
using namespace hs::logging;
using namespace hs::util;

namespace {

// 12345 -> "12,345"
std::string thousands(const uint32_t n) {
    auto s = std::to_string(n);
    for (auto i = static_cast<int>(s.size()) - 3; i > 0; i -= 3) s.insert(static_cast<size_t>(i), ",");
    return s;
}

int percent(const double value, const double goal) {
    return goal > 0 ? static_cast<int>(value / goal * 100.0) : 0;
}

}

MarkdownLog::MarkdownLog(std::filesystem::path path) : path_(std::move(path)) {}

std::string MarkdownLog::header() {
    return "# Daily Health Summaries\n\nAutomatically logged by healthsync.\n\n---\n\n";
}

std::string MarkdownLog::render(const DailySummary& s) {
    std::string out = std::format("## {}\n\n| Metric | Value | Goal | Status |\n|--------|-------|------|--------|\n",
                                  formatDate(s.date));

    const auto stepsStatus = s.stepsMet() ? std::string("✓") : std::format("{}%", percent(s.steps, s.steps_goal));
    out += std::format("| Steps | {} | {} | {} |\n", thousands(s.steps), thousands(s.steps_goal), stepsStatus);

    const auto sleepStatus = s.sleepMet() ? std::string("✓") : std::format("{}%", percent(s.sleep_hours, s.sleep_goal));
    out += std::format("| Sleep | {:.1f}h | {:g}h | {} |\n", s.sleep_hours, s.sleep_goal, sleepStatus);

    if (s.weight_kg && *s.weight_kg > 0) {
        const auto diff = *s.weight_kg - s.weight_goal;
        const auto weightStatus = diff <= 0 ? std::string("✓") : std::format("↓{:.1f}kg", diff);
        out += std::format("| Weight | {:.1f}kg | {:g}kg | {} |\n", *s.weight_kg, s.weight_goal, weightStatus);
    }

    if (s.body_battery && *s.body_battery > 0)
        out += std::format("| Body Battery | {}% | - | - |\n", *s.body_battery);

    if (!s.status.empty()) out += std::format("\n**Status:** {}\n", s.status);

    out += "\n---\n\n";
    return out;
}

void MarkdownLog::append(const DailySummary& summary) const {
    if (path_.has_parent_path()) std::filesystem::create_directories(path_.parent_path());

    const bool fresh = !std::filesystem::exists(path_);

    std::ofstream out(path_, std::ios::app | std::ios::binary);
    if (!out) throw std::runtime_error("Failed to open summary log: " + path_.string());

    if (fresh) out << header();
    out << render(summary);
    out.flush();
    if (!out) throw std::runtime_error("Failed to write summary log: " + path_.string());

    LogRegistry::healthsync()->info("[MarkdownLog] Appended summary for {} to {}", formatDate(summary.date), path_.string());
}
