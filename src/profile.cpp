#include "simenv/profile.hpp"

#include <sstream>

namespace simenv {

void duration_stats::observe(std::chrono::nanoseconds sample, std::chrono::nanoseconds budget) {
    ++count;
    last = sample;
    total += sample;
    if (sample > max) {
        max = sample;
    }
    if (budget.count() > 0 && sample > budget) {
        ++over_budget_count;
    }
}

std::chrono::nanoseconds duration_stats::mean() const noexcept {
    if (count == 0) {
        return std::chrono::nanoseconds{0};
    }
    return std::chrono::nanoseconds{total.count() / static_cast<std::int64_t>(count)};
}

std::string format_duration_stats(const std::string& label, const duration_stats& stats) {
    std::ostringstream out;
    out << label << "_count=" << stats.count << '\n';
    out << label << "_last_ns=" << stats.last.count() << '\n';
    out << label << "_max_ns=" << stats.max.count() << '\n';
    out << label << "_mean_ns=" << stats.mean().count() << '\n';
    out << label << "_over_budget=" << stats.over_budget_count << '\n';
    return out.str();
}

}  // namespace simenv
