#pragma once

#include <chrono>
#include <cstdint>
#include <string>

namespace simenv {

struct duration_stats {
    std::uint64_t count = 0;
    std::chrono::nanoseconds last{0};
    std::chrono::nanoseconds max{0};
    std::chrono::nanoseconds total{0};
    std::uint64_t over_budget_count = 0;

    void observe(std::chrono::nanoseconds sample, std::chrono::nanoseconds budget = std::chrono::nanoseconds{0});
    [[nodiscard]] std::chrono::nanoseconds mean() const noexcept;
};

struct environment_profile_stats {
    duration_stats reset_duration;
    duration_stats step_duration;
    std::chrono::nanoseconds configured_step_budget{0};
};

std::string format_duration_stats(const std::string& label, const duration_stats& stats);

}  // namespace simenv
