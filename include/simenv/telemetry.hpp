#pragma once

#include <array>
#include <cstddef>
#include <cstdint>
#include <map>
#include <string>

#include "simenv/logging.hpp"
#include "simenv/specs.hpp"

namespace simenv {

enum class counter_scope {
    total,
    episode
};

inline constexpr std::size_t k_num_counter_scopes = 2;

const char* counter_scope_name(counter_scope scope) noexcept;

using telemetry_snapshot = std::map<std::string, double>;

class episode_telemetry {
public:
    explicit episode_telemetry(std::string prefix = "simenv", log_sink* diagnostics = nullptr);

    void record_step(action_type type);
    void record_restart();
    void record_timeout_reset();
    void begin_episode();

    // Counters under their export keys, merged with backend_counters (backend
    // wins on key collision), plus per-scope action type ratios.
    [[nodiscard]] telemetry_snapshot flush(const std::map<std::string, double>& backend_counters = {}) const;

    [[nodiscard]] std::uint64_t steps(counter_scope scope) const noexcept;
    [[nodiscard]] std::uint64_t action_type_count(counter_scope scope, action_type type) const noexcept;
    [[nodiscard]] std::uint64_t restart_count() const noexcept { return restart_count_; }
    [[nodiscard]] std::uint64_t timeout_reset_count() const noexcept { return timeout_reset_count_; }

    [[nodiscard]] const std::string& prefix() const noexcept { return prefix_; }
    void set_diagnostics_sink(log_sink* sink) noexcept { diagnostics_ = sink; }

    std::string steps_key(counter_scope scope) const;
    std::string action_type_key(counter_scope scope, action_type type) const;
    std::string action_type_ratio_key(counter_scope scope, action_type type) const;

    static constexpr const char* k_restart_count_key = "restart_count";
    static constexpr const char* k_timeout_reset_count_key = "reset_count_step_timeout";

private:
    struct scope_counters {
        std::uint64_t steps = 0;
        std::array<std::uint64_t, k_num_action_types> action_types{};
    };

    const scope_counters& counters(counter_scope scope) const noexcept;
    scope_counters& counters(counter_scope scope) noexcept;
    void warn(std::string message) const;

    std::string prefix_;
    log_sink* diagnostics_ = nullptr;
    std::array<scope_counters, k_num_counter_scopes> scopes_{};
    std::uint64_t restart_count_ = 0;
    std::uint64_t timeout_reset_count_ = 0;
};

}  // namespace simenv
