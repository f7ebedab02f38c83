#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <string>

#include "simenv/array.hpp"
#include "simenv/collaborators.hpp"
#include "simenv/logging.hpp"
#include "simenv/profile.hpp"
#include "simenv/specs.hpp"
#include "simenv/task.hpp"
#include "simenv/telemetry.hpp"

namespace simenv {

enum class step_type {
    first,
    mid,
    last
};

const char* step_type_name(step_type type) noexcept;

struct timestep {
    step_type type = step_type::first;
    array_map observation{};
    double reward = 0.0;
    double discount = 0.0;

    [[nodiscard]] bool first() const noexcept { return type == step_type::first; }
    [[nodiscard]] bool mid() const noexcept { return type == step_type::mid; }
    [[nodiscard]] bool last() const noexcept { return type == step_type::last; }
};

enum class lifecycle_state {
    uninitialized,
    active,
    terminated
};

const char* lifecycle_state_name(lifecycle_state state) noexcept;

struct environment_options {
    std::string telemetry_prefix = "simenv";
    std::size_t log_capacity = 1024;
    log_level min_log_level = log_level::debug;
    bool validate_actions = true;
    std::chrono::nanoseconds step_budget{0};
    log_sink* extra_log_sink = nullptr;
};

class environment {
public:
    environment(std::shared_ptr<coordinator> coord,
                std::shared_ptr<task_manager> tasks,
                task_definition task,
                environment_options options = {});
    ~environment();

    environment(const environment&) = delete;
    environment& operator=(const environment&) = delete;

    [[nodiscard]] const spec_map& action_spec() const noexcept { return action_spec_; }
    [[nodiscard]] const spec_map& observation_spec() const noexcept { return observation_spec_; }
    [[nodiscard]] const spec_map& task_extras_spec() const noexcept { return task_extras_spec_; }
    [[nodiscard]] const task_definition& task() const noexcept { return task_; }

    timestep reset();
    timestep step(const array_map& action);

    // Read-only views of the latest cached values; invalidated by the next
    // reset() or step().
    [[nodiscard]] const array_map& raw_action() const noexcept { return latest_.action; }
    [[nodiscard]] const array_map& raw_observation() const noexcept { return latest_.observation; }
    [[nodiscard]] step_type latest_step_type() const noexcept { return latest_.type; }

    [[nodiscard]] array_map task_extras(bool latest_only = true) const;

    [[nodiscard]] lifecycle_state state() const noexcept { return state_; }
    [[nodiscard]] bool reset_pending() const noexcept { return reset_next_step_; }
    [[nodiscard]] bool closed() const noexcept { return closed_; }
    [[nodiscard]] std::uint64_t episode_index() const noexcept { return episode_index_; }

    // Backend counters are merged only while the environment is open.
    [[nodiscard]] telemetry_snapshot telemetry() const;
    [[nodiscard]] const episode_telemetry& ledger() const noexcept { return ledger_; }

    [[nodiscard]] const memory_log_sink& logs() const noexcept { return logs_; }
    std::string dump_logs() const;

    [[nodiscard]] environment_profile_stats profile_snapshot() const { return profile_; }
    std::string dump_profile() const;

    // Releases the coordinator once; later calls are no-ops. Never throws.
    void close() noexcept;

private:
    struct latest_state {
        array_map action{};
        array_map observation{};
        array_map extras{};
        step_type type = step_type::last;
    };

    class forwarding_sink final : public log_sink {
    public:
        forwarding_sink(memory_log_sink& primary, log_sink* secondary) : primary_(primary), secondary_(secondary) {}
        void write(const log_record& rec) override;

    private:
        memory_log_sink& primary_;
        log_sink* secondary_;
    };

    timestep terminate_without_step();
    void require_open(const char* where) const;
    void emit_log(log_level level, std::string category, std::string message) const;
    void emit_teardown_log(log_level level, const std::string& message) const noexcept;

    std::shared_ptr<coordinator> coordinator_;
    std::shared_ptr<task_manager> task_manager_;
    task_definition task_;
    environment_options options_;

    mutable memory_log_sink logs_;
    mutable forwarding_sink sink_;
    episode_telemetry ledger_;

    spec_map action_spec_;
    spec_map observation_spec_;
    spec_map task_extras_spec_;

    latest_state latest_{};
    lifecycle_state state_ = lifecycle_state::uninitialized;
    bool reset_next_step_ = true;
    bool closed_ = false;
    std::uint64_t episode_index_ = 0;
    std::uint64_t step_index_ = 0;

    environment_profile_stats profile_{};
};

}  // namespace simenv
