#include "simenv/environment.hpp"

#include <iostream>
#include <sstream>
#include <stdexcept>
#include <utility>

#include "simenv/error.hpp"

namespace simenv {
namespace {

using clock_type = std::chrono::steady_clock;

std::chrono::nanoseconds elapsed_since(clock_type::time_point started) {
    return std::chrono::duration_cast<std::chrono::nanoseconds>(clock_type::now() - started);
}

void check_action_against_spec(const array_map& action, const spec_map& specs) {
    for (const auto& [name, spec] : specs) {
        const auto it = action.find(name);
        if (it == action.end()) {
            throw schema_violation(name, "missing from action");
        }
        validate(it->second, spec);
    }
    for (const auto& [name, _] : action) {
        if (specs.find(name) == specs.end()) {
            throw schema_violation(name, "not declared in the action spec");
        }
    }
}

// Extras arrive with a leading dimension indexing the values accumulated since
// the last fetch.
void check_extra_sequence(const array& values, const array_spec& spec) {
    if (values.shape.size() != spec.shape.size() + 1) {
        throw schema_violation(spec.name, "expected a sequence of " + shape_repr(spec.shape) + " values, got shape " +
                                              shape_repr(values.shape));
    }
    for (std::int64_t dim : values.shape) {
        if (dim < 0) {
            throw schema_violation(spec.name, "negative dimension in shape " + shape_repr(values.shape));
        }
    }
    std::int64_t expected = 0;
    try {
        expected = element_count(values.shape);
    } catch (const std::invalid_argument& e) {
        throw schema_violation(spec.name, e.what());
    }
    if (static_cast<std::int64_t>(values.data.size()) != expected) {
        throw schema_violation(spec.name, "data size " + std::to_string(values.data.size()) +
                                              " does not match shape " + shape_repr(values.shape));
    }
}

}  // namespace

const char* step_type_name(step_type type) noexcept {
    switch (type) {
        case step_type::first:
            return "FIRST";
        case step_type::mid:
            return "MID";
        case step_type::last:
            return "LAST";
    }
    return "UNKNOWN";
}

const char* lifecycle_state_name(lifecycle_state state) noexcept {
    switch (state) {
        case lifecycle_state::uninitialized:
            return "uninitialized";
        case lifecycle_state::active:
            return "active";
        case lifecycle_state::terminated:
            return "terminated";
    }
    return "unknown";
}

void environment::forwarding_sink::write(const log_record& rec) {
    primary_.write(rec);
    if (secondary_) {
        secondary_->write(rec);
    }
}

environment::environment(std::shared_ptr<coordinator> coord,
                         std::shared_ptr<task_manager> tasks,
                         task_definition task,
                         environment_options options)
    : coordinator_(std::move(coord)),
      task_manager_(std::move(tasks)),
      task_(std::move(task)),
      options_(std::move(options)),
      logs_(options_.log_capacity, options_.min_log_level),
      sink_(logs_, options_.extra_log_sink),
      ledger_(options_.telemetry_prefix, &sink_) {
    if (!coordinator_) {
        throw std::invalid_argument("environment: coordinator must not be null");
    }
    if (!task_manager_) {
        throw std::invalid_argument("environment: task manager must not be null");
    }
    if (options_.step_budget.count() < 0) {
        throw std::invalid_argument("environment: step_budget must be non-negative");
    }
    profile_.configured_step_budget = options_.step_budget;

    action_spec_ = base_action_spec();
    observation_spec_ = base_observation_spec(coordinator_->screen_dims());
    task_extras_spec_ = simenv::task_extras_spec(task_);

    emit_log(log_level::info, "env", "Task config: " + task_repr(task_));
    emit_log(log_level::info, "env", "Action spec: " + spec_map_repr(action_spec_));
    emit_log(log_level::info, "env", "Observation spec: " + spec_map_repr(observation_spec_));
    emit_log(log_level::info, "env", "Task extras spec: " + spec_map_repr(task_extras_spec_));
}

environment::~environment() {
    if (!closed_) {
        close();
    }
}

timestep environment::reset() {
    require_open("environment::reset");
    const auto started = clock_type::now();

    ++episode_index_;
    step_index_ = 0;
    emit_log(log_level::info, "env", "Resetting environment.");
    coordinator_->reset();

    latest_.action.clear();
    ledger_.begin_episode();

    std::optional<array_map> observation = coordinator_->execute_action(std::nullopt);
    if (observation.has_value()) {
        latest_.observation = std::move(*observation);
    }
    latest_.extras = task_manager_->get_current_extras();

    reset_next_step_ = false;
    latest_.type = step_type::first;
    state_ = lifecycle_state::active;

    emit_log(log_level::info, "env", "Done resetting environment. New episode started.");
    profile_.reset_duration.observe(elapsed_since(started));

    timestep out;
    out.type = step_type::first;
    out.observation = latest_.observation;
    out.reward = 0.0;
    out.discount = 0.0;
    return out;
}

timestep environment::step(const array_map& action) {
    require_open("environment::step");
    const auto started = clock_type::now();

    if (coordinator_->should_restart()) {
        emit_log(log_level::warn, "env", "Simulator requires a restart. Ending episode.");
        coordinator_->restart_simulator();
        ledger_.record_restart();
        timestep out = terminate_without_step();
        profile_.step_duration.observe(elapsed_since(started), options_.step_budget);
        return out;
    }

    if (coordinator_->check_timeout()) {
        ledger_.record_timeout_reset();
        emit_log(log_level::info, "env", "Step has timed out. Ending episode.");
        timestep out = terminate_without_step();
        profile_.step_duration.observe(elapsed_since(started), options_.step_budget);
        return out;
    }

    // The caller's action is dropped here; the agent sees a FIRST step instead.
    if (reset_next_step_) {
        emit_log(log_level::debug, "env", "Step requested while a reset is pending. Resetting instead.");
        return reset();
    }

    const action_type type = action_type_of(action);
    if (options_.validate_actions) {
        check_action_against_spec(action, action_spec_);
    }

    latest_.action = action;
    ledger_.record_step(type);
    task_manager_->increment_steps();
    ++step_index_;

    std::optional<array_map> observation = coordinator_->execute_action(std::optional<array_map>(action));
    const double reward = task_manager_->get_current_reward();
    array_map extras = task_manager_->get_current_extras();
    if (observation.has_value()) {
        latest_.observation = std::move(*observation);
    }
    latest_.extras = std::move(extras);

    reset_next_step_ = task_manager_->check_if_episode_ended();
    latest_.type = reset_next_step_ ? step_type::last : step_type::mid;
    state_ = reset_next_step_ ? lifecycle_state::terminated : lifecycle_state::active;
    if (reset_next_step_) {
        emit_log(log_level::info, "env", "Episode ended after " + std::to_string(step_index_) + " steps.");
    }

    profile_.step_duration.observe(elapsed_since(started), options_.step_budget);

    timestep out;
    out.type = latest_.type;
    out.observation = latest_.observation;
    out.reward = reward;
    out.discount = reset_next_step_ ? 0.0 : 1.0;
    return out;
}

array_map environment::task_extras(bool latest_only) const {
    array_map out;
    for (const auto& [key, spec] : task_extras_spec_) {
        const auto it = latest_.extras.find(key);
        if (it == latest_.extras.end()) {
            continue;
        }
        const array& values = it->second;
        check_extra_sequence(values, spec);

        const std::int64_t count = values.shape.front();
        if (count == 0) {
            continue;
        }

        array sequence;
        sequence.type = spec.type;
        sequence.shape = values.shape;
        sequence.data.reserve(values.data.size());
        array latest;
        for (std::int64_t i = 0; i < count; ++i) {
            latest = conform(leading_slice(values, i), spec);
            sequence.data.insert(sequence.data.end(), latest.data.begin(), latest.data.end());
        }
        out.emplace(key, latest_only ? std::move(latest) : std::move(sequence));
    }
    return out;
}

telemetry_snapshot environment::telemetry() const {
    // The coordinator's resources are gone after close.
    if (closed_) {
        return ledger_.flush();
    }
    return ledger_.flush(coordinator_->log_dict());
}

std::string environment::dump_logs() const {
    return format_log_records(logs_.snapshot());
}

std::string environment::dump_profile() const {
    std::ostringstream out;
    out << format_duration_stats("reset", profile_.reset_duration);
    out << format_duration_stats("step", profile_.step_duration);
    out << "step_budget_ns=" << profile_.configured_step_budget.count() << '\n';
    return out.str();
}

void environment::close() noexcept {
    if (closed_) {
        return;
    }
    closed_ = true;
    emit_teardown_log(log_level::info, "Cleaning up environment.");
    try {
        coordinator_->close();
    } catch (const std::exception& e) {
        emit_teardown_log(log_level::error, std::string("coordinator close failed: ") + e.what());
    }
    emit_teardown_log(log_level::info, "Done cleaning up environment.");
}

timestep environment::terminate_without_step() {
    reset_next_step_ = true;
    latest_.type = step_type::last;
    state_ = lifecycle_state::terminated;

    timestep out;
    out.type = step_type::last;
    out.observation = latest_.observation;
    out.reward = 0.0;
    out.discount = 0.0;
    return out;
}

void environment::require_open(const char* where) const {
    if (closed_) {
        throw simenv_error(std::string(where) + ": environment is closed");
    }
}

void environment::emit_teardown_log(log_level level, const std::string& message) const noexcept {
    try {
        emit_log(level, "env", message);
    } catch (const std::exception& e) {
        std::cerr << "simenv: log sink failed during close: " << e.what() << " (dropped: " << message << ")\n";
    }
}

void environment::emit_log(log_level level, std::string category, std::string message) const {
    log_record rec;
    rec.ts = clock_type::now();
    rec.level = level;
    rec.episode_index = episode_index_;
    rec.step_index = step_index_;
    rec.category = std::move(category);
    rec.message = std::move(message);
    sink_.write(rec);
}

}  // namespace simenv
