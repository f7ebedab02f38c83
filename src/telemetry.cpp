#include "simenv/telemetry.hpp"

#include <cctype>
#include <chrono>
#include <stdexcept>
#include <utility>

namespace simenv {
namespace {

constexpr std::array<counter_scope, k_num_counter_scopes> k_scopes = {counter_scope::total, counter_scope::episode};

constexpr std::array<action_type, k_num_action_types> k_action_types = {action_type::touch,
                                                                         action_type::lift,
                                                                         action_type::repeat};

std::size_t scope_index(counter_scope scope) noexcept {
    return static_cast<std::size_t>(scope);
}

std::size_t action_index(action_type type) noexcept {
    return static_cast<std::size_t>(type);
}

}  // namespace

const char* counter_scope_name(counter_scope scope) noexcept {
    switch (scope) {
        case counter_scope::total:
            return "total";
        case counter_scope::episode:
            return "episode";
    }
    return "unknown";
}

episode_telemetry::episode_telemetry(std::string prefix, log_sink* diagnostics)
    : prefix_(std::move(prefix)), diagnostics_(diagnostics) {
    if (prefix_.empty()) {
        throw std::invalid_argument("episode_telemetry: prefix must not be empty");
    }
    for (char c : prefix_) {
        if (std::isspace(static_cast<unsigned char>(c))) {
            throw std::invalid_argument("episode_telemetry: prefix must not contain whitespace");
        }
    }
}

void episode_telemetry::record_step(action_type type) {
    const std::size_t idx = action_index(type);
    if (idx >= k_num_action_types) {
        throw std::invalid_argument("episode_telemetry::record_step: unknown action type");
    }
    for (scope_counters& scope : scopes_) {
        ++scope.steps;
        ++scope.action_types[idx];
    }
}

void episode_telemetry::record_restart() {
    ++restart_count_;
}

void episode_telemetry::record_timeout_reset() {
    ++timeout_reset_count_;
}

void episode_telemetry::begin_episode() {
    counters(counter_scope::episode) = scope_counters{};
}

telemetry_snapshot episode_telemetry::flush(const std::map<std::string, double>& backend_counters) const {
    telemetry_snapshot out;
    out[k_restart_count_key] = static_cast<double>(restart_count_);
    out[k_timeout_reset_count_key] = static_cast<double>(timeout_reset_count_);
    for (counter_scope scope : k_scopes) {
        const scope_counters& c = counters(scope);
        out[steps_key(scope)] = static_cast<double>(c.steps);
        for (action_type type : k_action_types) {
            out[action_type_key(scope, type)] = static_cast<double>(c.action_types[action_index(type)]);
        }
    }

    for (const auto& [key, value] : backend_counters) {
        out[key] = value;
    }

    for (counter_scope scope : k_scopes) {
        const scope_counters& c = counters(scope);
        if (c.steps == 0) {
            warn(steps_key(scope) + " is 0. Skipping ratio logs.");
            continue;
        }
        const double steps = static_cast<double>(c.steps);
        for (action_type type : k_action_types) {
            out[action_type_ratio_key(scope, type)] = static_cast<double>(c.action_types[action_index(type)]) / steps;
        }
    }
    return out;
}

std::uint64_t episode_telemetry::steps(counter_scope scope) const noexcept {
    return counters(scope).steps;
}

std::uint64_t episode_telemetry::action_type_count(counter_scope scope, action_type type) const noexcept {
    const std::size_t idx = action_index(type);
    if (idx >= k_num_action_types) {
        return 0;
    }
    return counters(scope).action_types[idx];
}

std::string episode_telemetry::steps_key(counter_scope scope) const {
    return prefix_ + "_" + counter_scope_name(scope) + "_steps";
}

std::string episode_telemetry::action_type_key(counter_scope scope, action_type type) const {
    return prefix_ + "_" + counter_scope_name(scope) + "_action_type_" + action_type_name(type);
}

std::string episode_telemetry::action_type_ratio_key(counter_scope scope, action_type type) const {
    return prefix_ + "_" + counter_scope_name(scope) + "_action_type_ratio_" + action_type_name(type);
}

const episode_telemetry::scope_counters& episode_telemetry::counters(counter_scope scope) const noexcept {
    return scopes_[scope_index(scope)];
}

episode_telemetry::scope_counters& episode_telemetry::counters(counter_scope scope) noexcept {
    return scopes_[scope_index(scope)];
}

void episode_telemetry::warn(std::string message) const {
    if (!diagnostics_) {
        return;
    }
    log_record rec;
    rec.ts = std::chrono::steady_clock::now();
    rec.level = log_level::warn;
    rec.category = "telemetry";
    rec.message = std::move(message);
    diagnostics_->write(rec);
}

}  // namespace simenv
