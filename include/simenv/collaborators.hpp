#pragma once

#include <map>
#include <optional>
#include <string>

#include "simenv/array.hpp"
#include "simenv/specs.hpp"

namespace simenv {

// Controls the simulated device. Calls may block on device latency; a stalled
// step is reported through check_timeout() rather than by cancellation.
class coordinator {
public:
    virtual ~coordinator() = default;

    [[nodiscard]] virtual screen_dimensions screen_dims() = 0;
    virtual void reset() = 0;
    // A nullopt action is a no-op used to fetch the current observation.
    [[nodiscard]] virtual std::optional<array_map> execute_action(const std::optional<array_map>& action) = 0;
    [[nodiscard]] virtual bool should_restart() = 0;
    virtual void restart_simulator() = 0;
    [[nodiscard]] virtual bool check_timeout() = 0;
    [[nodiscard]] virtual std::map<std::string, double> log_dict() { return {}; }
    virtual void close() = 0;
};

class task_manager {
public:
    virtual ~task_manager() = default;

    [[nodiscard]] virtual double get_current_reward() = 0;
    [[nodiscard]] virtual array_map get_current_extras() = 0;
    virtual void increment_steps() = 0;
    [[nodiscard]] virtual bool check_if_episode_ended() = 0;
};

}  // namespace simenv
