#pragma once

#include <cstdint>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "simenv/collaborators.hpp"
#include "simenv/task.hpp"

namespace simenv {

struct demo_task_options {
    std::int64_t max_steps = 20;
    // Touches inside [target_lo, target_hi] on both axes earn a reward of 1.
    double target_lo = 0.25;
    double target_hi = 0.75;
};

class demo_task_manager final : public task_manager {
public:
    explicit demo_task_manager(demo_task_options options = {});

    [[nodiscard]] double get_current_reward() override;
    [[nodiscard]] array_map get_current_extras() override;
    void increment_steps() override;
    [[nodiscard]] bool check_if_episode_ended() override;

    void reset_task();
    void on_touch(bool touching, double x, double y);

    [[nodiscard]] std::int64_t episode_steps() const noexcept { return steps_; }
    [[nodiscard]] double score() const noexcept { return score_; }
    [[nodiscard]] const demo_task_options& options() const noexcept { return options_; }

private:
    demo_task_options options_;
    std::int64_t steps_ = 0;
    double score_ = 0.0;
    double pending_reward_ = 0.0;
    std::vector<double> pending_scores_{};
};

task_definition demo_task_definition(const demo_task_options& options);

struct demo_device_options {
    screen_dimensions dims{32, 32, 3};
    // Zero disables the scripted fault.
    std::int64_t restart_every = 0;
    std::int64_t timeout_every = 0;
    std::int64_t frame_interval_us = 33333;
};

class demo_coordinator final : public coordinator {
public:
    demo_coordinator(std::shared_ptr<demo_task_manager> tasks, demo_device_options options = {});

    [[nodiscard]] screen_dimensions screen_dims() override;
    void reset() override;
    [[nodiscard]] std::optional<array_map> execute_action(const std::optional<array_map>& action) override;
    [[nodiscard]] bool should_restart() override;
    void restart_simulator() override;
    [[nodiscard]] bool check_timeout() override;
    [[nodiscard]] std::map<std::string, double> log_dict() override;
    void close() override;

    [[nodiscard]] bool closed() const noexcept { return closed_; }
    [[nodiscard]] std::int64_t close_calls() const noexcept { return close_calls_; }

private:
    array_map render() const;

    std::shared_ptr<demo_task_manager> tasks_;
    demo_device_options options_;
    bool touching_ = false;
    double touch_x_ = 0.0;
    double touch_y_ = 0.0;
    std::int64_t executed_actions_ = 0;
    std::int64_t actions_since_restart_ = 0;
    std::int64_t restarts_ = 0;
    std::int64_t resets_ = 0;
    bool timeout_pending_ = false;
    bool closed_ = false;
    std::int64_t close_calls_ = 0;
};

}  // namespace simenv
