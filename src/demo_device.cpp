#include "simenv/demo_device.hpp"

#include <cmath>
#include <stdexcept>
#include <utility>

#include "simenv/error.hpp"

namespace simenv {

demo_task_manager::demo_task_manager(demo_task_options options) : options_(options) {
    if (options_.max_steps < 0) {
        throw std::invalid_argument("demo_task_manager: max_steps must be non-negative");
    }
    if (!(options_.target_lo <= options_.target_hi)) {
        throw std::invalid_argument("demo_task_manager: target_lo must not exceed target_hi");
    }
}

double demo_task_manager::get_current_reward() {
    const double reward = pending_reward_;
    pending_reward_ = 0.0;
    score_ += reward;
    pending_scores_.push_back(score_);
    return reward;
}

array_map demo_task_manager::get_current_extras() {
    array_map extras;
    const auto count = static_cast<std::int64_t>(pending_scores_.size());
    extras.emplace("score", make_array(dtype::float32, {count}, std::move(pending_scores_)));
    pending_scores_.clear();
    return extras;
}

void demo_task_manager::increment_steps() {
    ++steps_;
}

bool demo_task_manager::check_if_episode_ended() {
    return options_.max_steps > 0 && steps_ >= options_.max_steps;
}

void demo_task_manager::reset_task() {
    steps_ = 0;
    score_ = 0.0;
    pending_reward_ = 0.0;
    pending_scores_.clear();
}

void demo_task_manager::on_touch(bool touching, double x, double y) {
    if (!touching) {
        return;
    }
    const bool inside_x = x >= options_.target_lo && x <= options_.target_hi;
    const bool inside_y = y >= options_.target_lo && y <= options_.target_hi;
    if (inside_x && inside_y) {
        pending_reward_ += 1.0;
    }
}

task_definition demo_task_definition(const demo_task_options& options) {
    task_definition task;
    task.id = "demo_touch_target";
    task.name = "Touch the target cell";
    task.description = "Reward 1 for every touch that lands inside the centre cell.";
    task.max_episode_steps = options.max_steps;
    task.extras_spec.push_back(extra_declaration{"score", {}, "float32"});
    return task;
}

demo_coordinator::demo_coordinator(std::shared_ptr<demo_task_manager> tasks, demo_device_options options)
    : tasks_(std::move(tasks)), options_(options) {
    if (!tasks_) {
        throw std::invalid_argument("demo_coordinator: task manager must not be null");
    }
    if (options_.restart_every < 0 || options_.timeout_every < 0) {
        throw std::invalid_argument("demo_coordinator: fault intervals must be non-negative");
    }
}

screen_dimensions demo_coordinator::screen_dims() {
    return options_.dims;
}

void demo_coordinator::reset() {
    if (closed_) {
        throw simenv_error("demo_coordinator::reset: device is closed");
    }
    ++resets_;
    touching_ = false;
    timeout_pending_ = false;
    tasks_->reset_task();
}

std::optional<array_map> demo_coordinator::execute_action(const std::optional<array_map>& action) {
    if (closed_) {
        throw simenv_error("demo_coordinator::execute_action: device is closed");
    }
    if (!action.has_value()) {
        return render();
    }

    const action_type type = action_type_of(*action);
    switch (type) {
        case action_type::touch: {
            const auto it = action->find("touch_position");
            if (it == action->end() || it->second.data.size() != 2) {
                throw schema_violation("touch_position", "touch action requires two coordinates");
            }
            touching_ = true;
            touch_x_ = it->second.data[0];
            touch_y_ = it->second.data[1];
            break;
        }
        case action_type::lift:
            touching_ = false;
            break;
        case action_type::repeat:
            break;
    }

    ++executed_actions_;
    ++actions_since_restart_;
    if (options_.timeout_every > 0 && executed_actions_ % options_.timeout_every == 0) {
        timeout_pending_ = true;
    }
    tasks_->on_touch(touching_, touch_x_, touch_y_);
    return render();
}

bool demo_coordinator::should_restart() {
    return options_.restart_every > 0 && actions_since_restart_ >= options_.restart_every;
}

void demo_coordinator::restart_simulator() {
    ++restarts_;
    actions_since_restart_ = 0;
    touching_ = false;
    timeout_pending_ = false;
}

bool demo_coordinator::check_timeout() {
    const bool timed_out = timeout_pending_;
    timeout_pending_ = false;
    return timed_out;
}

std::map<std::string, double> demo_coordinator::log_dict() {
    return {
        {"demo_executed_actions", static_cast<double>(executed_actions_)},
        {"demo_restarts", static_cast<double>(restarts_)},
        {"demo_resets", static_cast<double>(resets_)},
    };
}

void demo_coordinator::close() {
    ++close_calls_;
    closed_ = true;
}

array_map demo_coordinator::render() const {
    const screen_dimensions& dims = options_.dims;
    std::vector<double> pixels;
    pixels.reserve(static_cast<std::size_t>(dims.height * dims.width * dims.channels));
    const double radius = 0.1;
    for (std::int64_t row = 0; row < dims.height; ++row) {
        const double y = (static_cast<double>(row) + 0.5) / static_cast<double>(dims.height);
        for (std::int64_t col = 0; col < dims.width; ++col) {
            const double x = (static_cast<double>(col) + 0.5) / static_cast<double>(dims.width);
            const bool lit = touching_ && std::hypot(x - touch_x_, y - touch_y_) <= radius;
            for (std::int64_t ch = 0; ch < dims.channels; ++ch) {
                pixels.push_back(lit ? 255.0 : static_cast<double>((row * 7 + col * 3 + ch * 11) % 64));
            }
        }
    }

    array_map observation;
    observation.emplace("pixels", make_array(dtype::uint8, {dims.height, dims.width, dims.channels}, std::move(pixels)));
    observation.emplace("timedelta", make_scalar(dtype::int64, static_cast<double>(options_.frame_interval_us)));
    observation.emplace("orientation", make_array(dtype::uint8, {4}, {1.0, 0.0, 0.0, 0.0}));
    return observation;
}

}  // namespace simenv
