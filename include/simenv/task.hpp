#pragma once

#include <cstdint>
#include <string>
#include <vector>

namespace simenv {

struct extra_declaration {
    std::string name;
    std::vector<std::int64_t> shape{};
    std::string dtype = "float32";
};

struct task_definition {
    std::string id;
    std::string name;
    std::string description;
    std::int64_t max_episode_steps = 0;
    std::vector<extra_declaration> extras_spec{};
};

std::string task_repr(const task_definition& task);

}  // namespace simenv
