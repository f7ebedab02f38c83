#include "simenv/task.hpp"

#include <sstream>

#include "simenv/array.hpp"

namespace simenv {

std::string task_repr(const task_definition& task) {
    std::ostringstream out;
    out << "id=" << task.id << " name=" << task.name;
    if (!task.description.empty()) {
        out << " description=\"" << task.description << '"';
    }
    out << " max_episode_steps=" << task.max_episode_steps << " extras=[";
    for (std::size_t i = 0; i < task.extras_spec.size(); ++i) {
        const extra_declaration& extra = task.extras_spec[i];
        if (i > 0) {
            out << ", ";
        }
        out << extra.name << ':' << extra.dtype << shape_repr(extra.shape);
    }
    out << ']';
    return out.str();
}

}  // namespace simenv
