#pragma once

#include <cstddef>
#include <cstdint>
#include <map>
#include <optional>
#include <string>

#include "simenv/array.hpp"
#include "simenv/task.hpp"

namespace simenv {

enum class action_type {
    touch = 0,
    lift = 1,
    repeat = 2
};

inline constexpr std::size_t k_num_action_types = 3;

const char* action_type_name(action_type type) noexcept;
[[nodiscard]] bool action_type_from_index(std::int64_t index, action_type& out) noexcept;

struct screen_dimensions {
    std::int64_t width = 0;
    std::int64_t height = 0;
    std::int64_t channels = 3;
};

struct array_spec {
    std::string name;
    dtype type = dtype::float64;
    shape_t shape{};
    std::optional<double> minimum;
    std::optional<double> maximum;

    [[nodiscard]] bool bounded() const noexcept { return minimum.has_value() || maximum.has_value(); }
};

using spec_map = std::map<std::string, array_spec>;

array_spec make_spec(std::string name, dtype type, shape_t shape);
array_spec make_bounded_spec(std::string name, dtype type, shape_t shape, double minimum, double maximum);

// Throws schema_violation when dtype, shape, element count, dtype range or
// declared bounds are not met.
void validate(const array& value, const array_spec& spec);

// Converts value to spec.type when every element survives the conversion
// unchanged, then validates. Lossy conversions throw schema_violation.
array conform(const array& value, const array_spec& spec);

spec_map base_action_spec();
spec_map base_observation_spec(const screen_dimensions& dims);
spec_map task_extras_spec(const task_definition& task);

// Reads the scalar `action_type` entry of an action.
action_type action_type_of(const array_map& action);

std::string spec_repr(const array_spec& spec);
std::string spec_map_repr(const spec_map& specs);

}  // namespace simenv
