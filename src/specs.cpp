#include "simenv/specs.hpp"

#include <cmath>
#include <sstream>
#include <stdexcept>
#include <utility>

#include "simenv/error.hpp"

namespace simenv {
namespace {

std::string number_repr(double value) {
    std::ostringstream out;
    out << value;
    return out.str();
}

bool survives_conversion(double value, dtype type) {
    if (!std::isfinite(value)) {
        return !is_integer_dtype(type);
    }
    double lo = 0.0;
    double hi = 0.0;
    dtype_range(type, lo, hi);
    if (value < lo || value > hi) {
        return false;
    }
    if (is_integer_dtype(type)) {
        return std::trunc(value) == value;
    }
    if (type == dtype::float32) {
        return static_cast<double>(static_cast<float>(value)) == value;
    }
    return true;
}

}  // namespace

const char* action_type_name(action_type type) noexcept {
    switch (type) {
        case action_type::touch:
            return "TOUCH";
        case action_type::lift:
            return "LIFT";
        case action_type::repeat:
            return "REPEAT";
    }
    return "UNKNOWN";
}

bool action_type_from_index(std::int64_t index, action_type& out) noexcept {
    if (index < 0 || index >= static_cast<std::int64_t>(k_num_action_types)) {
        return false;
    }
    out = static_cast<action_type>(index);
    return true;
}

array_spec make_spec(std::string name, dtype type, shape_t shape) {
    array_spec spec;
    spec.name = std::move(name);
    spec.type = type;
    spec.shape = std::move(shape);
    return spec;
}

array_spec make_bounded_spec(std::string name, dtype type, shape_t shape, double minimum, double maximum) {
    if (!(minimum <= maximum)) {
        throw std::invalid_argument("make_bounded_spec: minimum must not exceed maximum for " + name);
    }
    array_spec spec = make_spec(std::move(name), type, std::move(shape));
    spec.minimum = minimum;
    spec.maximum = maximum;
    return spec;
}

void validate(const array& value, const array_spec& spec) {
    if (value.type != spec.type) {
        throw schema_violation(spec.name,
                               std::string("expected dtype ") + dtype_name(spec.type) + ", got " + dtype_name(value.type));
    }
    if (value.shape != spec.shape) {
        throw schema_violation(spec.name,
                               "expected shape " + shape_repr(spec.shape) + ", got " + shape_repr(value.shape));
    }
    const std::int64_t expected = element_count(spec.shape);
    if (static_cast<std::int64_t>(value.data.size()) != expected) {
        throw schema_violation(spec.name,
                               "expected " + std::to_string(expected) + " elements, got " + std::to_string(value.data.size()));
    }

    double lo = 0.0;
    double hi = 0.0;
    dtype_range(spec.type, lo, hi);
    const bool integral = is_integer_dtype(spec.type);
    for (std::size_t i = 0; i < value.data.size(); ++i) {
        const double v = value.data[i];
        if (integral && (!std::isfinite(v) || std::trunc(v) != v)) {
            throw schema_violation(spec.name,
                                   "element " + std::to_string(i) + " = " + number_repr(v) + " is not an integer");
        }
        if (std::isfinite(v) && (v < lo || v > hi)) {
            throw schema_violation(spec.name, "element " + std::to_string(i) + " = " + number_repr(v) +
                                                  " is not representable as " + dtype_name(spec.type));
        }
        if (spec.minimum.has_value() && !(v >= *spec.minimum)) {
            throw schema_violation(spec.name, "element " + std::to_string(i) + " = " + number_repr(v) +
                                                  " is below minimum " + number_repr(*spec.minimum));
        }
        if (spec.maximum.has_value() && !(v <= *spec.maximum)) {
            throw schema_violation(spec.name, "element " + std::to_string(i) + " = " + number_repr(v) +
                                                  " is above maximum " + number_repr(*spec.maximum));
        }
    }
}

array conform(const array& value, const array_spec& spec) {
    if (value.type == spec.type) {
        validate(value, spec);
        return value;
    }
    for (std::size_t i = 0; i < value.data.size(); ++i) {
        if (!survives_conversion(value.data[i], spec.type)) {
            throw schema_violation(spec.name, "element " + std::to_string(i) + " = " + number_repr(value.data[i]) +
                                                  " cannot be converted from " + dtype_name(value.type) + " to " +
                                                  dtype_name(spec.type) + " without loss");
        }
    }
    array converted = value;
    converted.type = spec.type;
    validate(converted, spec);
    return converted;
}

spec_map base_action_spec() {
    spec_map specs;
    specs.emplace("action_type",
                  make_bounded_spec("action_type", dtype::int32, {}, 0.0, static_cast<double>(k_num_action_types - 1)));
    specs.emplace("touch_position", make_bounded_spec("touch_position", dtype::float32, {2}, 0.0, 1.0));
    return specs;
}

spec_map base_observation_spec(const screen_dimensions& dims) {
    if (dims.width <= 0 || dims.height <= 0 || dims.channels <= 0) {
        throw std::invalid_argument("base_observation_spec: screen dimensions must be > 0, got " +
                                    std::to_string(dims.width) + "x" + std::to_string(dims.height) + "x" +
                                    std::to_string(dims.channels));
    }
    spec_map specs;
    specs.emplace("pixels",
                  make_bounded_spec("pixels", dtype::uint8, {dims.height, dims.width, dims.channels}, 0.0, 255.0));
    specs.emplace("timedelta", make_spec("timedelta", dtype::int64, {}));
    specs.emplace("orientation", make_bounded_spec("orientation", dtype::uint8, {4}, 0.0, 1.0));
    return specs;
}

spec_map task_extras_spec(const task_definition& task) {
    spec_map specs;
    for (const extra_declaration& extra : task.extras_spec) {
        if (extra.name.empty()) {
            throw std::invalid_argument("task_extras_spec: extra name must not be empty in task " + task.id);
        }
        dtype type = dtype::float32;
        if (!parse_dtype(extra.dtype, type)) {
            throw std::invalid_argument("task_extras_spec: unknown dtype '" + extra.dtype + "' for extra " + extra.name);
        }
        for (std::int64_t dim : extra.shape) {
            if (dim < 0) {
                throw std::invalid_argument("task_extras_spec: negative dimension for extra " + extra.name);
            }
        }
        if (!specs.emplace(extra.name, make_spec(extra.name, type, extra.shape)).second) {
            throw std::invalid_argument("task_extras_spec: duplicate extra " + extra.name);
        }
    }
    return specs;
}

action_type action_type_of(const array_map& action) {
    const auto it = action.find("action_type");
    if (it == action.end()) {
        throw schema_violation("action_type", "action has no action_type entry");
    }
    const array& value = it->second;
    if (value.data.size() != 1) {
        throw schema_violation("action_type", "expected a single element, got " + std::to_string(value.data.size()));
    }
    const double raw = value.data.front();
    if (!std::isfinite(raw) || std::trunc(raw) != raw) {
        throw schema_violation("action_type", "value " + number_repr(raw) + " is not an integer");
    }
    action_type out = action_type::touch;
    if (raw < 0.0 || raw > static_cast<double>(k_num_action_types - 1) ||
        !action_type_from_index(static_cast<std::int64_t>(raw), out)) {
        throw schema_violation("action_type", "value " + number_repr(raw) + " is not a known action type");
    }
    return out;
}

std::string spec_repr(const array_spec& spec) {
    std::ostringstream out;
    out << (spec.bounded() ? "BoundedArray" : "Array") << "(name=" << spec.name << ", shape=" << shape_repr(spec.shape)
        << ", dtype=" << dtype_name(spec.type);
    if (spec.minimum.has_value()) {
        out << ", minimum=" << *spec.minimum;
    }
    if (spec.maximum.has_value()) {
        out << ", maximum=" << *spec.maximum;
    }
    out << ')';
    return out.str();
}

std::string spec_map_repr(const spec_map& specs) {
    std::ostringstream out;
    out << '{';
    bool first = true;
    for (const auto& [name, spec] : specs) {
        if (!first) {
            out << ", ";
        }
        first = false;
        out << name << ": " << spec_repr(spec);
    }
    out << '}';
    return out.str();
}

}  // namespace simenv
