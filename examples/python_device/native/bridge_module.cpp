#include <chrono>
#include <cstdint>
#include <map>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

#include <pybind11/numpy.h>
#include <pybind11/pybind11.h>
#include <pybind11/stl.h>

#include "simenv/environment.hpp"
#include "simenv/error.hpp"

namespace py = pybind11;

namespace {

simenv::dtype dtype_of(const py::array& arr, const std::string& where) {
    const py::dtype dt = arr.dtype();
    const char kind = dt.kind();
    const py::ssize_t size = dt.itemsize();
    if (kind == 'b' || (kind == 'u' && size == 1)) {
        return simenv::dtype::uint8;
    }
    if (kind == 'i' && size == 4) {
        return simenv::dtype::int32;
    }
    if (kind == 'i' && size == 8) {
        return simenv::dtype::int64;
    }
    if (kind == 'f' && size == 4) {
        return simenv::dtype::float32;
    }
    if (kind == 'f' && size == 8) {
        return simenv::dtype::float64;
    }
    throw std::runtime_error(where + ": unsupported numpy dtype kind '" + std::string(1, kind) + "' itemsize " +
                             std::to_string(size));
}

simenv::array py_to_array(const py::handle& value, const std::string& where) {
    py::array arr = py::array::ensure(value);
    if (!arr) {
        throw std::runtime_error(where + ": expected array-like value");
    }
    simenv::array out;
    out.type = dtype_of(arr, where);
    for (py::ssize_t i = 0; i < arr.ndim(); ++i) {
        out.shape.push_back(static_cast<std::int64_t>(arr.shape(i)));
    }
    auto as_double = py::array_t<double, py::array::c_style | py::array::forcecast>::ensure(arr);
    if (!as_double) {
        throw std::runtime_error(where + ": array is not convertible to float64");
    }
    const double* ptr = as_double.data();
    out.data.assign(ptr, ptr + as_double.size());
    return out;
}

simenv::array_map py_to_array_map(const py::handle& value, const std::string& where) {
    if (!py::isinstance<py::dict>(value)) {
        throw std::runtime_error(where + ": expected dict of arrays");
    }
    simenv::array_map out;
    for (const auto& [key, item] : py::reinterpret_borrow<py::dict>(value)) {
        const std::string name = py::cast<std::string>(key);
        out.emplace(name, py_to_array(item, where + "." + name));
    }
    return out;
}

template <typename T>
py::array typed_array(const simenv::array& value) {
    std::vector<py::ssize_t> shape(value.shape.begin(), value.shape.end());
    py::array_t<T> out(shape);
    T* ptr = out.mutable_data();
    for (std::size_t i = 0; i < value.data.size(); ++i) {
        ptr[i] = static_cast<T>(value.data[i]);
    }
    return std::move(out);
}

py::array array_to_py(const simenv::array& value) {
    switch (value.type) {
        case simenv::dtype::uint8:
            return typed_array<std::uint8_t>(value);
        case simenv::dtype::int32:
            return typed_array<std::int32_t>(value);
        case simenv::dtype::int64:
            return typed_array<std::int64_t>(value);
        case simenv::dtype::float32:
            return typed_array<float>(value);
        case simenv::dtype::float64:
            return typed_array<double>(value);
    }
    throw std::runtime_error("array_to_py: unknown dtype");
}

py::dict array_map_to_py(const simenv::array_map& values) {
    py::dict out;
    for (const auto& [name, value] : values) {
        out[py::str(name)] = array_to_py(value);
    }
    return out;
}

py::dict spec_map_to_py(const simenv::spec_map& specs) {
    py::dict out;
    for (const auto& [name, spec] : specs) {
        py::dict entry;
        entry[py::str("name")] = py::str(spec.name);
        entry[py::str("dtype")] = py::str(simenv::dtype_name(spec.type));
        entry[py::str("shape")] = py::tuple(py::cast(spec.shape));
        entry[py::str("minimum")] = spec.minimum.has_value() ? py::object(py::float_(*spec.minimum)) : py::object(py::none());
        entry[py::str("maximum")] = spec.maximum.has_value() ? py::object(py::float_(*spec.maximum)) : py::object(py::none());
        out[py::str(name)] = entry;
    }
    return out;
}

py::dict timestep_to_py(const simenv::timestep& ts) {
    py::dict out;
    out[py::str("step_type")] = py::str(simenv::step_type_name(ts.type));
    out[py::str("observation")] = array_map_to_py(ts.observation);
    out[py::str("reward")] = py::float_(ts.reward);
    out[py::str("discount")] = py::float_(ts.discount);
    return out;
}

template <typename T>
T dict_value_or(const py::dict& obj, const char* key, T fallback) {
    if (!obj.contains(py::str(key))) {
        return fallback;
    }
    return py::cast<T>(obj[py::str(key)]);
}

simenv::task_definition py_to_task(const py::dict& obj) {
    simenv::task_definition task;
    task.id = dict_value_or<std::string>(obj, "id", "");
    task.name = dict_value_or<std::string>(obj, "name", "");
    task.description = dict_value_or<std::string>(obj, "description", "");
    task.max_episode_steps = dict_value_or<std::int64_t>(obj, "max_episode_steps", 0);
    if (obj.contains(py::str("extras_spec"))) {
        for (py::handle item : py::reinterpret_borrow<py::sequence>(obj[py::str("extras_spec")])) {
            py::dict extra = py::reinterpret_borrow<py::dict>(item);
            simenv::extra_declaration decl;
            decl.name = dict_value_or<std::string>(extra, "name", "");
            decl.shape = dict_value_or<std::vector<std::int64_t>>(extra, "shape", {});
            decl.dtype = dict_value_or<std::string>(extra, "dtype", "float32");
            task.extras_spec.push_back(std::move(decl));
        }
    }
    return task;
}

simenv::environment_options py_to_options(const py::dict& obj) {
    simenv::environment_options options;
    options.telemetry_prefix = dict_value_or<std::string>(obj, "telemetry_prefix", options.telemetry_prefix);
    options.log_capacity = dict_value_or<std::size_t>(obj, "log_capacity", options.log_capacity);
    options.validate_actions = dict_value_or<bool>(obj, "validate_actions", options.validate_actions);
    options.step_budget = std::chrono::milliseconds(dict_value_or<std::int64_t>(obj, "step_budget_ms", 0));
    return options;
}

std::runtime_error collaborator_error(const char* where, const py::error_already_set& e) {
    return std::runtime_error(std::string(where) + " failed: " + e.what());
}

class python_coordinator final : public simenv::coordinator {
public:
    explicit python_coordinator(py::object obj) : obj_(std::move(obj)) {}
    ~python_coordinator() override {
        if (Py_IsInitialized() == 0) {
            return;
        }
        py::gil_scoped_acquire gil;
        obj_ = py::none();
    }

    [[nodiscard]] simenv::screen_dimensions screen_dims() override {
        py::gil_scoped_acquire gil;
        try {
            const auto dims = py::cast<std::vector<std::int64_t>>(obj_.attr("screen_dims")());
            if (dims.size() != 2 && dims.size() != 3) {
                throw std::runtime_error("coordinator.screen_dims() must return (width, height[, channels])");
            }
            simenv::screen_dimensions out;
            out.width = dims[0];
            out.height = dims[1];
            if (dims.size() == 3) {
                out.channels = dims[2];
            }
            return out;
        } catch (const py::error_already_set& e) {
            throw collaborator_error("coordinator.screen_dims", e);
        }
    }

    void reset() override {
        py::gil_scoped_acquire gil;
        try {
            obj_.attr("reset")();
        } catch (const py::error_already_set& e) {
            throw collaborator_error("coordinator.reset", e);
        }
    }

    [[nodiscard]] std::optional<simenv::array_map> execute_action(
        const std::optional<simenv::array_map>& action) override {
        py::gil_scoped_acquire gil;
        try {
            py::object arg = action.has_value() ? py::object(array_map_to_py(*action)) : py::object(py::none());
            py::object out = obj_.attr("execute_action")(arg);
            if (out.is_none()) {
                return std::nullopt;
            }
            return py_to_array_map(out, "coordinator.execute_action");
        } catch (const py::error_already_set& e) {
            throw collaborator_error("coordinator.execute_action", e);
        }
    }

    [[nodiscard]] bool should_restart() override {
        py::gil_scoped_acquire gil;
        try {
            return py::cast<bool>(obj_.attr("should_restart")());
        } catch (const py::error_already_set& e) {
            throw collaborator_error("coordinator.should_restart", e);
        }
    }

    void restart_simulator() override {
        py::gil_scoped_acquire gil;
        try {
            obj_.attr("restart_simulator")();
        } catch (const py::error_already_set& e) {
            throw collaborator_error("coordinator.restart_simulator", e);
        }
    }

    [[nodiscard]] bool check_timeout() override {
        py::gil_scoped_acquire gil;
        try {
            return py::cast<bool>(obj_.attr("check_timeout")());
        } catch (const py::error_already_set& e) {
            throw collaborator_error("coordinator.check_timeout", e);
        }
    }

    [[nodiscard]] std::map<std::string, double> log_dict() override {
        py::gil_scoped_acquire gil;
        try {
            if (!py::hasattr(obj_, "log_dict")) {
                return {};
            }
            return py::cast<std::map<std::string, double>>(obj_.attr("log_dict")());
        } catch (const py::error_already_set& e) {
            throw collaborator_error("coordinator.log_dict", e);
        }
    }

    void close() override {
        py::gil_scoped_acquire gil;
        try {
            obj_.attr("close")();
        } catch (const py::error_already_set& e) {
            throw collaborator_error("coordinator.close", e);
        }
    }

private:
    py::object obj_;
};

class python_task_manager final : public simenv::task_manager {
public:
    explicit python_task_manager(py::object obj) : obj_(std::move(obj)) {}
    ~python_task_manager() override {
        if (Py_IsInitialized() == 0) {
            return;
        }
        py::gil_scoped_acquire gil;
        obj_ = py::none();
    }

    [[nodiscard]] double get_current_reward() override {
        py::gil_scoped_acquire gil;
        try {
            return py::cast<double>(obj_.attr("get_current_reward")());
        } catch (const py::error_already_set& e) {
            throw collaborator_error("task_manager.get_current_reward", e);
        }
    }

    [[nodiscard]] simenv::array_map get_current_extras() override {
        py::gil_scoped_acquire gil;
        try {
            return py_to_array_map(obj_.attr("get_current_extras")(), "task_manager.get_current_extras");
        } catch (const py::error_already_set& e) {
            throw collaborator_error("task_manager.get_current_extras", e);
        }
    }

    void increment_steps() override {
        py::gil_scoped_acquire gil;
        try {
            obj_.attr("increment_steps")();
        } catch (const py::error_already_set& e) {
            throw collaborator_error("task_manager.increment_steps", e);
        }
    }

    [[nodiscard]] bool check_if_episode_ended() override {
        py::gil_scoped_acquire gil;
        try {
            return py::cast<bool>(obj_.attr("check_if_episode_ended")());
        } catch (const py::error_already_set& e) {
            throw collaborator_error("task_manager.check_if_episode_ended", e);
        }
    }

private:
    py::object obj_;
};

class environment_bridge {
public:
    environment_bridge(py::object coordinator, py::object task_manager, py::dict task, py::dict options)
        : env_(std::make_shared<python_coordinator>(std::move(coordinator)),
               std::make_shared<python_task_manager>(std::move(task_manager)),
               py_to_task(task),
               py_to_options(options)) {}

    py::dict action_spec() const { return spec_map_to_py(env_.action_spec()); }
    py::dict observation_spec() const { return spec_map_to_py(env_.observation_spec()); }
    py::dict task_extras_spec() const { return spec_map_to_py(env_.task_extras_spec()); }

    py::dict reset() { return timestep_to_py(env_.reset()); }

    py::dict step(const py::dict& action) {
        return timestep_to_py(env_.step(py_to_array_map(action, "Environment.step")));
    }

    py::dict raw_action() const { return array_map_to_py(env_.raw_action()); }
    py::dict raw_observation() const { return array_map_to_py(env_.raw_observation()); }
    py::dict task_extras(bool latest_only) const { return array_map_to_py(env_.task_extras(latest_only)); }

    std::map<std::string, double> telemetry() const { return env_.telemetry(); }
    std::string dump_logs() const { return env_.dump_logs(); }
    std::string dump_profile() const { return env_.dump_profile(); }
    std::string state() const { return simenv::lifecycle_state_name(env_.state()); }
    bool reset_pending() const { return env_.reset_pending(); }

    void close() { env_.close(); }

private:
    simenv::environment env_;
};

}  // namespace

PYBIND11_MODULE(simenv_bridge, m) {
    m.doc() = "simenv python bridge";

    // Translators run newest first, so the derived type is registered last.
    py::register_exception<simenv::simenv_error>(m, "SimenvError", PyExc_RuntimeError);
    py::register_exception<simenv::schema_violation>(m, "SchemaViolation", PyExc_ValueError);

    py::class_<environment_bridge>(m, "Environment")
        .def(py::init<py::object, py::object, py::dict, py::dict>(),
             py::arg("coordinator"),
             py::arg("task_manager"),
             py::arg("task"),
             py::arg("options") = py::dict())
        .def("action_spec", &environment_bridge::action_spec)
        .def("observation_spec", &environment_bridge::observation_spec)
        .def("task_extras_spec", &environment_bridge::task_extras_spec)
        .def("reset", &environment_bridge::reset)
        .def("step", &environment_bridge::step, py::arg("action"))
        .def_property_readonly("raw_action", &environment_bridge::raw_action)
        .def_property_readonly("raw_observation", &environment_bridge::raw_observation)
        .def("task_extras", &environment_bridge::task_extras, py::arg("latest_only") = true)
        .def("telemetry", &environment_bridge::telemetry)
        .def("dump_logs", &environment_bridge::dump_logs)
        .def("dump_profile", &environment_bridge::dump_profile)
        .def_property_readonly("state", &environment_bridge::state)
        .def_property_readonly("reset_pending", &environment_bridge::reset_pending)
        .def("close", &environment_bridge::close);
}
