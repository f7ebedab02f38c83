#include "simenv/array.hpp"

#include <limits>
#include <sstream>
#include <stdexcept>
#include <utility>

namespace simenv {

const char* dtype_name(dtype type) noexcept {
    switch (type) {
        case dtype::uint8:
            return "uint8";
        case dtype::int32:
            return "int32";
        case dtype::int64:
            return "int64";
        case dtype::float32:
            return "float32";
        case dtype::float64:
            return "float64";
    }
    return "unknown";
}

bool parse_dtype(std::string_view name, dtype& out) noexcept {
    if (name == "uint8") {
        out = dtype::uint8;
    } else if (name == "int32") {
        out = dtype::int32;
    } else if (name == "int64") {
        out = dtype::int64;
    } else if (name == "float32") {
        out = dtype::float32;
    } else if (name == "float64") {
        out = dtype::float64;
    } else {
        return false;
    }
    return true;
}

bool is_integer_dtype(dtype type) noexcept {
    return type == dtype::uint8 || type == dtype::int32 || type == dtype::int64;
}

void dtype_range(dtype type, double& lo, double& hi) noexcept {
    switch (type) {
        case dtype::uint8:
            lo = 0.0;
            hi = 255.0;
            return;
        case dtype::int32:
            lo = static_cast<double>(std::numeric_limits<std::int32_t>::min());
            hi = static_cast<double>(std::numeric_limits<std::int32_t>::max());
            return;
        case dtype::int64:
            // Exactly representable doubles only.
            lo = -9007199254740992.0;
            hi = 9007199254740992.0;
            return;
        case dtype::float32:
            lo = -static_cast<double>(std::numeric_limits<float>::max());
            hi = static_cast<double>(std::numeric_limits<float>::max());
            return;
        case dtype::float64:
            lo = std::numeric_limits<double>::lowest();
            hi = std::numeric_limits<double>::max();
            return;
    }
}

std::int64_t element_count(const shape_t& shape) {
    std::int64_t count = 1;
    for (std::int64_t dim : shape) {
        if (dim < 0) {
            throw std::invalid_argument("element_count: negative dimension in shape " + shape_repr(shape));
        }
        if (dim != 0 && count > std::numeric_limits<std::int64_t>::max() / dim) {
            throw std::invalid_argument("element_count: shape " + shape_repr(shape) + " overflows int64");
        }
        count *= dim;
    }
    return count;
}

std::string shape_repr(const shape_t& shape) {
    std::ostringstream out;
    out << '(';
    for (std::size_t i = 0; i < shape.size(); ++i) {
        if (i > 0) {
            out << ", ";
        }
        out << shape[i];
    }
    if (shape.size() == 1) {
        out << ',';
    }
    out << ')';
    return out.str();
}

array make_scalar(dtype type, double value) {
    array out;
    out.type = type;
    out.data.push_back(value);
    return out;
}

array make_array(dtype type, shape_t shape, std::vector<double> data) {
    const std::int64_t expected = element_count(shape);
    if (static_cast<std::int64_t>(data.size()) != expected) {
        throw std::invalid_argument("make_array: data size " + std::to_string(data.size()) +
                                    " does not match shape " + shape_repr(shape));
    }
    array out;
    out.type = type;
    out.shape = std::move(shape);
    out.data = std::move(data);
    return out;
}

array make_zeros(dtype type, shape_t shape) {
    const std::int64_t count = element_count(shape);
    return make_array(type, std::move(shape), std::vector<double>(static_cast<std::size_t>(count), 0.0));
}

array leading_slice(const array& value, std::int64_t index) {
    if (value.shape.empty()) {
        throw std::invalid_argument("leading_slice: scalar has no leading dimension");
    }
    if (index < 0 || index >= value.shape.front()) {
        throw std::out_of_range("leading_slice: index " + std::to_string(index) + " out of range for shape " +
                                shape_repr(value.shape));
    }
    shape_t inner(value.shape.begin() + 1, value.shape.end());
    const std::int64_t stride = element_count(inner);
    const std::size_t begin = static_cast<std::size_t>(index * stride);
    const std::size_t end = begin + static_cast<std::size_t>(stride);
    if (end > value.data.size()) {
        throw std::out_of_range("leading_slice: data shorter than shape " + shape_repr(value.shape));
    }
    array out;
    out.type = value.type;
    out.shape = std::move(inner);
    out.data.assign(value.data.begin() + static_cast<std::ptrdiff_t>(begin),
                    value.data.begin() + static_cast<std::ptrdiff_t>(end));
    return out;
}

bool operator==(const array& a, const array& b) {
    return a.type == b.type && a.shape == b.shape && a.data == b.data;
}

bool operator!=(const array& a, const array& b) {
    return !(a == b);
}

}  // namespace simenv
