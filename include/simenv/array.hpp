#pragma once

#include <cstddef>
#include <cstdint>
#include <map>
#include <string>
#include <string_view>
#include <vector>

namespace simenv {

enum class dtype {
    uint8,
    int32,
    int64,
    float32,
    float64
};

using shape_t = std::vector<std::int64_t>;

// Row-major n-d array. Elements are held as double regardless of dtype; the
// dtype states what the values must be representable as.
struct array {
    dtype type = dtype::float64;
    shape_t shape{};
    std::vector<double> data{};

    [[nodiscard]] std::size_t size() const noexcept { return data.size(); }
    [[nodiscard]] bool is_scalar() const noexcept { return shape.empty(); }
};

using array_map = std::map<std::string, array>;

const char* dtype_name(dtype type) noexcept;
[[nodiscard]] bool parse_dtype(std::string_view name, dtype& out) noexcept;
[[nodiscard]] bool is_integer_dtype(dtype type) noexcept;
void dtype_range(dtype type, double& lo, double& hi) noexcept;

[[nodiscard]] std::int64_t element_count(const shape_t& shape);
std::string shape_repr(const shape_t& shape);

array make_scalar(dtype type, double value);
array make_array(dtype type, shape_t shape, std::vector<double> data);
array make_zeros(dtype type, shape_t shape);

// Sub-array at `index` along the leading dimension.
array leading_slice(const array& value, std::int64_t index);

bool operator==(const array& a, const array& b);
bool operator!=(const array& a, const array& b);

}  // namespace simenv
