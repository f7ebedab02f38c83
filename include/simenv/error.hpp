#pragma once

#include <stdexcept>
#include <string>

namespace simenv {

class simenv_error : public std::runtime_error {
public:
    explicit simenv_error(const std::string& message) : std::runtime_error(message) {}
};

class schema_violation : public simenv_error {
public:
    schema_violation(const std::string& spec_name, const std::string& message)
        : simenv_error(spec_name + ": " + message), spec_name_(spec_name) {}

    [[nodiscard]] const std::string& spec_name() const noexcept { return spec_name_; }

private:
    std::string spec_name_;
};

}  // namespace simenv
