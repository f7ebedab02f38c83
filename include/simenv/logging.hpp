#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <deque>
#include <mutex>
#include <string>
#include <vector>

namespace simenv {

enum class log_level {
    debug,
    info,
    warn,
    error
};

struct log_record {
    std::uint64_t sequence = 0;
    std::chrono::steady_clock::time_point ts{};
    log_level level = log_level::info;
    std::uint64_t episode_index = 0;
    std::uint64_t step_index = 0;
    std::string category;
    std::string message;
};

class log_sink {
public:
    virtual ~log_sink() = default;
    virtual void write(const log_record& rec) = 0;
};

// Bounded in-memory sink. Records below min_level are ignored; once full the
// oldest record is evicted.
class memory_log_sink final : public log_sink {
public:
    explicit memory_log_sink(std::size_t capacity_records, log_level min_level = log_level::debug);

    void write(const log_record& rec) override;
    std::vector<log_record> snapshot() const;
    std::size_t size() const;
    std::size_t capacity() const noexcept { return capacity_; }
    std::uint64_t evicted() const;
    log_level min_level() const noexcept { return min_level_; }
    void clear();

private:
    std::size_t capacity_;
    log_level min_level_;
    std::deque<log_record> records_;
    std::uint64_t sequence_ = 0;
    std::uint64_t evicted_ = 0;
    mutable std::mutex mutex_;
};

const char* log_level_name(log_level level) noexcept;
std::string format_log_records(const std::vector<log_record>& records);

}  // namespace simenv
