#include "simenv/logging.hpp"

#include <sstream>
#include <utility>

namespace simenv {

memory_log_sink::memory_log_sink(std::size_t capacity_records, log_level min_level)
    : capacity_(capacity_records), min_level_(min_level) {}

void memory_log_sink::write(const log_record& rec) {
    if (rec.level < min_level_) {
        return;
    }
    std::lock_guard<std::mutex> lock(mutex_);
    log_record copy = rec;
    copy.sequence = ++sequence_;
    if (capacity_ == 0) {
        ++evicted_;
        return;
    }
    while (records_.size() >= capacity_) {
        records_.pop_front();
        ++evicted_;
    }
    records_.push_back(std::move(copy));
}

std::vector<log_record> memory_log_sink::snapshot() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return {records_.begin(), records_.end()};
}

std::size_t memory_log_sink::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return records_.size();
}

std::uint64_t memory_log_sink::evicted() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return evicted_;
}

void memory_log_sink::clear() {
    std::lock_guard<std::mutex> lock(mutex_);
    records_.clear();
}

const char* log_level_name(log_level level) noexcept {
    switch (level) {
        case log_level::debug:
            return "debug";
        case log_level::info:
            return "info";
        case log_level::warn:
            return "warn";
        case log_level::error:
            return "error";
    }
    return "unknown";
}

std::string format_log_records(const std::vector<log_record>& records) {
    std::ostringstream out;
    for (const log_record& rec : records) {
        out << rec.sequence << " level=" << log_level_name(rec.level) << " ts_ns="
            << std::chrono::duration_cast<std::chrono::nanoseconds>(rec.ts.time_since_epoch()).count()
            << " episode=" << rec.episode_index << " step=" << rec.step_index << " category=" << rec.category
            << " msg=" << rec.message << '\n';
    }
    return out.str();
}

}  // namespace simenv
