#pragma once

#include <algorithm>
#include <chrono>
#include <cstdint>

namespace docgate::runtime {

// Absolute point in time by which a request must answer. Created once by the
// dispatcher and handed down so nested calls share a single budget.
class Deadline {
public:
    using Clock = std::chrono::steady_clock;

    static Deadline after_ms(const std::uint32_t budget_ms) {
        return Deadline(Clock::now() + std::chrono::milliseconds(budget_ms));
    }

    explicit Deadline(Clock::time_point at) : at_(at) {}

    bool expired() const { return Clock::now() >= at_; }

    std::uint32_t remaining_ms() const {
        const auto left = std::chrono::duration_cast<std::chrono::milliseconds>(
                              at_ - Clock::now())
                              .count();
        return static_cast<std::uint32_t>(std::max<std::int64_t>(left, 0));
    }

    // Never extends the deadline, only tightens it.
    Deadline capped_ms(const std::uint32_t cap_ms) const {
        return Deadline(std::min(at_, Clock::now() + std::chrono::milliseconds(cap_ms)));
    }

    Clock::time_point at() const { return at_; }

private:
    Clock::time_point at_;
};

}  // namespace docgate::runtime
