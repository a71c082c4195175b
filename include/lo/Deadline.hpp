#pragma once

#include <chrono>
#include <string>

namespace pglo::lo {

// Whole-call time budget. A non-positive budget never expires.
class Deadline {
public:
    using Clock = std::chrono::steady_clock;

    explicit Deadline(std::chrono::milliseconds budget);

    [[nodiscard]] bool expired() const;
    [[nodiscard]] std::chrono::milliseconds remaining() const;

    // Throws lo::Error(Timeout) once expired
    void check(const std::string& ctx) const;

private:
    std::chrono::milliseconds budget_;
    Clock::time_point start_;
};

}
