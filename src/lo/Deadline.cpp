#include "lo/Deadline.hpp"
#include "lo/Error.hpp"

#include <algorithm>

namespace pglo::lo {

Deadline::Deadline(const std::chrono::milliseconds budget) : budget_(budget), start_(Clock::now()) {}

bool Deadline::expired() const {
    if (budget_.count() <= 0) return false;
    return Clock::now() - start_ >= budget_;
}

std::chrono::milliseconds Deadline::remaining() const {
    if (budget_.count() <= 0) return std::chrono::milliseconds::max();
    const auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(Clock::now() - start_);
    return std::max(budget_ - elapsed, std::chrono::milliseconds::zero());
}

void Deadline::check(const std::string& ctx) const {
    if (expired())
        throw Error(ErrorKind::Timeout, ctx, "exceeded time budget of " + std::to_string(budget_.count()) + " ms");
}

}
