#include <mcp_host/core/deadline.hpp>

#include <algorithm>
#include <sstream>

namespace mcp_host {

Deadline Deadline::After(std::chrono::milliseconds budget) {
    if (budget.count() < 0) {
        budget = std::chrono::milliseconds{0};
    }
    if (budget.count() / 1000 > static_cast<long long>(kMaxBudgetSeconds)) {
        return Never();
    }
    const double seconds = static_cast<double>(budget.count()) / 1000.0;
    return Deadline(Clock::now() + budget, false, seconds);
}

Deadline Deadline::AfterSeconds(double seconds) {
    if (!(seconds > 0.0)) {  // negative or NaN
        seconds = 0.0;
    }
    if (seconds > kMaxBudgetSeconds) {
        return Never();
    }
    const auto budget = std::chrono::duration_cast<Clock::duration>(
        std::chrono::duration<double>(seconds));
    return Deadline(Clock::now() + budget, false, seconds);
}

Deadline Deadline::Never() {
    return Deadline(Clock::time_point::max(), true, 0.0);
}

bool Deadline::Expired() const {
    return !never_ && Clock::now() >= at_;
}

std::chrono::milliseconds Deadline::Remaining() const {
    if (never_) {
        return std::chrono::milliseconds::max();
    }
    const auto now = Clock::now();
    if (now >= at_) {
        return std::chrono::milliseconds{0};
    }
    // Round up so a poll slice never undershoots the deadline to zero early.
    auto left = std::chrono::duration_cast<std::chrono::milliseconds>(at_ - now);
    if (now + left < at_) {
        left += std::chrono::milliseconds{1};
    }
    return left;
}

int Deadline::PollSliceMs(int slice_ms) const {
    if (never_) {
        return slice_ms;
    }
    const auto left = Remaining().count();
    return static_cast<int>(std::clamp<long long>(left, 0, slice_ms));
}

Deadline Deadline::Tighten(std::chrono::milliseconds budget) const {
    auto other = After(budget);
    if (never_ || other.at_ < at_) {
        return other;
    }
    return *this;
}

std::string FormatSeconds(double seconds) {
    std::ostringstream oss;
    oss << seconds << 's';
    return oss.str();
}

} // namespace mcp_host
