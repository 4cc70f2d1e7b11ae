#pragma once

#include <chrono>
#include <string>

namespace mcp_host {

// ---------------------------------------------------------------------------
// Deadline - a point on the steady clock after which a blocking process or
// pipe operation gives up. Every wait in process/ and session/ takes one, and
// the operation that observes expiry is the one that kills the child.
// ---------------------------------------------------------------------------
class Deadline {
public:
    using Clock = std::chrono::steady_clock;

    /// Budgets above this (one year) are treated as Never(), so the
    /// conversion to clock ticks cannot overflow.
    static constexpr double kMaxBudgetSeconds = 365.0 * 24 * 60 * 60;

    static Deadline After(std::chrono::milliseconds budget);
    static Deadline AfterSeconds(double seconds);
    static Deadline Never();

    [[nodiscard]] bool IsNever() const noexcept { return never_; }
    [[nodiscard]] bool Expired() const;

    /// Time left, clamped at zero. Never() reports milliseconds::max().
    [[nodiscard]] std::chrono::milliseconds Remaining() const;

    /// Timeout argument for poll(2): at most `slice_ms`, at least 0.
    [[nodiscard]] int PollSliceMs(int slice_ms) const;

    /// The earlier of this deadline and `now + budget`.
    [[nodiscard]] Deadline Tighten(std::chrono::milliseconds budget) const;

    /// Budget this deadline was created with, in seconds (0 for Never()).
    [[nodiscard]] double BudgetSeconds() const noexcept { return budget_seconds_; }

private:
    Deadline(Clock::time_point at, bool never, double budget_seconds)
        : at_(at), never_(never), budget_seconds_(budget_seconds) {}

    Clock::time_point at_;
    bool never_ = false;
    double budget_seconds_ = 0.0;
};

/// "0.5s", "30s" - compact seconds for messages and logs.
[[nodiscard]] std::string FormatSeconds(double seconds);

} // namespace mcp_host
