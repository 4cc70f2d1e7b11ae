#pragma once

#include <mcp_host/process/process_runner.hpp>

#include <deque>
#include <memory>
#include <string>
#include <vector>

namespace mcp_host {
namespace testing {

// ---------------------------------------------------------------------------
// MockProcessRunner - stands in for RunProcess behind an invoker.
//
// Usage:
//   MockProcessRunner runner;
//   runner.EnqueueExit(1, "", "boom");
//   runner.EnqueueExit(0, "{\"ok\":true}");
//   ExecutableInvoker invoker(spec, 5.0, runner.Fn());
//   ...
//   CHECK(runner.Calls().size() == 2);
//
// Outcomes are consumed FIFO; an empty queue answers exit 0 with no output.
// The state is shared, so Fn() stays valid after the mock is copied into
// an invoker.
// ---------------------------------------------------------------------------
class MockProcessRunner {
public:
    struct Call {
        std::vector<std::string> argv;
        double budget_seconds = 0.0;
    };

    void EnqueueExit(int code, std::string stdout_text = {}, std::string stderr_text = {}) {
        ProcessOutput output;
        output.returncode = code;
        output.stdout_text = std::move(stdout_text);
        output.stderr_text = std::move(stderr_text);
        state_->outcomes.push_back(Result<ProcessOutput, Error>::Ok(std::move(output)));
    }

    void EnqueueTimeout() {
        ProcessOutput output;
        output.timed_out = true;
        state_->outcomes.push_back(Result<ProcessOutput, Error>::Ok(std::move(output)));
    }

    void EnqueueStartError(const std::string& message) {
        state_->outcomes.push_back(Result<ProcessOutput, Error>::Err(
            Error::Make("RunProcess", "mock", message, ErrorCategory::Start)));
    }

    [[nodiscard]] ProcessRunnerFn Fn() const {
        auto state = state_;
        return [state](const std::vector<std::string>& argv, const Deadline& deadline) {
            state->calls.push_back(Call{argv, deadline.BudgetSeconds()});
            if (state->outcomes.empty()) {
                ProcessOutput output;
                output.command = argv;
                output.returncode = 0;
                output.timeout_seconds = deadline.BudgetSeconds();
                return Result<ProcessOutput, Error>::Ok(std::move(output));
            }
            auto outcome = std::move(state->outcomes.front());
            state->outcomes.pop_front();
            if (outcome.IsOk()) {
                auto output = std::move(outcome).Value();
                output.command = argv;
                output.timeout_seconds = deadline.BudgetSeconds();
                return Result<ProcessOutput, Error>::Ok(std::move(output));
            }
            return outcome;
        };
    }

    [[nodiscard]] const std::vector<Call>& Calls() const { return state_->calls; }

private:
    struct State {
        std::deque<Result<ProcessOutput, Error>> outcomes;
        std::vector<Call> calls;
    };
    std::shared_ptr<State> state_ = std::make_shared<State>();
};

} // namespace testing
} // namespace mcp_host
