#pragma once

#include <cassert>
#include <iosfwd>
#include <optional>
#include <string>
#include <type_traits>
#include <utility>
#include <variant>

namespace mcp_host {

// ---------------------------------------------------------------------------
// Result<T, E> - holds either a value or an error. Expected failures are
// returned through Result; exceptions never cross a module boundary.
// ---------------------------------------------------------------------------
template <typename T, typename E>
class Result {
public:
    static Result Ok(const T& value) { return Result(OkTag{}, value); }
    static Result Ok(T&& value) { return Result(OkTag{}, std::move(value)); }

    static Result Err(const E& error) { return Result(ErrTag{}, error); }
    static Result Err(E&& error) { return Result(ErrTag{}, std::move(error)); }

    [[nodiscard]] bool IsOk() const noexcept { return storage_.index() == 0; }
    [[nodiscard]] bool IsErr() const noexcept { return storage_.index() == 1; }
    explicit operator bool() const noexcept { return IsOk(); }

    [[nodiscard]] const T& Value() const& {
        assert(IsOk() && "Value() called on an Err Result");
        return std::get<0>(storage_);
    }

    [[nodiscard]] T& Value() & {
        assert(IsOk() && "Value() called on an Err Result");
        return std::get<0>(storage_);
    }

    [[nodiscard]] T Value() && {
        assert(IsOk() && "Value() called on an Err Result");
        return std::get<0>(std::move(storage_));
    }

    [[nodiscard]] const E& Error() const& {
        assert(IsErr() && "Error() called on an Ok Result");
        return std::get<1>(storage_);
    }

    [[nodiscard]] E Error() && {
        assert(IsErr() && "Error() called on an Ok Result");
        return std::get<1>(std::move(storage_));
    }

    [[nodiscard]] T ValueOr(T fallback) const& {
        return IsOk() ? std::get<0>(storage_) : std::move(fallback);
    }

    // fn: const T& -> Result<U, E>
    template <typename Fn>
    auto AndThen(Fn&& fn) const& -> std::invoke_result_t<Fn, const T&> {
        using Next = std::invoke_result_t<Fn, const T&>;
        if (IsErr()) {
            return Next::Err(std::get<1>(storage_));
        }
        return std::forward<Fn>(fn)(std::get<0>(storage_));
    }

    // fn: const T& -> U
    template <typename Fn>
    auto Map(Fn&& fn) const& -> Result<std::invoke_result_t<Fn, const T&>, E> {
        using U = std::invoke_result_t<Fn, const T&>;
        if (IsErr()) {
            return Result<U, E>::Err(std::get<1>(storage_));
        }
        return Result<U, E>::Ok(std::forward<Fn>(fn)(std::get<0>(storage_)));
    }

private:
    struct OkTag {};
    struct ErrTag {};

    Result(OkTag, const T& value) : storage_(std::in_place_index<0>, value) {}
    Result(OkTag, T&& value) : storage_(std::in_place_index<0>, std::move(value)) {}
    Result(ErrTag, const E& error) : storage_(std::in_place_index<1>, error) {}
    Result(ErrTag, E&& error) : storage_(std::in_place_index<1>, std::move(error)) {}

    std::variant<T, E> storage_;
};

// Result<void, E> - success carries no value.
template <typename E>
class Result<void, E> {
public:
    static Result Ok() { return Result(); }
    static Result Err(const E& error) { return Result(error); }
    static Result Err(E&& error) { return Result(std::move(error)); }

    [[nodiscard]] bool IsOk() const noexcept { return !error_.has_value(); }
    [[nodiscard]] bool IsErr() const noexcept { return error_.has_value(); }
    explicit operator bool() const noexcept { return IsOk(); }

    [[nodiscard]] const E& Error() const& {
        assert(IsErr() && "Error() called on an Ok Result");
        return *error_;
    }

    [[nodiscard]] E Error() && {
        assert(IsErr() && "Error() called on an Ok Result");
        return std::move(*error_);
    }

private:
    Result() = default;
    explicit Result(const E& error) : error_(error) {}
    explicit Result(E&& error) : error_(std::move(error)) {}

    std::optional<E> error_;
};

// ---------------------------------------------------------------------------
// ErrorCategory - what went wrong, independent of where.
// ---------------------------------------------------------------------------
enum class ErrorCategory {
    Validation,     // arguments rejected before anything was spawned
    NotFound,       // no candidate executable exists
    Start,          // process could not be spawned
    Protocol,       // malformed line, RPC error response, id mismatch
    Timeout,        // deadline exceeded, child force-killed
    NonZeroExit,    // process ran and exited with failure status
    BrokenPipe,     // child went away while we were writing to it
    SessionClosed,  // call on a terminated session
    Config,
    Planner,
    Internal,
};

// ---------------------------------------------------------------------------
// Error - structured error for process, protocol and configuration failures.
// ---------------------------------------------------------------------------
struct Error {
    std::string operation;   // e.g. "ToolServerSession::Call"
    std::string target;      // tool name or command, may be empty
    std::string message;
    ErrorCategory category = ErrorCategory::Internal;
    std::optional<int> rpc_code;             // JSON-RPC error code, if any
    std::optional<std::string> stderr_text;  // captured child diagnostics

    static Error Make(std::string operation, std::string target,
                      std::string message, ErrorCategory category);

    /// Build a Protocol error from a JSON-RPC error object {code, message}.
    static Error FromRpcError(const std::string& operation,
                              const std::string& target,
                              int code,
                              const std::string& message);

    [[nodiscard]] int ExitCode() const;
    [[nodiscard]] std::string CategoryName() const;
    [[nodiscard]] std::string ToString() const;
    [[nodiscard]] std::string ToJson() const;

    friend std::ostream& operator<<(std::ostream& os, const Error& e);

    bool operator==(const Error& other) const {
        return operation == other.operation &&
               target == other.target &&
               message == other.message &&
               category == other.category &&
               rpc_code == other.rpc_code &&
               stderr_text == other.stderr_text;
    }

    bool operator!=(const Error& other) const { return !(*this == other); }
};

/// Stable snake_case name of a category ("timeout", "not_found", ...).
[[nodiscard]] const char* ErrorCategoryName(ErrorCategory category);

/// Process exit code the CLI uses for a category (2..10, 99 for Internal).
[[nodiscard]] int ErrorCategoryExitCode(ErrorCategory category);

} // namespace mcp_host
