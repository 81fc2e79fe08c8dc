#pragma once

#include <cassert>
#include <iosfwd>
#include <optional>
#include <string>
#include <type_traits>
#include <utility>
#include <variant>

namespace synthetic_mcp {

// ---------------------------------------------------------------------------
// Result<T, E>: either a T or an E. Accessing the wrong side is a programming
// error and asserts in debug builds.
// ---------------------------------------------------------------------------
template <typename T, typename E>
class Result {
    static constexpr std::size_t kValue = 0;
    static constexpr std::size_t kError = 1;

public:
    template <typename U = T>
    static Result Ok(U&& value) {
        return Result(std::in_place_index<kValue>, std::forward<U>(value));
    }

    template <typename U = E>
    static Result Err(U&& error) {
        return Result(std::in_place_index<kError>, std::forward<U>(error));
    }

    [[nodiscard]] bool IsOk() const noexcept { return storage_.index() == kValue; }
    [[nodiscard]] bool IsErr() const noexcept { return !IsOk(); }
    explicit operator bool() const noexcept { return IsOk(); }

    [[nodiscard]] const T& Value() const& {
        assert(IsOk());
        return std::get<kValue>(storage_);
    }
    [[nodiscard]] T Value() && {
        assert(IsOk());
        return std::get<kValue>(std::move(storage_));
    }

    [[nodiscard]] const E& Error() const& {
        assert(IsErr());
        return std::get<kError>(storage_);
    }
    [[nodiscard]] E Error() && {
        assert(IsErr());
        return std::get<kError>(std::move(storage_));
    }

    [[nodiscard]] T ValueOr(T fallback) const& {
        return IsOk() ? std::get<kValue>(storage_) : std::move(fallback);
    }

    /// Chain a step that can fail: fn(T) -> Result<U, E>.
    template <typename Fn>
    auto AndThen(Fn&& fn) && -> std::invoke_result_t<Fn, T&&> {
        using Next = std::invoke_result_t<Fn, T&&>;
        if (IsErr()) {
            return Next::Err(std::get<kError>(std::move(storage_)));
        }
        return std::forward<Fn>(fn)(std::get<kValue>(std::move(storage_)));
    }

    /// Transform the value: fn(T) -> U.
    template <typename Fn>
    auto Map(Fn&& fn) && -> Result<std::invoke_result_t<Fn, T&&>, E> {
        using Next = Result<std::invoke_result_t<Fn, T&&>, E>;
        if (IsErr()) {
            return Next::Err(std::get<kError>(std::move(storage_)));
        }
        return Next::Ok(std::forward<Fn>(fn)(std::get<kValue>(std::move(storage_))));
    }

private:
    template <std::size_t I, typename U>
    Result(std::in_place_index_t<I> side, U&& payload)
        : storage_(side, std::forward<U>(payload)) {}

    std::variant<T, E> storage_;
};

// Success carries nothing; only the error side is stored.
template <typename E>
class Result<void, E> {
public:
    static Result Ok() { return Result(std::nullopt); }

    template <typename U = E>
    static Result Err(U&& error) {
        return Result(std::optional<E>(std::forward<U>(error)));
    }

    [[nodiscard]] bool IsOk() const noexcept { return !error_; }
    [[nodiscard]] bool IsErr() const noexcept { return error_.has_value(); }
    explicit operator bool() const noexcept { return IsOk(); }

    [[nodiscard]] const E& Error() const& {
        assert(IsErr());
        return *error_;
    }
    [[nodiscard]] E Error() && {
        assert(IsErr());
        return std::move(*error_);
    }

private:
    explicit Result(std::optional<E> error) : error_(std::move(error)) {}

    std::optional<E> error_;
};

// Where a failure originated. The protocol loop maps it onto JSON-RPC codes
// and the bootstrap onto a process exit code.
enum class ErrorCategory {
    Configuration,
    Parse,
    InvalidInvocation,
    CapabilityNotFound,
    ExecutionFailed,
    OperationCanceled,
    Upstream,
    Connection,
    Timeout,
    Internal,
};

struct Error {
    std::string operation;   // e.g. "SyntheticSearch", "LoadFromYaml"
    std::string endpoint;    // request path or file, empty when not applicable
    std::optional<int> http_status;
    std::string message;
    ErrorCategory category = ErrorCategory::Internal;

    /// Non-2xx reply from the search API. The message embeds the status code
    /// and the raw response body; 408 and 504 count as timeouts.
    static Error FromHttpStatus(const std::string& operation,
                                const std::string& endpoint,
                                int status_code,
                                const std::string& response_body = "");

    static Error Canceled(const std::string& operation);

    [[nodiscard]] int ExitCode() const;
    [[nodiscard]] std::string CategoryName() const;

    /// "operation [endpoint] (HTTP status): message", omitting empty parts.
    [[nodiscard]] std::string ToString() const;

    bool operator==(const Error& other) const;
    bool operator!=(const Error& other) const { return !(*this == other); }
};

std::ostream& operator<<(std::ostream& os, const Error& error);

} // namespace synthetic_mcp
