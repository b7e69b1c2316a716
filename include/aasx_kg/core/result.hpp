#pragma once

#include <cassert>
#include <optional>
#include <ostream>
#include <string>
#include <type_traits>
#include <utility>
#include <variant>

namespace aasx_kg {

// ---------------------------------------------------------------------------
// Result<T, E> — holds either a value or an error. Every fallible operation
// in the engine returns one; exceptions from third-party parsers are caught
// at the call site and converted.
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

    [[nodiscard]] const E& Error() const& {
        assert(IsErr() && "Error() called on an Ok Result");
        return std::get<1>(storage_);
    }

    [[nodiscard]] T Value() && {
        assert(IsOk() && "Value() called on an Err Result");
        return std::get<0>(std::move(storage_));
    }

    [[nodiscard]] E Error() && {
        assert(IsErr() && "Error() called on an Ok Result");
        return std::get<1>(std::move(storage_));
    }

    [[nodiscard]] T ValueOr(T default_value) const& {
        return IsOk() ? std::get<0>(storage_) : std::move(default_value);
    }

    [[nodiscard]] T ValueOr(T default_value) && {
        return IsOk() ? std::get<0>(std::move(storage_)) : std::move(default_value);
    }

    // fn: T -> Result<U, E>
    template <typename Fn>
    auto AndThen(Fn&& fn) const& -> std::invoke_result_t<Fn, const T&> {
        using ReturnType = std::invoke_result_t<Fn, const T&>;
        if (IsOk()) {
            return std::forward<Fn>(fn)(std::get<0>(storage_));
        }
        return ReturnType::Err(std::get<1>(storage_));
    }

    template <typename Fn>
    auto AndThen(Fn&& fn) && -> std::invoke_result_t<Fn, T&&> {
        using ReturnType = std::invoke_result_t<Fn, T&&>;
        if (IsOk()) {
            return std::forward<Fn>(fn)(std::get<0>(std::move(storage_)));
        }
        return ReturnType::Err(std::get<1>(std::move(storage_)));
    }

    // fn: T -> U
    template <typename Fn>
    auto Map(Fn&& fn) const& -> Result<std::invoke_result_t<Fn, const T&>, E> {
        using U = std::invoke_result_t<Fn, const T&>;
        if (IsOk()) {
            return Result<U, E>::Ok(std::forward<Fn>(fn)(std::get<0>(storage_)));
        }
        return Result<U, E>::Err(std::get<1>(storage_));
    }

    // fn: E -> F. Used to lift validation strings into structured errors.
    template <typename Fn>
    auto MapError(Fn&& fn) && -> Result<T, std::invoke_result_t<Fn, E&&>> {
        using F = std::invoke_result_t<Fn, E&&>;
        if (IsOk()) {
            return Result<T, F>::Ok(std::get<0>(std::move(storage_)));
        }
        return Result<T, F>::Err(std::forward<Fn>(fn)(std::get<1>(std::move(storage_))));
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

template <typename E>
class Result<void, E> {
public:
    static Result Ok() { return Result(OkTag{}); }

    static Result Err(const E& error) { return Result(ErrTag{}, error); }
    static Result Err(E&& error) { return Result(ErrTag{}, std::move(error)); }

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
    struct OkTag {};
    struct ErrTag {};

    explicit Result(OkTag) : error_(std::nullopt) {}
    Result(ErrTag, const E& error) : error_(error) {}
    Result(ErrTag, E&& error) : error_(std::move(error)) {}

    std::optional<E> error_;
};

// ---------------------------------------------------------------------------
// ErrorCategory — classifies failures for exit codes and diagnostics.
// ---------------------------------------------------------------------------
enum class ErrorCategory {
    NotFound,
    InvalidContainerFormat,
    EntryParseFailure,
    SchemaMismatch,
    ImportValidationFailure,
    ConnectionFailure,
    Authentication,
    QueryExecutionFailure,
    Configuration,
    Internal,
};

// ---------------------------------------------------------------------------
// Error — structured error for extraction, import and query operations.
//
// `target` names what the operation worked on: a container path, an entry
// name inside a container, a graph file or a store endpoint.
// ---------------------------------------------------------------------------
struct Error {
    std::string operation;
    std::string target;
    std::optional<int> http_status;
    std::string message;
    std::optional<std::string> store_error;
    ErrorCategory category = ErrorCategory::Internal;
    std::optional<std::string> query;

    /// Map a graph-store HTTP status to an Error. Pulls the first
    /// `errors[].message` out of a JSON response body when present.
    static Error FromHttpStatus(const std::string& operation,
                                const std::string& endpoint,
                                int status_code,
                                const std::string& response_body = "");

    [[nodiscard]] int ExitCode() const;
    [[nodiscard]] std::string CategoryName() const;
    [[nodiscard]] std::string ToString() const;
    [[nodiscard]] std::string ToJson() const;

    friend std::ostream& operator<<(std::ostream& os, const Error& e) {
        return os << e.ToString();
    }

    bool operator==(const Error& other) const {
        return operation == other.operation &&
               target == other.target &&
               http_status == other.http_status &&
               message == other.message &&
               store_error == other.store_error &&
               category == other.category &&
               query == other.query;
    }

    bool operator!=(const Error& other) const {
        return !(*this == other);
    }
};

/// snake_case name of a category ("entry_parse_failure", ...).
std::string CategoryName(ErrorCategory category);

// ---------------------------------------------------------------------------
// Diagnostic — a recovered, non-fatal failure reported beside results.
// ---------------------------------------------------------------------------
struct Diagnostic {
    ErrorCategory category = ErrorCategory::Internal;
    std::string target;
    std::string message;

    static Diagnostic FromError(const Error& error) {
        return Diagnostic{error.category, error.target, error.message};
    }
};

} // namespace aasx_kg
