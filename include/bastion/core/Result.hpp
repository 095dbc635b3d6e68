#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <utility>
#include <variant>

namespace bastion {

enum class ErrorCode : uint8_t {
    Validation,              // bad input type or range, surfaced to caller
    Configuration,           // malformed config or pattern file
    TransientCollaborator,   // classifier or audit store unavailable
    StateConflict,           // review already resolved
    NotFound
};

inline const char* error_code_str(ErrorCode c) noexcept {
    switch (c) {
        case ErrorCode::Validation:            return "validation";
        case ErrorCode::Configuration:         return "configuration";
        case ErrorCode::TransientCollaborator: return "transient_collaborator";
        case ErrorCode::StateConflict:         return "state_conflict";
        case ErrorCode::NotFound:              return "not_found";
        default: return "unknown";
    }
}

struct Error {
    ErrorCode   code;
    std::string message;

    std::string describe() const {
        return std::string(error_code_str(code)) + ": " + message;
    }
};

inline Error makeError(ErrorCode code, std::string message) {
    return Error{code, std::move(message)};
}

// ---------------------------------------------------------------------------
// Value-or-error return. Callers must check ok() before value().
// ---------------------------------------------------------------------------
template<typename T>
class Result {
public:
    Result(T value) : v_(std::move(value)) {}
    Result(Error err) : v_(std::move(err)) {}

    [[nodiscard]] bool ok() const noexcept { return std::holds_alternative<T>(v_); }
    explicit operator bool() const noexcept { return ok(); }

    const T& value() const& { return std::get<T>(v_); }
    T& value() & { return std::get<T>(v_); }
    T&& value() && { return std::get<T>(std::move(v_)); }

    const Error& error() const { return std::get<Error>(v_); }

    const T* operator->() const { return &std::get<T>(v_); }
    const T& operator*() const { return std::get<T>(v_); }

private:
    std::variant<T, Error> v_;
};

class Status {
public:
    Status() = default;
    Status(Error err) : err_(std::move(err)) {}

    static Status success() { return Status(); }

    [[nodiscard]] bool ok() const noexcept { return !err_.has_value(); }
    explicit operator bool() const noexcept { return ok(); }

    const Error& error() const { return *err_; }

private:
    std::optional<Error> err_;
};

} // namespace bastion
