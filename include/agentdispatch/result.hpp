#pragma once

#include <optional>
#include <stdexcept>
#include <string>
#include <utility>

namespace agentdispatch {

// Failure taxonomy used when composing routing and execution steps
enum class ErrorKind {
    Validation,        // unknown agent type, malformed decision
    Collaborator,      // LLM call or agent failed
    Synthesis,         // combining primary and secondary results failed
    NoSuitableAgent,   // distributed selection found no candidate
    TerminalFallback   // the last-resort handler itself failed
};

inline const char* to_string(ErrorKind k) {
    switch (k) {
        case ErrorKind::Validation:       return "Validation";
        case ErrorKind::Collaborator:     return "Collaborator";
        case ErrorKind::Synthesis:        return "Synthesis";
        case ErrorKind::NoSuitableAgent:  return "NoSuitableAgent";
        case ErrorKind::TerminalFallback: return "TerminalFallback";
    }
    return "Unknown";
}

struct Error {
    ErrorKind kind{ErrorKind::Collaborator};
    std::string message;
};

template <typename T>
class Result {
public:
    static Result success(T value) {
        Result r;
        r.value_ = std::move(value);
        return r;
    }

    static Result failure(ErrorKind kind, std::string message) {
        Result r;
        r.error_ = Error{kind, std::move(message)};
        return r;
    }

    static Result failure(Error error) {
        Result r;
        r.error_ = std::move(error);
        return r;
    }

    bool ok() const noexcept { return value_.has_value(); }
    explicit operator bool() const noexcept { return ok(); }

    T& value() {
        if (!value_) throw std::logic_error("Result has no value: " + error_->message);
        return *value_;
    }

    const T& value() const {
        if (!value_) throw std::logic_error("Result has no value: " + error_->message);
        return *value_;
    }

    const Error& error() const {
        if (!error_) throw std::logic_error("Result holds a value, not an error");
        return *error_;
    }

    ErrorKind kind() const { return error().kind; }
    const std::string& message() const { return error().message; }

private:
    Result() = default;

    std::optional<T> value_;
    std::optional<Error> error_;
};

} // namespace agentdispatch
