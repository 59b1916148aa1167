#pragma once

#include <string>
#include <utility>
#include <variant>

namespace pmx {

enum class ErrorKind {
    INSUFFICIENT_DATA,   // Fewer points than the computation needs
    INVALID_INPUT,       // Non-finite / out-of-range values, bad parameters
    UNFILLABLE,          // Depth walk exhausted before the requested size
    UPSTREAM_DATA_GAP    // Caller supplied empty or missing data
};

struct Error {
    ErrorKind kind;
    std::string message;

    Error(ErrorKind k, std::string msg) : kind(k), message(std::move(msg)) {}
};

std::string to_string(ErrorKind kind);

template<typename T>
class Result {
private:
    std::variant<T, Error> value_;

public:
    explicit Result(T value) : value_(std::move(value)) {}
    explicit Result(Error error) : value_(std::move(error)) {}

    static Result<T> success(T value) {
        return Result<T>(std::move(value));
    }

    static Result<T> error(Error error) {
        return Result<T>(std::move(error));
    }

    static Result<T> error(ErrorKind kind, std::string message) {
        return Result<T>(Error(kind, std::move(message)));
    }

    bool is_success() const {
        return std::holds_alternative<T>(value_);
    }

    bool is_error() const {
        return std::holds_alternative<Error>(value_);
    }

    bool is_error(ErrorKind kind) const {
        return is_error() && error().kind == kind;
    }

    const T& value() const {
        return std::get<T>(value_);
    }

    T& value() {
        return std::get<T>(value_);
    }

    const Error& error() const {
        return std::get<Error>(value_);
    }

    T value_or(T default_value) const {
        if (is_success()) {
            return value();
        }
        return default_value;
    }

    template<typename F>
    auto map(F&& f) const -> Result<decltype(f(value()))> {
        if (is_success()) {
            return Result<decltype(f(value()))>::success(f(value()));
        }
        return Result<decltype(f(value()))>::error(error());
    }

    template<typename F>
    auto and_then(F&& f) const -> decltype(f(value())) {
        if (is_success()) {
            return f(value());
        }
        return decltype(f(value()))::error(error());
    }
};

// One item of a batch computation. A failing item keeps its slot.
template<typename T>
struct BatchSlot {
    std::string item_id;
    Result<T> outcome;

    BatchSlot(std::string id, Result<T> result)
        : item_id(std::move(id)), outcome(std::move(result)) {}
};

} // namespace pmx
