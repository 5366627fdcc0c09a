/**
 * @file Result.hpp
 * @brief Value-or-error return type used instead of exceptions.
 *
 * Every fallible operation in the project returns a Result. The error side
 * carries a human readable message and an ErrorCode that callers map to
 * their own reporting (see RecordingSession's Status).
 */

#pragma once
#include <optional>
#include <string>
#include <utility>
#include <variant>

namespace mw {

enum class ErrorCode {
    Unknown,
    Device, // GPU backend or GPU object creation
    Codec,  // codec lookup, open, send or receive
    Format, // pixel/sample layout not supported
    State,  // call made in the wrong lifecycle state
    Io      // output file cannot be opened or written
};

struct Error {
    std::string message;
    ErrorCode code{ErrorCode::Unknown};
};

template <typename T>
class Result {
public:
    static Result ok(T value) {
        return Result(std::move(value));
    }
    static Result err(std::string message,
                      ErrorCode code = ErrorCode::Unknown) {
        return Result(Error{std::move(message), code});
    }
    static Result err(Error error) {
        return Result(std::move(error));
    }

    bool isOk() const {
        return std::holds_alternative<T>(data_);
    }
    bool isErr() const {
        return !isOk();
    }
    explicit operator bool() const {
        return isOk();
    }

    T& value() {
        return std::get<T>(data_);
    }
    const T& value() const {
        return std::get<T>(data_);
    }
    T& operator*() {
        return value();
    }
    const T& operator*() const {
        return value();
    }
    T* operator->() {
        return &value();
    }
    const T* operator->() const {
        return &value();
    }

    const Error& error() const {
        return std::get<Error>(data_);
    }

private:
    explicit Result(T value) : data_(std::move(value)) {
    }
    explicit Result(Error error) : data_(std::move(error)) {
    }

    std::variant<T, Error> data_;
};

template <>
class Result<void> {
public:
    static Result ok() {
        return Result();
    }
    static Result err(std::string message,
                      ErrorCode code = ErrorCode::Unknown) {
        return Result(Error{std::move(message), code});
    }
    static Result err(Error error) {
        return Result(std::move(error));
    }

    bool isOk() const {
        return !error_.has_value();
    }
    bool isErr() const {
        return error_.has_value();
    }
    explicit operator bool() const {
        return isOk();
    }

    const Error& error() const {
        return *error_;
    }

private:
    Result() = default;
    explicit Result(Error error) : error_(std::move(error)) {
    }

    std::optional<Error> error_;
};

inline const char* errorCodeName(ErrorCode code) {
    switch (code) {
    case ErrorCode::Device:
        return "DeviceError";
    case ErrorCode::Codec:
        return "CodecError";
    case ErrorCode::Format:
        return "FormatError";
    case ErrorCode::State:
        return "StateError";
    case ErrorCode::Io:
        return "IoError";
    case ErrorCode::Unknown:
        break;
    }
    return "Error";
}

} // namespace mw
