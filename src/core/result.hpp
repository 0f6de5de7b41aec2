#pragma once

#include <optional>
#include <string>
#include <variant>

namespace nbfs {

enum class ErrorKind {
    NotFound,
    IsADirectory,
    NotADirectory,
    ParseError,
    ReadOnly,
    Io,
    Config,
};

const char* error_kind_name(ErrorKind kind);

struct Error {
    ErrorKind kind = ErrorKind::Io;
    std::string message;

    Error() = default;
    explicit Error(std::string msg) : message(std::move(msg)) {}
    Error(ErrorKind k, std::string msg) : kind(k), message(std::move(msg)) {}
};

/// Simple Result type: holds either a value of type T or an Error.
/// For void results, use Result<void>.
template <typename T>
class Result {
public:
    Result(T value) : data_(std::move(value)) {}
    Result(Error err) : data_(std::move(err)) {}

    bool ok() const { return std::holds_alternative<T>(data_); }
    explicit operator bool() const { return ok(); }

    const T& value() const { return std::get<T>(data_); }
    T& value() { return std::get<T>(data_); }

    const Error& error() const { return std::get<Error>(data_); }

private:
    std::variant<T, Error> data_;
};

/// Specialization for void results.
template <>
class Result<void> {
public:
    Result() : err_(std::nullopt) {}
    Result(Error err) : err_(std::move(err)) {}

    bool ok() const { return !err_.has_value(); }
    explicit operator bool() const { return ok(); }

    const Error& error() const { return err_.value(); }

private:
    std::optional<Error> err_;
};

inline const char* error_kind_name(ErrorKind kind) {
    switch (kind) {
    case ErrorKind::NotFound:      return "not found";
    case ErrorKind::IsADirectory:  return "is a directory";
    case ErrorKind::NotADirectory: return "not a directory";
    case ErrorKind::ParseError:    return "parse error";
    case ErrorKind::ReadOnly:      return "read-only filesystem";
    case ErrorKind::Io:            return "i/o error";
    case ErrorKind::Config:        return "configuration error";
    }
    return "unknown";
}

} // namespace nbfs
