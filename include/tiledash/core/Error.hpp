#pragma once

/**
 * @file Error.hpp
 * @brief Error values returned by the container tree
 *
 * Nothing in tiledash throws for configuration or geometry problems.
 * Operations return a Status (success or one Error) or a Result<T>
 * (a value or one Error) and the caller decides what to do with it.
 */

#include <optional>
#include <string>
#include <utility>
#include <variant>

namespace tdash {

enum class ErrorKind {
    ConfigurationError,
    GeometryError
};

std::string errorKindToString(ErrorKind kind);

struct Error {
    ErrorKind kind{ErrorKind::ConfigurationError};
    std::string message;
    std::string container_id;   // empty when the container has no id

    std::string toString() const;
};

Error configurationError(std::string message, std::string container_id = {});

Error geometryError(std::string message, std::string container_id = {});

class Status {
public:
    Status() = default;
    Status(Error error) : error_(std::move(error)) {}

    static Status ok() { return Status(); }

    inline bool isOk() const { return !error_.has_value(); }
    explicit operator bool() const { return isOk(); }

    const Error& error() const { return *error_; }

private:
    std::optional<Error> error_;
};

template <typename T>
class Result {
public:
    Result(T value) : data_(std::move(value)) {}
    Result(Error error) : data_(std::move(error)) {}

    inline bool isOk() const { return std::holds_alternative<T>(data_); }
    explicit operator bool() const { return isOk(); }

    T& value() & { return std::get<T>(data_); }
    const T& value() const& { return std::get<T>(data_); }
    T&& value() && { return std::get<T>(std::move(data_)); }

    const Error& error() const { return std::get<Error>(data_); }

    Status status() const {
        if (isOk()) return Status::ok();
        return Status(error());
    }

private:
    std::variant<T, Error> data_;
};

}
