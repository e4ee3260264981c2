#pragma once

#include <filesystem>
#include <string>
#include <string_view>
#include <system_error>
#include <utility>
#include <variant>

namespace fc::fs::model {

enum class ErrorKind {
    NotFound,
    PermissionDenied,
    IOFailure,
    HashFailure,
    AlreadyExists
};

struct Error {
    ErrorKind kind{ErrorKind::IOFailure};
    std::filesystem::path path{};
    std::string message{};

    static Error fromErrorCode(const std::error_code& ec, std::filesystem::path path);

    [[nodiscard]] std::string toString() const;
};

std::string_view to_string(ErrorKind kind);

template<typename T = std::monostate>
class Result {
public:
    Result(T value) : data_(std::move(value)) {}
    Result(Error error) : data_(std::move(error)) {}

    [[nodiscard]] bool ok() const { return std::holds_alternative<T>(data_); }
    explicit operator bool() const { return ok(); }

    T& value() { return std::get<T>(data_); }
    const T& value() const { return std::get<T>(data_); }
    T& operator*() { return value(); }
    const T& operator*() const { return value(); }
    T* operator->() { return &value(); }
    const T* operator->() const { return &value(); }

    const Error& error() const { return std::get<Error>(data_); }

private:
    std::variant<T, Error> data_;
};

using Status = Result<std::monostate>;

inline Status success() { return Status{std::monostate{}}; }

}
