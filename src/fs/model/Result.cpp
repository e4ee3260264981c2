#include "fs/model/Result.hpp"

#include <format>

using namespace fc::fs::model;

std::string_view fc::fs::model::to_string(const ErrorKind kind) {
    switch (kind) {
    case ErrorKind::NotFound: return "not found";
    case ErrorKind::PermissionDenied: return "permission denied";
    case ErrorKind::IOFailure: return "I/O failure";
    case ErrorKind::HashFailure: return "hash failure";
    case ErrorKind::AlreadyExists: return "already exists";
    }
    return "unknown";
}

Error Error::fromErrorCode(const std::error_code& ec, std::filesystem::path path) {
    Error err{.path = std::move(path), .message = ec.message()};

    if (ec == std::errc::no_such_file_or_directory || ec == std::errc::not_a_directory)
        err.kind = ErrorKind::NotFound;
    else if (ec == std::errc::permission_denied || ec == std::errc::operation_not_permitted)
        err.kind = ErrorKind::PermissionDenied;
    else if (ec == std::errc::file_exists)
        err.kind = ErrorKind::AlreadyExists;
    else
        err.kind = ErrorKind::IOFailure;

    return err;
}

std::string Error::toString() const {
    if (path.empty()) return std::format("{}: {}", to_string(kind), message);
    return std::format("{} ({}): {}", to_string(kind), path.string(), message);
}
