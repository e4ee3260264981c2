#include "fs/LocalBackend.hpp"
#include "log/Registry.hpp"

#include <cerrno>
#include <exception>
#include <fcntl.h>
#include <system_error>
#include <unistd.h>

using namespace fc::fs;
using namespace fc::fs::model;
using namespace fc::crypto;

namespace {

EntryType classify(const std::filesystem::directory_entry& entry) {
    std::error_code ec;

    if (entry.is_symlink(ec)) {
        // Follow the link once to find out what it points at; dangling links stay Symlink.
        const auto target = std::filesystem::status(entry.path(), ec);
        if (!ec && std::filesystem::is_regular_file(target)) return EntryType::File;
        return EntryType::Symlink;
    }

    if (entry.is_regular_file(ec)) return EntryType::File;
    if (entry.is_directory(ec)) return EntryType::Directory;
    return EntryType::Other;
}

}

LocalBackend::LocalBackend(const std::size_t hashChunkSize)
    : hashChunkSize_(hashChunkSize == 0 ? hash::DEFAULT_CHUNK_SIZE : hashChunkSize) {}

Result<bool> LocalBackend::exists(const std::filesystem::path& path) const {
    std::error_code ec;
    const auto st = std::filesystem::symlink_status(path, ec);
    if (ec) {
        if (ec == std::errc::no_such_file_or_directory || ec == std::errc::not_a_directory) return false;
        return Error::fromErrorCode(ec, path);
    }
    return st.type() != std::filesystem::file_type::not_found;
}

Result<std::vector<Entry>> LocalBackend::list(const std::filesystem::path& dir) const {
    std::error_code ec;
    std::filesystem::directory_iterator it(dir, ec);
    if (ec) return Error::fromErrorCode(ec, dir);

    std::vector<Entry> entries;
    while (it != std::filesystem::directory_iterator()) {
        entries.push_back({it->path(), classify(*it)});
        it.increment(ec);
        if (ec) return Error::fromErrorCode(ec, dir);
    }

    return entries;
}

Result<uintmax_t> LocalBackend::fileSize(const std::filesystem::path& path) const {
    std::error_code ec;
    const auto size = std::filesystem::file_size(path, ec);
    if (ec) return Error::fromErrorCode(ec, path);
    return size;
}

Result<hash::Digest> LocalBackend::digest(const std::filesystem::path& path) const {
    try {
        return hash::blake2b(path, hashChunkSize_);
    } catch (const std::exception& e) {
        return Error{ErrorKind::HashFailure, path, e.what()};
    }
}

Status LocalBackend::createDirectory(const std::filesystem::path& path) {
    std::error_code ec;
    std::filesystem::create_directory(path, ec);
    if (ec) return Error::fromErrorCode(ec, path);

    if (!std::filesystem::is_directory(path, ec))
        return Error{ErrorKind::AlreadyExists, path, "exists and is not a directory"};

    log::Registry::fs()->debug("[LocalBackend] Created directory {}", path.string());
    return success();
}

Status LocalBackend::createDirectories(const std::filesystem::path& path) {
    std::error_code ec;
    std::filesystem::create_directories(path, ec);
    if (ec) return Error::fromErrorCode(ec, path);

    if (!std::filesystem::is_directory(path, ec))
        return Error{ErrorKind::AlreadyExists, path, "exists and is not a directory"};

    return success();
}

Status LocalBackend::copyFile(const std::filesystem::path& from, const std::filesystem::path& to) {
    // Claim the target exclusively first; only a target created here may be removed on failure.
    const int fd = ::open(to.c_str(), O_WRONLY | O_CREAT | O_EXCL | O_CLOEXEC, 0600);
    if (fd < 0) {
        const std::error_code openEc(errno, std::generic_category());
        if (openEc == std::errc::file_exists) return Error{ErrorKind::AlreadyExists, to, "refusing to overwrite"};
        return Error::fromErrorCode(openEc, to);
    }
    ::close(fd);

    std::error_code ec;
    std::filesystem::copy_file(from, to, std::filesystem::copy_options::overwrite_existing, ec);
    if (ec) {
        std::error_code rmEc;
        std::filesystem::remove(to, rmEc);
        if (rmEc) log::Registry::fs()->warn("[LocalBackend] Could not remove partial copy {}: {}",
                                            to.string(), rmEc.message());
        return Error::fromErrorCode(ec, from);
    }

    // Metadata is best effort, the bytes are already in place.
    const auto mtime = std::filesystem::last_write_time(from, ec);
    if (!ec) std::filesystem::last_write_time(to, mtime, ec);
    if (ec) log::Registry::fs()->warn("[LocalBackend] Could not carry over mtime to {}: {}", to.string(), ec.message());

    log::Registry::fs()->debug("[LocalBackend] Copied {} -> {}", from.string(), to.string());
    return success();
}

Status LocalBackend::removeDirectory(const std::filesystem::path& path) {
    std::error_code ec;
    const auto st = std::filesystem::symlink_status(path, ec);
    if (ec) return Error::fromErrorCode(ec, path);
    if (st.type() == std::filesystem::file_type::not_found)
        return Error{ErrorKind::NotFound, path, "directory already removed"};
    if (st.type() != std::filesystem::file_type::directory)
        return Error{ErrorKind::IOFailure, path, "not a directory"};

    std::filesystem::remove(path, ec);
    if (ec) return Error::fromErrorCode(ec, path);

    log::Registry::fs()->debug("[LocalBackend] Removed directory {}", path.string());
    return success();
}
