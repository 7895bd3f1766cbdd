#include "storage_backend.h"

#include <cerrno>
#include <cstdio>
#include <fcntl.h>
#include <sys/stat.h>
#include <unistd.h>
#include <utility>

namespace fs = std::filesystem;

static std::error_code last_error() {
    return std::error_code(errno, std::generic_category());
}

FileStorage::FileStorage(bool sync_writes) : sync_writes_(sync_writes) {}

bool FileStorage::is_temporary_name(const std::string& filename) {
    return !filename.empty() && filename[0] == '.' &&
           filename.find(".tmp.") != std::string::npos;
}

fs::path FileStorage::temporary_for(const fs::path& path) {
    uint64_t n = temp_counter_.fetch_add(1);
    return path.parent_path() / ("." + path.filename().string() + ".tmp." + std::to_string(n));
}

std::error_code FileStorage::write(const fs::path& path, const std::string& bytes) {
    std::error_code ec;
    const fs::path tmp = temporary_for(path);
    int fd = -1;
    for (int attempt = 0; attempt < max_open_attempts && fd == -1; ++attempt) {
        if (path.has_parent_path()) {
            fs::create_directories(path.parent_path(), ec);
            if (ec) return ec;
        }
        fd = ::open(tmp.c_str(), O_WRONLY | O_CREAT | O_TRUNC | O_CLOEXEC, 0644);
        // ENOENT: an emptied parent was pruned between mkdir and open, retry
        if (fd == -1 && errno != ENOENT) return last_error();
    }
    if (fd == -1) return std::make_error_code(std::errc::no_such_file_or_directory);

    const char* data = bytes.data();
    size_t left = bytes.size();
    while (left > 0) {
        ssize_t written = ::write(fd, data, left);
        if (written == -1) {
            if (errno == EINTR) continue;
            ec = last_error();
            break;
        }
        data += written;
        left -= static_cast<size_t>(written);
    }

    if (!ec && sync_writes_ && ::fsync(fd) == -1) {
        ec = last_error();
    }
    if (::close(fd) == -1 && !ec) {
        ec = last_error();
    }
    if (!ec && ::rename(tmp.c_str(), path.c_str()) == -1) {
        ec = last_error();
    }

    if (ec) {
        // Never leave a partial value behind
        ::unlink(tmp.c_str());
    }
    return ec;
}

std::error_code FileStorage::read(const fs::path& path, std::string& out) {
    int fd = ::open(path.c_str(), O_RDONLY | O_CLOEXEC);
    if (fd == -1) return last_error();

    std::error_code ec;
    struct stat st;
    if (::fstat(fd, &st) == -1) {
        ec = last_error();
        ::close(fd);
        return ec;
    }

    std::string buffer;
    buffer.resize(static_cast<size_t>(st.st_size));
    size_t offset = 0;
    while (offset < buffer.size()) {
        ssize_t got = ::read(fd, &buffer[offset], buffer.size() - offset);
        if (got == -1) {
            if (errno == EINTR) continue;
            ec = last_error();
            break;
        }
        if (got == 0) {
            // File shrank underneath us
            buffer.resize(offset);
            break;
        }
        offset += static_cast<size_t>(got);
    }
    ::close(fd);

    if (!ec) {
        out = std::move(buffer);
    }
    return ec;
}

std::error_code FileStorage::remove(const fs::path& path) {
    if (::unlink(path.c_str()) == -1) {
        return last_error();
    }
    return {};
}

std::error_code FileStorage::remove_directory(const fs::path& path) {
    if (::rmdir(path.c_str()) == -1) {
        return last_error();
    }
    return {};
}
