#pragma once
#ifndef STORAGE_BACKEND_H
#define STORAGE_BACKEND_H

#include <atomic>
#include <cstdint>
#include <filesystem>
#include <string>
#include <system_error>

/**
 * Byte storage addressed by path. Failures are reported as error codes,
 * never thrown. Operations on distinct paths must not interfere.
 */
class StorageBackend {
public:
    virtual ~StorageBackend() = default;

    /**
     * Store `bytes` at `path`, replacing any previous content.
     * On failure nothing readable is left at `path`.
     */
    virtual std::error_code write(const std::filesystem::path& path, const std::string& bytes) = 0;

    /// Load the whole content of `path` into `out`.
    virtual std::error_code read(const std::filesystem::path& path, std::string& out) = 0;

    /// Delete `path`. Reports errc::no_such_file_or_directory if absent.
    virtual std::error_code remove(const std::filesystem::path& path) = 0;

    /**
     * Delete the directory `path` if it is empty. Reports
     * errc::directory_not_empty (or errc::file_exists) when it is not,
     * errc::no_such_file_or_directory when it is gone.
     */
    virtual std::error_code remove_directory(const std::filesystem::path& path) = 0;
};

/**
 * Local filesystem backend.
 * Values are written to a hidden temporary sibling and renamed into place,
 * so a reader sees either the previous state or the complete new file.
 */
class FileStorage : public StorageBackend {
public:
    /**
     * @param sync_writes fsync each temporary file before the rename
     */
    explicit FileStorage(bool sync_writes = false);

    std::error_code write(const std::filesystem::path& path, const std::string& bytes) override;
    std::error_code read(const std::filesystem::path& path, std::string& out) override;
    std::error_code remove(const std::filesystem::path& path) override;
    std::error_code remove_directory(const std::filesystem::path& path) override;

    bool sync_writes() const { return sync_writes_; }

    /// True for names of the form ".<name>.tmp.<n>" used for in-flight writes.
    static bool is_temporary_name(const std::string& filename);

    /// Attempts at creating the temporary when its directory vanishes underneath.
    static constexpr int max_open_attempts = 8;

private:
    std::filesystem::path temporary_for(const std::filesystem::path& path);

    bool sync_writes_;
    std::atomic<uint64_t> temp_counter_{0};
};

#endif // STORAGE_BACKEND_H
