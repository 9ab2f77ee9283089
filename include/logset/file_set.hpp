// SPDX-License-Identifier: MIT
// Copyright (c) 2024 Logset Contributors

#pragma once

#include <cstdint>
#include <filesystem>
#include <memory>
#include <string>
#include <string_view>
#include <vector>

namespace logset {

// ============================================================================
// FileSet - Actor owning one rotating set of log files
// ============================================================================
//
// All file state lives on the actor's own thread; the public methods only
// post requests and wait for the reply. A reply that does not arrive within
// kFileSetReplyTimeout is fatal, and so is any filesystem error.
//
// Files are named "<prefix>_<timestamp>.log". A write that brings the current
// file to max_file_bytes or more rotates: the file is closed, the oldest files
// are removed until at most max_files remain including the new one, and a new
// file with a threshold header is opened. The actor also rotates once when it
// starts, so each FileSet writes to a fresh file.
//
// ============================================================================

class FileSet {
public:
    /// Creates `log_dir` if needed and starts the actor
    FileSet(std::filesystem::path log_dir,
            std::string name_prefix,
            std::int64_t max_file_bytes,
            int max_files);

    /// Closes if still open
    ~FileSet();

    FileSet(const FileSet&) = delete;
    FileSet& operator=(const FileSet&) = delete;
    FileSet(FileSet&&) = delete;
    FileSet& operator=(FileSet&&) = delete;

    /// Append to the current file. Returns bytes written, 0 once closed.
    std::size_t write(std::string_view data);

    /// Rotates at once if the current file is already above `max_file_bytes`
    void set_config(int max_files, std::int64_t max_file_bytes);

    /// Write out queued requests, close the file, delete it if it got no data
    void close();

    [[nodiscard]] bool is_open() const noexcept;

    /// File currently written to (empty before the first rotation)
    [[nodiscard]] std::filesystem::path current_path() const;

    /**
     * @brief Log files of `name_prefix` in `log_dir`, oldest first
     *
     * Read-only directory scan; safe to call while a FileSet is writing.
     * A missing directory yields an empty list.
     */
    [[nodiscard]] static std::vector<std::filesystem::path>
    list_log_files(const std::filesystem::path& log_dir, std::string_view name_prefix);

private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
};

} // namespace logset
