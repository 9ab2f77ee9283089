// SPDX-License-Identifier: MIT
// Copyright (c) 2024 Logset Contributors

#include "logset/formatter.hpp"
#include "logset/config.hpp"

#include <ctime>
#include <format>
#include <iterator>
#include <string>

namespace logset {

namespace {

inline std::tm gmtime_safe(std::time_t time) {
    std::tm tm_buf{};
#ifdef _WIN32
    gmtime_s(&tm_buf, &time);
#else
    gmtime_r(&time, &tm_buf);
#endif
    return tm_buf;
}

} // anonymous namespace

std::string format_timestamp(const Timestamp& ts) {
    auto tm_buf = gmtime_safe(static_cast<std::time_t>(ts.tv_sec));

    return std::format("{:04d}-{:02d}-{:02d}T{:02d}:{:02d}:{:02d}.{:09d}Z",
        1900 + tm_buf.tm_year, 1 + tm_buf.tm_mon, tm_buf.tm_mday,
        tm_buf.tm_hour, tm_buf.tm_min, tm_buf.tm_sec,
        static_cast<long long>(ts.tv_nsec));
}

std::string format_line(const Record& record) {
    std::string out;
    out.reserve(64 + record.message.size() + record.stack_trace.size());

    auto it = std::back_inserter(out);
    it = std::format_to(it, "{} [", format_timestamp(record.timestamp));
    if (record.exit_code) {
        it = std::format_to(it, "EXIT {}", *record.exit_code);
    } else {
        it = std::format_to(it, "{}", priority_name(record.priority));
    }
    std::format_to(it, "] -{}, line {}- {}\n",
        extract_filename(record.file), record.line,
        trim_trailing_newlines(record.message));

    if (auto trace = trim_trailing_newlines(record.stack_trace); !trace.empty()) {
        out.append(trace);
        out.push_back('\n');
    }
    return out;
}

std::string format_config_record(const Config& config, const Timestamp& ts) {
    return std::format(
        "{} Log configuration:\n"
        "  RootDir: {}\n"
        "  FileName: {}\n"
        "  NumFiles: {}\n"
        "  NumBytes: {}\n"
        "  Priority: {}\n"
        "  Suppress: {}\n",
        format_timestamp(ts),
        config.root_dir.string(),
        config.file_name_prefix,
        config.max_files,
        config.max_file_bytes,
        priority_name(config.threshold),
        config.suppressed_list());
}

std::string format_file_header(std::int64_t max_file_bytes, int max_files, const Timestamp& ts) {
    return std::format(
        "File set configuration @ {}\n"
        "Maximum file size {} bytes\n"
        "Maximum {} files\n",
        format_timestamp(ts), max_file_bytes, max_files);
}

} // namespace logset
