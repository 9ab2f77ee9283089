// SPDX-License-Identifier: MIT
// Copyright (c) 2024 Logset Contributors
//
// logset_config - Inspect logset configuration and log files
//
// Usage:
//   logset_config                       Print the default config document
//   logset_config <file>                Print the effective config read from <file>
//   logset_config --find [dir]          Print the config file a logger in [dir] would use
//   logset_config --list <dir> <prefix> List the log files of <prefix>, oldest first

#include <logset/config_source.hpp>
#include <logset/file_set.hpp>

#include <cstdio>
#include <cstring>
#include <filesystem>
#include <string>

namespace fs = std::filesystem;
using namespace logset;

static void print_usage(const char* prog) {
    std::fprintf(stderr,
        "Usage:\n"
        "  %s                        Print the default config document\n"
        "  %s <file>                 Print the effective config read from <file>\n"
        "  %s --find [dir]           Print the config file found in [dir]\n"
        "  %s --list <dir> <prefix>  List log files, oldest first\n",
        prog, prog, prog, prog);
}

static int print_config(const Config& config) {
    std::printf("%s\n", config.to_json().c_str());
    return 0;
}

static int find_config(const fs::path& dir) {
    auto source = JsonFileConfigSource::in_directory(dir);
    auto path = source->locate();
    if (!path) {
        std::fprintf(stderr, "No logging config file in %s\n", dir.string().c_str());
        return 1;
    }
    std::printf("%s\n", path->string().c_str());
    return 0;
}

static int list_files(const fs::path& dir, const std::string& prefix) {
    auto files = FileSet::list_log_files(dir, prefix);
    for (const auto& file : files) {
        std::error_code ec;
        auto size = fs::file_size(file, ec);
        std::printf("%10llu  %s\n", ec ? 0ULL : static_cast<unsigned long long>(size),
                    file.filename().string().c_str());
    }
    std::fprintf(stderr, "%zu file(s)\n", files.size());
    return 0;
}

int main(int argc, char* argv[]) {
    if (argc == 1) {
        return print_config(default_config());
    }

    if (std::strcmp(argv[1], "-h") == 0 || std::strcmp(argv[1], "--help") == 0) {
        print_usage(argv[0]);
        return 0;
    }

    if (std::strcmp(argv[1], "--find") == 0) {
        if (argc > 3) {
            print_usage(argv[0]);
            return 1;
        }
        return find_config(argc == 3 ? fs::path(argv[2]) : fs::current_path());
    }

    if (std::strcmp(argv[1], "--list") == 0) {
        if (argc != 4) {
            print_usage(argv[0]);
            return 1;
        }
        return list_files(argv[2], argv[3]);
    }

    if (argc != 2) {
        print_usage(argv[0]);
        return 1;
    }

    fs::path file = argv[1];
    if (!fs::is_regular_file(file)) {
        std::fprintf(stderr, "Not a file: %s\n", file.string().c_str());
        return 1;
    }
    // Diagnostics about the document go to stderr, the result to stdout
    return print_config(JsonFileConfigSource::from_file(file)->read(true));
}
