// SPDX-License-Identifier: MIT
// Copyright (c) 2024 Logset Contributors

#include "logset/config.hpp"
#include "logset/formatter.hpp"
#include "logset/platform.hpp"

#include <nlohmann/json.hpp>

#include <algorithm>
#include <cctype>
#include <format>
#include <limits>
#include <string>

namespace logset {

namespace {

// Document keys, compared case-insensitively
constexpr std::string_view kKeyRootDir = "rootDir";
constexpr std::string_view kKeyNumFiles = "numFiles";
constexpr std::string_view kKeyFileNumBytes = "fileNumBytes";
constexpr std::string_view kKeyPriority = "priority";
constexpr std::string_view kKeySuppressedFiles = "suppressedFiles";

bool iequals(std::string_view a, std::string_view b) {
    return std::ranges::equal(a, b, [](unsigned char x, unsigned char y) {
        return std::tolower(x) == std::tolower(y);
    });
}

std::string_view trim(std::string_view s) {
    while (!s.empty() && std::isspace(static_cast<unsigned char>(s.front()))) s.remove_prefix(1);
    while (!s.empty() && std::isspace(static_cast<unsigned char>(s.back()))) s.remove_suffix(1);
    return s;
}

void warn(std::vector<std::string>* warnings, std::string message) {
    if (warnings) warnings->push_back(std::move(message));
}

// Positive integer field, or nothing (with a warning) when the value is unusable
std::optional<std::int64_t> positive_integer(const nlohmann::json& value,
                                             std::string_view key,
                                             std::vector<std::string>* warnings) {
    if (!value.is_number_integer()) {
        warn(warnings, std::format("{} must be an integer, using default", key));
        return std::nullopt;
    }
    auto n = value.get<std::int64_t>();
    if (n < 1) {
        warn(warnings, std::format("{} must be at least 1, got {}, using default", key, n));
        return std::nullopt;
    }
    return n;
}

} // anonymous namespace

// ============================================================================
// Config
// ============================================================================

std::string Config::to_json() const {
    nlohmann::ordered_json doc;
    doc[std::string(kKeyRootDir)] = root_dir.string();
    doc[std::string(kKeyNumFiles)] = max_files;
    doc[std::string(kKeyFileNumBytes)] = max_file_bytes;
    doc[std::string(kKeyPriority)] = std::string(priority_name(threshold));
    doc[std::string(kKeySuppressedFiles)] = suppressed_list();
    return doc.dump(4);
}

std::string Config::suppressed_list() const {
    std::string out;
    for (const auto& stem : suppressed_file_stems) {
        if (!out.empty()) out.push_back(',');
        out.append(stem);
    }
    return out;
}

Config default_config() {
    Config config;
    config.file_name_prefix = get_executable_name();
    return config;
}

std::set<std::string> parse_suppressed(std::string_view csv) {
    std::set<std::string> stems;

    while (!csv.empty()) {
        auto comma = csv.find(',');
        auto item = trim(csv.substr(0, comma));
        csv = comma == std::string_view::npos ? std::string_view{} : csv.substr(comma + 1);

        if (auto stem = extract_stem(item); !stem.empty()) {
            stems.emplace(stem);
        }
    }
    return stems;
}

std::expected<Config, std::string>
parse_config(std::string_view json_text, std::vector<std::string>* warnings) {
    nlohmann::json doc;
    try {
        doc = nlohmann::json::parse(json_text);
    } catch (const nlohmann::json::parse_error& ex) {
        return std::unexpected(std::string("json parse failed: ") + ex.what());
    }

    if (!doc.is_object()) {
        return std::unexpected(std::string("config document must be a JSON object"));
    }

    Config config = default_config();

    for (const auto& [key, value] : doc.items()) {
        if (iequals(key, kKeyRootDir)) {
            if (!value.is_string()) {
                warn(warnings, std::format("{} must be a string, using default", kKeyRootDir));
            } else if (auto dir = value.get<std::string>(); !dir.empty()) {
                config.root_dir = dir;
            }
        } else if (iequals(key, kKeyNumFiles)) {
            if (auto n = positive_integer(value, kKeyNumFiles, warnings)) {
                config.max_files = static_cast<int>(std::min<std::int64_t>(*n, std::numeric_limits<int>::max()));
            }
        } else if (iequals(key, kKeyFileNumBytes)) {
            if (auto n = positive_integer(value, kKeyFileNumBytes, warnings)) {
                config.max_file_bytes = *n;
            }
        } else if (iequals(key, kKeyPriority)) {
            auto text = value.is_string() ? value.get<std::string>() : value.dump();
            if (text.empty()) continue;
            if (auto p = parse_priority(text)) {
                config.threshold = *p;
            } else {
                warn(warnings, std::format("Invalid priority string: {}", text));
            }
        } else if (iequals(key, kKeySuppressedFiles)) {
            if (value.is_string()) {
                config.suppressed_file_stems = parse_suppressed(value.get<std::string>());
            } else {
                warn(warnings, std::format("{} must be a comma separated string", kKeySuppressedFiles));
            }
        } else {
            warn(warnings, std::format("ignoring unknown field {}", key));
        }
    }

    return config;
}

} // namespace logset
