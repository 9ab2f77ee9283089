// SPDX-License-Identifier: MIT
// Copyright (c) 2024 Logset Contributors

#include "logset/config_source.hpp"
#include "console.hpp"

#include <algorithm>
#include <fstream>
#include <sstream>
#include <vector>

namespace logset {

// ============================================================================
// JsonFileConfigSource
// ============================================================================

JsonFileConfigSource::JsonFileConfigSource() {
    std::error_code ec;
    directory_ = std::filesystem::current_path(ec);
    if (ec) {
        directory_ = ".";
    }
}

std::shared_ptr<JsonFileConfigSource>
JsonFileConfigSource::in_directory(std::filesystem::path directory) {
    auto source = std::make_shared<JsonFileConfigSource>();
    source->directory_ = std::move(directory);
    return source;
}

std::shared_ptr<JsonFileConfigSource>
JsonFileConfigSource::from_file(std::filesystem::path file) {
    auto source = std::make_shared<JsonFileConfigSource>();
    source->file_ = std::move(file);
    return source;
}

std::optional<std::filesystem::path> JsonFileConfigSource::locate() const {
    if (!file_.empty()) {
        return file_;
    }

    // First match by name so the choice does not depend on directory order.
    // A directory that cannot be scanned to the end has no config file.
    std::vector<std::filesystem::path> candidates;
    std::error_code ec;
    for (std::filesystem::directory_iterator it(directory_, ec), end; !ec && it != end; it.increment(ec)) {
        std::error_code type_ec;
        if (!it->is_regular_file(type_ec)) continue;
        if (it->path().filename().string().ends_with(kConfigFileSuffix)) {
            candidates.push_back(it->path());
        }
    }
    if (ec || candidates.empty()) {
        return std::nullopt;
    }
    return *std::ranges::min_element(candidates);
}

Config JsonFileConfigSource::read(bool warn_if_missing) {
    auto path = locate();
    if (!path) {
        if (warn_if_missing) {
            detail::report("No logging config file found. Using defaults");
        }
        return default_config();
    }

    std::ifstream in(*path, std::ios::in | std::ios::binary);
    if (!in.is_open()) {
        if (warn_if_missing) {
            detail::reportf("Warning reading {}: cannot open file", path->string());
        }
        return default_config();
    }
    std::stringstream buffer;
    buffer << in.rdbuf();

    std::vector<std::string> warnings;
    auto config = parse_config(buffer.str(), &warnings);
    if (!config) {
        detail::reportf("Error parsing {}: {}", path->string(), config.error());
        return default_config();
    }
    for (const auto& w : warnings) {
        detail::reportf("{}: {}", path->string(), w);
    }
    return std::move(*config);
}

// ============================================================================
// StaticConfigSource
// ============================================================================

StaticConfigSource::StaticConfigSource() : config_(default_config()) {}

StaticConfigSource::StaticConfigSource(Config config) : config_(std::move(config)) {}

Config StaticConfigSource::read(bool) {
    std::lock_guard lock(mutex_);
    return config_.clone();
}

void StaticConfigSource::set(Config config) {
    std::lock_guard lock(mutex_);
    config_ = std::move(config);
}

} // namespace logset
