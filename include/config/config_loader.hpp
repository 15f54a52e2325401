#pragma once

#include "config/configs.hpp"

#include <nlohmann/json.hpp>

#include <algorithm>
#include <array>
#include <charconv>
#include <cstdlib>
#include <fstream>
#include <functional>
#include <limits>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>

using EnvLookup = std::function<std::optional<std::string>(const char*)>;

inline std::optional<std::string> process_env(const char* name) {
    const char* value = std::getenv(name);
    if (value == nullptr) {
        return std::nullopt;
    }
    return std::string(value);
}

template <typename T>
T parse_config_number(std::string_view key, std::string_view text) {
    T value{};
    auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), value);
    if (ec != std::errc{} || ptr != text.data() + text.size() || text.empty()) {
        throw std::runtime_error("Invalid value for " + std::string(key) + ": '" +
                                 std::string(text) + "'");
    }
    return value;
}

// Level names understood by spdlog::level::from_str
inline constexpr std::array<std::string_view, 9> kLogLevels{
    "trace", "debug", "info", "warn", "warning", "err", "error", "critical", "off"};

inline void validate_config(const ServiceConfig& c) {
    if (c.fsync_every_n == 0) {
        throw std::runtime_error("Invalid value for fsync_every_n: must be at least 1");
    }
    if (c.snapshot_interval.count() <= 0) {
        throw std::runtime_error("Invalid value for snapshot_interval_ms: must be positive");
    }
    if (c.price_scale == 0 || c.quantity_scale == 0) {
        throw std::runtime_error(
            "Invalid value for price_scale/quantity_scale: must be positive");
    }
    if (c.wal_path.empty()) {
        throw std::runtime_error("Invalid value for wal_path: must not be empty");
    }
    if (std::ranges::find(kLogLevels, c.log_level) == kLogLevels.end()) {
        throw std::runtime_error("Invalid value for log_level: '" + c.log_level + "'");
    }
}

// Every key is optional; missing keys keep their current value.
inline void from_json(const nlohmann::json& j, ServiceConfig& c) {
    if (j.contains("port")) {
        c.port = j.at("port").get<std::uint16_t>();
    }
    if (j.contains("wal_path")) {
        c.wal_path = j.at("wal_path").get<std::string>();
    }
    if (j.contains("fsync_every_n")) {
        c.fsync_every_n = j.at("fsync_every_n").get<std::uint32_t>();
    }
    if (j.contains("snapshot_interval_ms")) {
        c.snapshot_interval =
            std::chrono::milliseconds{j.at("snapshot_interval_ms").get<std::int64_t>()};
    }
    if (j.contains("snapshot_dir")) {
        c.snapshot_dir = j.at("snapshot_dir").get<std::string>();
    }
    if (j.contains("snapshots_enabled")) {
        c.snapshots_enabled = j.at("snapshots_enabled").get<bool>();
    }
    if (j.contains("price_scale")) {
        c.price_scale = j.at("price_scale").get<std::uint64_t>();
    }
    if (j.contains("quantity_scale")) {
        c.quantity_scale = j.at("quantity_scale").get<std::uint64_t>();
    }
    if (j.contains("log_level")) {
        c.log_level = j.at("log_level").get<std::string>();
    }
}

inline void apply_environment(ServiceConfig& c, const EnvLookup& env = process_env) {
    if (auto v = env("ORDERBOOK_PORT")) {
        c.port = parse_config_number<std::uint16_t>("ORDERBOOK_PORT", *v);
    }
    if (auto v = env("ORDERBOOK_WAL_PATH")) {
        c.wal_path = *v;
    }
    if (auto v = env("FSYNC_EVERY_N")) {
        c.fsync_every_n = parse_config_number<std::uint32_t>("FSYNC_EVERY_N", *v);
    }
    if (auto v = env("SNAPSHOT_INTERVAL_MS")) {
        c.snapshot_interval = std::chrono::milliseconds{
            parse_config_number<std::int64_t>("SNAPSHOT_INTERVAL_MS", *v)};
    }
    if (auto v = env("ORDERBOOK_SNAPSHOT_DIR")) {
        c.snapshot_dir = *v;
    }
    if (auto v = env("ORDERBOOK_LOG_LEVEL")) {
        c.log_level = *v;
    }
}

inline ServiceConfig load_config_file(const std::filesystem::path& path,
                                      ServiceConfig config = {}) {
    std::ifstream file(path);
    if (!file.is_open()) {
        throw std::runtime_error("Failed to open config file: " + path.string());
    }

    nlohmann::json j;
    try {
        file >> j;
    } catch (const nlohmann::json::parse_error& e) {
        throw std::runtime_error("Failed to parse config file: " + std::string(e.what()));
    }

    try {
        from_json(j, config);
    } catch (const nlohmann::json::exception& e) {
        throw std::runtime_error("Invalid config file " + path.string() + ": " + e.what());
    }
    return config;
}

// Defaults, then the file (if given), then the environment.
inline ServiceConfig load_config(const std::optional<std::filesystem::path>& path,
                                 const EnvLookup& env = process_env) {
    ServiceConfig config;
    if (path) {
        config = load_config_file(*path, config);
    }
    apply_environment(config, env);
    validate_config(config);
    return config;
}
