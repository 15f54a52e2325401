#pragma once

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <string>

/**
 * Runtime configuration of the order book service.
 *
 * Resolution order, later wins: these defaults, the optional JSON config file,
 * then environment variables:
 *
 *   ORDERBOOK_PORT          port
 *   ORDERBOOK_WAL_PATH      wal_path
 *   FSYNC_EVERY_N           fsync_every_n
 *   SNAPSHOT_INTERVAL_MS    snapshot_interval
 *   ORDERBOOK_SNAPSHOT_DIR  snapshot_dir
 *   ORDERBOOK_LOG_LEVEL     log_level
 */
struct ServiceConfig {
    std::uint16_t port{3001};
    std::filesystem::path wal_path{"./data/wal/orderbook.wal"};
    std::uint32_t fsync_every_n{1};
    std::chrono::milliseconds snapshot_interval{10000};
    std::filesystem::path snapshot_dir{"./data/snapshots"};
    bool snapshots_enabled{true};
    std::uint64_t price_scale{100'000'000};
    std::uint64_t quantity_scale{100'000'000};
    std::string log_level{"info"};
};
