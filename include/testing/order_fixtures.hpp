#pragma once

#include "exchange/types.hpp"
#include "persistence/wal.hpp"
#include "utils/fixed_point.hpp"

#include <atomic>
#include <cerrno>
#include <filesystem>
#include <fstream>
#include <string>
#include <unistd.h>
#include <vector>

namespace testing {

/**
 * Builders and scratch files shared by the unit tests.
 *
 * Prices and quantities are given as decimals and converted with the default
 * FixedPointScale, so tests read like the requests they model:
 *
 *   auto buy = limit_order("b1", OrderSide::BUY, 50000.0, 1.0);
 */
inline Order limit_order(std::string order_id, OrderSide side, double price, double quantity,
                         std::string symbol = "BTC-USD", std::string user_id = "user-1") {
    FixedPointScale scale;
    return Order{.order_id = std::move(order_id),
                 .user_id = std::move(user_id),
                 .symbol = std::move(symbol),
                 .side = side,
                 .type = OrderType::LIMIT,
                 .price = scale.to_price(price),
                 .quantity = scale.to_quantity(quantity)};
}

inline Order market_order(std::string order_id, OrderSide side, double quantity,
                          std::string symbol = "BTC-USD", std::string user_id = "user-1") {
    FixedPointScale scale;
    return Order{.order_id = std::move(order_id),
                 .user_id = std::move(user_id),
                 .symbol = std::move(symbol),
                 .side = side,
                 .type = OrderType::MARKET,
                 .price = Price{0},
                 .quantity = scale.to_quantity(quantity)};
}

inline Price px(double price) {
    return FixedPointScale{}.to_price(price);
}

inline Quantity qty(double quantity) {
    return FixedPointScale{}.to_quantity(quantity);
}

// Unique directory under the system temp dir, removed on destruction.
class ScratchDirectory {
public:
    explicit ScratchDirectory(const std::string& prefix = "orderbook_test") {
        path_ = std::filesystem::temp_directory_path() /
                (prefix + "_" + std::to_string(::getpid()) + "_" +
                 std::to_string(counter_.fetch_add(1)));
        std::filesystem::remove_all(path_);
        std::filesystem::create_directories(path_);
    }

    ~ScratchDirectory() {
        std::error_code ec;
        std::filesystem::remove_all(path_, ec);
    }

    ScratchDirectory(const ScratchDirectory&) = delete;
    ScratchDirectory& operator=(const ScratchDirectory&) = delete;

    [[nodiscard]] const std::filesystem::path& path() const noexcept { return path_; }
    [[nodiscard]] std::filesystem::path operator/(const std::string& name) const {
        return path_ / name;
    }

private:
    std::filesystem::path path_;
    static inline std::atomic<int> counter_{0};
};

inline std::vector<std::string> read_lines(const std::filesystem::path& path) {
    std::ifstream file(path);
    std::vector<std::string> lines;
    std::string line;
    while (std::getline(file, line)) {
        lines.push_back(line);
    }
    return lines;
}

// Appends raw text, bypassing the WAL, to simulate corruption and torn writes.
inline void append_raw(const std::filesystem::path& path, const std::string& text) {
    std::ofstream file(path, std::ios::app | std::ios::binary);
    file << text;
}

// WAL whose fsync can be made to fail with EIO, as a full or dying disk would.
class FlakySyncWal : public WriteAheadLog {
public:
    using WriteAheadLog::WriteAheadLog;

    bool fail_sync{false};

protected:
    int sync_descriptor_(int fd) override {
        if (fail_sync) {
            errno = EIO;
            return -1;
        }
        return WriteAheadLog::sync_descriptor_(fd);
    }
};

} // namespace testing
