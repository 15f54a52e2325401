#pragma once

#include "exchange/matching_engine.hpp"
#include "persistence/wal.hpp"
#include "time/clock.hpp"
#include "utils/fixed_point.hpp"

#include <nlohmann/json.hpp>

#include <mutex>
#include <string>
#include <variant>

struct ServiceResponse {
    int status_code;
    nlohmann::json body;

    [[nodiscard]] bool ok() const noexcept { return status_code == 200; }
};

/**
 * Transport-independent request handling for the order book.
 *
 * Every mutating request is one unit of work under the engine mutex: validate,
 * append to the WAL, apply to the engine. Nothing reaches the engine unless its
 * WAL entry was written, and a WAL failure surfaces as WalError (500 through
 * handle()). Once the WAL has failed an fsync its file may hold an entry the
 * engine never applied; handle() rethrows then and the process must recover
 * from the log. Reads take the same mutex so they see a state between two
 * completed operations.
 *
 * Request and response bodies follow the HTTP contract:
 *   POST /order    {order_id?, user_id, symbol, side, type, price?, quantity}
 *   POST /cancel   {order_id, symbol}
 *   GET  /snapshot ?symbol=
 *   GET  /health
 * Prices and quantities are decimals at this boundary and fixed point inside.
 */
class OrderService {
public:
    OrderService(MatchingEngine& engine, WriteAheadLog& wal, std::mutex& engine_mutex,
                 FixedPointScale scale = {}, const Clock& clock = system_clock());

    // 200 {server_order_id, status, matched, trades, sequence_number} or
    // 400 {error}. Throws WalError if the placement could not be logged.
    ServiceResponse place_order(const nlohmann::json& body);

    // 200 {status: "cancelled" | "not_found"} or 400 {error}. Throws WalError.
    ServiceResponse cancel_order(const nlohmann::json& body);

    [[nodiscard]] ServiceResponse snapshot(const std::string& symbol) const;
    [[nodiscard]] ServiceResponse health() const;

    // Routes {"op": "order" | "cancel" | "snapshot" | "health", ...}. Request
    // errors become 400 and WAL errors 500, except after a failed fsync
    // (WriteAheadLog::failed()), which rethrows the WalError.
    ServiceResponse handle(const nlohmann::json& request);

private:
    MatchingEngine& engine_;
    WriteAheadLog& wal_;
    std::mutex& mutex_;
    FixedPointScale scale_;
    const Clock& clock_;

    // Either a well-formed order (without id/timestamp when absent) or the
    // reason it was rejected.
    [[nodiscard]] std::variant<Order, std::string>
    build_order_(const nlohmann::json& body) const;

    [[nodiscard]] nlohmann::json trade_to_json_(const Trade& trade) const;
    [[nodiscard]] nlohmann::json levels_to_json_(const PriceLevels& levels) const;
};

[[nodiscard]] inline ServiceResponse bad_request(std::string reason) {
    return ServiceResponse{.status_code = 400, .body = {{"error", std::move(reason)}}};
}
