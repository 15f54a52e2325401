#pragma once

#include "exchange/types.hpp"
#include "utils/types.hpp"

#include <nlohmann/json.hpp>

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

enum class WalEntryType : std::uint8_t { ORDER_PLACED = 0, ORDER_MATCHED, ORDER_CANCELLED };

/**
 * One line of the write-ahead log.
 *
 * {"seq": 7, "ts": 1718000000000, "type": "ORDER_PLACED", "payload": {...}}
 *
 * Payload shapes:
 *   ORDER_PLACED     {"order": <order>}
 *   ORDER_MATCHED    {"trade": <trade>}
 *   ORDER_CANCELLED  {"symbol": "...", "order_id": "..."}
 */
struct WalEntry {
    SequenceNumber seq;
    Timestamp ts;
    WalEntryType type;
    nlohmann::json payload;
};

/**
 * Point-in-time copy of every book plus the WAL sequence it reflects. Entries
 * with seq <= sequence are already contained in books.
 */
struct Snapshot {
    Timestamp timestamp;
    SequenceNumber sequence;
    FullState books;
};

[[nodiscard]] constexpr const char* wal_entry_type_to_string(WalEntryType type) {
    switch (type) {
        case WalEntryType::ORDER_PLACED: return "ORDER_PLACED";
        case WalEntryType::ORDER_MATCHED: return "ORDER_MATCHED";
        case WalEntryType::ORDER_CANCELLED: return "ORDER_CANCELLED";
    }
    return "UNKNOWN";
}

[[nodiscard]] std::optional<WalEntryType> parse_wal_entry_type(std::string_view text);

// Orders omit "price" when it is a market order; "sequence" is optional on read.
void to_json(nlohmann::json& j, const Order& order);
void from_json(const nlohmann::json& j, Order& order);

void to_json(nlohmann::json& j, const Trade& trade);
void from_json(const nlohmann::json& j, Trade& trade);

void to_json(nlohmann::json& j, const BookState& state);
void from_json(const nlohmann::json& j, BookState& state);

void to_json(nlohmann::json& j, const WalEntry& entry);
// Throws nlohmann::json::exception for missing fields and std::invalid_argument
// for an unknown entry type.
void from_json(const nlohmann::json& j, WalEntry& entry);

void to_json(nlohmann::json& j, const Snapshot& snapshot);
void from_json(const nlohmann::json& j, Snapshot& snapshot);

// Payload builders
[[nodiscard]] nlohmann::json order_placed_payload(const Order& order);
[[nodiscard]] nlohmann::json order_matched_payload(const Trade& trade);
[[nodiscard]] nlohmann::json order_cancelled_payload(const std::string& symbol,
                                                     const std::string& order_id);
