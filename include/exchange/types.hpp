#pragma once

#include <cstdint>
#include <deque>
#include <functional>
#include <map>
#include <stdexcept>
#include <string>
#include <string_view>
#include <unordered_map>
#include <utility>
#include <vector>

#include "utils/types.hpp"

enum class OrderStatus : std::uint8_t {
    ACCEPTED = 0x00,
    PARTIALLY_FILLED = 0x01,
    FILLED = 0x02,
    CANCELLED = 0x03
};

enum class OrderType : std::uint8_t { LIMIT = 0, MARKET };

enum class OrderSide : std::uint8_t { BUY = 0, SELL };

struct Order {
    std::string order_id;
    std::string user_id;
    std::string symbol;
    OrderSide side{OrderSide::BUY};
    OrderType type{OrderType::LIMIT};
    Price price{0};              // 0 for market orders
    Quantity quantity{0};
    Quantity filled_quantity{0};
    Timestamp timestamp{0};      // submission time, informational only
    SequenceNumber sequence{0};  // WAL entry that placed the order, 0 if none

    [[nodiscard]] Quantity remaining() const noexcept { return quantity - filled_quantity; }
    [[nodiscard]] bool is_filled() const noexcept { return filled_quantity >= quantity; }

    bool operator==(const Order&) const = default;
};

struct Trade {
    std::string buyer_order_id;
    std::string seller_order_id;
    Price price;
    Quantity quantity;

    bool operator==(const Trade&) const = default;
};

struct PlaceResult {
    Order order;
    std::vector<Trade> trades;
    OrderStatus status;
};

// Aggregated (price, remaining quantity) per level, best level first.
using PriceLevels = std::vector<std::pair<Price, Quantity>>;

struct BookSnapshot {
    PriceLevels bids;
    PriceLevels asks;

    bool operator==(const BookSnapshot&) const = default;
};

// Raw resting orders of one symbol, in matching priority order.
struct BookState {
    std::vector<Order> bids;
    std::vector<Order> asks;

    bool operator==(const BookState&) const = default;
};

using FullState = std::map<std::string, BookState>;

struct OrderBook {
    std::map<Price, std::deque<Order>, std::greater<Price>> bids;
    std::map<Price, std::deque<Order>, std::less<Price>> asks;
    std::unordered_map<std::string, std::pair<Price, OrderSide>> registry;

    [[nodiscard]] bool empty() const noexcept { return bids.empty() && asks.empty(); }
};

class MatchingInvariantError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

[[nodiscard]] constexpr const char* order_side_to_string(OrderSide side) {
    switch (side) {
        case OrderSide::BUY: return "buy";
        case OrderSide::SELL: return "sell";
    }
    return "unknown";
}

[[nodiscard]] constexpr const char* order_type_to_string(OrderType type) {
    switch (type) {
        case OrderType::LIMIT: return "limit";
        case OrderType::MARKET: return "market";
    }
    return "unknown";
}

[[nodiscard]] constexpr const char* order_status_to_string(OrderStatus status) {
    switch (status) {
        case OrderStatus::ACCEPTED: return "accepted";
        case OrderStatus::PARTIALLY_FILLED: return "partially_filled";
        case OrderStatus::FILLED: return "filled";
        case OrderStatus::CANCELLED: return "cancelled";
    }
    return "unknown";
}

// Throws std::invalid_argument for anything but "buy"/"sell".
[[nodiscard]] OrderSide parse_order_side(std::string_view text);

// Throws std::invalid_argument for anything but "limit"/"market".
[[nodiscard]] OrderType parse_order_type(std::string_view text);
