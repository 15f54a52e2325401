#include "persistence/records.hpp"

#include <stdexcept>

std::optional<WalEntryType> parse_wal_entry_type(std::string_view text) {
    if (text == "ORDER_PLACED") {
        return WalEntryType::ORDER_PLACED;
    }
    if (text == "ORDER_MATCHED") {
        return WalEntryType::ORDER_MATCHED;
    }
    if (text == "ORDER_CANCELLED") {
        return WalEntryType::ORDER_CANCELLED;
    }
    return std::nullopt;
}

void to_json(nlohmann::json& j, const Order& order) {
    j = nlohmann::json{{"order_id", order.order_id},
                       {"user_id", order.user_id},
                       {"symbol", order.symbol},
                       {"side", order_side_to_string(order.side)},
                       {"type", order_type_to_string(order.type)},
                       {"quantity", order.quantity},
                       {"filled_quantity", order.filled_quantity},
                       {"timestamp", order.timestamp},
                       {"sequence", order.sequence}};
    if (order.type == OrderType::LIMIT) {
        j["price"] = order.price;
    }
}

void from_json(const nlohmann::json& j, Order& order) {
    order.order_id = j.at("order_id").get<std::string>();
    order.user_id = j.at("user_id").get<std::string>();
    order.symbol = j.at("symbol").get<std::string>();
    order.side = parse_order_side(j.at("side").get<std::string>());
    order.type = parse_order_type(j.at("type").get<std::string>());
    order.price = j.value("price", Price{0});
    order.quantity = j.at("quantity").get<Quantity>();
    order.filled_quantity = j.value("filled_quantity", Quantity{0});
    order.timestamp = j.value("timestamp", Timestamp{0});
    order.sequence = j.value("sequence", SequenceNumber{0});

    if (order.type == OrderType::LIMIT && !j.contains("price")) {
        throw std::invalid_argument("limit order " + order.order_id + " has no price");
    }
}

void to_json(nlohmann::json& j, const Trade& trade) {
    j = nlohmann::json{{"buyer_order_id", trade.buyer_order_id},
                       {"seller_order_id", trade.seller_order_id},
                       {"price", trade.price},
                       {"quantity", trade.quantity}};
}

void from_json(const nlohmann::json& j, Trade& trade) {
    trade.buyer_order_id = j.at("buyer_order_id").get<std::string>();
    trade.seller_order_id = j.at("seller_order_id").get<std::string>();
    trade.price = j.at("price").get<Price>();
    trade.quantity = j.at("quantity").get<Quantity>();
}

void to_json(nlohmann::json& j, const BookState& state) {
    j = nlohmann::json{{"bids", state.bids}, {"asks", state.asks}};
}

void from_json(const nlohmann::json& j, BookState& state) {
    state.bids = j.at("bids").get<std::vector<Order>>();
    state.asks = j.at("asks").get<std::vector<Order>>();
}

void to_json(nlohmann::json& j, const WalEntry& entry) {
    j = nlohmann::json{{"seq", entry.seq},
                       {"ts", entry.ts},
                       {"type", wal_entry_type_to_string(entry.type)},
                       {"payload", entry.payload}};
}

void from_json(const nlohmann::json& j, WalEntry& entry) {
    entry.seq = j.at("seq").get<SequenceNumber>();
    entry.ts = j.value("ts", Timestamp{0});

    const auto type_name = j.at("type").get<std::string>();
    auto type = parse_wal_entry_type(type_name);
    if (!type) {
        throw std::invalid_argument("unknown WAL entry type: " + type_name);
    }
    entry.type = *type;
    entry.payload = j.at("payload");
}

void to_json(nlohmann::json& j, const Snapshot& snapshot) {
    nlohmann::json books = nlohmann::json::object();
    for (const auto& [symbol, state] : snapshot.books) {
        books[symbol] = state;
    }

    j = nlohmann::json{{"timestamp", snapshot.timestamp},
                       {"sequence", snapshot.sequence},
                       {"books", books}};
}

void from_json(const nlohmann::json& j, Snapshot& snapshot) {
    snapshot.timestamp = j.at("timestamp").get<Timestamp>();
    snapshot.sequence = j.at("sequence").get<SequenceNumber>();

    snapshot.books.clear();
    for (const auto& [symbol, state] : j.at("books").items()) {
        snapshot.books.emplace(symbol, state.get<BookState>());
    }
}

nlohmann::json order_placed_payload(const Order& order) {
    return nlohmann::json{{"order", order}};
}

nlohmann::json order_matched_payload(const Trade& trade) {
    return nlohmann::json{{"trade", trade}};
}

nlohmann::json order_cancelled_payload(const std::string& symbol,
                                       const std::string& order_id) {
    return nlohmann::json{{"symbol", symbol}, {"order_id", order_id}};
}
