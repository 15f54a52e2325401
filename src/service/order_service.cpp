#include "service/order_service.hpp"

#include "persistence/records.hpp"

#include <spdlog/spdlog.h>

#include <format>
#include <stdexcept>
#include <string_view>
#include <tuple>

namespace {

// Server-assigned ids are "ORD-<sequence of the placement>", unique per log.
constexpr std::string_view kGeneratedIdPrefix = "ORD-";

bool has_text(const nlohmann::json& body, const char* key) {
    auto it = body.find(key);
    return it != body.end() && it->is_string() && !it->get_ref<const std::string&>().empty();
}

bool has_value(const nlohmann::json& body, const char* key) {
    auto it = body.find(key);
    return it != body.end() && !it->is_null();
}

// Status reported to the client is derived from the fill, so a market order
// that found no liquidity reads "accepted" with no trades.
const char* fill_status(const Order& order) {
    if (order.filled_quantity.is_zero()) {
        return "accepted";
    }
    return order.is_filled() ? "filled" : "partially_filled";
}

} // namespace

OrderService::OrderService(MatchingEngine& engine, WriteAheadLog& wal,
                           std::mutex& engine_mutex, FixedPointScale scale,
                           const Clock& clock)
    : engine_(engine), wal_(wal), mutex_(engine_mutex), scale_(scale), clock_(clock) {}

std::variant<Order, std::string> OrderService::build_order_(const nlohmann::json& body) const {
    if (!body.is_object()) {
        return std::string("Request body must be a JSON object");
    }

    if (!has_text(body, "user_id") || !has_text(body, "symbol") || !has_text(body, "side") ||
        !has_text(body, "type") || !has_value(body, "quantity")) {
        return std::string("Missing required fields");
    }

    Order order;
    order.user_id = body.at("user_id").get<std::string>();
    order.symbol = body.at("symbol").get<std::string>();

    try {
        order.side = parse_order_side(body.at("side").get<std::string>());
    } catch (const std::invalid_argument&) {
        return std::string("Invalid side");
    }

    try {
        order.type = parse_order_type(body.at("type").get<std::string>());
    } catch (const std::invalid_argument&) {
        return std::string("Invalid type");
    }

    if (has_value(body, "order_id")) {
        if (!body.at("order_id").is_string()) {
            return std::string("order_id must be a string");
        }
        order.order_id = body.at("order_id").get<std::string>();
        if (order.order_id.starts_with(kGeneratedIdPrefix)) {
            return std::format("order_id prefix '{}' is reserved for server-assigned ids",
                               kGeneratedIdPrefix);
        }
    }

    if (!body.at("quantity").is_number()) {
        return std::string("Quantity must be a number");
    }
    try {
        order.quantity = scale_.to_quantity(body.at("quantity").get<double>());
    } catch (const std::invalid_argument& e) {
        return std::string(e.what());
    }
    if (order.quantity.is_zero()) {
        return std::string("Quantity must be positive");
    }

    if (order.type == OrderType::LIMIT) {
        if (!has_value(body, "price")) {
            return std::string("Limit orders require price");
        }
        if (!body.at("price").is_number()) {
            return std::string("Price must be a number");
        }
        try {
            order.price = scale_.to_price(body.at("price").get<double>());
        } catch (const std::invalid_argument& e) {
            return std::string(e.what());
        }
        if (order.price.is_zero()) {
            return std::string("Limit orders require price");
        }
    }

    return order;
}

ServiceResponse OrderService::place_order(const nlohmann::json& body) {
    auto built = build_order_(body);
    if (auto* reason = std::get_if<std::string>(&built)) {
        return bad_request(std::move(*reason));
    }
    Order order = std::get<Order>(std::move(built));

    std::lock_guard lock(mutex_);

    if (order.order_id.empty()) {
        order.order_id = std::format("{}{}", kGeneratedIdPrefix,
                                     wal_.current_sequence().value() + 1);
    }
    if (engine_.has_order(order.symbol, order.order_id)) {
        return bad_request("Duplicate order_id: " + order.order_id);
    }

    order.timestamp = clock_.now();

    // the placement must be on disk before the engine sees it
    const SequenceNumber seq = wal_.append(WalEntryType::ORDER_PLACED,
                                           order_placed_payload(order));
    order.sequence = seq;

    PlaceResult result;
    try {
        result = engine_.place_order(order);
    } catch (const MatchingInvariantError& e) {
        spdlog::critical("Matching invariant violated at sequence {}: {}", seq.value(),
                         e.what());
        throw;
    }

    nlohmann::json trades = nlohmann::json::array();
    for (const Trade& trade : result.trades) {
        trades.push_back(trade_to_json_(trade));
        try {
            std::ignore = wal_.append(WalEntryType::ORDER_MATCHED, order_matched_payload(trade));
        } catch (const WalError& e) {
            // audit only; the placement is durable and replay re-derives the trade
            spdlog::error("Failed to log trade {} / {}: {}", trade.buyer_order_id,
                          trade.seller_order_id, e.what());
        }
    }

    return ServiceResponse{.status_code = 200,
                           .body = {{"server_order_id", result.order.order_id},
                                    {"status", fill_status(result.order)},
                                    {"matched", !result.trades.empty()},
                                    {"trades", trades},
                                    {"sequence_number", seq.value()}}};
}

ServiceResponse OrderService::cancel_order(const nlohmann::json& body) {
    if (!body.is_object() || !has_text(body, "order_id") || !has_text(body, "symbol")) {
        return bad_request("Missing order_id or symbol");
    }

    const auto order_id = body.at("order_id").get<std::string>();
    const auto symbol = body.at("symbol").get<std::string>();

    std::lock_guard lock(mutex_);

    std::ignore = wal_.append(WalEntryType::ORDER_CANCELLED,
                              order_cancelled_payload(symbol, order_id));
    const bool cancelled = engine_.cancel_order(symbol, order_id);

    return ServiceResponse{.status_code = 200,
                           .body = {{"status", cancelled ? "cancelled" : "not_found"}}};
}

ServiceResponse OrderService::snapshot(const std::string& symbol) const {
    if (symbol.empty()) {
        return bad_request("Missing symbol parameter");
    }

    BookSnapshot book;
    SequenceNumber sequence;
    {
        std::lock_guard lock(mutex_);
        book = engine_.get_snapshot(symbol);
        sequence = wal_.current_sequence();
    }

    return ServiceResponse{.status_code = 200,
                           .body = {{"symbol", symbol},
                                    {"bids", levels_to_json_(book.bids)},
                                    {"asks", levels_to_json_(book.asks)},
                                    {"last_sequence", sequence.value()}}};
}

ServiceResponse OrderService::health() const {
    SequenceNumber sequence;
    {
        std::lock_guard lock(mutex_);
        sequence = wal_.current_sequence();
    }

    return ServiceResponse{.status_code = 200,
                           .body = {{"status", "healthy"},
                                    {"sequence", sequence.value()},
                                    {"timestamp", clock_.now().value()}}};
}

ServiceResponse OrderService::handle(const nlohmann::json& request) {
    if (!request.is_object() || !has_text(request, "op")) {
        return bad_request("Missing op");
    }

    const auto op = request.at("op").get<std::string>();
    try {
        if (op == "order") {
            return place_order(request);
        }
        if (op == "cancel") {
            return cancel_order(request);
        }
        if (op == "snapshot") {
            return snapshot(has_text(request, "symbol") ? request.at("symbol").get<std::string>()
                                                        : std::string{});
        }
        if (op == "health") {
            return health();
        }
    } catch (const WalError& e) {
        if (wal_.failed()) {
            // the entry may be in the file without having been applied
            spdlog::critical("WAL failed during '{}', engine and log may differ: {}", op,
                             e.what());
            throw;
        }
        spdlog::error("Request '{}' failed: {}", op, e.what());
        return ServiceResponse{.status_code = 500, .body = {{"error", "Internal server error"}}};
    }

    return ServiceResponse{.status_code = 404, .body = {{"error", "Unknown op: " + op}}};
}

nlohmann::json OrderService::trade_to_json_(const Trade& trade) const {
    return nlohmann::json{{"buyer_order_id", trade.buyer_order_id},
                          {"seller_order_id", trade.seller_order_id},
                          {"price", scale_.from_price(trade.price)},
                          {"quantity", scale_.from_quantity(trade.quantity)}};
}

nlohmann::json OrderService::levels_to_json_(const PriceLevels& levels) const {
    nlohmann::json result = nlohmann::json::array();
    for (const auto& [price, quantity] : levels) {
        result.push_back({scale_.from_price(price), scale_.from_quantity(quantity)});
    }
    return result;
}
