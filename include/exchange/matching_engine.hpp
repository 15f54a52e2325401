#pragma once

#include "exchange/types.hpp"
#include <algorithm>
#include <deque>
#include <map>
#include <optional>
#include <ranges>
#include <string>
#include <vector>

/**
 * Price-time priority matcher over one order book per symbol.
 *
 * The engine is a pure state machine: the same ordered sequence of
 * place_order/cancel_order calls always yields the same books and the same
 * trades. It never reads the clock; queue position within a price level is the
 * order in which orders were added to the book. It is not thread safe, callers
 * serialise access (see OrderService).
 */
class MatchingEngine {
public:
    MatchingEngine() {
        dispatch_table_[0][0] = &MatchingEngine::match_order_<BuySide, LimitOrderPolicy>;
        dispatch_table_[0][1] = &MatchingEngine::match_order_<BuySide, MarketOrderPolicy>;
        dispatch_table_[1][0] = &MatchingEngine::match_order_<SellSide, LimitOrderPolicy>;
        dispatch_table_[1][1] =
            &MatchingEngine::match_order_<SellSide, MarketOrderPolicy>;
    }

    // Matches the order against the opposite side and rests any limit remainder.
    // Trades execute at the resting order's price. The order is not validated.
    [[nodiscard]] PlaceResult place_order(Order order);

    [[nodiscard]] bool cancel_order(const std::string& symbol, const std::string& order_id);

    [[nodiscard]] std::optional<Order> get_order(const std::string& symbol,
                                                 const std::string& order_id) const;
    [[nodiscard]] bool has_order(const std::string& symbol,
                                 const std::string& order_id) const;

    // Aggregated price levels, best first. Unknown symbols give empty sides.
    [[nodiscard]] BookSnapshot get_snapshot(const std::string& symbol) const;

    [[nodiscard]] FullState get_full_state() const;

    // Replaces every book with the given state. Throws std::invalid_argument if
    // the state holds an order that could not legally rest; the engine is left
    // empty in that case.
    void restore_state(const FullState& state);

    [[nodiscard]] std::optional<Price> best_bid(const std::string& symbol) const;
    [[nodiscard]] std::optional<Price> best_ask(const std::string& symbol) const;

    [[nodiscard]] std::vector<std::string> symbols() const;
    [[nodiscard]] std::size_t resting_order_count() const noexcept;

    void reset();

    void print_order_book(const std::string& symbol, std::size_t depth = 15) const;

private:
    std::map<std::string, OrderBook> books_;

    using MatchFunction = PlaceResult (MatchingEngine::*)(OrderBook&, Order&);
    MatchFunction dispatch_table_[2][2];

    template <typename SidePolicy, typename TypePolicy>
    PlaceResult match_order_(OrderBook& book, Order& order);

    [[nodiscard]] const OrderBook* find_book_(const std::string& symbol) const;

    static void add_to_book_(OrderBook& book, const Order& order);

    template <typename Book> [[nodiscard]] static bool
    remove_from_book_(OrderBook& book, const std::string& order_id, Price price,
                      Book& book_side);

    template <typename Book> static const Order*
    find_in_side_(const Book& book_side, const std::string& order_id, Price price);

    static PriceLevels make_snapshot(const auto& book_side) {
        PriceLevels snapshot;
        snapshot.reserve(book_side.size());

        for (const auto& [price, queue] : book_side) {
            auto qtyView = queue | std::views::transform([](const Order& order) {
                               return order.remaining();
                           });

            Quantity total = std::ranges::fold_left(qtyView, Quantity{0},
                                                    [](Quantity acc, Quantity q) {
                                                        return acc + q;
                                                    });

            if (!total.is_zero()) {
                snapshot.emplace_back(price, total);
            }
        }

        return snapshot;
    }

    static std::vector<Order> flatten(const auto& book_side) {
        std::vector<Order> orders;
        for (const auto& [price, queue] : book_side) {
            orders.insert(orders.end(), queue.begin(), queue.end());
        }
        return orders;
    }

    struct BuySide {
        constexpr static auto& book(OrderBook& book) { return book.asks; }
        static bool price_passes(Price order_price, Price best_price) {
            return order_price >= best_price;
        }
        constexpr static bool is_buyer() { return true; }
    };

    struct SellSide {
        constexpr static auto& book(OrderBook& book) { return book.bids; }
        static bool price_passes(Price order_price, Price best_price) {
            return order_price <= best_price;
        }
        constexpr static bool is_buyer() { return false; }
    };

    struct LimitOrderPolicy {
        constexpr static bool needs_price_check() { return true; }

        static OrderStatus finalize(OrderBook& book, const Order& order) {
            if (order.is_filled()) {
                return OrderStatus::FILLED;
            }

            add_to_book_(book, order);
            return order.filled_quantity.is_zero() ? OrderStatus::ACCEPTED
                                                   : OrderStatus::PARTIALLY_FILLED;
        }
    };

    struct MarketOrderPolicy {
        constexpr static bool needs_price_check() { return false; }

        static OrderStatus finalize(OrderBook&, const Order& order) {
            if (order.is_filled()) {
                return OrderStatus::FILLED;
            }

            // the unfilled remainder of a market order is discarded, never rested
            return order.filled_quantity.is_zero() ? OrderStatus::CANCELLED
                                                   : OrderStatus::PARTIALLY_FILLED;
        }
    };
};

template <typename SidePolicy, typename OrderTypePolicy>
PlaceResult MatchingEngine::match_order_(OrderBook& book, Order& order) {
    std::vector<Trade> trades{};
    auto& book_side = SidePolicy::book(book);

    while (!order.is_filled() && !book_side.empty()) {
        auto it = book_side.begin();
        const Price best_price = it->first;

        if constexpr (OrderTypePolicy::needs_price_check()) {
            if (!SidePolicy::price_passes(order.price, best_price)) {
                break;
            }
        }

        std::deque<Order>& queue = it->second;

        while (!order.is_filled() && !queue.empty()) {
            Order& resting = queue.front();
            Quantity match_quantity = std::min(order.remaining(), resting.remaining());

            order.filled_quantity += match_quantity;
            resting.filled_quantity += match_quantity;

            if (SidePolicy::is_buyer()) {
                trades.emplace_back(Trade{.buyer_order_id = order.order_id,
                                          .seller_order_id = resting.order_id,
                                          .price = best_price,
                                          .quantity = match_quantity});
            } else {
                trades.emplace_back(Trade{.buyer_order_id = resting.order_id,
                                          .seller_order_id = order.order_id,
                                          .price = best_price,
                                          .quantity = match_quantity});
            }

            if (resting.is_filled()) {
                book.registry.erase(resting.order_id);
                queue.pop_front();
            }
        }

        if (queue.empty()) {
            book_side.erase(it);
        }
    }

    if (order.filled_quantity > order.quantity) {
        throw MatchingInvariantError("order " + order.order_id + " overfilled");
    }

    OrderStatus status = OrderTypePolicy::finalize(book, order);

    return PlaceResult{.order = order, .trades = std::move(trades), .status = status};
}

template <typename Book>
bool MatchingEngine::remove_from_book_(OrderBook& book, const std::string& order_id,
                                       Price price, Book& book_side) {
    auto it = book_side.find(price);
    if (it == book_side.end()) {
        return false;
    }

    std::deque<Order>& queue = it->second;

    for (auto qIt = queue.begin(); qIt != queue.end(); ++qIt) {
        if (qIt->order_id != order_id) {
            continue;
        }

        book.registry.erase(order_id);
        queue.erase(qIt);

        if (queue.empty()) {
            book_side.erase(it);
        }

        return true;
    }

    return false;
}

template <typename Book>
const Order* MatchingEngine::find_in_side_(const Book& book_side,
                                           const std::string& order_id, Price price) {
    auto it = book_side.find(price);
    if (it == book_side.end()) {
        return nullptr;
    }

    for (const auto& order : it->second) {
        if (order.order_id == order_id) {
            return &order;
        }
    }

    return nullptr;
}
