#include "exchange/matching_engine.hpp"

#include <iomanip>
#include <iostream>
#include <stdexcept>

PlaceResult MatchingEngine::place_order(Order order) {
    int side_idx = order.side == OrderSide::BUY ? 0 : 1;
    int type_idx = order.type == OrderType::LIMIT ? 0 : 1;
    MatchFunction match = dispatch_table_[side_idx][type_idx];

    auto it = books_.find(order.symbol);
    if (it != books_.end()) {
        return (this->*match)(it->second, order);
    }

    // a symbol only gets a book once something rests in it
    OrderBook book;
    std::string symbol = order.symbol;
    PlaceResult result = (this->*match)(book, order);
    if (!book.registry.empty()) {
        books_.emplace(std::move(symbol), std::move(book));
    }
    return result;
}

void MatchingEngine::add_to_book_(OrderBook& book, const Order& order) {
    if (order.type != OrderType::LIMIT || order.is_filled()) {
        throw MatchingInvariantError("order " + order.order_id +
                                     " cannot rest: only unfilled limit orders rest");
    }

    if (order.side == OrderSide::BUY) {
        auto& queue = book.bids[order.price];
        queue.push_back(order);
        book.registry[order.order_id] = {order.price, OrderSide::BUY};
    } else {
        auto& queue = book.asks[order.price];
        queue.push_back(order);
        book.registry[order.order_id] = {order.price, OrderSide::SELL};
    }
}

const OrderBook* MatchingEngine::find_book_(const std::string& symbol) const {
    auto it = books_.find(symbol);
    return it == books_.end() ? nullptr : &it->second;
}

std::optional<Order> MatchingEngine::get_order(const std::string& symbol,
                                               const std::string& order_id) const {
    const OrderBook* book = find_book_(symbol);
    if (book == nullptr) {
        return std::nullopt;
    }

    auto it = book->registry.find(order_id);
    if (it == book->registry.end()) {
        return std::nullopt;
    }

    const auto& [price, side] = it->second;
    const Order* order = side == OrderSide::BUY
                             ? find_in_side_(book->bids, order_id, price)
                             : find_in_side_(book->asks, order_id, price);

    if (order == nullptr) {
        return std::nullopt;
    }
    return *order;
}

bool MatchingEngine::has_order(const std::string& symbol,
                               const std::string& order_id) const {
    const OrderBook* book = find_book_(symbol);
    return book != nullptr && book->registry.contains(order_id);
}

bool MatchingEngine::cancel_order(const std::string& symbol, const std::string& order_id) {
    auto book_it = books_.find(symbol);
    if (book_it == books_.end()) {
        return false;
    }

    OrderBook& book = book_it->second;
    auto it = book.registry.find(order_id);
    if (it == book.registry.end()) {
        return false;
    }

    const auto [price, side] = it->second;

    return side == OrderSide::BUY ? remove_from_book_(book, order_id, price, book.bids)
                                  : remove_from_book_(book, order_id, price, book.asks);
}

BookSnapshot MatchingEngine::get_snapshot(const std::string& symbol) const {
    const OrderBook* book = find_book_(symbol);
    if (book == nullptr) {
        return {};
    }

    return BookSnapshot{.bids = make_snapshot(book->bids), .asks = make_snapshot(book->asks)};
}

FullState MatchingEngine::get_full_state() const {
    FullState state;
    for (const auto& [symbol, book] : books_) {
        state.emplace(symbol, BookState{.bids = flatten(book.bids), .asks = flatten(book.asks)});
    }
    return state;
}

void MatchingEngine::restore_state(const FullState& state) {
    books_.clear();

    auto restore_side = [](OrderBook& book, const std::string& symbol,
                           std::vector<Order> orders, OrderSide side) {
        // Queue position follows the WAL sequence that placed each order; stable
        // so orders without a sequence keep their serialised order.
        std::ranges::stable_sort(orders, {}, &Order::sequence);

        for (const Order& order : orders) {
            if (order.symbol != symbol || order.side != side ||
                order.type != OrderType::LIMIT || order.is_filled() ||
                book.registry.contains(order.order_id)) {
                throw std::invalid_argument("cannot restore order '" + order.order_id +
                                            "' into " + symbol);
            }
            add_to_book_(book, order);
        }
    };

    try {
        for (const auto& [symbol, book_state] : state) {
            OrderBook& book = books_[symbol];
            restore_side(book, symbol, book_state.bids, OrderSide::BUY);
            restore_side(book, symbol, book_state.asks, OrderSide::SELL);
        }
    } catch (...) {
        books_.clear();
        throw;
    }
}

std::optional<Price> MatchingEngine::best_bid(const std::string& symbol) const {
    const OrderBook* book = find_book_(symbol);
    if (book == nullptr || book->bids.empty()) {
        return std::nullopt;
    }
    return book->bids.begin()->first;
}

std::optional<Price> MatchingEngine::best_ask(const std::string& symbol) const {
    const OrderBook* book = find_book_(symbol);
    if (book == nullptr || book->asks.empty()) {
        return std::nullopt;
    }
    return book->asks.begin()->first;
}

std::vector<std::string> MatchingEngine::symbols() const {
    std::vector<std::string> result;
    result.reserve(books_.size());
    for (const auto& [symbol, book] : books_) {
        result.push_back(symbol);
    }
    return result;
}

std::size_t MatchingEngine::resting_order_count() const noexcept {
    std::size_t count = 0;
    for (const auto& [symbol, book] : books_) {
        count += book.registry.size();
    }
    return count;
}

void MatchingEngine::reset() {
    books_.clear();
}

void MatchingEngine::print_order_book(const std::string& symbol, std::size_t depth) const {
    BookSnapshot snapshot = get_snapshot(symbol);

    std::cout << "=============== " << symbol << " ===============\n";
    std::cout << "   BID (Qty @ Price) |   ASK (Qty @ Price)\n";
    std::cout << "---------------------+---------------------\n";

    auto bid_it = snapshot.bids.begin();
    auto ask_it = snapshot.asks.begin();

    for (std::size_t i = 0; i < depth; ++i) {
        if (bid_it == snapshot.bids.end() && ask_it == snapshot.asks.end()) {
            break;
        }

        std::string bid_str = (bid_it != snapshot.bids.end())
                                  ? (std::to_string(bid_it->second.value()) + " @ " +
                                     std::to_string(bid_it->first.value()))
                                  : "";
        std::string ask_str = (ask_it != snapshot.asks.end())
                                  ? (std::to_string(ask_it->second.value()) + " @ " +
                                     std::to_string(ask_it->first.value()))
                                  : "";

        std::cout << std::setw(20) << bid_str << " | " << ask_str << "\n";

        if (bid_it != snapshot.bids.end()) ++bid_it;
        if (ask_it != snapshot.asks.end()) ++ask_it;
    }

    std::cout << std::flush;
}
