#include "exchange/types.hpp"

#include <string>

OrderSide parse_order_side(std::string_view text) {
    if (text == "buy") {
        return OrderSide::BUY;
    }
    if (text == "sell") {
        return OrderSide::SELL;
    }
    throw std::invalid_argument("Invalid side: " + std::string(text));
}

OrderType parse_order_type(std::string_view text) {
    if (text == "limit") {
        return OrderType::LIMIT;
    }
    if (text == "market") {
        return OrderType::MARKET;
    }
    throw std::invalid_argument("Invalid type: " + std::string(text));
}
