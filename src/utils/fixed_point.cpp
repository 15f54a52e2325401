#include "utils/fixed_point.hpp"

#include <cmath>
#include <format>
#include <limits>
#include <stdexcept>

namespace {

std::uint64_t scale_value(double value, std::uint64_t scale, const char* what) {
    if (!std::isfinite(value) || value < 0.0) {
        throw std::invalid_argument(std::format("{} must be a finite, non-negative number",
                                                what));
    }

    const double scaled = std::round(value * static_cast<double>(scale));
    // 2^64 is exactly representable; anything at or above it does not fit
    if (scaled >= 18446744073709551616.0) {
        throw std::invalid_argument(std::format("{} is out of range", what));
    }

    return static_cast<std::uint64_t>(scaled);
}

} // namespace

Price FixedPointScale::to_price(double value) const {
    return Price{scale_value(value, price_scale, "price")};
}

Quantity FixedPointScale::to_quantity(double value) const {
    return Quantity{scale_value(value, quantity_scale, "quantity")};
}

double FixedPointScale::from_price(Price price) const noexcept {
    return static_cast<double>(price.value()) / static_cast<double>(price_scale);
}

double FixedPointScale::from_quantity(Quantity quantity) const noexcept {
    return static_cast<double>(quantity.value()) / static_cast<double>(quantity_scale);
}
