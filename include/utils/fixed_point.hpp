#pragma once

#include "utils/types.hpp"

#include <cstdint>

/**
 * Conversion between the decimal numbers used at the request boundary and the
 * integer ticks/lots used everywhere else.
 *
 * With the default scale of 10^8, a price of 50000.0 is Price{5'000'000'000'000}
 * and a quantity of 0.5 is Quantity{50'000'000}. Values are rounded to the
 * nearest unit; negative, non-finite and out-of-range values throw
 * std::invalid_argument.
 */
struct FixedPointScale {
    std::uint64_t price_scale{100'000'000};
    std::uint64_t quantity_scale{100'000'000};

    [[nodiscard]] Price to_price(double value) const;
    [[nodiscard]] Quantity to_quantity(double value) const;

    [[nodiscard]] double from_price(Price price) const noexcept;
    [[nodiscard]] double from_quantity(Quantity quantity) const noexcept;
};
