#include <gtest/gtest.h>

#include "utils/fixed_point.hpp"
#include "utils/types.hpp"

#include <cmath>
#include <format>
#include <limits>
#include <sstream>
#include <stdexcept>
#include <tuple>
#include <unordered_set>

// =============================================================================
// Arithmetic Operators
// =============================================================================

TEST(StrongTypeTest, AdditionOperator) {
    EXPECT_EQ(Quantity{100} + Quantity{50}, Quantity{150});
    EXPECT_EQ(Price{1000} + Price{500}, Price{1500});
    EXPECT_EQ(Timestamp{10} + Timestamp{5}, Timestamp{15});
}

TEST(StrongTypeTest, SubtractionOperator) {
    EXPECT_EQ(Quantity{100} - Quantity{30}, Quantity{70});
    EXPECT_EQ(Price{1000} - Price{100}, Price{900});
}

TEST(StrongTypeTest, AddAssign) {
    Quantity q{100};
    q += Quantity{50};
    EXPECT_EQ(q, Quantity{150});
}

TEST(StrongTypeTest, SubAssign) {
    Quantity q{100};
    q -= Quantity{30};
    EXPECT_EQ(q, Quantity{70});
}

TEST(StrongTypeTest, PreIncrement) {
    SequenceNumber seq{5};
    SequenceNumber& ref = ++seq;
    EXPECT_EQ(seq, SequenceNumber{6});
    EXPECT_EQ(&ref, &seq);
}

// =============================================================================
// Comparison Operators
// =============================================================================

TEST(StrongTypeTest, Ordering) {
    EXPECT_TRUE(Price{100} < Price{200});
    EXPECT_FALSE(Price{200} < Price{100});
    EXPECT_TRUE(Price{100} <= Price{100});
    EXPECT_TRUE(Price{200} > Price{100});
    EXPECT_TRUE(Price{100} != Price{200});
}

TEST(StrongTypeTest, ComparisonWithBaseType) {
    EXPECT_TRUE(Price{100} == 100);
    EXPECT_TRUE(Price{100} < 200);
    EXPECT_TRUE(Price{200} > 100);
}

TEST(StrongTypeTest, IsZeroAndDefault) {
    Quantity q;
    EXPECT_TRUE(q.is_zero());
    EXPECT_FALSE(Quantity{1}.is_zero());
    EXPECT_EQ(static_cast<std::uint64_t>(Price{12345}), 12345ULL);
}

// =============================================================================
// Formatting, Hashing, JSON
// =============================================================================

TEST(StrongTypeTest, FormatsAsUnderlyingValue) {
    EXPECT_EQ(std::format("{}", SequenceNumber{42}), "42");
    EXPECT_EQ(std::format("{:05}", Price{7}), "00007");

    std::ostringstream os;
    os << Quantity{9};
    EXPECT_EQ(os.str(), "9");
}

TEST(StrongTypeTest, UsableAsHashKey) {
    std::unordered_set<Price, strong_hash<Price>> prices;
    prices.insert(Price{1});
    prices.insert(Price{1});
    prices.insert(Price{2});
    EXPECT_EQ(prices.size(), 2u);
}

TEST(StrongTypeTest, JsonIsBareInteger) {
    nlohmann::json j = SequenceNumber{17};
    EXPECT_TRUE(j.is_number_unsigned());
    EXPECT_EQ(j.get<std::uint64_t>(), 17u);
    EXPECT_EQ(j.get<SequenceNumber>(), SequenceNumber{17});
}

// =============================================================================
// Fixed Point Conversion
// =============================================================================

TEST(FixedPointTest, DefaultScaleIsTenToTheEighth) {
    FixedPointScale scale;
    EXPECT_EQ(scale.to_price(50000.0), Price{5'000'000'000'000});
    EXPECT_EQ(scale.to_quantity(0.5), Quantity{50'000'000});
    EXPECT_EQ(scale.to_quantity(1.0), Quantity{100'000'000});
}

TEST(FixedPointTest, RoundsToNearestUnit) {
    FixedPointScale scale;
    // 0.1 and 0.2 are not exact in binary; the sum must still be 0.3 in lots
    EXPECT_EQ(scale.to_quantity(0.1) + scale.to_quantity(0.2), scale.to_quantity(0.3));
    EXPECT_EQ(scale.to_price(0.000000004), Price{0});
    EXPECT_EQ(scale.to_price(0.000000006), Price{1});
}

TEST(FixedPointTest, ConvertsBack) {
    FixedPointScale scale;
    EXPECT_DOUBLE_EQ(scale.from_price(Price{5'000'000'000'000}), 50000.0);
    EXPECT_DOUBLE_EQ(scale.from_quantity(Quantity{50'000'000}), 0.5);
}

TEST(FixedPointTest, CustomScale) {
    FixedPointScale cents{.price_scale = 100, .quantity_scale = 1};
    EXPECT_EQ(cents.to_price(12.34), Price{1234});
    EXPECT_EQ(cents.to_quantity(3.0), Quantity{3});
}

TEST(FixedPointTest, RejectsUnrepresentableValues) {
    FixedPointScale scale;
    EXPECT_THROW(std::ignore = scale.to_price(-1.0), std::invalid_argument);
    EXPECT_THROW(std::ignore = scale.to_quantity(std::nan("")), std::invalid_argument);
    EXPECT_THROW(std::ignore = scale.to_quantity(std::numeric_limits<double>::infinity()),
                 std::invalid_argument);
    EXPECT_THROW(std::ignore = scale.to_price(1e12), std::invalid_argument);
}
