#pragma once

#include <concepts>
#include <cstddef>
#include <cstdint>
#include <format>
#include <functional>
#include <ostream>
#include <type_traits>

#include <nlohmann/json.hpp>

/**
    Strong type over a trivial integer. Keeps prices, quantities, timestamps and
    WAL sequence numbers from being mixed up by accident.

    To define a type:

    struct Custom : StrongType<std::uint64_t, Custom> {
        using StrongType::StrongType;
    };

    Custom var = Custom{199};
*/
template <typename Base, typename Tag> struct StrongType {
    static_assert(std::is_integral_v<Base>, "The value type must be an integer");
    using value_type = Base;
    using tag_type = Tag;

public:
    explicit constexpr StrongType(Base value) noexcept : data_m(value) {}
    constexpr StrongType() noexcept : data_m{} {}

    [[nodiscard]] constexpr auto value() const noexcept { return data_m; }
    explicit constexpr operator Base() const noexcept { return data_m; }

    friend std::ostream& operator<<(std::ostream& os, const StrongType& st) {
        return os << st.data_m;
    }

    constexpr auto operator<=>(const StrongType&) const noexcept = default;
    constexpr auto operator<=>(Base other) const noexcept { return data_m <=> other; }
    constexpr bool operator==(Base other) const noexcept { return data_m == other; }
    constexpr bool operator==(const StrongType& other) const noexcept {
        return other.data_m == data_m;
    }

    constexpr Tag operator+(const Tag& other) const noexcept {
        return Tag{static_cast<Base>(data_m + other.data_m)};
    }

    constexpr Tag operator-(const Tag& other) const noexcept {
        return Tag{static_cast<Base>(data_m - other.data_m)};
    }

    constexpr Tag& operator+=(const Tag& other) noexcept {
        data_m += other.data_m;
        return static_cast<Tag&>(*this);
    }

    constexpr Tag& operator-=(const Tag& other) noexcept {
        data_m -= other.data_m;
        return static_cast<Tag&>(*this);
    }

    constexpr Tag& operator++() noexcept {
        ++data_m;
        return static_cast<Tag&>(*this);
    }

    [[nodiscard]] constexpr bool is_zero() const noexcept { return data_m == 0; }

protected:
    Base data_m;
};

template <typename T>
concept IsStrongType = requires {
    typename T::value_type;
    typename T::tag_type;
} && std::derived_from<T, StrongType<typename T::value_type, typename T::tag_type>>;

template <typename Tag>
    requires IsStrongType<Tag> && std::formattable<typename Tag::value_type, char>
struct std::formatter<Tag> : std::formatter<typename Tag::value_type> {
    template <typename FormatContext>
    auto format(const Tag& st, FormatContext& ctx) const {
        return std::formatter<typename Tag::value_type>::format(st.value(), ctx);
    }
};

template <typename Strong> struct strong_hash {
    std::size_t operator()(const Strong& v) const noexcept {
        return std::hash<typename Strong::value_type>{}(v.value());
    }
};

// Strong types go to JSON as the bare integer so WAL lines and snapshot files
// stay readable with any JSON tool.
template <typename Tag>
    requires IsStrongType<Tag>
void to_json(nlohmann::json& j, const Tag& st) {
    j = st.value();
}

template <typename Tag>
    requires IsStrongType<Tag>
void from_json(const nlohmann::json& j, Tag& st) {
    st = Tag{j.get<typename Tag::value_type>()};
}

// Price in ticks (see FixedPointScale)
struct Price : StrongType<std::uint64_t, Price> {
    using StrongType::StrongType;
};

// Quantity in lots (see FixedPointScale)
struct Quantity : StrongType<std::uint64_t, Quantity> {
    using StrongType::StrongType;
};

// Milliseconds since the Unix epoch
struct Timestamp : StrongType<std::uint64_t, Timestamp> {
    using StrongType::StrongType;
};

struct SequenceNumber : StrongType<std::uint64_t, SequenceNumber> {
    using StrongType::StrongType;
};
