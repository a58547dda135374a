#pragma once

#include <compare>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <type_traits>
#include <variant>
#include <vector>

namespace quarry {

/// Semantic type of a value or column.
enum class ValueKind : std::uint8_t {
    Null,
    Bool,
    Int,
    BigInt,
    Double,
    String,
};

/// A single SQL value. Integers keep their declared width.
using Value = std::variant<std::monostate, bool, std::int32_t, std::int64_t, double, std::string>;

/// Positional sequence of values (one per projected column).
using Row = std::vector<Value>;

[[nodiscard]] auto kind_of(const Value& value) noexcept -> ValueKind;
[[nodiscard]] auto kind_name(ValueKind kind) noexcept -> const char*;

[[nodiscard]] inline auto is_null(const Value& value) noexcept -> bool {
    return std::holds_alternative<std::monostate>(value);
}

[[nodiscard]] auto is_numeric(const Value& value) noexcept -> bool;
[[nodiscard]] auto is_integral(const Value& value) noexcept -> bool;

/// Numeric value as double; nullopt for non-numeric values.
[[nodiscard]] auto as_double(const Value& value) noexcept -> std::optional<double>;

/// Integral value widened to 64 bits; nullopt for non-integral values.
[[nodiscard]] auto as_int64(const Value& value) noexcept -> std::optional<std::int64_t>;

/// Total order used by indexes, ORDER BY and GROUP BY:
/// NULL < BOOLEAN < numeric < VARCHAR. Numerics compare by value across kinds,
/// strings compare byte-wise.
[[nodiscard]] auto compare(const Value& lhs, const Value& rhs) noexcept -> std::weak_ordering;

[[nodiscard]] inline auto values_equal(const Value& lhs, const Value& rhs) noexcept -> bool {
    return compare(lhs, rhs) == std::weak_ordering::equivalent;
}

/// Hash consistent with `compare`: numerically equal values hash equal.
[[nodiscard]] auto hash_value(const Value& value) noexcept -> std::size_t;

/// Render a value for display (NULL, TRUE/FALSE, numbers, raw strings).
[[nodiscard]] auto format_value(const Value& value) -> std::string;

/// Convert `value` to the representation of `kind`, if lossless.
[[nodiscard]] auto coerce(const Value& value, ValueKind kind) -> std::optional<Value>;

struct ValueLess {
    auto operator()(const Value& lhs, const Value& rhs) const noexcept -> bool {
        return compare(lhs, rhs) < 0;
    }
};

struct ValueHash {
    auto operator()(const Value& value) const noexcept -> std::size_t { return hash_value(value); }
};

struct ValueEq {
    auto operator()(const Value& lhs, const Value& rhs) const noexcept -> bool {
        return values_equal(lhs, rhs);
    }
};

struct RowHash {
    auto operator()(const Row& row) const noexcept -> std::size_t;
};

struct RowEq {
    auto operator()(const Row& lhs, const Row& rhs) const noexcept -> bool;
};

/// Maps a C++ field type onto its semantic kind.
template <typename T>
constexpr auto kind_for() -> ValueKind {
    if constexpr (std::is_same_v<T, bool>) {
        return ValueKind::Bool;
    } else if constexpr (std::is_same_v<T, std::int32_t>) {
        return ValueKind::Int;
    } else if constexpr (std::is_same_v<T, std::int64_t>) {
        return ValueKind::BigInt;
    } else if constexpr (std::is_same_v<T, double>) {
        return ValueKind::Double;
    } else if constexpr (std::is_same_v<T, std::string>) {
        return ValueKind::String;
    } else {
        static_assert(!sizeof(T), "unsupported field type");
    }
}

/// Extract a typed C++ value, coercing numerics losslessly.
template <typename T>
[[nodiscard]] auto value_as(const Value& value) -> std::optional<T> {
    auto converted = coerce(value, kind_for<T>());
    if (!converted.has_value()) {
        return std::nullopt;
    }
    if (const auto* typed = std::get_if<T>(&*converted)) {
        return *typed;
    }
    return std::nullopt;
}

}  // namespace quarry
