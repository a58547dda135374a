#include <quarry/core/value.hpp>

#include <fmt/core.h>

#include <bit>
#include <cmath>
#include <functional>
#include <limits>

namespace quarry {

namespace {

// Rank of each kind in the cross-kind total order. Numeric kinds share a rank.
auto kind_rank(ValueKind kind) noexcept -> int {
    switch (kind) {
        case ValueKind::Null:
            return 0;
        case ValueKind::Bool:
            return 1;
        case ValueKind::Int:
        case ValueKind::BigInt:
        case ValueKind::Double:
            return 2;
        case ValueKind::String:
            return 3;
    }
    return 4;
}

auto compare_doubles(double l, double r) noexcept -> std::weak_ordering {
    const bool l_nan = std::isnan(l);
    const bool r_nan = std::isnan(r);
    if (l_nan || r_nan) {
        return l_nan <=> r_nan;
    }
    if (l < r) {
        return std::weak_ordering::less;
    }
    if (l > r) {
        return std::weak_ordering::greater;
    }
    return std::weak_ordering::equivalent;
}

// Exact; converting the integer to double would round above 2^53.
auto compare_int_double(std::int64_t i, double d) noexcept -> std::weak_ordering {
    if (std::isnan(d) || d >= 0x1p63) {
        return std::weak_ordering::less;
    }
    if (d < -0x1p63) {
        return std::weak_ordering::greater;
    }
    const double whole = std::trunc(d);
    const auto t = static_cast<std::int64_t>(whole);
    if (i != t) {
        return i <=> t;
    }
    const double fraction = d - whole;
    if (fraction > 0.0) {
        return std::weak_ordering::less;
    }
    if (fraction < 0.0) {
        return std::weak_ordering::greater;
    }
    return std::weak_ordering::equivalent;
}

// Total order over numbers: NaN equals only NaN and sorts after every other number.
auto compare_numeric(const Value& lhs, const Value& rhs) noexcept -> std::weak_ordering {
    const bool l_int = is_integral(lhs);
    const bool r_int = is_integral(rhs);
    if (l_int && r_int) {
        return *as_int64(lhs) <=> *as_int64(rhs);
    }
    if (l_int) {
        return compare_int_double(*as_int64(lhs), std::get<double>(rhs));
    }
    if (r_int) {
        return 0 <=> compare_int_double(*as_int64(rhs), std::get<double>(lhs));
    }
    return compare_doubles(std::get<double>(lhs), std::get<double>(rhs));
}

auto format_double(double value) -> std::string {
    if (std::isfinite(value) && value == std::floor(value) && std::fabs(value) < 1e15) {
        return fmt::format("{:.1f}", value);
    }
    return fmt::format("{}", value);
}

}  // namespace

auto kind_of(const Value& value) noexcept -> ValueKind {
    switch (value.index()) {
        case 0:
            return ValueKind::Null;
        case 1:
            return ValueKind::Bool;
        case 2:
            return ValueKind::Int;
        case 3:
            return ValueKind::BigInt;
        case 4:
            return ValueKind::Double;
        default:
            return ValueKind::String;
    }
}

auto kind_name(ValueKind kind) noexcept -> const char* {
    switch (kind) {
        case ValueKind::Null:
            return "NULL";
        case ValueKind::Bool:
            return "BOOLEAN";
        case ValueKind::Int:
            return "INT";
        case ValueKind::BigInt:
            return "BIGINT";
        case ValueKind::Double:
            return "DOUBLE";
        case ValueKind::String:
            return "VARCHAR";
    }
    return "?";
}

auto is_numeric(const Value& value) noexcept -> bool {
    const auto kind = kind_of(value);
    return kind == ValueKind::Int || kind == ValueKind::BigInt || kind == ValueKind::Double;
}

auto is_integral(const Value& value) noexcept -> bool {
    const auto kind = kind_of(value);
    return kind == ValueKind::Int || kind == ValueKind::BigInt;
}

auto as_double(const Value& value) noexcept -> std::optional<double> {
    if (const auto* v = std::get_if<std::int32_t>(&value)) {
        return static_cast<double>(*v);
    }
    if (const auto* v = std::get_if<std::int64_t>(&value)) {
        return static_cast<double>(*v);
    }
    if (const auto* v = std::get_if<double>(&value)) {
        return *v;
    }
    return std::nullopt;
}

auto as_int64(const Value& value) noexcept -> std::optional<std::int64_t> {
    if (const auto* v = std::get_if<std::int32_t>(&value)) {
        return static_cast<std::int64_t>(*v);
    }
    if (const auto* v = std::get_if<std::int64_t>(&value)) {
        return *v;
    }
    return std::nullopt;
}

auto compare(const Value& lhs, const Value& rhs) noexcept -> std::weak_ordering {
    const auto lkind = kind_of(lhs);
    const auto rkind = kind_of(rhs);
    const int lrank = kind_rank(lkind);
    const int rrank = kind_rank(rkind);
    if (lrank != rrank) {
        return lrank <=> rrank;
    }
    switch (lkind) {
        case ValueKind::Null:
            return std::weak_ordering::equivalent;
        case ValueKind::Bool:
            return std::get<bool>(lhs) <=> std::get<bool>(rhs);
        case ValueKind::String:
            return std::get<std::string>(lhs).compare(std::get<std::string>(rhs)) <=> 0;
        default:
            return compare_numeric(lhs, rhs);
    }
}

auto hash_value(const Value& value) noexcept -> std::size_t {
    switch (kind_of(value)) {
        case ValueKind::Null:
            return 0x9e3779b97f4a7c15ULL;
        case ValueKind::Bool:
            return std::hash<bool>{}(std::get<bool>(value));
        case ValueKind::String:
            return std::hash<std::string>{}(std::get<std::string>(value));
        case ValueKind::Int:
        case ValueKind::BigInt:
            return std::hash<std::int64_t>{}(*as_int64(value));
        case ValueKind::Double: {
            const double d = std::get<double>(value);
            if (std::isnan(d)) {
                return 0x7ff8000000000000ULL;
            }
            // Integral doubles must hash like the equal integer.
            if (d == std::floor(d) && d >= -0x1p63 && d < 0x1p63) {
                return std::hash<std::int64_t>{}(static_cast<std::int64_t>(d));
            }
            return std::hash<std::uint64_t>{}(std::bit_cast<std::uint64_t>(d));
        }
    }
    return 0;
}

auto format_value(const Value& value) -> std::string {
    return std::visit(
        [](const auto& v) -> std::string {
            using T = std::decay_t<decltype(v)>;
            if constexpr (std::is_same_v<T, std::monostate>) {
                return "NULL";
            } else if constexpr (std::is_same_v<T, bool>) {
                return v ? "TRUE" : "FALSE";
            } else if constexpr (std::is_same_v<T, double>) {
                return format_double(v);
            } else {
                return fmt::format("{}", v);
            }
        },
        value);
}

auto coerce(const Value& value, ValueKind kind) -> std::optional<Value> {
    if (is_null(value)) {
        return Value{};
    }
    const auto source = kind_of(value);
    if (source == kind) {
        return value;
    }
    switch (kind) {
        case ValueKind::Int: {
            auto wide = as_int64(value);
            if (!wide.has_value() || *wide < std::numeric_limits<std::int32_t>::min() ||
                *wide > std::numeric_limits<std::int32_t>::max()) {
                return std::nullopt;
            }
            return Value{static_cast<std::int32_t>(*wide)};
        }
        case ValueKind::BigInt: {
            auto wide = as_int64(value);
            if (!wide.has_value()) {
                return std::nullopt;
            }
            return Value{*wide};
        }
        case ValueKind::Double: {
            auto d = as_double(value);
            if (!d.has_value()) {
                return std::nullopt;
            }
            return Value{*d};
        }
        default:
            return std::nullopt;
    }
}

auto RowHash::operator()(const Row& row) const noexcept -> std::size_t {
    std::size_t seed = row.size();
    for (const auto& value : row) {
        seed ^= hash_value(value) + 0x9e3779b97f4a7c15ULL + (seed << 6) + (seed >> 2);
    }
    return seed;
}

auto RowEq::operator()(const Row& lhs, const Row& rhs) const noexcept -> bool {
    if (lhs.size() != rhs.size()) {
        return false;
    }
    for (std::size_t i = 0; i < lhs.size(); ++i) {
        if (!values_equal(lhs[i], rhs[i])) {
            return false;
        }
    }
    return true;
}

}  // namespace quarry
