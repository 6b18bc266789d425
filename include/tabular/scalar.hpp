#pragma once

#include <charconv>
#include <limits>
#include <string>
#include <system_error>
#include <type_traits>
#include "error.hpp"
#include "kinds.hpp"

namespace tabular {

// =============================================================================
// Scalar formatting
// =============================================================================

auto format_bool(bool value) -> std::string;

template<Integer T>
auto format_integer(T value) -> std::string {
    char buffer[std::numeric_limits<T>::digits10 + 3];
    auto [end, ec] = std::to_chars(buffer, buffer + sizeof(buffer), value);
    return std::string(buffer, end);
}

// Shortest representation that parses back to the same value, in fixed
// notation (60.429, not 6.0429e+01)
template<Floating T>
auto format_floating(T value) -> std::string {
    auto buffer = std::string(64, '\0');
    while (true) {
        auto [end, ec] = std::to_chars(buffer.data(), buffer.data() + buffer.size(), value,
                                       std::chars_format::fixed);
        if (ec == std::errc{}) {
            buffer.resize(static_cast<std::size_t>(end - buffer.data()));
            return buffer;
        }
        buffer.resize(buffer.size() * 4);
    }
}

template<Scalar T>
auto format_scalar(const T& value) -> std::string {
    if constexpr (Boolean<T>) {
        return format_bool(value);
    } else if constexpr (Integer<T>) {
        return format_integer(value);
    } else if constexpr (Floating<T>) {
        return format_floating(value);
    } else {
        return value;
    }
}

// =============================================================================
// Scalar parsing (inverse of the above; throws conversion errors)
// =============================================================================

auto parse_bool(const std::string& text) -> bool;

namespace detail {

struct integer_text_t {
    bool negative = false;
    unsigned long long magnitude = 0;
};

// Sign, optional 0x / 0o / 0b / leading-0 prefix, digits with optional '_'
// separators after a prefix. Throws on syntax errors and on overflow of
// unsigned long long.
auto parse_integer_text(const std::string& text, const std::string& type) -> integer_text_t;

auto parse_floating_text(const std::string& text) -> std::string;

} // namespace detail

template<Integer T>
auto parse_integer(const std::string& text) -> T {
    auto parsed = detail::parse_integer_text(text, type_name<T>());
    auto out_of_range = [&]() {
        return conversion_error("parsing `" + text + "` as " + type_name<T>() + ": value out of range");
    };

    if constexpr (std::is_unsigned_v<T>) {
        if (parsed.negative && parsed.magnitude != 0) throw out_of_range();
        if (parsed.magnitude > std::numeric_limits<T>::max()) throw out_of_range();
        return static_cast<T>(parsed.magnitude);
    } else {
        using U = std::make_unsigned_t<T>;
        auto limit = static_cast<unsigned long long>(static_cast<U>(std::numeric_limits<T>::max()));
        if (!parsed.negative) {
            if (parsed.magnitude > limit) throw out_of_range();
            return static_cast<T>(parsed.magnitude);
        }
        if (parsed.magnitude > limit + 1) throw out_of_range();
        if (parsed.magnitude == limit + 1) return std::numeric_limits<T>::min();
        return static_cast<T>(-static_cast<long long>(parsed.magnitude));
    }
}

template<Floating T>
auto parse_floating(const std::string& text) -> T {
    auto digits = detail::parse_floating_text(text);
    auto value = T{};
    auto first = digits.data();
    auto last = digits.data() + digits.size();
    auto [end, ec] = std::from_chars(first, last, value, std::chars_format::general);

    if (ec == std::errc::result_out_of_range) {
        throw conversion_error("parsing `" + text + "` as " + type_name<T>() + ": value out of range");
    }
    if (ec != std::errc{} || end != last || digits.empty()) {
        throw conversion_error("parsing `" + text + "` as " + type_name<T>() + ": invalid syntax");
    }
    return value;
}

template<Scalar T>
void parse_scalar(T& target, const std::string& text) {
    if constexpr (Boolean<T>) {
        target = parse_bool(text);
    } else if constexpr (Integer<T>) {
        target = parse_integer<T>(text);
    } else if constexpr (Floating<T>) {
        target = parse_floating<T>(text);
    } else {
        target = text;
    }
}

} // namespace tabular
