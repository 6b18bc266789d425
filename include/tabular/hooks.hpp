#pragma once

#include <concepts>
#include <exception>
#include <string>
#include <type_traits>
#include <utility>
#include <vector>
#include "error.hpp"

namespace tabular {

// =============================================================================
// Hook capabilities
// =============================================================================
//
// A type overrides the structural encode/decode logic by exposing one of:
//
//   get_cells() const -> std::vector<std::string>     (cell getter)
//   set_cells(const std::vector<std::string>&)        (cell setter)
//   to_text() const -> std::string                    (text marshal)
//   from_text(const std::string&)                     (text unmarshal)
//
// either as members or as ADL free functions taking the value by reference
// (get_cells(v), set_cells(v, cells), to_text(v), from_text(v, text)).
// Enums with ADL to_string(e) / from_string(std::type_identity<E>, s) have
// the text capability. Hooks report failure by throwing.

namespace detail {

template<typename T>
concept MemberCellGetter = requires(const T& t) {
    { t.get_cells() } -> std::convertible_to<std::vector<std::string>>;
};

template<typename T>
concept FreeCellGetter = requires(const T& t) {
    { get_cells(t) } -> std::convertible_to<std::vector<std::string>>;
};

template<typename T>
concept MemberCellSetter = requires(T& t, const std::vector<std::string>& cells) {
    t.set_cells(cells);
};

template<typename T>
concept FreeCellSetter = requires(T& t, const std::vector<std::string>& cells) {
    set_cells(t, cells);
};

template<typename T>
concept MemberTextMarshaler = requires(const T& t) {
    { t.to_text() } -> std::convertible_to<std::string>;
};

template<typename T>
concept FreeTextMarshaler = requires(const T& t) {
    { to_text(t) } -> std::convertible_to<std::string>;
};

template<typename T>
concept MemberTextUnmarshaler = requires(T& t, const std::string& text) {
    t.from_text(text);
};

template<typename T>
concept FreeTextUnmarshaler = requires(T& t, const std::string& text) {
    from_text(t, text);
};

template<typename E>
concept EnumStrings = std::is_enum_v<E> && requires(E e, const std::string& s) {
    { to_string(e) } -> std::convertible_to<std::string>;
    { from_string(std::type_identity<E>{}, s) } -> std::same_as<E>;
};

} // namespace detail

template<typename T>
concept CellGetter = detail::MemberCellGetter<T> || detail::FreeCellGetter<T>;

template<typename T>
concept CellSetter = detail::MemberCellSetter<T> || detail::FreeCellSetter<T>;

template<typename T>
concept TextMarshaler = detail::MemberTextMarshaler<T> || detail::FreeTextMarshaler<T> || detail::EnumStrings<T>;

template<typename T>
concept TextUnmarshaler = detail::MemberTextUnmarshaler<T> || detail::FreeTextUnmarshaler<T> || detail::EnumStrings<T>;

// =============================================================================
// detect_hooks - the hook registry query, resolved per type at compile time
// =============================================================================

enum class encode_hook_t { none, cells, text };
enum class decode_hook_t { none, cells, text };

struct hook_set_t {
    encode_hook_t encode = encode_hook_t::none;
    decode_hook_t decode = decode_hook_t::none;
};

template<typename T>
constexpr auto detect_hooks() -> hook_set_t {
    auto hooks = hook_set_t{};

    if constexpr (CellGetter<T>) {
        hooks.encode = encode_hook_t::cells;
    } else if constexpr (TextMarshaler<T>) {
        hooks.encode = encode_hook_t::text;
    }

    if constexpr (CellSetter<T>) {
        hooks.decode = decode_hook_t::cells;
    } else if constexpr (TextUnmarshaler<T>) {
        hooks.decode = decode_hook_t::text;
    }
    return hooks;
}

template<typename T>
inline constexpr bool has_encode_hook = detect_hooks<T>().encode != encode_hook_t::none;

template<typename T>
inline constexpr bool has_decode_hook = detect_hooks<T>().decode != decode_hook_t::none;

// =============================================================================
// Hook invocation
// =============================================================================

namespace detail {

// Run a user hook; foreign exceptions become hook errors
template<typename F>
auto run_hook(const char* hook_name, F&& f) -> decltype(f()) {
    try {
        return f();
    } catch (const error&) {
        throw;
    } catch (const std::exception& e) {
        throw error(error_kind::hook, std::string(hook_name) + ": " + e.what());
    }
}

} // namespace detail

template<CellGetter T>
auto call_cell_getter(const T& value) -> std::vector<std::string> {
    return detail::run_hook("get_cells", [&value]() -> std::vector<std::string> {
        if constexpr (detail::MemberCellGetter<T>) {
            return value.get_cells();
        } else {
            return get_cells(value);
        }
    });
}

template<CellSetter T>
void call_cell_setter(T& value, const std::vector<std::string>& cells) {
    detail::run_hook("set_cells", [&value, &cells]() {
        if constexpr (detail::MemberCellSetter<T>) {
            value.set_cells(cells);
        } else {
            set_cells(value, cells);
        }
    });
}

template<TextMarshaler T>
auto call_text_marshaler(const T& value) -> std::string {
    return detail::run_hook("to_text", [&value]() -> std::string {
        if constexpr (detail::MemberTextMarshaler<T>) {
            return value.to_text();
        } else if constexpr (detail::FreeTextMarshaler<T>) {
            return to_text(value);
        } else {
            return std::string(to_string(value));
        }
    });
}

template<TextUnmarshaler T>
void call_text_unmarshaler(T& value, const std::string& text) {
    detail::run_hook("from_text", [&value, &text]() {
        if constexpr (detail::MemberTextUnmarshaler<T>) {
            value.from_text(text);
        } else if constexpr (detail::FreeTextUnmarshaler<T>) {
            from_text(value, text);
        } else {
            value = from_string(std::type_identity<T>{}, text);
        }
    });
}

} // namespace tabular
