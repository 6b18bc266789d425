#pragma once

#include <array>
#include <concepts>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <type_traits>
#include <typeinfo>
#include <unordered_map>
#include <vector>

namespace tabular {

// =============================================================================
// Closed enumeration of supported kinds
// =============================================================================
//
// boolean, integer, floating, string, optional, sequence, associative, record.
// Everything else is an unsupported type unless it carries a hook (hooks.hpp).

// Character types are not integers here; signed char and unsigned char are,
// being std::int8_t and std::uint8_t
template<typename T>
struct is_character : std::false_type {};

template<> struct is_character<char> : std::true_type {};
template<> struct is_character<wchar_t> : std::true_type {};
template<> struct is_character<char8_t> : std::true_type {};
template<> struct is_character<char16_t> : std::true_type {};
template<> struct is_character<char32_t> : std::true_type {};

template<typename T>
concept Boolean = std::same_as<T, bool>;

template<typename T>
concept Integer = std::integral<T> && !Boolean<T> && !is_character<T>::value;

template<typename T>
concept Floating = std::floating_point<T>;

template<typename T>
concept String = std::same_as<T, std::string>;

// Enums without string hooks travel as their underlying integer
template<typename T>
concept PlainEnum = std::is_enum_v<T>;

template<typename T>
concept Scalar = Boolean<T> || Integer<T> || Floating<T> || String<T>;

// =============================================================================
// Optional kinds: std::optional, std::unique_ptr, std::shared_ptr
// =============================================================================

template<typename T>
struct optional_traits : std::false_type {};

template<typename U>
struct optional_traits<std::optional<U>> : std::true_type {
    using value_type = U;
    static auto engaged(const std::optional<U>& v) -> bool { return v.has_value(); }
    static auto get(const std::optional<U>& v) -> const U& { return *v; }
    static auto emplace(std::optional<U>& v) -> U& { return v.emplace(); }
};

template<typename U>
struct optional_traits<std::unique_ptr<U>> : std::true_type {
    using value_type = U;
    static auto engaged(const std::unique_ptr<U>& v) -> bool { return v != nullptr; }
    static auto get(const std::unique_ptr<U>& v) -> const U& { return *v; }
    static auto emplace(std::unique_ptr<U>& v) -> U& {
        v = std::make_unique<U>();
        return *v;
    }
};

template<typename U>
struct optional_traits<std::shared_ptr<U>> : std::true_type {
    using value_type = U;
    static auto engaged(const std::shared_ptr<U>& v) -> bool { return v != nullptr; }
    static auto get(const std::shared_ptr<U>& v) -> const U& { return *v; }
    static auto emplace(std::shared_ptr<U>& v) -> U& {
        v = std::make_shared<U>();
        return *v;
    }
};

template<typename T>
concept Optional = optional_traits<T>::value;

template<Optional T>
using pointee_t = typename optional_traits<T>::value_type;

// =============================================================================
// Sequence kinds: std::vector, std::array
// =============================================================================

template<typename T>
struct is_vector : std::false_type {};

template<typename U, typename A>
struct is_vector<std::vector<U, A>> : std::true_type {};

template<typename T>
struct is_std_array : std::false_type {};

template<typename U, std::size_t N>
struct is_std_array<std::array<U, N>> : std::true_type {};

template<typename T>
concept Sequence = is_vector<T>::value || is_std_array<T>::value;

// =============================================================================
// Associative kinds: std::map, std::unordered_map
// =============================================================================

template<typename T>
struct is_associative : std::false_type {};

template<typename K, typename V, typename C, typename A>
struct is_associative<std::map<K, V, C, A>> : std::true_type {};

template<typename K, typename V, typename H, typename E, typename A>
struct is_associative<std::unordered_map<K, V, H, E, A>> : std::true_type {};

template<typename T>
concept Associative = is_associative<T>::value;

// =============================================================================
// Record kind: types declaring their fields through ADL fields(t)
// =============================================================================

template<typename T>
concept Record = std::default_initializable<T> && requires(T& t, const T& c) {
    { fields(t) };
    { fields(c) };
};

// =============================================================================
// Type names for diagnostics
// =============================================================================

template<typename T>
auto type_name() -> std::string {
    if constexpr (Boolean<T>) {
        return "bool";
    } else if constexpr (Integer<T>) {
        return (std::is_signed_v<T> ? "int" : "uint") + std::to_string(sizeof(T) * 8);
    } else if constexpr (Floating<T>) {
        return "float" + std::to_string(sizeof(T) * 8);
    } else if constexpr (String<T>) {
        return "string";
    } else if constexpr (Optional<T>) {
        return "optional<" + type_name<pointee_t<T>>() + ">";
    } else if constexpr (Sequence<T>) {
        return "sequence<" + type_name<typename T::value_type>() + ">";
    } else if constexpr (Associative<T>) {
        return "map<" + type_name<typename T::key_type>() + ", " + type_name<typename T::mapped_type>() + ">";
    } else {
        return typeid(T).name();
    }
}

} // namespace tabular
