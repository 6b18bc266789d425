#pragma once

#include <cstddef>
#include <string>
#include <tuple>
#include <type_traits>
#include <utility>
#include <vector>
#include "hooks.hpp"
#include "kinds.hpp"

namespace tabular {

// =============================================================================
// Field declarations
// =============================================================================
//
// A record lists its externally visible members through ADL free functions:
//
//   struct person_t {
//       std::string name;
//       std::optional<int> age;
//       address_t address;
//       audit_t audit;
//   };
//
//   auto fields(const person_t& p) {
//       return std::make_tuple(
//           tabular::field("Name", p.name, "handle"),
//           tabular::field("Age", p.age, ",omitEmpty"),
//           tabular::field("Address", p.address),
//           tabular::embed("Audit", p.audit)
//       );
//   }
//   auto fields(person_t& p) { ...same, non-const... }
//
// The tag has the form `name[,omitEmpty]`; a name of "-" excludes the field.
// Members not listed take no part in encoding or decoding.

template<typename T>
struct field_t {
    using value_type = std::remove_const_t<T>;

    const char* name;
    T& value;
    const char* tag;
    bool embedded;
};

template<typename T>
constexpr auto field(const char* name, T& value, const char* tag = "") {
    return field_t<T>{name, value, tag, false};
}

// An anonymous member whose fields are spliced into the parent record
template<typename T>
    requires Record<std::remove_const_t<T>>
constexpr auto embed(const char* name, T& value, const char* tag = "") {
    return field_t<T>{name, value, tag, true};
}

// =============================================================================
// Field resolution
// =============================================================================

struct field_descriptor_t {
    std::string declared_name;
    std::string effective_name;
    bool omit_empty = false;
    bool skip = false;
    bool embedded = false;
};

// Parse one declaration's tag into a descriptor
auto resolve_field(const char* declared_name, const char* tag, bool embedded) -> field_descriptor_t;

template<Record T>
using fields_tuple_t = decltype(fields(std::declval<T&>()));

// Descriptors for a record type in declaration order, resolved once
template<Record T>
auto field_descriptors() -> const std::vector<field_descriptor_t>& {
    static const auto descriptors = [] {
        auto probe = T{};
        auto result = std::vector<field_descriptor_t>{};
        std::apply([&result](auto&&... f) {
            (result.push_back(resolve_field(f.name, f.tag, f.embedded)), ...);
        }, fields(probe));
        return result;
    }();
    return descriptors;
}

// =============================================================================
// Cell width - number of cells a value of type T encodes to
// =============================================================================
//
// A type-level property: records sum their non-skipped fields, optionals take
// their pointee's width, everything else (including hooked types) is one cell.
// An absent optional record encodes as this many nil cells, so populated and
// absent values produce rows of the same length.

template<typename T>
auto cell_width() -> std::size_t;

namespace detail {

template<Record T, std::size_t... I>
auto record_width(std::index_sequence<I...>) -> std::size_t {
    const auto& descriptors = field_descriptors<T>();
    auto width = std::size_t{0};
    ((width += descriptors[I].skip
        ? 0
        : cell_width<typename std::tuple_element_t<I, fields_tuple_t<T>>::value_type>()), ...);
    return width;
}

} // namespace detail

template<typename T>
auto cell_width() -> std::size_t {
    if constexpr (has_encode_hook<T>) {
        return 1;
    } else if constexpr (Optional<T>) {
        return cell_width<pointee_t<T>>();
    } else if constexpr (Record<T>) {
        static const auto width = detail::record_width<T>(
            std::make_index_sequence<std::tuple_size_v<fields_tuple_t<T>>>{});
        return width;
    } else {
        return 1;
    }
}

} // namespace tabular
