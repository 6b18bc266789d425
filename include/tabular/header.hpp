#pragma once

#include <string>
#include <tuple>
#include <utility>
#include <vector>
#include "fields.hpp"

namespace tabular {

// =============================================================================
// header_of<T>() - dotted column paths a record type encodes to
// =============================================================================
//
// Lists one path per encoded cell, in encode order, named the way the decoder
// looks them up: nested records extend the path, embedded records splice into
// the parent's namespace, skipped fields are absent.

namespace detail {

inline auto join_path(const std::string& prefix, const std::string& name) -> std::string {
    return prefix.empty() ? name : prefix + "." + name;
}

template<typename T>
void collect_header(const std::string& prefix, std::vector<std::string>& out);

template<Record T, std::size_t... I>
void collect_record_header(const std::string& prefix, std::vector<std::string>& out,
                           std::index_sequence<I...>) {
    const auto& descriptors = field_descriptors<T>();
    auto visit = [&](const field_descriptor_t& d, auto tag) {
        using field_type = typename decltype(tag)::type;
        if (d.skip) return;
        collect_header<field_type>(d.embedded ? prefix : join_path(prefix, d.effective_name), out);
    };
    (visit(descriptors[I],
           std::type_identity<typename std::tuple_element_t<I, fields_tuple_t<T>>::value_type>{}), ...);
}

template<typename T>
void collect_header(const std::string& prefix, std::vector<std::string>& out) {
    if constexpr (has_encode_hook<T>) {
        out.push_back(prefix);
    } else if constexpr (Optional<T>) {
        collect_header<pointee_t<T>>(prefix, out);
    } else if constexpr (Record<T>) {
        collect_record_header<T>(prefix, out,
            std::make_index_sequence<std::tuple_size_v<fields_tuple_t<T>>>{});
    } else {
        out.push_back(prefix);
    }
}

} // namespace detail

template<Record T>
auto header_of() -> std::vector<std::string> {
    auto header = std::vector<std::string>{};
    detail::collect_header<T>("", header);
    return header;
}

} // namespace tabular
