#pragma once

#include <string>
#include <tuple>
#include "fields.hpp"

namespace tabular {

inline const std::string default_empty_value = "";
inline const std::string default_nil_value = "NULL";

// =============================================================================
// options_t - sentinel configuration for an encoder or decoder session
// =============================================================================
//
// empty_value: cell standing in for a zero value (written for omitEmpty
//              fields; decoded back to the zero value)
// nil_value:   cell standing in for an absent optional (written for empty
//              optionals; decoded by leaving the field untouched)

struct options_t {
    std::string empty_value = default_empty_value;
    std::string nil_value = default_nil_value;
};

inline auto fields(const options_t& o) {
    return std::make_tuple(
        field("EmptyValue", o.empty_value, "empty_value"),
        field("NilValue", o.nil_value, "nil_value")
    );
}

inline auto fields(options_t& o) {
    return std::make_tuple(
        field("EmptyValue", o.empty_value, "empty_value"),
        field("NilValue", o.nil_value, "nil_value")
    );
}

} // namespace tabular
