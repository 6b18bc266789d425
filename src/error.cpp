#include "tabular/error.hpp"

namespace tabular {

auto to_string(error_kind kind) -> const char* {
    switch (kind) {
        case error_kind::unsupported_type: return "unsupported type";
        case error_kind::conversion: return "conversion error";
        case error_kind::hook: return "hook error";
        case error_kind::unexpected_shape: return "unexpected shape";
        case error_kind::io: return "i/o error";
    }
    return "unknown";
}

error::error(error_kind kind, const std::string& message)
    : std::runtime_error(message), kind_(kind) {}

auto error::kind() const noexcept -> error_kind {
    return kind_;
}

auto error::wrap(const std::string& context) const -> error {
    return error(kind_, context + ": " + what());
}

} // namespace tabular
