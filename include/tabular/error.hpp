#pragma once

#include <stdexcept>
#include <string>

namespace tabular {

// =============================================================================
// Error model
// =============================================================================

enum class error_kind {
    unsupported_type,
    conversion,
    hook,
    unexpected_shape,
    io,
};

auto to_string(error_kind kind) -> const char*;

class error : public std::runtime_error {
public:
    error(error_kind kind, const std::string& message);

    auto kind() const noexcept -> error_kind;

    // A new error of the same kind with `context: ` prepended to the message
    auto wrap(const std::string& context) const -> error;

private:
    error_kind kind_;
};

inline auto unsupported_type(const std::string& message) -> error {
    return error(error_kind::unsupported_type, message);
}

inline auto conversion_error(const std::string& message) -> error {
    return error(error_kind::conversion, message);
}

inline auto unexpected_shape(const std::string& message) -> error {
    return error(error_kind::unexpected_shape, message);
}

inline auto io_error(const std::string& message) -> error {
    return error(error_kind::io, message);
}

} // namespace tabular
