#pragma once

#include <concepts>
#include <exception>
#include <ostream>
#include <string>
#include <tuple>
#include <vector>
#include "error.hpp"
#include "fields.hpp"
#include "header.hpp"
#include "hooks.hpp"
#include "kinds.hpp"
#include "options.hpp"
#include "scalar.hpp"

namespace tabular {

// =============================================================================
// Helpers
// =============================================================================

auto join(const std::vector<std::string>& parts, const std::string& separator) -> std::string;

// Short rendering of a value for error breadcrumbs
template<typename T>
auto describe(const T& value) -> std::string {
    if constexpr (Scalar<T>) {
        return format_scalar(value);
    } else if constexpr (detail::EnumStrings<T>) {
        return std::string(to_string(value));
    } else if constexpr (PlainEnum<T>) {
        return format_integer(static_cast<std::underlying_type_t<T>>(value));
    } else if constexpr (Optional<T>) {
        return optional_traits<T>::engaged(value) ? describe(optional_traits<T>::get(value)) : "nil";
    } else if constexpr (Sequence<T>) {
        return "[...]";
    } else if constexpr (Associative<T>) {
        return "map[...]";
    } else {
        return "{...}";
    }
}

// =============================================================================
// is_zero - whether a value equals the zero value of its type
// =============================================================================

template<typename T>
auto is_zero(const T& value) -> bool {
    if constexpr (Optional<T>) {
        return !optional_traits<T>::engaged(value);
    } else if constexpr (Boolean<T>) {
        return !value;
    } else if constexpr (Integer<T> || Floating<T> || PlainEnum<T>) {
        return value == T{};
    } else if constexpr (String<T> || Associative<T> || is_vector<T>::value) {
        return value.empty();
    } else if constexpr (is_std_array<T>::value) {
        for (const auto& elem : value) {
            if (!is_zero(elem)) return false;
        }
        return true;
    } else if constexpr (Record<T>) {
        const auto& descriptors = field_descriptors<T>();
        auto index = std::size_t{0};
        auto zero = true;
        std::apply([&](auto&&... f) {
            ((zero = (descriptors[index++].skip || is_zero(f.value)) && zero), ...);
        }, fields(value));
        return zero;
    } else if constexpr (std::equality_comparable<T> && std::default_initializable<T>) {
        return value == T{};
    } else {
        return false;
    }
}

// =============================================================================
// marshal - a value to its flat cell sequence
// =============================================================================

template<typename T>
auto marshal(const T& value, bool omit_empty, const options_t& options) -> std::vector<std::string>;

namespace detail {

template<typename F>
void marshal_field(const F& f, const field_descriptor_t& descriptor,
                   std::vector<std::string>& output, const options_t& options) {
    if (descriptor.skip) return;
    try {
        auto cells = marshal(f.value, descriptor.omit_empty, options);
        output.insert(output.end(), cells.begin(), cells.end());
    } catch (const error& e) {
        throw e.wrap("struct field `" + descriptor.declared_name + "`: `" + describe(f.value) + "`");
    }
}

} // namespace detail

template<typename T>
auto marshal(const T& value, bool omit_empty, const options_t& options) -> std::vector<std::string> {
    constexpr auto hooks = detect_hooks<T>();

    if constexpr (hooks.encode == encode_hook_t::cells) {
        return call_cell_getter(value);
    } else if constexpr (hooks.encode == encode_hook_t::text) {
        return {call_text_marshaler(value)};
    } else if constexpr (Optional<T>) {
        using pointee = pointee_t<T>;
        if (!optional_traits<T>::engaged(value)) {
            if constexpr (Record<pointee>) {
                return std::vector<std::string>(cell_width<pointee>(), options.nil_value);
            } else {
                return {options.nil_value};
            }
        }
        return marshal(optional_traits<T>::get(value), omit_empty, options);
    } else {
        if (omit_empty && is_zero(value)) {
            return {options.empty_value};
        }

        if constexpr (Scalar<T>) {
            return {format_scalar(value)};
        } else if constexpr (PlainEnum<T>) {
            return {format_integer(static_cast<std::underlying_type_t<T>>(value))};
        } else if constexpr (Sequence<T>) {
            auto parts = std::vector<std::string>{};
            parts.reserve(value.size());
            for (const auto& elem : value) {
                try {
                    parts.push_back(join(marshal(elem, false, options), ","));
                } catch (const error& e) {
                    throw e.wrap("slice element `" + describe(elem) + "`");
                }
            }
            // One cell regardless of length, so every row keeps the same width
            return {join(parts, ",")};
        } else if constexpr (Associative<T>) {
            auto entries = std::vector<std::string>{};
            entries.reserve(value.size());
            for (const auto& [key, val] : value) {
                auto key_text = std::string{};
                auto val_text = std::string{};
                try {
                    key_text = join(marshal(key, false, options), ",");
                } catch (const error& e) {
                    throw e.wrap("map key `" + describe(key) + "`");
                }
                try {
                    val_text = join(marshal(val, false, options), ",");
                } catch (const error& e) {
                    throw e.wrap("map value `" + describe(val) + "`");
                }
                entries.push_back(key_text + ":" + val_text);
            }
            return {join(entries, ",")};
        } else if constexpr (Record<T>) {
            const auto& descriptors = field_descriptors<T>();
            auto output = std::vector<std::string>{};
            auto index = std::size_t{0};
            std::apply([&](auto&&... f) {
                (detail::marshal_field(f, descriptors[index++], output, options), ...);
            }, fields(value));
            return output;
        } else {
            throw unsupported_type("cannot marshal " + type_name<T>() + " to csv");
        }
    }
}

// =============================================================================
// RowWriter - the tabular collaborator the encoder writes through
// =============================================================================

template<typename W>
concept RowWriter = requires(W& w, const std::vector<std::string>& row) {
    w.write_row(row);
    w.flush();
};

// =============================================================================
// encoder - writes one record per row
// =============================================================================
//
// The first failure poisons the encoder: it is stored and rethrown by every
// later call without doing further work. Construct a new encoder to recover.

template<RowWriter W>
class encoder {
public:
    explicit encoder(W& writer, options_t options = {})
        : writer_(writer), options_(std::move(options)) {}

    void set_empty_value(std::string value) { options_.empty_value = std::move(value); }
    void set_nil_value(std::string value) { options_.nil_value = std::move(value); }
    void set_options(options_t options) { options_ = std::move(options); }
    auto options() const -> const options_t& { return options_; }

    void set_log_stream(std::ostream& os) { log_stream_ = &os; }

    template<Record T>
    void encode(const T& record) {
        guarded([this, &record] {
            writer_.write_row(marshal(record, false, options_));
            writer_.flush();
        });
    }

    // Write the dotted header matching encode() of T
    template<Record T>
    void write_header() {
        guarded([this] {
            auto header = header_of<T>();
            log("header: " + join(header, ","));
            writer_.write_row(header);
            writer_.flush();
        });
    }

    auto failed() const -> bool { return error_ != nullptr; }
    auto last_error() const -> std::exception_ptr { return error_; }

private:
    W& writer_;
    options_t options_;
    std::exception_ptr error_;
    std::ostream* log_stream_ = nullptr;

    template<typename F>
    void guarded(F&& f) {
        if (error_) {
            std::rethrow_exception(error_);
        }
        try {
            f();
        } catch (const std::exception& e) {
            error_ = std::current_exception();
            log(std::string("error: ") + e.what());
            throw;
        }
    }

    void log(const std::string& message) {
        if (log_stream_) {
            *log_stream_ << "encoder: " << message << "\n";
            log_stream_->flush();
        }
    }
};

} // namespace tabular
