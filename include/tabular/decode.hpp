#pragma once

#include <algorithm>
#include <concepts>
#include <exception>
#include <ostream>
#include <string>
#include <tuple>
#include <utility>
#include <vector>
#include "error.hpp"
#include "fields.hpp"
#include "header.hpp"
#include "hooks.hpp"
#include "kinds.hpp"
#include "options.hpp"
#include "path_tree.hpp"
#include "scalar.hpp"

namespace tabular {

auto split(const std::string& text, char separator) -> std::vector<std::string>;

// =============================================================================
// assign - one cell into a field
// =============================================================================
//
// Optionals get a fresh pointee for every decoded cell. With `merge` an
// engaged optional is written through instead, as set() does.

template<typename T>
void assign(T& target, const std::string& text, const options_t& options, bool merge = false) {
    if (text == options.nil_value) {
        return;
    }

    if constexpr (Optional<T>) {
        // Instantiated even when the cell is the empty value
        if (!merge || !optional_traits<T>::engaged(target)) {
            optional_traits<T>::emplace(target);
        }
        assign(*target, text, options, merge);
    } else {
        if (text == options.empty_value) {
            return;
        }

        constexpr auto hooks = detect_hooks<T>();

        if constexpr (hooks.decode == decode_hook_t::cells) {
            call_cell_setter(target, std::vector<std::string>{text});
        } else if constexpr (hooks.decode == decode_hook_t::text) {
            call_text_unmarshaler(target, text);
        } else if constexpr (Scalar<T>) {
            parse_scalar(target, text);
        } else if constexpr (PlainEnum<T>) {
            target = static_cast<T>(parse_integer<std::underlying_type_t<T>>(text));
        } else if constexpr (is_vector<T>::value) {
            auto parts = split(text, ',');
            auto fresh = T{};
            fresh.reserve(parts.size());
            for (const auto& part : parts) {
                auto elem = typename T::value_type{};
                try {
                    assign(elem, part, options);
                } catch (const error& e) {
                    throw e.wrap("slice element `" + part + "`");
                }
                fresh.push_back(std::move(elem));
            }
            // Committed only once every element parsed
            target = std::move(fresh);
        } else if constexpr (is_std_array<T>::value) {
            auto parts = split(text, ',');
            if (parts.size() != std::tuple_size_v<T>) {
                throw conversion_error("parsing `" + text + "` as " + type_name<T>() + ": expected " +
                                       std::to_string(std::tuple_size_v<T>) + " elements, found " +
                                       std::to_string(parts.size()));
            }
            auto fresh = T{};
            for (std::size_t i = 0; i < parts.size(); ++i) {
                try {
                    assign(fresh[i], parts[i], options);
                } catch (const error& e) {
                    throw e.wrap("slice element `" + parts[i] + "`");
                }
            }
            target = std::move(fresh);
        } else if constexpr (Record<T>) {
            throw unexpected_shape("expected nested columns for " + type_name<T>() + ", found the single cell `" + text + "`");
        } else {
            throw unsupported_type("cannot unmarshal " + type_name<T>() + " from csv");
        }
    }
}

// =============================================================================
// unmarshal - a path tree into a record
// =============================================================================

template<typename T>
void unmarshal(T& target, const path_tree_t& tree, const options_t& options, bool merge = false);

namespace detail {

template<typename F>
void unmarshal_field(const F& f, const field_descriptor_t& descriptor,
                     const path_tree_t& tree, const options_t& options, bool merge) {
    if (descriptor.skip) return;
    try {
        if (descriptor.embedded) {
            unmarshal(f.value, tree, options, merge);
            return;
        }
        auto node = tree.get(descriptor.effective_name);
        if (!node) return;

        if (is_leaf(*node)) {
            assign(f.value, as_leaf(*node), options, merge);
        } else {
            unmarshal(f.value, as_tree(*node), options, merge);
        }
    } catch (const error& e) {
        throw e.wrap("struct field `" + descriptor.declared_name + "`");
    }
}

} // namespace detail

template<typename T>
void unmarshal(T& target, const path_tree_t& tree, const options_t& options, bool merge) {
    if constexpr (Optional<T>) {
        if constexpr (Record<pointee_t<T>>) {
            // Every column nil: the value was absent when encoded
            if (tree.all_leaves_equal(options.nil_value)) return;
            if (!merge || !optional_traits<T>::engaged(target)) {
                optional_traits<T>::emplace(target);
            }
            unmarshal(*target, tree, options, merge);
        } else {
            throw unexpected_shape("cannot descend into " + type_name<T>() + ": not a record");
        }
    } else if constexpr (Record<T>) {
        const auto& descriptors = field_descriptors<T>();
        auto index = std::size_t{0};
        std::apply([&](auto&&... f) {
            (detail::unmarshal_field(f, descriptors[index++], tree, options, merge), ...);
        }, fields(target));
    } else {
        throw unexpected_shape("cannot descend into " + type_name<T>() + ": not a record");
    }
}

/**
 * Set a field in a record by dot-separated path, with the conversion rules
 * of a decoded cell. Optionals already engaged along the path are kept.
 *
 * Example:
 *   set(options, "nil_value", "NA");
 *   set(person, "address.city", "Springfield");
 */
template<Record T>
void set(T& record, const std::string& path, const std::string& value, const options_t& options = {}) {
    auto header = header_of<T>();
    if (std::find(header.begin(), header.end(), path) == header.end()) {
        throw unexpected_shape("field not found: " + path);
    }
    auto tree = path_tree_t{};
    tree.set(path, value);
    unmarshal(record, tree, options, true);
}

// =============================================================================
// RowReader - the tabular collaborator the decoder reads through
// =============================================================================

template<typename R>
concept RowReader = requires(R& r, std::vector<std::string>& row) {
    { r.read_row(row) } -> std::convertible_to<bool>;
};

// =============================================================================
// decoder - reads one record per row, addressed by the header
// =============================================================================
//
// The first row is captured as the header on construction. decode() returns
// false at end of input and keeps returning false. The first failure,
// including one while reading the header, is stored and rethrown by every
// later call without doing further work.

template<RowReader R>
class decoder {
public:
    explicit decoder(R& reader, options_t options = {})
        : reader_(reader), options_(std::move(options)) {
        try {
            exhausted_ = !reader_.read_row(header_);
        } catch (const std::exception&) {
            error_ = std::current_exception();
        }
    }

    auto header() const -> const std::vector<std::string>& { return header_; }

    void set_empty_value(std::string value) { options_.empty_value = std::move(value); }
    void set_nil_value(std::string value) { options_.nil_value = std::move(value); }
    void set_options(options_t options) { options_ = std::move(options); }
    auto options() const -> const options_t& { return options_; }

    void set_log_stream(std::ostream& os) { log_stream_ = &os; }

    template<Record T>
    auto decode(T& target) -> bool {
        if (error_) {
            std::rethrow_exception(error_);
        }
        if (exhausted_) {
            return false;
        }
        try {
            auto row = std::vector<std::string>{};
            if (!reader_.read_row(row)) {
                exhausted_ = true;
                log("end of input after " + std::to_string(rows_decoded_) + " rows");
                return false;
            }
            auto tree = path_tree_t::from_row(header_, row);
            unmarshal(target, tree, options_);
            ++rows_decoded_;
            return true;
        } catch (const std::exception& e) {
            error_ = std::current_exception();
            log("error at row " + std::to_string(rows_decoded_ + 1) + ": " + e.what());
            throw;
        }
    }

    auto rows_decoded() const -> std::size_t { return rows_decoded_; }
    auto failed() const -> bool { return error_ != nullptr; }
    auto last_error() const -> std::exception_ptr { return error_; }

private:
    R& reader_;
    options_t options_;
    std::vector<std::string> header_;
    std::exception_ptr error_;
    bool exhausted_ = false;
    std::size_t rows_decoded_ = 0;
    std::ostream* log_stream_ = nullptr;

    void log(const std::string& message) {
        if (log_stream_) {
            *log_stream_ << "decoder: " << message << "\n";
            log_stream_->flush();
        }
    }
};

} // namespace tabular
