#include <cctype>
#include "tabular/scalar.hpp"

namespace tabular {

auto format_bool(bool value) -> std::string {
    return value ? "true" : "false";
}

auto parse_bool(const std::string& text) -> bool {
    if (text == "1" || text == "t" || text == "T" || text == "TRUE" || text == "true" || text == "True") {
        return true;
    }
    if (text == "0" || text == "f" || text == "F" || text == "FALSE" || text == "false" || text == "False") {
        return false;
    }
    throw conversion_error("parsing `" + text + "` as bool: invalid syntax");
}

namespace detail {

auto parse_integer_text(const std::string& text, const std::string& type) -> integer_text_t {
    auto invalid = [&]() {
        return conversion_error("parsing `" + text + "` as " + type + ": invalid syntax");
    };
    auto result = integer_text_t{};
    auto pos = std::size_t{0};

    if (pos < text.size() && (text[pos] == '+' || text[pos] == '-')) {
        result.negative = text[pos] == '-';
        ++pos;
    }

    auto base = 10;
    auto prefixed = false;
    if (pos + 1 < text.size() && text[pos] == '0') {
        auto p = static_cast<char>(std::tolower(static_cast<unsigned char>(text[pos + 1])));
        if (p == 'x') { base = 16; pos += 2; prefixed = true; }
        else if (p == 'o') { base = 8; pos += 2; prefixed = true; }
        else if (p == 'b') { base = 2; pos += 2; prefixed = true; }
        else { base = 8; pos += 1; prefixed = true; }
    }

    auto digits = std::string{};
    for (; pos < text.size(); ++pos) {
        if (text[pos] == '_' && prefixed) continue;
        digits += text[pos];
    }
    if (digits.empty()) throw invalid();

    auto first = digits.data();
    auto last = digits.data() + digits.size();
    auto [end, ec] = std::from_chars(first, last, result.magnitude, base);

    if (ec == std::errc::result_out_of_range) {
        throw conversion_error("parsing `" + text + "` as " + type + ": value out of range");
    }
    if (ec != std::errc{} || end != last) {
        throw invalid();
    }
    return result;
}

auto parse_floating_text(const std::string& text) -> std::string {
    // from_chars accepts neither a leading '+' nor digit separators
    auto start = (!text.empty() && text[0] == '+') ? std::size_t{1} : std::size_t{0};
    if (start == 1 && text.size() > 1 && text[1] == '-') {
        return {};
    }
    return text.substr(start);
}

} // namespace detail

} // namespace tabular
