#include "tabular/csv_reader.hpp"
#include "tabular/error.hpp"

namespace tabular {

csv_reader::csv_reader(std::istream& is, csv_options_t options)
    : is_(is), options_(options) {
    auto d = options_.delimiter;
    if (d == '"' || d == '\n' || d == '\r' || (options_.comment != '\0' && options_.comment == d)) {
        throw io_error(std::string("invalid csv delimiter '") + d + "'");
    }
}

auto csv_reader::next_line(std::string& text) -> bool {
    if (!std::getline(is_, text)) {
        if (is_.bad()) {
            throw io_error("read failed after line " + std::to_string(line_));
        }
        return false;
    }
    ++line_;
    if (!text.empty() && text.back() == '\r') {
        text.pop_back();
    }
    return true;
}

void csv_reader::parse_error(std::size_t column, const std::string& message) const {
    throw io_error("parse error on line " + std::to_string(line_) + ", column " +
                   std::to_string(column) + ": " + message);
}

auto csv_reader::read_row(std::vector<std::string>& row) -> bool {
    auto text = std::string{};
    do {
        if (!next_line(text)) return false;
    } while (text.empty() || (options_.comment != '\0' && text[0] == options_.comment));

    const auto d = options_.delimiter;
    auto pos = std::size_t{0};
    row.clear();

    while (true) {
        if (options_.trim_leading_space) {
            while (pos < text.size() && (text[pos] == ' ' || text[pos] == '\t')) ++pos;
        }

        // --- Unquoted field ---

        if (pos >= text.size() || text[pos] != '"') {
            auto end = text.find(d, pos);
            auto cell = text.substr(pos, end == std::string::npos ? std::string::npos : end - pos);
            if (!options_.lazy_quotes) {
                auto quote = cell.find('"');
                if (quote != std::string::npos) {
                    parse_error(pos + quote + 1, "bare \" in non-quoted field");
                }
            }
            row.push_back(std::move(cell));
            if (end == std::string::npos) return true;
            pos = end + 1;
            continue;
        }

        // --- Quoted field, possibly spanning lines ---

        auto cell = std::string{};
        auto at_end_of_row = false;
        ++pos;
        while (true) {
            auto quote = text.find('"', pos);
            if (quote == std::string::npos) {
                cell.append(text, pos, std::string::npos);
                if (!next_line(text)) {
                    if (!options_.lazy_quotes) {
                        parse_error(text.size() + 1, "extraneous or missing \" in quoted field");
                    }
                    at_end_of_row = true;
                    break;
                }
                cell += '\n';
                pos = 0;
                continue;
            }
            cell.append(text, pos, quote - pos);
            pos = quote + 1;

            if (pos < text.size() && text[pos] == '"') {
                cell += '"';
                ++pos;
            } else if (pos < text.size() && text[pos] == d) {
                ++pos;
                break;
            } else if (pos >= text.size()) {
                at_end_of_row = true;
                break;
            } else if (options_.lazy_quotes) {
                cell += '"';
            } else {
                parse_error(pos + 1, "extraneous or missing \" in quoted field");
            }
        }
        row.push_back(std::move(cell));
        if (at_end_of_row) return true;
    }
}

} // namespace tabular
