#include "tabular/csv_writer.hpp"
#include "tabular/error.hpp"

namespace tabular {

csv_writer::csv_writer(std::ostream& os, csv_options_t options)
    : os_(os), options_(options) {
    auto d = options_.delimiter;
    if (d == '"' || d == '\n' || d == '\r') {
        throw io_error(std::string("invalid csv delimiter '") + d + "'");
    }
}

void csv_writer::write_row(const std::vector<std::string>& row) {
    // A lone empty cell would be a blank line, which readers skip
    if (row.size() == 1 && row[0].empty()) {
        os_ << "\"\"" << (options_.use_crlf ? "\r\n" : "\n");
        check_stream();
        return;
    }
    for (std::size_t i = 0; i < row.size(); ++i) {
        if (i > 0) os_ << options_.delimiter;
        if (needs_quotes(row[i])) {
            write_quoted(row[i]);
        } else {
            os_ << row[i];
        }
    }
    os_ << (options_.use_crlf ? "\r\n" : "\n");
    check_stream();
}

void csv_writer::flush() {
    os_.flush();
    check_stream();
}

auto csv_writer::needs_quotes(const std::string& cell) const -> bool {
    if (cell.empty()) return false;
    if (cell == "\\.") return true;
    if (cell.find_first_of(std::string{options_.delimiter, '"', '\r', '\n'}) != std::string::npos) {
        return true;
    }
    return cell[0] == ' ' || cell[0] == '\t';
}

void csv_writer::write_quoted(const std::string& cell) {
    os_ << '"';
    for (char c : cell) {
        switch (c) {
            case '"':  os_ << "\"\""; break;
            case '\r': if (!options_.use_crlf) os_ << '\r'; break;
            case '\n': os_ << (options_.use_crlf ? "\r\n" : "\n"); break;
            default:   os_ << c; break;
        }
    }
    os_ << '"';
}

void csv_writer::check_stream() const {
    if (!os_) {
        throw io_error("write failed");
    }
}

} // namespace tabular
