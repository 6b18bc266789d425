#pragma once

namespace tabular {

// Line-level framing options shared by csv_reader and csv_writer
struct csv_options_t {
    char delimiter = ',';
    char comment = '\0';             // lines starting with this are skipped ('\0': none)
    bool lazy_quotes = false;        // tolerate stray quotes in fields
    bool trim_leading_space = false; // ignore leading whitespace in a field
    bool use_crlf = false;           // terminate written rows with \r\n
};

} // namespace tabular
