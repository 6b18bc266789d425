#pragma once

#include <cstddef>
#include <istream>
#include <string>
#include <vector>
#include "csv_options.hpp"

namespace tabular {

// =============================================================================
// CSV Reader - one row of cells per call, RFC 4180 quoting
// =============================================================================
//
// Quoted fields may contain delimiters, doubled quotes and line breaks. Empty
// lines are skipped. Malformed input throws an io error naming the line and
// column.

class csv_reader {
public:
    explicit csv_reader(std::istream& is, csv_options_t options = {});

    // Read the next row; false at end of input
    auto read_row(std::vector<std::string>& row) -> bool;

    // Line number of the last line consumed
    auto line() const -> std::size_t { return line_; }

private:
    std::istream& is_;
    csv_options_t options_;
    std::size_t line_ = 0;

    auto next_line(std::string& text) -> bool;
    void parse_error(std::size_t column, const std::string& message) const;
};

} // namespace tabular
