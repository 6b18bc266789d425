#pragma once

#include <ostream>
#include <string>
#include <vector>
#include "csv_options.hpp"

namespace tabular {

// =============================================================================
// CSV Writer - quotes a cell only when it has to
// =============================================================================

class csv_writer {
public:
    explicit csv_writer(std::ostream& os, csv_options_t options = {});

    void write_row(const std::vector<std::string>& row);
    void flush();

private:
    std::ostream& os_;
    csv_options_t options_;

    auto needs_quotes(const std::string& cell) const -> bool;
    void write_quoted(const std::string& cell);
    void check_stream() const;
};

} // namespace tabular
