#include "tabular/decode.hpp"

namespace tabular {

auto split(const std::string& text, char separator) -> std::vector<std::string> {
    auto parts = std::vector<std::string>{};
    auto start = std::size_t{0};
    while (true) {
        auto pos = text.find(separator, start);
        if (pos == std::string::npos) {
            parts.push_back(text.substr(start));
            return parts;
        }
        parts.push_back(text.substr(start, pos - start));
        start = pos + 1;
    }
}

} // namespace tabular
