#include "tabular/encode.hpp"

namespace tabular {

auto join(const std::vector<std::string>& parts, const std::string& separator) -> std::string {
    auto result = std::string{};
    for (std::size_t i = 0; i < parts.size(); ++i) {
        if (i > 0) result += separator;
        result += parts[i];
    }
    return result;
}

} // namespace tabular
