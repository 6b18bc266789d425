#include <cctype>
#include "tabular/fields.hpp"

namespace tabular {

auto resolve_field(const char* declared_name, const char* tag, bool embedded) -> field_descriptor_t {
    auto descriptor = field_descriptor_t{};
    auto text = std::string(tag ? tag : "");
    auto comma = text.find(',');
    auto name = text.substr(0, comma);

    descriptor.declared_name = declared_name;
    descriptor.embedded = embedded;
    descriptor.skip = name == "-";

    if (comma != std::string::npos) {
        auto option = text.substr(comma + 1);
        descriptor.omit_empty = option.substr(0, option.find(',')) == "omitEmpty";
    }

    if (name.empty()) {
        for (char c : descriptor.declared_name) {
            name += static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
        }
    }
    descriptor.effective_name = name;
    return descriptor;
}

} // namespace tabular
