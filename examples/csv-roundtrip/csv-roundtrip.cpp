#include <iostream>
#include <memory>
#include <optional>
#include <sstream>
#include <stdexcept>
#include <string>
#include <type_traits>
#include <vector>
#include "tabular/tabular.hpp"

using namespace tabular;

// =============================================================================
// Crew role enum with ADL string conversion
// =============================================================================

enum class role_t { pilot, engineer, medic };

inline const char* to_string(role_t r) {
    switch (r) {
        case role_t::pilot: return "pilot";
        case role_t::engineer: return "engineer";
        case role_t::medic: return "medic";
    }
    return "unknown";
}

inline role_t from_string(std::type_identity<role_t>, const std::string& s) {
    if (s == "pilot") return role_t::pilot;
    if (s == "engineer") return role_t::engineer;
    if (s == "medic") return role_t::medic;
    throw std::runtime_error("invalid role: " + s);
}

// =============================================================================
// Records
// =============================================================================

struct address_t {
    std::string city;
    int zip = 0;
};

inline auto fields(const address_t& a) {
    return std::make_tuple(field("City", a.city), field("Zip", a.zip));
}

inline auto fields(address_t& a) {
    return std::make_tuple(field("City", a.city), field("Zip", a.zip));
}

struct crew_member_t {
    std::string name;
    role_t role = role_t::pilot;
    std::optional<int> age;
    std::vector<std::string> callsigns;
    std::unique_ptr<address_t> home;
    std::string notes;
};

inline auto fields(const crew_member_t& c) {
    return std::make_tuple(
        field("Name", c.name),
        field("Role", c.role),
        field("Age", c.age),
        field("Callsigns", c.callsigns),
        field("Home", c.home),
        field("Notes", c.notes, ",omitEmpty")
    );
}

inline auto fields(crew_member_t& c) {
    return std::make_tuple(
        field("Name", c.name),
        field("Role", c.role),
        field("Age", c.age),
        field("Callsigns", c.callsigns),
        field("Home", c.home),
        field("Notes", c.notes, ",omitEmpty")
    );
}

auto make_crew() -> std::vector<crew_member_t> {
    auto crew = std::vector<crew_member_t>(3);

    crew[0].name = "Riddick";
    crew[0].role = role_t::pilot;
    crew[0].age = 35;
    crew[0].callsigns = {"furyan", "ghost"};
    crew[0].home = std::make_unique<address_t>(address_t{"Furya", 1});

    crew[1].name = "Fry";
    crew[1].role = role_t::engineer;
    crew[1].notes = "docking pilot, \"acting captain\"";

    crew[2].name = "Imam";
    crew[2].role = role_t::medic;
    crew[2].age = 52;
    crew[2].home = std::make_unique<address_t>(address_t{"New Mecca", 0});

    return crew;
}

void print(const crew_member_t& c) {
    std::cout << "  " << c.name << " (" << to_string(c.role) << ")";
    std::cout << " age=" << (c.age ? std::to_string(*c.age) : "?");
    std::cout << " callsigns=" << c.callsigns.size();
    if (c.home) {
        std::cout << " home=" << c.home->city << ":" << c.home->zip;
    }
    if (!c.notes.empty()) {
        std::cout << " notes=" << c.notes;
    }
    std::cout << "\n";
}

// =============================================================================
// Main
// =============================================================================

int main(int argc, char* argv[]) {
    auto options = options_t{};

    try {
        // Overrides such as nil_value=NA or empty_value=-
        for (int i = 1; i < argc; ++i) {
            auto arg = std::string(argv[i]);
            auto eq = arg.find('=');
            if (eq == std::string::npos) {
                std::cerr << "Usage: " << argv[0] << " [empty_value=...] [nil_value=...]\n";
                return 1;
            }
            set(options, arg.substr(0, eq), arg.substr(eq + 1));
        }

        auto buffer = std::stringstream{};
        auto writer = csv_writer(buffer);
        auto enc = encoder(writer, options);
        enc.set_log_stream(std::cerr);

        enc.write_header<crew_member_t>();
        for (const auto& member : make_crew()) {
            enc.encode(member);
        }

        std::cout << "Encoded:\n";
        std::cout << "========================================\n";
        std::cout << buffer.str();
        std::cout << "========================================\n\n";

        auto reader = csv_reader(buffer);
        auto dec = decoder(reader, options);
        dec.set_log_stream(std::cerr);

        std::cout << "Decoded:\n";
        for (auto member = crew_member_t{}; dec.decode(member); member = crew_member_t{}) {
            print(member);
        }
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << "\n";
        return 1;
    }

    return 0;
}
