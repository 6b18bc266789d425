#include <cassert>
#include <cstdint>
#include <iostream>
#include <map>
#include <memory>
#include <optional>
#include <sstream>
#include <string>
#include <unordered_map>
#include <utility>
#include <vector>
#include "tabular/tabular.hpp"

using namespace tabular;

// =============================================================================
// Test structures
// =============================================================================

struct basic_t {
    std::string str;
    int i = 0;
    bool b = false;
    double f = 0.0;
};

inline auto fields(const basic_t& v) {
    return std::make_tuple(field("String", v.str), field("Int", v.i), field("Bool", v.b), field("Float", v.f));
}

inline auto fields(basic_t& v) {
    return std::make_tuple(field("String", v.str), field("Int", v.i), field("Bool", v.b), field("Float", v.f));
}

struct pointers_t {
    std::unique_ptr<std::string> str;
    std::optional<int> i;
    std::shared_ptr<bool> b;
    std::optional<double> f;
};

inline auto fields(const pointers_t& v) {
    return std::make_tuple(field("String", v.str), field("Int", v.i), field("Bool", v.b), field("Float", v.f));
}

inline auto fields(pointers_t& v) {
    return std::make_tuple(field("String", v.str), field("Int", v.i), field("Bool", v.b), field("Float", v.f));
}

struct sequences_t {
    std::vector<std::string> strings;
    std::vector<int> ints;
    std::vector<bool> bools;
    std::vector<double> floats;
    std::vector<std::unique_ptr<std::string>> pstrings;
};

inline auto fields(const sequences_t& v) {
    return std::make_tuple(
        field("Strings", v.strings),
        field("Ints", v.ints),
        field("Bools", v.bools),
        field("Floats", v.floats),
        field("Pstrings", v.pstrings)
    );
}

inline auto fields(sequences_t& v) {
    return std::make_tuple(
        field("Strings", v.strings),
        field("Ints", v.ints),
        field("Bools", v.bools),
        field("Floats", v.floats),
        field("Pstrings", v.pstrings)
    );
}

struct child_t {
    std::vector<std::string> names;
};

inline auto fields(const child_t& c) { return std::make_tuple(field("Names", c.names)); }
inline auto fields(child_t& c) { return std::make_tuple(field("Names", c.names)); }

struct family_t {
    child_t child;
    std::unique_ptr<child_t> step_child;
};

inline auto fields(const family_t& f) {
    return std::make_tuple(field("Child", f.child), field("StepChild", f.step_child));
}

inline auto fields(family_t& f) {
    return std::make_tuple(field("Child", f.child), field("StepChild", f.step_child));
}

struct roster_t {
    std::vector<std::string> names;
    std::vector<int> ages;
};

inline auto fields(const roster_t& r) { return std::make_tuple(field("Names", r.names), field("Ages", r.ages)); }
inline auto fields(roster_t& r) { return std::make_tuple(field("Names", r.names), field("Ages", r.ages)); }

struct guardian_t {
    std::unique_ptr<roster_t> child;
};

inline auto fields(const guardian_t& g) { return std::make_tuple(field("Child", g.child)); }
inline auto fields(guardian_t& g) { return std::make_tuple(field("Child", g.child)); }

// Calendar-like type with text conversion
struct date_t {
    int year = 0, month = 0, day = 0;

    auto to_text() const -> std::string {
        auto oss = std::ostringstream{};
        oss << year << "-" << (month < 10 ? "0" : "") << month << "-" << (day < 10 ? "0" : "") << day;
        return oss.str();
    }
};

struct event_t {
    date_t date;
};

inline auto fields(const event_t& e) { return std::make_tuple(field("Date", e.date)); }
inline auto fields(event_t& e) { return std::make_tuple(field("Date", e.date)); }

// A map type with cell hooks attached through ADL on its value type
namespace labels {

struct label_t {
    std::string text;
};

using label_map_t = std::map<std::string, label_t>;

inline auto get_cells(const label_map_t&) -> std::vector<std::string> {
    return {"getcsv"};
}

inline void set_cells(label_map_t& m, const std::vector<std::string>&) {
    m = {{"set", label_t{"csv"}}};
}

} // namespace labels

struct labelled_t {
    labels::label_map_t json;
};

inline auto fields(const labelled_t& l) { return std::make_tuple(field("Json", l.json)); }
inline auto fields(labelled_t& l) { return std::make_tuple(field("Json", l.json)); }

struct rgb_t {
    int r = 0, g = 0, b = 0;
    auto get_cells() const -> std::vector<std::string> {
        return {std::to_string(r), std::to_string(g), std::to_string(b)};
    }
};

struct swatch_t {
    std::string name;
    rgb_t color;
};

inline auto fields(const swatch_t& s) { return std::make_tuple(field("Name", s.name), field("Color", s.color)); }
inline auto fields(swatch_t& s) { return std::make_tuple(field("Name", s.name), field("Color", s.color)); }

// A record that also encodes itself as one cell
struct ratio_t {
    int num = 0;
    int den = 1;
    auto get_cells() const -> std::vector<std::string> {
        return {std::to_string(num) + "/" + std::to_string(den)};
    }
};

inline auto fields(const ratio_t& r) { return std::make_tuple(field("Num", r.num), field("Den", r.den)); }
inline auto fields(ratio_t& r) { return std::make_tuple(field("Num", r.num), field("Den", r.den)); }

struct measurement_t {
    std::optional<ratio_t> ratio;
    int count = 0;
};

inline auto fields(const measurement_t& m) { return std::make_tuple(field("Ratio", m.ratio), field("Count", m.count)); }
inline auto fields(measurement_t& m) { return std::make_tuple(field("Ratio", m.ratio), field("Count", m.count)); }

struct sentinel_t {
    std::string name;
    std::unique_ptr<int> age;
};

inline auto fields(const sentinel_t& s) {
    return std::make_tuple(field("Name", s.name, ",omitEmpty"), field("Age", s.age));
}

inline auto fields(sentinel_t& s) {
    return std::make_tuple(field("Name", s.name, ",omitEmpty"), field("Age", s.age));
}

struct visibility_t {
    std::string hidden;
    std::string public_skipped;
    std::string name;
};

inline auto fields(const visibility_t& v) {
    return std::make_tuple(field("PublicSkipped", v.public_skipped, "-"), field("Name", v.name));
}

inline auto fields(visibility_t& v) {
    return std::make_tuple(field("PublicSkipped", v.public_skipped, "-"), field("Name", v.name));
}

struct anonymous_t {
    std::string name;
};

inline auto fields(const anonymous_t& a) { return std::make_tuple(field("Name", a.name)); }
inline auto fields(anonymous_t& a) { return std::make_tuple(field("Name", a.name)); }

struct outer_t {
    anonymous_t base;
};

inline auto fields(const outer_t& o) { return std::make_tuple(embed("AnonymousStruct", o.base)); }
inline auto fields(outer_t& o) { return std::make_tuple(embed("AnonymousStruct", o.base)); }

struct point_t {
    int x = 0;
    int y = 0;
};

inline auto fields(const point_t& p) { return std::make_tuple(field("X", p.x), field("Y", p.y)); }
inline auto fields(point_t& p) { return std::make_tuple(field("X", p.x), field("Y", p.y)); }

struct sparse_t {
    point_t origin;
    std::vector<int> samples;
    std::optional<int> count;
    std::string tail;
};

inline auto fields(const sparse_t& s) {
    return std::make_tuple(
        field("Origin", s.origin, ",omitEmpty"),
        field("Samples", s.samples, ",omitEmpty"),
        field("Count", s.count, ",omitEmpty"),
        field("Tail", s.tail)
    );
}

inline auto fields(sparse_t& s) {
    return std::make_tuple(
        field("Origin", s.origin, ",omitEmpty"),
        field("Samples", s.samples, ",omitEmpty"),
        field("Count", s.count, ",omitEmpty"),
        field("Tail", s.tail)
    );
}

struct maps_t {
    std::map<std::string, int> single;
    std::unordered_map<std::string, int> pair;
};

inline auto fields(const maps_t& m) { return std::make_tuple(field("Single", m.single), field("Pair", m.pair)); }
inline auto fields(maps_t& m) { return std::make_tuple(field("Single", m.single), field("Pair", m.pair)); }

enum class level_t { low = 1, high = 7 };

enum class suit_t { hearts, spades };

inline auto to_string(suit_t s) -> const char* { return s == suit_t::hearts ? "hearts" : "spades"; }
inline auto from_string(std::type_identity<suit_t>, const std::string& s) -> suit_t {
    return s == "hearts" ? suit_t::hearts : suit_t::spades;
}

struct card_t {
    level_t level = level_t::low;
    suit_t suit = suit_t::hearts;
};

inline auto fields(const card_t& c) { return std::make_tuple(field("Level", c.level), field("Suit", c.suit)); }
inline auto fields(card_t& c) { return std::make_tuple(field("Level", c.level), field("Suit", c.suit)); }

struct unsupported_t {
    std::pair<int, int> pair;
};

inline auto fields(const unsupported_t& u) { return std::make_tuple(field("Pair", u.pair)); }
inline auto fields(unsupported_t& u) { return std::make_tuple(field("Pair", u.pair)); }

// =============================================================================
// Helpers
// =============================================================================

template<typename T>
auto encode_row(const T& value, options_t options = {}) -> std::string {
    auto ss = std::stringstream{};
    auto writer = csv_writer(ss);
    auto enc = encoder(writer, options);
    enc.encode(value);
    return ss.str();
}

// =============================================================================
// Tests
// =============================================================================

void test_basic_types() {
    std::cout << "Testing basic types... ";
    assert(encode_row(basic_t{"henry", 23, true, 60.429}) == "henry,23,true,60.429\n");
    std::cout << "PASSED\n";
}

void test_pointers() {
    std::cout << "Testing optionals and pointers... ";

    auto value = pointers_t{};
    value.str = std::make_unique<std::string>("henry");
    value.i = 23;
    value.b = std::make_shared<bool>(true);
    value.f = 60.429;
    assert(encode_row(value) == "henry,23,true,60.429\n");

    assert(encode_row(pointers_t{}) == "NULL,NULL,NULL,NULL\n");

    std::cout << "PASSED\n";
}

void test_sequences() {
    std::cout << "Testing sequences flatten to one cell... ";

    auto value = sequences_t{};
    value.strings = {"vin", "diesel"};
    value.ints = {23, 24};
    value.bools = {true, false};
    value.floats = {60.429, 50.534};
    value.pstrings.push_back(std::make_unique<std::string>("vin"));

    assert(encode_row(value) == "\"vin,diesel\",\"23,24\",\"true,false\",\"60.429,50.534\",vin\n");

    auto cells = marshal(value, false, options_t{});
    assert(cells.size() == 5);
    assert(cells[0] == "vin,diesel");

    std::cout << "PASSED\n";
}

void test_nested_records() {
    std::cout << "Testing nested records... ";

    auto value = family_t{};
    value.child.names = {"uno", "dos"};
    value.step_child = std::make_unique<child_t>(child_t{{"wut"}});
    assert(encode_row(value) == "\"uno,dos\",wut\n");

    std::cout << "PASSED\n";
}

void test_text_hook() {
    std::cout << "Testing text hooks... ";
    assert(encode_row(event_t{{2000, 10, 9}}) == "2000-10-09\n");
    std::cout << "PASSED\n";
}

void test_nil_records() {
    std::cout << "Testing nil records expand to their width... ";

    auto ss = std::stringstream{};
    auto writer = csv_writer(ss);
    auto enc = encoder(writer);

    enc.encode(guardian_t{});

    auto populated = guardian_t{};
    populated.child = std::make_unique<roster_t>(roster_t{{"vin"}, {47}});
    enc.encode(populated);

    assert(ss.str() == "NULL,NULL\nvin,47\n");

    std::cout << "PASSED\n";
}

void test_cell_hooks() {
    std::cout << "Testing cell hooks take precedence... ";

    // std::map is an associative kind, but its hook wins
    auto value = labelled_t{};
    value.json = {{"name", labels::label_t{"henry"}}};
    assert(encode_row(value) == "getcsv\n");

    // A getter may produce several cells
    assert(encode_row(swatch_t{"teal", {0, 128, 128}}) == "teal,0,128,128\n");

    // A hooked record is one column, so its absence is one nil cell
    assert(encode_row(measurement_t{ratio_t{3, 4}, 2}) == "3/4,2\n");
    assert(encode_row(measurement_t{std::nullopt, 2}) == "NULL,2\n");
    assert(cell_width<std::optional<ratio_t>>() == 1);
    assert((header_of<measurement_t>() == std::vector<std::string>{"ratio", "count"}));

    std::cout << "PASSED\n";
}

void test_custom_sentinels() {
    std::cout << "Testing custom empty and nil values... ";

    auto ss = std::stringstream{};
    auto writer = csv_writer(ss);
    auto enc = encoder(writer);
    enc.set_empty_value("VIN");
    enc.set_nil_value("IMMORTAL");
    enc.encode(sentinel_t{});
    assert(ss.str() == "VIN,IMMORTAL\n");

    std::cout << "PASSED\n";
}

void test_skipped_fields() {
    std::cout << "Testing hidden and skipped fields... ";
    assert(encode_row(visibility_t{"riddick", "dom", "vin"}) == "vin\n");
    std::cout << "PASSED\n";
}

void test_embedded() {
    std::cout << "Testing embedded records... ";
    assert(encode_row(outer_t{{"riddick"}}) == "riddick\n");
    std::cout << "PASSED\n";
}

void test_omit_empty() {
    std::cout << "Testing omitEmpty collapses zero values... ";

    // A zero multi-cell record becomes a single empty cell
    auto cells = marshal(sparse_t{{0, 0}, {}, std::nullopt, "tail"}, false, options_t{"-", "NULL"});
    assert((cells == std::vector<std::string>{"-", "-", "NULL", "tail"}));

    auto zero_count = marshal(sparse_t{{1, 2}, {3}, 0, "tail"}, false, options_t{"-", "NULL"});
    assert((zero_count == std::vector<std::string>{"1", "2", "3", "-", "tail"}));

    assert(encode_row(sparse_t{{0, 0}, {}, std::nullopt, "tail"}) == ",,NULL,tail\n");

    std::cout << "PASSED\n";
}

void test_maps() {
    std::cout << "Testing maps flatten to one cell... ";

    auto value = maps_t{};
    value.single = {{"a", 1}};
    value.pair = {{"x", 1}, {"y", 2}};

    auto cells = marshal(value, false, options_t{});
    assert(cells.size() == 2);
    assert(cells[0] == "a:1");
    assert(cells[1] == "x:1,y:2" || cells[1] == "y:2,x:1");

    std::cout << "PASSED\n";
}

void test_enums() {
    std::cout << "Testing enums... ";
    assert(encode_row(card_t{level_t::high, suit_t::spades}) == "7,spades\n");
    std::cout << "PASSED\n";
}

void test_unsupported() {
    std::cout << "Testing unsupported types... ";

    try {
        encode_row(unsupported_t{});
        assert(false);
    } catch (const error& e) {
        assert(e.kind() == error_kind::unsupported_type);
        assert(std::string(e.what()).rfind("struct field `Pair`: `{...}`: cannot marshal", 0) == 0);
    }

    std::cout << "PASSED\n";
}

void test_write_header() {
    std::cout << "Testing header row... ";

    auto ss = std::stringstream{};
    auto writer = csv_writer(ss);
    auto enc = encoder(writer);
    enc.write_header<guardian_t>();
    enc.write_header<outer_t>();
    enc.write_header<swatch_t>();
    assert(ss.str() == "child.names,child.ages\nname\nname,color\n");

    std::cout << "PASSED\n";
}

// =============================================================================
// Main
// =============================================================================

int main() {
    std::cout << "=== Encoding ===\n\n";

    test_basic_types();
    test_pointers();
    test_sequences();
    test_nested_records();
    test_text_hook();
    test_nil_records();
    test_cell_hooks();
    test_custom_sentinels();
    test_skipped_fields();
    test_embedded();
    test_omit_empty();
    test_maps();
    test_enums();
    test_unsupported();
    test_write_header();

    std::cout << "\n=== All tests passed! ===\n";
    return 0;
}
