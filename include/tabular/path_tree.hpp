#pragma once

#include <map>
#include <memory>
#include <string>
#include <variant>
#include <vector>

namespace tabular {

// =============================================================================
// path_tree_t - dotted header paths unflattened into a trie
// =============================================================================
//
// Each key is one path segment; each value is either the cell text (a leaf)
// or another path_tree_t. Built fresh for every decoded row:
//
//   auto tree = path_tree_t{};
//   tree.set("my.nested.struct", "henry");
//   // {my: {nested: {struct: "henry"}}}
//
class path_tree_t {
public:
    using node_t = std::variant<std::string, std::unique_ptr<path_tree_t>>;

    path_tree_t() = default;
    path_tree_t(const path_tree_t&) = delete;
    path_tree_t& operator=(const path_tree_t&) = delete;
    path_tree_t(path_tree_t&&) = default;
    path_tree_t& operator=(path_tree_t&&) = default;

    // Build a tree from a header and one row of cells (parallel sequences)
    static auto from_row(const std::vector<std::string>& header,
                         const std::vector<std::string>& row) -> path_tree_t;

    // Insert a value at a dotted path, creating intermediate nodes
    void set(const std::string& path, const std::string& value);

    // Direct child lookup by a single segment; nullptr if absent
    auto get(const std::string& key) const -> const node_t*;

    // Leaf lookup by dotted path; nullptr if absent or not a leaf
    auto find(const std::string& path) const -> const std::string*;

    // Whether every leaf below this node equals `value`
    auto all_leaves_equal(const std::string& value) const -> bool;

    auto size() const -> std::size_t { return nodes_.size(); }
    auto empty() const -> bool { return nodes_.empty(); }

    auto begin() const { return nodes_.begin(); }
    auto end() const { return nodes_.end(); }

    friend auto operator==(const path_tree_t& a, const path_tree_t& b) -> bool;

private:
    std::map<std::string, node_t> nodes_;
};

auto is_leaf(const path_tree_t::node_t& node) -> bool;
auto as_leaf(const path_tree_t::node_t& node) -> const std::string&;
auto as_tree(const path_tree_t::node_t& node) -> const path_tree_t&;

} // namespace tabular
