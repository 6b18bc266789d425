#include "tabular/path_tree.hpp"
#include "tabular/error.hpp"

namespace tabular {

auto path_tree_t::from_row(const std::vector<std::string>& header,
                           const std::vector<std::string>& row) -> path_tree_t {
    if (header.size() != row.size()) {
        throw io_error("row has " + std::to_string(row.size()) +
                       " cells, header has " + std::to_string(header.size()));
    }
    auto tree = path_tree_t{};
    for (std::size_t i = 0; i < header.size(); ++i) {
        tree.set(header[i], row[i]);
    }
    return tree;
}

void path_tree_t::set(const std::string& path, const std::string& value) {
    auto dot = path.find('.');

    if (dot == std::string::npos) {
        auto it = nodes_.find(path);
        if (it != nodes_.end() && !is_leaf(it->second)) {
            throw unexpected_shape("path segment `" + path + "` already has nested columns");
        }
        nodes_[path] = value;
        return;
    }

    auto head = path.substr(0, dot);
    auto tail = path.substr(dot + 1);
    auto it = nodes_.find(head);

    if (it == nodes_.end()) {
        it = nodes_.emplace(head, std::make_unique<path_tree_t>()).first;
    } else if (is_leaf(it->second)) {
        throw unexpected_shape("path segment `" + head + "` of `" + path + "` is already a cell value");
    }
    std::get<std::unique_ptr<path_tree_t>>(it->second)->set(tail, value);
}

auto path_tree_t::get(const std::string& key) const -> const node_t* {
    auto it = nodes_.find(key);
    return it == nodes_.end() ? nullptr : &it->second;
}

auto path_tree_t::find(const std::string& path) const -> const std::string* {
    auto dot = path.find('.');
    auto node = get(path.substr(0, dot));

    if (!node) return nullptr;
    if (dot == std::string::npos) {
        return is_leaf(*node) ? &as_leaf(*node) : nullptr;
    }
    if (is_leaf(*node)) return nullptr;
    return as_tree(*node).find(path.substr(dot + 1));
}

auto path_tree_t::all_leaves_equal(const std::string& value) const -> bool {
    for (const auto& [key, node] : nodes_) {
        if (is_leaf(node) ? as_leaf(node) != value : !as_tree(node).all_leaves_equal(value)) {
            return false;
        }
    }
    return true;
}

auto operator==(const path_tree_t& a, const path_tree_t& b) -> bool {
    if (a.nodes_.size() != b.nodes_.size()) return false;

    for (const auto& [key, node] : a.nodes_) {
        auto other = b.get(key);
        if (!other || is_leaf(node) != is_leaf(*other)) return false;
        if (is_leaf(node)) {
            if (as_leaf(node) != as_leaf(*other)) return false;
        } else if (!(as_tree(node) == as_tree(*other))) {
            return false;
        }
    }
    return true;
}

auto is_leaf(const path_tree_t::node_t& node) -> bool {
    return std::holds_alternative<std::string>(node);
}

auto as_leaf(const path_tree_t::node_t& node) -> const std::string& {
    return std::get<std::string>(node);
}

auto as_tree(const path_tree_t::node_t& node) -> const path_tree_t& {
    return *std::get<std::unique_ptr<path_tree_t>>(node);
}

} // namespace tabular
