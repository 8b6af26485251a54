#include "fem2d/node_registry.hpp"
#include <cmath>
#include <stdexcept>
#include <string>

namespace fem2d {

Node* NodeRegistry::create_node(int id, double x, double y) {
    if (index_.count(id) > 0) {
        throw std::invalid_argument("Node " + std::to_string(id) + " already exists");
    }
    if (!std::isfinite(x) || !std::isfinite(y)) {
        throw std::invalid_argument("Node " + std::to_string(id) + " has non-finite coordinates");
    }

    auto new_node = std::make_unique<Node>(id, x, y);
    Node* node_ptr = new_node.get();
    nodes_.push_back(std::move(new_node));
    index_[id] = node_ptr;
    return node_ptr;
}

Node* NodeRegistry::get_node_by_id(int id) const {
    auto it = index_.find(id);
    return it != index_.end() ? it->second : nullptr;
}

Node& NodeRegistry::require_node(int id) const {
    Node* node = get_node_by_id(id);
    if (node == nullptr) {
        throw std::invalid_argument("Node " + std::to_string(id) + " does not exist");
    }
    return *node;
}

const std::vector<std::unique_ptr<Node>>& NodeRegistry::all_nodes() const {
    return nodes_;
}

void NodeRegistry::clear() {
    index_.clear();
    nodes_.clear();
}

}  // namespace fem2d
