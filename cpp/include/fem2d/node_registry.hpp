#pragma once

#include "fem2d/node.hpp"
#include <map>
#include <memory>
#include <vector>

namespace fem2d {

/**
 * @brief Registry that owns the engine nodes
 *
 * Nodes are keyed by their tag. Coincident nodes are never merged:
 * duplicate nodes at the same coordinates are how moment releases and
 * spring supports are modelled.
 */
class NodeRegistry {
public:
    NodeRegistry() = default;

    /**
     * @brief Create a node with an explicit tag
     *
     * @throws std::invalid_argument if the tag is already used
     */
    Node* create_node(int id, double x, double y);

    /**
     * @brief Get node by its tag
     * @return Node* Pointer to node if found, nullptr otherwise
     */
    Node* get_node_by_id(int id) const;

    /**
     * @brief Get node by its tag
     * @throws std::invalid_argument if the tag is unknown
     */
    Node& require_node(int id) const;

    /// All nodes in creation order
    const std::vector<std::unique_ptr<Node>>& all_nodes() const;

    size_t size() const { return nodes_.size(); }

    void clear();

private:
    std::vector<std::unique_ptr<Node>> nodes_;   ///< Storage, creation order
    std::map<int, Node*> index_;                 ///< Tag -> node
};

}  // namespace fem2d
