#include "fem2d/node.hpp"

namespace fem2d {

Node::Node(int id, double x, double y)
    : id(id), x(x), y(y) {}

}  // namespace fem2d
