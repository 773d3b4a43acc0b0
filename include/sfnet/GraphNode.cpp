#include <sfnet/GraphNode.hpp>
#include <sfnet/Errors.hpp>

namespace sfnet {

void GraphNode::add_edge(const NodeId &other) {
    if (!neighbors_.insert(other).second)
        throw DuplicateEdgeError("Error: the edge from node " + id_.to_string() + " to node " + other.to_string() +
                                 " already exists");
}

void GraphNode::remove_edge(const NodeId &other) {
    if (!neighbors_.erase(other))
        throw MissingEdgeError("Error: the edge from node " + id_.to_string() + " to node " + other.to_string() +
                               " does not exist");
}

}
