#pragma once
#ifndef SFNET_GRAPHNODE_HPP
#define SFNET_GRAPHNODE_HPP

#include <set>
#include <utility>

#include <sfnet/defs.hpp>
#include <sfnet/NodeId.hpp>

namespace sfnet {

//! A vertex and the identifiers of its neighbors. The neighbors are backlinks into the
//! node pool of the owning Graph; a GraphNode never owns other nodes.
class GraphNode {
public:
    explicit GraphNode(NodeId id) : id_(std::move(id)) {}

    [[nodiscard]] const NodeId &id() const noexcept { return id_; }

    //! number of distinct neighbors
    [[nodiscard]] count degree() const noexcept { return neighbors_.size(); }

    //! neighbors in NodeId order
    [[nodiscard]] const std::set<NodeId> &neighbors() const noexcept { return neighbors_; }

    [[nodiscard]] bool has_edge_to(const NodeId &other) const { return neighbors_.count(other) != 0; }
    [[nodiscard]] bool has_edge_to(const GraphNode &other) const { return has_edge_to(other.id()); }

    //! only changes this node; throws DuplicateEdgeError if the edge exists
    void add_edge(const NodeId &other);
    void add_edge(const GraphNode &other) { add_edge(other.id()); }

    //! only changes this node; throws MissingEdgeError if the edge does not exist
    void remove_edge(const NodeId &other);
    void remove_edge(const GraphNode &other) { remove_edge(other.id()); }

    friend bool operator==(const GraphNode &a, const GraphNode &b) noexcept { return a.id_ == b.id_; }
    friend bool operator!=(const GraphNode &a, const GraphNode &b) noexcept { return a.id_ != b.id_; }
    friend bool operator<(const GraphNode &a, const GraphNode &b) noexcept { return a.id_ < b.id_; }

private:
    NodeId id_;
    std::set<NodeId> neighbors_;
};

}

#endif // SFNET_GRAPHNODE_HPP
