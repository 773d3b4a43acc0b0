#pragma once
#ifndef SFNET_GRAPH_HPP
#define SFNET_GRAPH_HPP

#include <iosfwd>
#include <map>
#include <utility>
#include <vector>

#include <range/v3/view.hpp>

#include <sfnet/defs.hpp>
#include <sfnet/NodeId.hpp>
#include <sfnet/GraphNode.hpp>

namespace sfnet {

//! Simple graph (no multi-edges, no weights) that owns its nodes. Undirected graphs keep
//! the adjacency of both endpoints in sync; every mutation either succeeds completely
//! or throws without changing the graph.
class Graph {
public:
    explicit Graph(bool undirected = true, bool allow_self_edges = false)
        : undirected_(undirected), allow_self_edges_(allow_self_edges) {}

    Graph(Graph &&) = default;

    Graph &operator=(Graph &&) = default;

private: // copy is expensive, so make using it explicit via copy()
    Graph(const Graph &) = default;

    Graph &operator=(const Graph &) = default;

public:
    //! return copy of the graph
    [[nodiscard]] Graph copy() const { return {*this}; }

    [[nodiscard]] bool undirected() const noexcept { return undirected_; }
    [[nodiscard]] bool allows_self_edges() const noexcept { return allow_self_edges_; }

    //! inserts a node with the identifier of `node`; the adjacency of `node` is not taken over
    void add_node(const GraphNode &node) { add_node(node.id()); }
    void add_node(const NodeId &id);

    //! the node stored in this graph; throws NodeNotFoundError
    [[nodiscard]] GraphNode &get_node(const NodeId &id);
    [[nodiscard]] const GraphNode &get_node(const NodeId &id) const;
    [[nodiscard]] GraphNode &get_node(const GraphNode &node) { return get_node(node.id()); }
    [[nodiscard]] const GraphNode &get_node(const GraphNode &node) const { return get_node(node.id()); }

    [[nodiscard]] bool has_node(const NodeId &id) const { return nodes_.count(id) != 0; }
    [[nodiscard]] bool has_node(const GraphNode &node) const { return has_node(node.id()); }

    //! undirected: both a->b and b->a are present; directed: a->b is present
    [[nodiscard]] bool edge_exists(const NodeId &a, const NodeId &b) const;

    void add_edge(const NodeId &a, const NodeId &b);
    void remove_edge(const NodeId &a, const NodeId &b);

    //! number of nodes
    [[nodiscard]] count size() const noexcept { return nodes_.size(); }

    //! undirected edges count once, directed edges once per direction, self-edges always once
    [[nodiscard]] count num_edges() const;

    [[nodiscard]] count max_degree() const;

    //! histogram[d] = number of nodes of degree d, for d in 0..max_degree()
    [[nodiscard]] std::vector<count> degree_histogram() const;

    //! degree histogram divided by the number of nodes; {1.0} for an empty graph
    [[nodiscard]] std::vector<double> normalized_degree_distribution() const;

    //! up to k (degree, id) pairs of the highest degree nodes, in descending order
    [[nodiscard]] std::vector<std::pair<count, NodeId>> highest_degree_nodes(count k) const;

    //! all nodes in NodeId order
    [[nodiscard]] auto nodes() const noexcept {
        return nodes_ | ranges::views::values;
    }

    //! degrees of all nodes in NodeId order
    [[nodiscard]] auto degrees() const noexcept {
        return nodes() | ranges::views::transform([](const GraphNode &u) { return u.degree(); });
    }

    //! view of std::pair<NodeId, NodeId> of all stored adjacencies; an undirected edge {u, v}
    //! with u != v appears as (u, v) and (v, u), a directed edge or a self-edge appears once
    [[nodiscard]] auto edges() const noexcept {
        return nodes() | ranges::views::for_each([](const GraphNode &u) {
            return u.neighbors() | ranges::views::transform([&u](const NodeId &v) {
                return std::pair<NodeId, NodeId>{u.id(), v};
            });
        });
    }

    //! sorted, human readable adjacency listing
    void write_adjacency(std::ostream &os) const;

private:
    std::map<NodeId, GraphNode> nodes_;
    bool undirected_;
    bool allow_self_edges_;
};

}

#endif // SFNET_GRAPH_HPP
