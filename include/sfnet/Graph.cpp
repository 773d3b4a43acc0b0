#include <sfnet/Graph.hpp>

#include <algorithm>
#include <cstddef>
#include <functional>
#include <iomanip>
#include <ostream>
#include <string>

#include <range/v3/algorithm.hpp>
#include <range/v3/numeric.hpp>
#include <range/v3/range/conversion.hpp>

#include <sfnet/DistributionStats.hpp>
#include <sfnet/Errors.hpp>

namespace sfnet {

void Graph::add_node(const NodeId &id) {
    if (!nodes_.emplace(id, GraphNode{id}).second)
        throw DuplicateNodeError("Error: the graph already has a node with identifier " + id.to_string());
}

GraphNode &Graph::get_node(const NodeId &id) {
    auto it = nodes_.find(id);
    if (it == nodes_.end())
        throw NodeNotFoundError("Error: there is no node " + id.to_string() + " in the graph");
    return it->second;
}

const GraphNode &Graph::get_node(const NodeId &id) const {
    auto it = nodes_.find(id);
    if (it == nodes_.end())
        throw NodeNotFoundError("Error: there is no node " + id.to_string() + " in the graph");
    return it->second;
}

bool Graph::edge_exists(const NodeId &a, const NodeId &b) const {
    const auto &u = get_node(a);
    const auto &v = get_node(b);

    if (undirected_)
        return u.has_edge_to(v) && v.has_edge_to(u);

    return u.has_edge_to(v);
}

void Graph::add_edge(const NodeId &a, const NodeId &b) {
    auto &u = get_node(a);
    auto &v = get_node(b);

    if (u == v && !allow_self_edges_)
        throw SelfEdgeNotAllowedError("Error: the graph does not allow self-edges (node " + u.id().to_string() + ")");

    const bool symmetric = undirected_ && u != v;

    // validate both halves first, so that a failure never leaves a one-directional edge
    if (symmetric && v.has_edge_to(u))
        throw DuplicateEdgeError("Error: the edge from node " + v.id().to_string() + " to node " + u.id().to_string() +
                                 " already exists");

    u.add_edge(v);
    if (symmetric)
        v.add_edge(u);
}

void Graph::remove_edge(const NodeId &a, const NodeId &b) {
    auto &u = get_node(a);
    auto &v = get_node(b);

    const bool symmetric = undirected_ && u != v;

    if (symmetric && !v.has_edge_to(u))
        throw MissingEdgeError("Error: the edge from node " + v.id().to_string() + " to node " + u.id().to_string() +
                               " does not exist");

    u.remove_edge(v);
    if (symmetric)
        v.remove_edge(u);
}

count Graph::num_edges() const {
    const count degree_sum = ranges::accumulate(degrees(), count(0));
    if (!undirected_)
        return degree_sum;

    // self-edges are stored once, every other undirected edge twice
    const auto self_edges = static_cast<count>(ranges::count_if(nodes(), [](const GraphNode &u) { return u.has_edge_to(u); }));
    return (degree_sum - self_edges) / 2 + self_edges;
}

count Graph::max_degree() const {
    return ranges::accumulate(degrees(), count(0), [](count a, count b) { return std::max(a, b); });
}

std::vector<count> Graph::degree_histogram() const {
    std::vector<count> histogram(max_degree() + 1, 0);
    for (auto d : degrees())
        histogram[d]++;

    return histogram;
}

std::vector<double> Graph::normalized_degree_distribution() const {
    return normalize(degree_histogram());
}

std::vector<std::pair<count, NodeId>> Graph::highest_degree_nodes(count k) const {
    auto ranked = nodes()
                  | ranges::views::transform([](const GraphNode &u) { return std::pair<count, NodeId>{u.degree(), u.id()}; })
                  | ranges::to<std::vector>();

    const auto keep = static_cast<std::ptrdiff_t>(std::min<count>(k, ranked.size()));
    std::partial_sort(ranked.begin(), ranked.begin() + keep, ranked.end(), std::greater<>());
    ranked.erase(ranked.begin() + keep, ranked.end());

    return ranked;
}

void Graph::write_adjacency(std::ostream &os) const {
    os << "Graph (" << (undirected_ ? "undirected" : "directed") << ", "
       << (allow_self_edges_ ? "" : "no ") << "self-edges allowed):" << (nodes_.empty() ? " empty" : "") << "\n";

    size_t width = 0;
    for (const auto &u : nodes())
        width = std::max(width, u.id().to_string().size());

    const char *edge_type = undirected_ ? "<-->" : "-->";
    for (const auto &u : nodes()) {
        os << std::setw(static_cast<int>(width + 2)) << u.id().to_string() << " " << edge_type << " ";

        if (u.neighbors().empty()) {
            os << "no edges\n";
            continue;
        }

        for (auto[i, v] : ranges::views::enumerate(u.neighbors()))
            os << (i ? ", " : "") << v;
        os << "\n";
    }
}

}
