#include <sfnet/UniformRandomGenerator.hpp>

#include <string>

#include <boost/multiprecision/cpp_int.hpp>
#include <tlx/define/likely.hpp>

#include <sfnet/Errors.hpp>

namespace sfnet {

using integer = boost::multiprecision::checked_cpp_int;

UniformRandomGenerator::UniformRandomGenerator(signed_count num_nodes, signed_count num_edges) {
    if (num_nodes < 0)
        throw InvalidParameterError("Error: the number of nodes (" + std::to_string(num_nodes) + ") must not be negative");
    if (num_edges < 0)
        throw InvalidParameterError("Error: the number of edges (" + std::to_string(num_edges) + ") must not be negative");

    const integer max_edges = integer(num_nodes) * (num_nodes - 1) / 2;
    if (integer(num_edges) > max_edges)
        throw InvalidParameterError("Error: " + std::to_string(num_edges) + " edges are more than possible (" +
                                    max_edges.str() + ") in an undirected graph with " + std::to_string(num_nodes) + " nodes");

    num_nodes_ = static_cast<count>(num_nodes);
    num_edges_ = static_cast<count>(num_edges);
    complete_ = num_edges_ && integer(num_edges) == max_edges;
}

Graph UniformRandomGenerator::generate(std::mt19937_64 &gen) const {
    Graph graph(true, false);
    for (count i = 0; i < num_nodes_; ++i)
        graph.add_node(i);

    if (!num_edges_)
        return graph;

    if (complete_)
        connect_all_pairs(graph);
    else
        sample_edges(graph, gen);

    return graph;
}

void UniformRandomGenerator::connect_all_pairs(Graph &graph) const {
    for (count u = 0; u < num_nodes_; ++u)
        for (count v = u + 1; v < num_nodes_; ++v)
            graph.add_edge(u, v);
}

void UniformRandomGenerator::sample_edges(Graph &graph, std::mt19937_64 &gen) const {
    // num_edges_ < n(n-1)/2 implies n >= 2
    std::uniform_int_distribution<count> first_distr{0, num_nodes_ - 1};
    std::uniform_int_distribution<count> second_distr{0, num_nodes_ - 2};

    count established = 0;
    while (established < num_edges_) {
        // uniform pair of distinct nodes: skip u when drawing v
        const count u = first_distr(gen);
        count v = second_distr(gen);
        v += (v >= u);

        if (TLX_UNLIKELY(graph.edge_exists(u, v)))
            continue;

        graph.add_edge(u, v);
        ++established;
    }
}

}
