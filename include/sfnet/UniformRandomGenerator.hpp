#pragma once
#ifndef SFNET_UNIFORM_RANDOM_GENERATOR_HPP
#define SFNET_UNIFORM_RANDOM_GENERATOR_HPP

#include <random>

#include <sfnet/defs.hpp>
#include <sfnet/Graph.hpp>

namespace sfnet {

//! Undirected graph without self-edges on nodes 0..n-1 with exactly m edges; every
//! simple graph with n nodes and m edges is equally likely.
class UniformRandomGenerator {
public:
    //! throws InvalidParameterError if a count is negative or m exceeds n(n-1)/2
    UniformRandomGenerator(signed_count num_nodes, signed_count num_edges);

    [[nodiscard]] count num_nodes() const noexcept { return num_nodes_; }
    [[nodiscard]] count num_edges() const noexcept { return num_edges_; }

    Graph generate(std::mt19937_64 &gen) const;

private:
    count num_nodes_;
    count num_edges_;
    bool complete_;

    void connect_all_pairs(Graph &graph) const;
    void sample_edges(Graph &graph, std::mt19937_64 &gen) const;
};

}

#endif // SFNET_UNIFORM_RANDOM_GENERATOR_HPP
