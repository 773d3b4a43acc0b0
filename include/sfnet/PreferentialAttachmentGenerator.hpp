#pragma once
#ifndef SFNET_PREFERENTIAL_ATTACHMENT_GENERATOR_HPP
#define SFNET_PREFERENTIAL_ATTACHMENT_GENERATOR_HPP

#include <random>
#include <vector>

#include <sfnet/defs.hpp>
#include <sfnet/Graph.hpp>

namespace sfnet {

//! Scale-free growth process on an undirected graph without self-edges.
//!
//! Seed phase: nodes 0..n-1 without edges.
//! Growth phase: in step i (0 <= i < n) node n+i is added and connected to min(m, i+1)
//! distinct existing nodes. A target is chosen with probability proportional to its degree;
//! if all existing nodes have degree 0 (the first step) the choice is uniform.
//!
//! The selection weights are a snapshot of the degrees taken once per step, before the
//! new node receives its edges. Targets already chosen in the same step are rejected
//! and redrawn.
class PreferentialAttachmentGenerator {
public:
    //! throws InvalidParameterError if a count is negative
    PreferentialAttachmentGenerator(signed_count num_seed_nodes, signed_count edges_per_step);

    [[nodiscard]] count num_seed_nodes() const noexcept { return num_seed_nodes_; }
    [[nodiscard]] count edges_per_step() const noexcept { return edges_per_step_; }

    //! the final graph has 2n nodes and sum_{i<n} min(m, i+1) edges
    [[nodiscard]] count expected_num_edges() const noexcept;

    Graph generate(std::mt19937_64 &gen) const;

private:
    count num_seed_nodes_;
    count edges_per_step_;

    //! prefix sums of `degrees`
    static void compute_cumulative_weights(const std::vector<count> &degrees, std::vector<count> &cumulative_weights);

    static count sample_target(const std::vector<count> &cumulative_weights, std::mt19937_64 &gen);
};

}

#endif // SFNET_PREFERENTIAL_ATTACHMENT_GENERATOR_HPP
