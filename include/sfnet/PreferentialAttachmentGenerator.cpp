#include <sfnet/PreferentialAttachmentGenerator.hpp>

#include <algorithm>
#include <iterator>
#include <string>

#include <range/v3/algorithm.hpp>
#include <range/v3/numeric.hpp>
#include <tlx/define/likely.hpp>

#include <sfnet/Errors.hpp>

namespace sfnet {

PreferentialAttachmentGenerator::PreferentialAttachmentGenerator(signed_count num_seed_nodes, signed_count edges_per_step) {
    if (num_seed_nodes < 0)
        throw InvalidParameterError("Error: the number of nodes (" + std::to_string(num_seed_nodes) + ") must not be negative");
    if (edges_per_step < 0)
        throw InvalidParameterError("Error: the number of edges per step (" + std::to_string(edges_per_step) +
                                    ") must not be negative");

    num_seed_nodes_ = static_cast<count>(num_seed_nodes);
    edges_per_step_ = static_cast<count>(edges_per_step);
}

count PreferentialAttachmentGenerator::expected_num_edges() const noexcept {
    count total = 0;
    for (count i = 0; i < num_seed_nodes_; ++i)
        total += std::min(edges_per_step_, i + 1);
    return total;
}

Graph PreferentialAttachmentGenerator::generate(std::mt19937_64 &gen) const {
    const count n = num_seed_nodes_;

    Graph graph(true, false);

    // node ids are dense, so degrees are mirrored here to compute weights without lookups
    std::vector<count> degrees;
    degrees.reserve(2 * n);

    for (count u = 0; u < n; ++u) {
        graph.add_node(u);
        degrees.push_back(0);
    }

    std::vector<count> cumulative_weights;
    std::vector<count> targets;
    targets.reserve(edges_per_step_);

    for (count i = 0; i < n; ++i) {
        const count new_node = n + i;

        // weights of all existing nodes; the new node is not among them
        compute_cumulative_weights(degrees, cumulative_weights);

        graph.add_node(new_node);
        degrees.push_back(0);

        // After step 0 at least i+1 existing nodes have a positive degree, so
        // min(m, i+1) distinct targets are always available.
        const count num_targets = std::min(edges_per_step_, i + 1);

        targets.clear();
        while (targets.size() < num_targets) {
            const count target = sample_target(cumulative_weights, gen);

            if (TLX_UNLIKELY(target == new_node || ranges::find(targets, target) != targets.end()))
                continue;

            graph.add_edge(new_node, target);
            targets.push_back(target);
        }

        for (auto v : targets)
            degrees[v]++;
        degrees[new_node] += targets.size();
    }

    return graph;
}

void PreferentialAttachmentGenerator::compute_cumulative_weights(const std::vector<count> &degrees,
                                                                 std::vector<count> &cumulative_weights) {
    cumulative_weights.resize(degrees.size());
    ranges::partial_sum(degrees, cumulative_weights.begin());
}

count PreferentialAttachmentGenerator::sample_target(const std::vector<count> &cumulative_weights, std::mt19937_64 &gen) {
    const count total_weight = cumulative_weights.back();

    if (TLX_UNLIKELY(!total_weight))
        return std::uniform_int_distribution<count>{0, cumulative_weights.size() - 1}(gen);

    // first node whose prefix sum exceeds r; nodes of degree 0 are never hit
    const auto r = std::uniform_int_distribution<count>{0, total_weight - 1}(gen);
    auto it = std::upper_bound(cumulative_weights.begin(), cumulative_weights.end(), r);
    return static_cast<count>(std::distance(cumulative_weights.begin(), it));
}

}
