#include <sfnet/PreferentialAttachmentGenerator.hpp>
#include <sfnet/DistributionStats.hpp>
#include <sfnet/Errors.hpp>
#include <sfnet/UniformRandomGenerator.hpp>

#include <gtest/gtest.h>
#include <range/v3/all.hpp>
#include <algorithm>

using namespace sfnet;

class TestPreferentialAttachmentGenerator : public ::testing::Test {};

TEST_F(TestPreferentialAttachmentGenerator, InvalidParameters) {
    ASSERT_THROW(PreferentialAttachmentGenerator(-1, 1), InvalidParameterError);
    ASSERT_THROW(PreferentialAttachmentGenerator(1, -1), InvalidParameterError);
}

TEST_F(TestPreferentialAttachmentGenerator, Empty) {
    std::mt19937_64 gen(0);
    auto graph = PreferentialAttachmentGenerator(0, 3).generate(gen);
    ASSERT_EQ(graph.size(), 0);

    // no edges per step: just 2n isolated nodes
    graph = PreferentialAttachmentGenerator(4, 0).generate(gen);
    ASSERT_EQ(graph.size(), 8);
    ASSERT_EQ(graph.num_edges(), 0);
}

// the first step has no degrees to weight by and falls back to a uniform choice
TEST_F(TestPreferentialAttachmentGenerator, SingleSeedNode) {
    std::mt19937_64 gen(0);
    auto graph = PreferentialAttachmentGenerator(1, 1).generate(gen);

    ASSERT_EQ(graph.size(), 2);
    ASSERT_EQ(graph.num_edges(), 1);
    ASSERT_TRUE(graph.edge_exists(0, 1));
}

TEST_F(TestPreferentialAttachmentGenerator, UniformFirstStep) {
    std::mt19937_64 gen(0);
    PreferentialAttachmentGenerator generator(4, 1);

    std::vector<count> hits(4);
    const unsigned iterations = 40000;
    for (unsigned i = 0; i < iterations; ++i) {
        auto graph = generator.generate(gen);
        ASSERT_GE(graph.get_node(4).degree(), 1);
        for (count u = 0; u < 4; ++u)
            hits[u] += graph.edge_exists(4, u);
    }

    for (auto h : hits) {
        ASSERT_GE(h, 9500);
        ASSERT_LE(h, 10500);
    }
}

TEST_F(TestPreferentialAttachmentGenerator, EdgeCounts) {
    std::mt19937_64 gen(1);

    for (count n : {1, 2, 3, 5, 20}) {
        for (count m : {1, 2, 3, 7}) {
            PreferentialAttachmentGenerator generator(n, m);
            auto graph = generator.generate(gen);

            ASSERT_TRUE(graph.undirected());
            ASSERT_FALSE(graph.allows_self_edges());
            ASSERT_EQ(graph.size(), 2 * n);
            ASSERT_EQ(graph.num_edges(), generator.expected_num_edges()) << n << " " << m;

            count expected = 0;
            for (count i = 0; i < n; ++i)
                expected += std::min(m, i + 1);
            ASSERT_EQ(generator.expected_num_edges(), expected);

            // node n+i attaches to min(m, i+1) older nodes and only to nodes younger than itself afterwards
            for (count i = 0; i < n; ++i) {
                const auto &node = graph.get_node(n + i);
                auto older = ranges::count_if(node.neighbors(), [&](const NodeId &v) { return v < NodeId(n + i); });
                ASSERT_EQ(static_cast<count>(older), std::min(m, i + 1));
            }
        }
    }
}

// Seed nodes have degree 0 and thus weight 0 after the first step, so all but the
// single seed node hit in the first step stay isolated.
TEST_F(TestPreferentialAttachmentGenerator, ZeroDegreeNodesAreNeverChosen) {
    std::mt19937_64 gen(2);

    for (count m : {1, 2, 4}) {
        const count n = 200;
        auto graph = PreferentialAttachmentGenerator(n, m).generate(gen);

        count isolated_seeds = 0;
        for (count u = 0; u < n; ++u)
            isolated_seeds += !graph.get_node(u).degree();

        ASSERT_EQ(isolated_seeds, n - 1);
        ASSERT_EQ(graph.degree_histogram()[0], n - 1);
    }
}

// n = 3, m = 1: node 3 attaches to some seed x. Node 4 attaches to x or 3 with
// probability 1/2 each. Node 5 then sees degrees (x: 2, 3: 1, 4: 1) or (x: 1, 3: 2, 4: 1),
// so it attaches to x with probability 1/2 * 1/2 + 1/2 * 1/4 = 3/8.
TEST_F(TestPreferentialAttachmentGenerator, DegreeProportionalChoice) {
    std::mt19937_64 gen(3);
    PreferentialAttachmentGenerator generator(3, 1);

    const unsigned iterations = 40000;
    unsigned fourth_to_third = 0;
    unsigned fifth_to_seed = 0;

    for (unsigned i = 0; i < iterations; ++i) {
        auto graph = generator.generate(gen);

        const auto &third = graph.get_node(3);
        auto seed = ranges::find_if(third.neighbors(), [](const NodeId &v) { return v < NodeId(3); });
        ASSERT_TRUE(seed != third.neighbors().end());

        fourth_to_third += graph.edge_exists(4, 3);
        fifth_to_seed += graph.edge_exists(5, *seed);

        // the isolated seed nodes are never chosen
        for (count u = 0; u < 3; ++u)
            if (NodeId(u) != *seed)
                ASSERT_EQ(graph.get_node(u).degree(), 0);
    }

    ASSERT_NEAR(static_cast<double>(fourth_to_third) / iterations, 0.5, 0.015);
    ASSERT_NEAR(static_cast<double>(fifth_to_seed) / iterations, 0.375, 0.015);
}

// n = 3, m = 2: node 3 attaches to a seed x; node 4 needs two targets and only x and 3
// have a positive degree, so it attaches to both; node 5 picks two of {x, 3, 4}
TEST_F(TestPreferentialAttachmentGenerator, DistinctTargetsPerStep) {
    std::mt19937_64 gen(4);
    PreferentialAttachmentGenerator generator(3, 2);

    for (unsigned i = 0; i < 1000; ++i) {
        auto graph = generator.generate(gen);

        const auto &third = graph.get_node(3);
        auto seed = ranges::find_if(third.neighbors(), [](const NodeId &v) { return v < NodeId(3); });
        ASSERT_TRUE(seed != third.neighbors().end());

        ASSERT_TRUE(graph.edge_exists(4, 3));
        ASSERT_TRUE(graph.edge_exists(4, *seed));

        const auto &fifth = graph.get_node(5);
        ASSERT_EQ(fifth.degree(), 2);
        for (const auto &v : fifth.neighbors())
            ASSERT_TRUE(v == *seed || v == NodeId(3) || v == NodeId(4)) << v;
    }
}

TEST_F(TestPreferentialAttachmentGenerator, SameSeedSameGraph) {
    PreferentialAttachmentGenerator generator(50, 3);
    std::mt19937_64 gen_a(11);
    std::mt19937_64 gen_b(11);

    auto a = generator.generate(gen_a);
    auto b = generator.generate(gen_b);
    ASSERT_TRUE(ranges::equal(a.edges(), b.edges()));
}

// preferential attachment grows hubs that a uniform random graph with the same
// number of nodes and edges does not have
TEST_F(TestPreferentialAttachmentGenerator, HeavyTail) {
    std::mt19937_64 gen(5);
    auto scale_free = PreferentialAttachmentGenerator(3000, 2).generate(gen);
    auto random = UniformRandomGenerator(scale_free.size(), scale_free.num_edges()).generate(gen);

    ASSERT_EQ(random.num_edges(), scale_free.num_edges());
    ASSERT_GT(scale_free.max_degree(), 3 * random.max_degree());

    auto top = scale_free.highest_degree_nodes(1);
    ASSERT_EQ(top.front().first, scale_free.max_degree());
}
