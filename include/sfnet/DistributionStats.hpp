#pragma once
#ifndef SFNET_DISTRIBUTION_STATS_HPP
#define SFNET_DISTRIBUTION_STATS_HPP

#include <vector>

#include <range/v3/numeric.hpp>

#include <sfnet/defs.hpp>

namespace sfnet {

    //! divides each bucket by the number of nodes (sum of all buckets); {1.0} if there are no nodes
    std::vector<double> normalize(const std::vector<count> &histogram);

    //! running prefix sum of `sequence`
    template<typename T>
    std::vector<T> cumulative(const std::vector<T> &sequence) {
        std::vector<T> result(sequence.size());
        ranges::partial_sum(sequence, result.begin());
        return result;
    }

    //! P(k) ~ k^-gamma for k in 1..max_degree normalized to sum_k k * P(k) = 1, with P(0) = 0
    std::vector<double> power_law_histogram(signed_count max_degree, double gamma);

    //! maximum distance of the cumulative distributions over the shorter of both index ranges
    double ks_distance(const std::vector<double> &histogram_a, const std::vector<double> &histogram_b);

}

#endif // SFNET_DISTRIBUTION_STATS_HPP
