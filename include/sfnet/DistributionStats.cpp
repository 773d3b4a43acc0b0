#include <sfnet/DistributionStats.hpp>

#include <cmath>
#include <string>

#include <range/v3/algorithm.hpp>
#include <range/v3/view.hpp>
#include <range/v3/range/conversion.hpp>

#include <sfnet/Errors.hpp>

namespace sfnet {

std::vector<double> normalize(const std::vector<count> &histogram) {
    const count num_nodes = ranges::accumulate(histogram, count(0));
    if (!num_nodes)
        return {1.0};

    return histogram
           | ranges::views::transform([num_nodes](count c) { return static_cast<double>(c) / num_nodes; })
           | ranges::to<std::vector>();
}

std::vector<double> power_law_histogram(signed_count max_degree, double gamma) {
    if (max_degree < 0)
        throw InvalidParameterError("Error: the maximum degree (" + std::to_string(max_degree) + ") must not be negative");

    std::vector<double> histogram;
    histogram.reserve(max_degree + 1);
    histogram.push_back(0.0);

    double normalization = 0;
    for (signed_count k = 1; k <= max_degree; ++k) {
        histogram.push_back(std::pow(static_cast<double>(k), -gamma));
        normalization += k * histogram.back();
    }

    for (signed_count k = 1; k <= max_degree; ++k)
        histogram[k] /= normalization;

    return histogram;
}

double ks_distance(const std::vector<double> &histogram_a, const std::vector<double> &histogram_b) {
    if (histogram_a.empty() || histogram_b.empty())
        throw EmptyInputError("Error: the Kolmogorov-Smirnov distance requires two non-empty histograms");

    const auto cumulative_a = cumulative(histogram_a);
    const auto cumulative_b = cumulative(histogram_b);

    // zip stops at the end of the shorter sequence
    return ranges::max(ranges::views::zip(cumulative_a, cumulative_b)
                       | ranges::views::transform([](const auto &p) { return std::abs(p.first - p.second); }));
}

}
