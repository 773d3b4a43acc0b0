#include <iostream>
#include <fstream>
#include <functional>
#include <optional>
#include <random>
#include <stdexcept>
#include <string>
#include <vector>

#include <omp.h>

#include <tlx/cmdline_parser.hpp>
#include <tlx/die.hpp>

#include <range/v3/numeric.hpp>
#include <range/v3/view.hpp>

#include <sfnet/DistributionStats.hpp>
#include <sfnet/EdgeListIO.hpp>
#include <sfnet/Errors.hpp>
#include <sfnet/PreferentialAttachmentGenerator.hpp>
#include <sfnet/ScopedTimer.hpp>
#include <sfnet/UniformRandomGenerator.hpp>

namespace sfnet {
static constexpr double kGamma = 3.0;

struct Config {
    enum class Model {
        Random, ScaleFree
    };

    unsigned seed{std::random_device{}()};

    Model model = Model::ScaleFree;
    std::string model_name{"scalefree"};

    unsigned num_nodes{1000};
    unsigned num_edges{2};
    double gamma{kGamma};
    unsigned repeats{1};

    std::string output_path;
    bool print_adjacency{false};

    static std::optional<Config> parse(int argc, char *argv[]) {
        tlx::CmdlineParser parser;
        parser.set_description("Generates random or scale-free networks and compares their degree distribution "
                               "to a power law.");

        Config config;

        parser.add_string('t', "model", config.model_name, "Network model: random or scalefree; default scalefree");
        parser.add_unsigned('n', "nodes", config.num_nodes,
                            "Number of nodes (random) or seed nodes (scalefree); default 1000");
        parser.add_unsigned('m', "edges", config.num_edges,
                            "Number of edges (random) or edges per growth step (scalefree); default 2");
        parser.add_double('g', "gamma", config.gamma, "Exponent of the reference power law; default 3");
        parser.add_unsigned('s', "seed", config.seed, "Seed of the first graph; graph i uses seed + i");
        parser.add_unsigned('r', "repeats", config.repeats, "Number of independent graphs; default 1");
        parser.add_string('o', "output", config.output_path, "Path to write the edge list of the first graph to");
        parser.add_flag('p', "print", config.print_adjacency, "Print the adjacency of the first graph");

        if (!parser.process(argc, argv))
            return {};

        if (config.model_name == "random") {
            config.model = Model::Random;
        } else if (config.model_name == "scalefree") {
            config.model = Model::ScaleFree;
        } else {
            std::cout << "Invalid model (-t): " << config.model_name << std::endl;
            return {};
        }

        if (!config.repeats) {
            std::cout << "Invalid number of repeats (-r)" << std::endl;
            return {};
        }

        return {config};
    };
};

struct Summary {
    count num_nodes{0};
    count num_edges{0};
    count max_degree{0};
    double ks_distance{0};
};

// the generators validate their parameters on construction, i.e. before any parallel work
std::function<Graph(std::mt19937_64 &)> make_generator(const Config &config) {
    switch (config.model) {
        case Config::Model::Random: {
            UniformRandomGenerator generator(config.num_nodes, config.num_edges);
            return [generator](std::mt19937_64 &gen) { return generator.generate(gen); };
        }

        case Config::Model::ScaleFree: {
            PreferentialAttachmentGenerator generator(config.num_nodes, config.num_edges);
            return [generator](std::mt19937_64 &gen) { return generator.generate(gen); };
        }

        default:
            die("Unsupported model");
    }
}

Summary summarize(const Graph &graph, double gamma) {
    Summary summary;
    summary.num_nodes = graph.size();
    summary.num_edges = graph.num_edges();
    summary.max_degree = graph.max_degree();
    summary.ks_distance = ks_distance(graph.normalized_degree_distribution(),
                                      power_law_histogram(static_cast<signed_count>(summary.max_degree), gamma));
    return summary;
}

void output_graph(const Config &config, const Graph &graph) {
    if (config.print_adjacency)
        graph.write_adjacency(std::cout);

    if (config.output_path.empty())
        return;

    std::ofstream output{config.output_path};
    die_unless(output);
    write_edge_list(output, graph);
}

int run(const Config &config) {
    const auto generate = make_generator(config);

    std::vector<Summary> summaries(config.repeats);
    std::optional<Graph> first_graph;

    std::cout << "Generating on up to " << omp_get_max_threads() << " threads" << std::endl;
    {
        ScopedTimer timer("Generating " + std::to_string(config.repeats) + " " + config.model_name + " graph(s)");

#pragma omp parallel for schedule(dynamic)
        for (long long i = 0; i < static_cast<long long>(config.repeats); ++i) {
            std::mt19937_64 gen(config.seed + i);
            auto graph = generate(gen);
            summaries[i] = summarize(graph, config.gamma);

            if (i == 0)
                first_graph = std::move(graph);
        }
    }

    for (const auto &[i, s] : ranges::views::enumerate(summaries)) {
        std::cout << "graph " << i << ": nodes=" << s.num_nodes << " edges=" << s.num_edges
                  << " max_degree=" << s.max_degree << " ks_distance=" << s.ks_distance << "\n";
    }

    const double mean_ks = ranges::accumulate(summaries, 0.0, std::plus<>(), &Summary::ks_distance) / summaries.size();
    std::cout << "mean ks_distance to power law (gamma=" << config.gamma << "): " << mean_ks << std::endl;

    die_unless(first_graph);
    if (config.model == Config::Model::Random)
        die_unequal(first_graph->num_edges(), config.num_edges);

    output_graph(config, *first_graph);
    return 0;
}

}

int main(int argc, char* argv[]) {
    auto config_opt = sfnet::Config::parse(argc, argv);
    if (!config_opt)
        return -1;

    try {
        return sfnet::run(config_opt.value());
    } catch (const std::invalid_argument &e) {
        std::cout << e.what() << std::endl;
        return -1;
    } catch (const sfnet::GraphError &e) {
        std::cout << e.what() << std::endl;
        return -1;
    }
}
