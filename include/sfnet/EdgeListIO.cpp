#include <sfnet/EdgeListIO.hpp>

#include <istream>
#include <ostream>
#include <string>
#include <vector>

namespace sfnet {

void write_edge_list(std::ostream &output, const Graph &graph, char delimiter) {
    for (const auto &[u, v] : graph.edges())
        output << u.to_string() << delimiter << v.to_string() << "\n";
}

static std::vector<std::string> split_row(const std::string &line, char delimiter) {
    std::vector<std::string> columns;
    size_t begin = 0;
    while (true) {
        const auto end = line.find(delimiter, begin);
        columns.push_back(line.substr(begin, end == std::string::npos ? std::string::npos : end - begin));
        if (end == std::string::npos)
            break;
        begin = end + 1;
    }
    return columns;
}

Graph read_edge_list(std::istream &input, char delimiter, bool undirected, bool allow_self_edges) {
    Graph graph(undirected, allow_self_edges);

    std::string line;
    while (std::getline(input, line)) {
        if (!line.empty() && line.back() == '\r')
            line.pop_back();

        const auto columns = split_row(line, delimiter);
        if (columns.size() != 2 || columns[0].empty() || columns[1].empty())
            continue;

        const auto u = NodeId::parse(columns[0]);
        const auto v = NodeId::parse(columns[1]);

        if (!graph.has_node(u))
            graph.add_node(u);
        if (!graph.has_node(v))
            graph.add_node(v);

        // the same edge is typically listed in both orientations
        if (u == v && !allow_self_edges)
            continue;
        if (graph.edge_exists(u, v))
            continue;

        graph.add_edge(u, v);
    }

    return graph;
}

}
