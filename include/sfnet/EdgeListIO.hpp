#pragma once
#ifndef SFNET_EDGE_LIST_IO_HPP
#define SFNET_EDGE_LIST_IO_HPP

#include <iosfwd>

#include <sfnet/Graph.hpp>

namespace sfnet {

    //! One "u<delimiter>v" row per entry of graph.edges(), i.e. undirected edges in both orientations.
    //! String identifiers are written quoted ('a'), so reading the rows back keeps 1 and '1' apart.
    void write_edge_list(std::ostream &output, const Graph &graph, char delimiter = '\t');

    //! Builds a graph from two-column rows. Rows with fewer or more columns are skipped;
    //! duplicate nodes, duplicate edges and forbidden self-edges are ignored. Fields are
    //! interpreted by NodeId::parse.
    Graph read_edge_list(std::istream &input, char delimiter = '\t', bool undirected = true, bool allow_self_edges = false);

}

#endif // SFNET_EDGE_LIST_IO_HPP
