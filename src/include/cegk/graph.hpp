/*
# Copyright (c) 2023 Reed A. Cartwright <racartwright@gmail.com>
#
# This file is part of the Ultimate Source Code Project.
#
# Permission is hereby granted, free of charge, to any person obtaining a copy
# of this software and associated documentation files (the "Software"), to deal
# in the Software without restriction, including without limitation the rights
# to use, copy, modify, merge, publish, distribute, sublicense, and/or sell
# copies of the Software, and to permit persons to whom the Software is
# furnished to do so, subject to the following conditions:
#
# The above copyright notice and this permission notice shall be included in all
# copies or substantial portions of the Software.
#
# THE SOFTWARE IS PROVIDED "AS IS", WITHOUT WARRANTY OF ANY KIND, EXPRESS OR
# IMPLIED, INCLUDING BUT NOT LIMITED TO THE WARRANTIES OF MERCHANTABILITY,
# FITNESS FOR A PARTICULAR PURPOSE AND NONINFRINGEMENT. IN NO EVENT SHALL THE
# AUTHORS OR COPYRIGHT HOLDERS BE LIABLE FOR ANY CLAIM, DAMAGES OR OTHER
# LIABILITY, WHETHER IN AN ACTION OF CONTRACT, TORT OR OTHERWISE, ARISING FROM,
# OUT OF OR IN CONNECTION WITH THE SOFTWARE OR THE USE OR OTHER DEALINGS IN THE
# SOFTWARE.
*/

#ifndef CEGK_GRAPH_HPP
#define CEGK_GRAPH_HPP

#include "edge_data.hpp"

#include <optional>
#include <string>
#include <type_traits>

#include <boost/graph/adjacency_list.hpp>
#include <boost/range/iterator_range_core.hpp>

// Install boost graph properties
namespace boost {
enum edge_label_t { edge_label };
enum edge_attributes_t { edge_attributes };

enum vertex_kind_t { vertex_kind };
enum vertex_stage_t { vertex_stage };

BOOST_INSTALL_PROPERTY(edge, label);
BOOST_INSTALL_PROPERTY(edge, attributes);

BOOST_INSTALL_PROPERTY(vertex, kind);
BOOST_INSTALL_PROPERTY(vertex, stage);
}

namespace cegk {

// A strongly-type int. Use unitary + to do a static cast.
enum struct stage_id_t : int {};
constexpr auto operator+(stage_id_t value) {
    return static_cast<std::underlying_type_t<stage_id_t>>(value);
}

using stage_t = std::optional<stage_id_t>;

enum struct NodeKind : int {
    Situation, Root, Sink
};

// max_dist_to_sink of a node before distances have been computed
constexpr int UNKNOWN_DISTANCE = -1;

namespace ceg_graph {

using EdgeAttributesProp = boost::property<boost::edge_attributes_t, EdgeData>;
using EdgeLabelProp = boost::property<boost::edge_label_t, std::string, EdgeAttributesProp>;
using EdgeProp = EdgeLabelProp;

using VertexIndexProp = boost::property<boost::vertex_index_t, std::size_t>;
using VertexDistanceProp = boost::property<boost::vertex_distance_t, int, VertexIndexProp>;
using VertexStageProp = boost::property<boost::vertex_stage_t, stage_t, VertexDistanceProp>;
using VertexKindProp = boost::property<boost::vertex_kind_t, NodeKind, VertexStageProp>;
using VertexNameProp = boost::property<boost::vertex_name_t, std::string, VertexKindProp>;
using VertexProp = VertexNameProp;

// Vertices live in a list so that removing one keeps the others valid.
// vertex_index has to be kept contiguous by the owner of the graph.
using Graph = boost::adjacency_list<boost::vecS, boost::listS, boost::bidirectionalS,
        VertexProp, EdgeProp>;
using vertex_t = boost::graph_traits<Graph>::vertex_descriptor;
using edge_t = boost::graph_traits<Graph>::edge_descriptor;

} // namespace ceg_graph

namespace tree_graph {
// an event tree never loses vertices, so they are plain integers

using VertexStageProp = boost::property<boost::vertex_stage_t, stage_t>;
using VertexNameProp = boost::property<boost::vertex_name_t, std::string, VertexStageProp>;
using VertexProp = VertexNameProp;

using EdgeProp = ceg_graph::EdgeProp;

using Graph = boost::adjacency_list<boost::vecS, boost::vecS, boost::bidirectionalS,
        VertexProp, EdgeProp>;
using vertex_t = boost::graph_traits<Graph>::vertex_descriptor;
using edge_t = boost::graph_traits<Graph>::edge_descriptor;

static_assert(std::is_integral<vertex_t>::value,
    "vertex_t is not an integral type, this violates many assumptions that have been made.");

} // namespace tree_graph

template<class G>
auto make_vertex_range(G &graph) {
    return boost::make_iterator_range(vertices(graph));
}

template<class G>
auto make_out_edge_range(typename G::vertex_descriptor v, G &graph) {
    return boost::make_iterator_range(out_edges(v, graph));
}

template<class G>
auto make_in_edge_range(typename G::vertex_descriptor v, G &graph) {
    return boost::make_iterator_range(in_edges(v, graph));
}

} // namespace cegk

#endif // CEGK_GRAPH_HPP
