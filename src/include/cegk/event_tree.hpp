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

#ifndef CEGK_EVENT_TREE_HPP
#define CEGK_EVENT_TREE_HPP

#include <cegk/graph.hpp>

#include <map>
#include <string>
#include <unordered_map>
#include <vector>

namespace cegk {

// An event tree built from counted categorical paths.
//
// Paths are ordered by length and then lexicographically. The root is "s0" and
// the i-th path ends at node "s<i>". The edge into a node is labelled with the
// last value of its path and carries the path's Count.
class EventTree {
public:
    using path_t = std::vector<std::string>;
    using path_counts_t = std::map<path_t, int>;
    using graph_t = tree_graph::Graph;
    using vertex_t = tree_graph::vertex_t;
    using edge_t = tree_graph::edge_t;

    EventTree() : EventTree(path_counts_t{}) { }

    explicit EventTree(const path_counts_t &path_counts,
        const std::vector<path_t> &sampling_zero_paths = {});

    // Count every prefix of every row. A row's path ends at its first empty value.
    static path_counts_t CountPaths(const std::vector<std::vector<std::string>> &rows);

    const std::string& root() const { return NodeName(0); }

    // nodes with at least one child
    std::vector<std::string> situations() const;

    std::vector<std::string> leaves() const;

    std::size_t NumberOfNodes() const { return num_vertices(graph_); }
    std::size_t NumberOfEdges() const { return num_edges(graph_); }

    const std::string& NodeName(vertex_t v) const {
        return get(boost::vertex_name, graph_, v);
    }

    vertex_t LookupNode(const std::string &name) const;

    const std::string& LookupPath(const path_t &path) const;

    const path_t& Path(const std::string &name) const {
        return paths_[LookupNode(name)];
    }

    bool IsLeaf(vertex_t v) const { return out_degree(v, graph_) == 0; }

    // number of distinct values observed at each depth of the tree
    std::vector<std::size_t> categories_per_variable() const;

    const std::vector<path_t>& sampling_zeros() const { return sampling_zeros_; }

    const graph_t& graph() const { return graph_; }

protected:
    graph_t graph_;

    std::vector<path_t> paths_;
    std::map<path_t, vertex_t> path_to_vertex_;
    std::unordered_map<std::string, vertex_t> names_;

    std::vector<path_t> sampling_zeros_;
};

} // namespace cegk

#endif // CEGK_EVENT_TREE_HPP
