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

#ifndef CEGK_CHAIN_EVENT_GRAPH_HPP
#define CEGK_CHAIN_EVENT_GRAPH_HPP

#include <cegk/graph.hpp>
#include <cegk/error.hpp>

#include <map>
#include <set>
#include <optional>
#include <ostream>
#include <string>
#include <tuple>
#include <unordered_map>
#include <vector>

namespace cegk {

class StagedTree;

class ChainEventGraph {
public:
    using graph_t = ceg_graph::Graph;
    using vertex_t = ceg_graph::vertex_t;
    using edge_t = ceg_graph::edge_t;

    // (source, target, label) uniquely identifies a transition
    struct edge_key_t {
        std::string source;
        std::string target;
        std::string label;

        bool operator==(const edge_key_t &other) const {
            return std::tie(source, target, label) == std::tie(other.source, other.target, other.label);
        }
        bool operator!=(const edge_key_t &other) const {
            return !(*this == other);
        }
        bool operator<(const edge_key_t &other) const {
            return std::tie(source, target, label) < std::tie(other.source, other.target, other.label);
        }
    };

    using stages_t = std::map<stage_t, std::vector<std::string>>;
    using path_t = std::vector<edge_key_t>;

    enum struct State {
        Uninitialized, DistancesComputed, Merging, Trimmed, Stable
    };

    struct Options {
        std::string node_prefix{"w"};
        std::string sink_suffix{"&infin;"};
    };

    ChainEventGraph() = default;

    explicit ChainEventGraph(Options options) : options_{std::move(options)} { }

    // Copy a staged tree, sending every transition into a leaf to the sink.
    explicit ChainEventGraph(const StagedTree &tree, bool generate = false);
    ChainEventGraph(const StagedTree &tree, bool generate, Options options);

    vertex_t AddNode(const std::string &name, NodeKind kind = NodeKind::Situation,
        stage_t stage = std::nullopt);

    // Removes the node and every transition that touches it
    void RemoveNode(const std::string &name);

    bool HasNode(const std::string &name) const {
        return names_.find(name) != names_.end();
    }

    vertex_t LookupNode(const std::string &name) const;

    void AddEdge(const std::string &source, const std::string &target,
        const std::string &label, EdgeData data = {});

    // Add a transition, or fold `data` into an existing one with the same
    // (source, target, label). The existing transition is the first operand
    // of merge_edge_data, so its probability is the one that survives.
    void MergeEdge(const std::string &source, const std::string &target,
        const std::string &label, const EdgeData &data);

    EdgeData RemoveEdge(const std::string &source, const std::string &target,
        const std::string &label);

    bool HasEdge(const std::string &source, const std::string &target,
        const std::string &label) const;

    const EdgeData& GetEdgeData(const std::string &source, const std::string &target,
        const std::string &label) const;

    std::vector<std::string> Nodes() const;
    std::vector<edge_key_t> Edges() const;
    std::vector<edge_key_t> OutEdges(const std::string &name) const;
    std::vector<edge_key_t> InEdges(const std::string &name) const;

    std::size_t NumberOfNodes() const { return num_vertices(graph_); }
    std::size_t NumberOfEdges() const { return num_edges(graph_); }

    const std::string& GetName(vertex_t v) const {
        return get(boost::vertex_name, graph_, v);
    }

    NodeKind GetKind(const std::string &name) const;

    stage_t GetStage(const std::string &name) const;
    void SetStage(const std::string &name, stage_t stage);

    int GetDistance(const std::string &name) const;
    void SetDistance(const std::string &name, int distance);
    void SetDistance(vertex_t v, int distance) {
        put(boost::vertex_distance, graph_, v, distance);
    }

    // the distinguished nodes; throw MalformedGraph unless exactly one exists
    const std::string& root_node() const;
    const std::string& sink_node() const;

    // Merge and trim the graph into its final shape. Can only be run once.
    void Generate();

    // Rename nodes to <prefix>0 (root), <prefix><sink_suffix> (sink), and
    // <prefix>1, <prefix>2, ... in breadth-first order from the root.
    void RelabelNodes();

    // node names grouped by stage; unstaged nodes are under std::nullopt
    stages_t stages() const;

    // every root-to-sink path
    std::vector<path_t> Paths() const;

    void PrintGraph(std::ostream &os) const;

    State state() const { return state_; }

    const Options& options() const { return options_; }

    const graph_t& graph() const { return graph_; }

protected:
    std::optional<edge_t> FindEdge(vertex_t source, vertex_t target,
        const std::string &label) const;

    const std::string& FindNodeOfKind(NodeKind kind, const char *role) const;

    void ReindexVertices();

    Options options_;

    graph_t graph_;
    std::unordered_map<std::string, vertex_t> names_;

    State state_{State::Uninitialized};
};

std::ostream& operator<<(std::ostream &os, const ChainEventGraph::edge_key_t &key);

// Distance Engine

// Set every node's max_dist_to_sink to the number of edges on its longest path
// to the sink. Throws MalformedGraph unless the graph is a DAG with one sink
// that every node can reach.
void update_distances_to_sink(ChainEventGraph &ceg);

// A single-pass stream of node batches ordered by max_dist_to_sink.
class DistanceGenerations {
public:
    using generation_t = std::vector<std::string>;

    DistanceGenerations(const ChainEventGraph &ceg, int start);

    // The next generation, or std::nullopt once the largest distance has been
    // produced. Generations are moved out as they are produced.
    std::optional<generation_t> Next();

    int next_distance() const { return next_; }

private:
    std::map<int, generation_t> index_;
    int next_;
    int last_;
};

DistanceGenerations nodes_with_increasing_distance(const ChainEventGraph &ceg, int start = 0);

// Merge Eligibility and Merger

using node_pair_t = std::pair<std::string, std::string>;

// True iff u and v share a non-null stage and the same (label, target) transitions.
bool nodes_can_be_merged(const ChainEventGraph &ceg, const std::string &u, const std::string &v);

// Collapse each connected component of `pairs` into the member inserted first.
// Throws IneligibleMergeRequest, before touching the graph, if any pair fails
// nodes_can_be_merged.
void merge_nodes(ChainEventGraph &ceg, const std::set<node_pair_t> &pairs);

// Move the outgoing transitions of old_node_1 and then old_node_2 onto new_node,
// which is created (with old_node_1's stage) if needed. Colliding transitions are
// merged with merge_edge_data. The old nodes themselves are left in place.
// Returns every moved transition as it was before the move.
std::vector<ChainEventGraph::edge_key_t> merge_and_add_edges(ChainEventGraph &ceg,
    const std::string &new_node, const std::string &old_node_1, const std::string &old_node_2);

// Leaf Trimmer

// Repeatedly remove nodes, other than the sink, that have no outgoing transitions.
// Returns the removed nodes in removal order.
std::vector<std::string> trim_leaves_from_graph(ChainEventGraph &ceg);

} // namespace cegk

#endif // CEGK_CHAIN_EVENT_GRAPH_HPP
