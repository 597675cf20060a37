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
#include "unit_testing.hpp"
#include "ceg_testing.hpp"

#include <algorithm>
#include <map>

#include <boost/graph/connected_components.hpp>

#include <cegk/chain_event_graph.hpp>

using cegk::ChainEventGraph;

namespace {
using successor_t = std::pair<std::string, std::string>;

// (label, target) of every outgoing transition, sorted
std::vector<successor_t> sorted_successors(const ChainEventGraph &ceg,
        ChainEventGraph::vertex_t v) {
    const auto &g = ceg.graph();
    std::vector<successor_t> ret;
    for(auto &&e : cegk::make_out_edge_range(v, g)) {
        ret.emplace_back(get(boost::edge_label, g, e), ceg.GetName(target(e, g)));
    }
    std::sort(ret.begin(), ret.end());
    return ret;
}
} // namespace

bool cegk::nodes_can_be_merged(const ChainEventGraph &ceg, const std::string &u,
        const std::string &v) {
    auto a = ceg.LookupNode(u);
    auto b = ceg.LookupNode(v);

    // unstaged nodes are never merge candidates
    auto stage_a = ceg.GetStage(u);
    auto stage_b = ceg.GetStage(v);
    if(!stage_a || !stage_b || *stage_a != *stage_b) {
        return false;
    }
    return sorted_successors(ceg, a) == sorted_successors(ceg, b);
}

std::vector<ChainEventGraph::edge_key_t> cegk::merge_and_add_edges(ChainEventGraph &ceg,
        const std::string &new_node, const std::string &old_node_1, const std::string &old_node_2) {
    ceg.LookupNode(old_node_1);
    ceg.LookupNode(old_node_2);

    if(!ceg.HasNode(new_node)) {
        ceg.AddNode(new_node, NodeKind::Situation, ceg.GetStage(old_node_1));
    }

    std::vector<ChainEventGraph::edge_key_t> ret;
    for(const std::string *old : {&old_node_1, &old_node_2}) {
        for(auto &&e : ceg.OutEdges(*old)) {
            if(*old == new_node) {
                continue;
            }
            auto data = ceg.RemoveEdge(e.source, e.target, e.label);
            ceg.MergeEdge(new_node, e.target, e.label, data);
            ret.push_back(e);
        }
    }
    return ret;
}

void cegk::merge_nodes(ChainEventGraph &ceg, const std::set<node_pair_t> &pairs) {
    // validate everything before touching the graph
    std::map<std::string, std::size_t> local_ids;
    for(auto &&[u, v] : pairs) {
        if(!nodes_can_be_merged(ceg, u, v)) {
            throw IneligibleMergeRequest("Unable to merge nodes '" + u + "' and '" + v
                + "'; they do not share a stage and identical outgoing transitions.");
        }
        local_ids.emplace(u, local_ids.size());
        local_ids.emplace(v, local_ids.size());
    }
    if(local_ids.empty()) {
        return;
    }

    using pair_graph_t = boost::adjacency_list<boost::vecS, boost::vecS, boost::undirectedS>;
    pair_graph_t pair_graph(local_ids.size());
    for(auto &&[u, v] : pairs) {
        add_edge(local_ids[u], local_ids[v], pair_graph);
    }
    std::vector<int> component(local_ids.size());
    int num_groups = boost::connected_components(pair_graph, &component[0]);

    std::vector<std::vector<std::string>> groups(num_groups);
    for(auto &&[name, id] : local_ids) {
        groups[component[id]].push_back(name);
    }

    // the member inserted first represents the group
    auto index = get(boost::vertex_index, ceg.graph());
    for(auto &&group : groups) {
        std::sort(group.begin(), group.end(), [&](const std::string &a, const std::string &b) {
            return index[ceg.LookupNode(a)] < index[ceg.LookupNode(b)];
        });
        const std::string &rep = group.front();
        for(auto it = std::next(group.begin()); it != group.end(); ++it) {
            for(auto &&e : ceg.InEdges(*it)) {
                auto data = ceg.RemoveEdge(e.source, e.target, e.label);
                ceg.MergeEdge(e.source, rep, e.label, data);
            }
            merge_and_add_edges(ceg, rep, rep, *it);
            ceg.RemoveNode(*it);
        }
    }
}

// LCOV_EXCL_START
namespace {
cegk::ChainEventGraph make_diamond_graph() {
    using cegk_testing::SINK;
    return cegk_testing::make_graph({"w0", "w1", "w2", "w3", "w4", SINK}, {
        {"w0", "w1", "a"}, {"w0", "w2", "b"},
        {"w1", "w3", "c"}, {"w1", "w4", "d"},
        {"w2", "w3", "c"}, {"w2", "w4", "d"},
        {"w3", SINK, "e"}, {"w4", SINK, "f"}
    });
}
} // namespace

TEST_CASE("[libcegk] nodes_can_be_merged") {
    using cegk::stage_id_t;
    using cegk::nodes_can_be_merged;
    using cegk_testing::SINK;

    auto ceg = make_diamond_graph();
    ceg.SetStage("w1", stage_id_t{2});
    ceg.SetStage("w2", stage_id_t{2});

    SUBCASE("same stage and successors") {
        CHECK(nodes_can_be_merged(ceg, "w1", "w2"));
        CHECK(nodes_can_be_merged(ceg, "w2", "w1"));
    }
    SUBCASE("different stage") {
        ceg.SetStage("w2", stage_id_t{3});
        CHECK_FALSE(nodes_can_be_merged(ceg, "w1", "w2"));
    }
    SUBCASE("unstaged") {
        ceg.SetStage("w1", std::nullopt);
        ceg.SetStage("w2", std::nullopt);
        CHECK_FALSE(nodes_can_be_merged(ceg, "w1", "w2"));
    }
    SUBCASE("different target") {
        ceg.RemoveEdge("w2", "w3", "c");
        ceg.AddEdge("w2", SINK, "c");
        CHECK_FALSE(nodes_can_be_merged(ceg, "w1", "w2"));
    }
    SUBCASE("different label") {
        ceg.RemoveEdge("w2", "w3", "c");
        ceg.AddEdge("w2", "w3", "g");
        CHECK_FALSE(nodes_can_be_merged(ceg, "w1", "w2"));
    }
    SUBCASE("extra transition") {
        ceg.AddEdge("w2", SINK, "h");
        CHECK_FALSE(nodes_can_be_merged(ceg, "w1", "w2"));
    }
    SUBCASE("unknown node") {
        CHECK_THROWS_AS(nodes_can_be_merged(ceg, "w1", "w9"), cegk::UnknownNode);
    }
}

TEST_CASE("[libcegk] merge_nodes") {
    using edge_key_t = cegk::ChainEventGraph::edge_key_t;
    using cegk::Attribute;
    using cegk::EdgeData;
    using cegk::stage_id_t;
    using cegk_testing::SINK;

    auto ceg = make_diamond_graph();
    ceg.SetStage("w1", stage_id_t{2});
    ceg.SetStage("w2", stage_id_t{2});

    SUBCASE("two nodes") {
        ceg.MergeEdge("w1", "w3", "c", EdgeData{{Attribute::Count, 2}, {Attribute::Probability, 0.4}});
        ceg.MergeEdge("w2", "w3", "c", EdgeData{{Attribute::Count, 5}, {Attribute::Probability, 0.7}});

        cegk::merge_nodes(ceg, {{"w1", "w2"}});

        CHECK_FALSE(ceg.HasNode("w2"));
        CHECK(ceg.NumberOfNodes() == 5);
        std::vector<edge_key_t> expected = {
            {"w0", "w1", "a"}, {"w0", "w1", "b"},
            {"w1", "w3", "c"}, {"w1", "w4", "d"},
            {"w3", SINK, "e"}, {"w4", SINK, "f"}
        };
        CHECK_EQ_RANGES(ceg.Edges(), expected);
        CHECK(ceg.GetEdgeData("w1", "w3", "c").get(Attribute::Count) == 7);
        CHECK(ceg.GetEdgeData("w1", "w3", "c").get(Attribute::Probability) == 0.4);
    }
    SUBCASE("three nodes in one component") {
        ceg.AddNode("w5");
        ceg.AddEdge("w0", "w5", "c");
        ceg.AddEdge("w5", "w3", "c");
        ceg.AddEdge("w5", "w4", "d");
        ceg.SetStage("w5", stage_id_t{2});

        cegk::merge_nodes(ceg, {{"w1", "w2"}, {"w2", "w5"}, {"w1", "w5"}});

        CHECK_FALSE(ceg.HasNode("w2"));
        CHECK_FALSE(ceg.HasNode("w5"));
        // three (source, label) pairs in, two (target, label) pairs out, two to the sink
        CHECK(ceg.NumberOfEdges() == 7);
        CHECK(ceg.HasEdge("w0", "w1", "a"));
        CHECK(ceg.HasEdge("w0", "w1", "b"));
        CHECK(ceg.HasEdge("w0", "w1", "c"));
        CHECK(ceg.HasEdge("w1", "w3", "c"));
        CHECK(ceg.HasEdge("w1", "w4", "d"));
    }
    SUBCASE("ineligible pair leaves the graph unchanged") {
        ceg.SetStage("w3", stage_id_t{2});
        auto before = ceg.Edges();
        CHECK_THROWS_AS(cegk::merge_nodes(ceg, {{"w1", "w2"}, {"w1", "w3"}}),
            cegk::IneligibleMergeRequest);
        CHECK(ceg.NumberOfNodes() == 6);
        CHECK_EQ_RANGES(ceg.Edges(), before);
    }
    SUBCASE("unknown node") {
        CHECK_THROWS_AS(cegk::merge_nodes(ceg, {{"w1", "w9"}}), cegk::UnknownNode);
        CHECK(ceg.NumberOfNodes() == 6);
    }
    SUBCASE("no pairs") {
        cegk::merge_nodes(ceg, {});
        CHECK(ceg.NumberOfNodes() == 6);
    }
}

TEST_CASE("[libcegk] merge_and_add_edges") {
    using edge_key_t = cegk::ChainEventGraph::edge_key_t;
    using cegk::Attribute;
    using cegk::EdgeData;
    using cegk_testing::make_graph;
    using cegk_testing::SINK;

    auto ceg = make_graph({"s0", "s1", "s2", "s3", "s4", SINK}, {
        {"s0", "s1", "a"}, {"s0", "s2", "b"},
        {"s3", SINK, "e"}, {"s4", SINK, "f"}
    }, "s0");
    ceg.AddEdge("s1", "s3", "event_1", EdgeData{{Attribute::Count, 5}, {Attribute::Prior, 0.2},
        {Attribute::Posterior, 1}, {Attribute::Probability, 0.8}});
    ceg.AddEdge("s1", "s4", "event_2", EdgeData{{Attribute::Count, 10}, {Attribute::Prior, 0.3},
        {Attribute::Posterior, 5}, {Attribute::Probability, 0.2}});
    ceg.AddEdge("s2", "s3", "event_1", EdgeData{{Attribute::Count, 11}, {Attribute::Prior, 0.5},
        {Attribute::Posterior, 2}, {Attribute::Probability, 0.8}});
    ceg.AddEdge("s2", "s4", "event_2", EdgeData{{Attribute::Count, 6}, {Attribute::Prior, 0.9},
        {Attribute::Posterior, 3}, {Attribute::Probability, 0.2}});

    auto actual = cegk::merge_and_add_edges(ceg, "s99", "s1", "s2");

    // the moved transitions, as they were before the move
    std::vector<edge_key_t> expected = {
        {"s1", "s3", "event_1"}, {"s1", "s4", "event_2"},
        {"s2", "s3", "event_1"}, {"s2", "s4", "event_2"}
    };
    CHECK(actual.size() == 4);
    CHECK_EQ_RANGES(actual, expected);
    CHECK(ceg.OutEdges("s99").size() == 2);
    CHECK(ceg.HasNode("s99"));
    CHECK(ceg.OutEdges("s1").empty());
    CHECK(ceg.OutEdges("s2").empty());

    const auto &data = ceg.GetEdgeData("s99", "s3", "event_1");
    CHECK(data.get(Attribute::Count) == 16);
    CHECK(data.get(Attribute::Prior) == doctest::Approx(0.7));
    CHECK(data.get(Attribute::Posterior) == 3);
    CHECK(data.get(Attribute::Probability) == 0.8);
    CHECK(ceg.GetEdgeData("s99", "s4", "event_2").get(Attribute::Count) == 16);

    CHECK_THROWS_AS(cegk::merge_and_add_edges(ceg, "s98", "s1", "s9"), cegk::UnknownNode);
    CHECK_FALSE(ceg.HasNode("s98"));

    SUBCASE("transitions already on the new node are not reported") {
        ceg.AddEdge("s0", SINK, "g");
        auto moved = cegk::merge_and_add_edges(ceg, "s0", "s0", "s99");
        std::vector<edge_key_t> expected_moved = {
            {"s99", "s3", "event_1"}, {"s99", "s4", "event_2"}
        };
        CHECK_EQ_RANGES(moved, expected_moved);
        CHECK(ceg.HasEdge("s0", "s3", "event_1"));
        CHECK(ceg.HasEdge("s0", SINK, "g"));
    }
}
// LCOV_EXCL_STOP
