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
#include <cctype>
#include <regex>

#include <cegk/chain_event_graph.hpp>

using cegk::ChainEventGraph;

namespace {
// Relabelling numbers nodes 0 through n-1 at most. A sink suffix that reads as
// one of those numbers would collide with a numbered node.
void check_sink_suffix(const ChainEventGraph &ceg) {
    const auto &suffix = ceg.options().sink_suffix;
    if(suffix.empty() || suffix.size() > 18
        || (suffix.size() > 1 && suffix[0] == '0')
        || !std::all_of(suffix.begin(), suffix.end(),
            [](unsigned char c) { return std::isdigit(c); })) {
        return;
    }
    if(std::stoull(suffix) < ceg.NumberOfNodes()) {
        throw std::invalid_argument("Unable to relabel nodes; the sink name '"
            + ceg.options().node_prefix + suffix + "' collides with a numbered node.");
    }
}
} // namespace

void ChainEventGraph::Generate() {
    if(state_ != State::Uninitialized) {
        throw std::logic_error("Chain event graph has already been generated.");
    }
    // relabelling needs these; check them before the graph changes
    root_node();
    sink_node();
    check_sink_suffix(*this);

    // Merging nodes with identical successors never changes the longest
    // path of any remaining node, so distances are computed once.
    update_distances_to_sink(*this);
    state_ = State::DistancesComputed;

    // nothing to merge at the sink
    auto generations = nodes_with_increasing_distance(*this, 1);
    state_ = State::Merging;
    while(auto generation = generations.Next()) {
        const auto &nodes = *generation;
        std::set<node_pair_t> pairs;
        for(std::size_t i = 0; i < nodes.size(); ++i) {
            for(std::size_t j = i + 1; j < nodes.size(); ++j) {
                if(nodes_can_be_merged(*this, nodes[i], nodes[j])) {
                    pairs.emplace(nodes[i], nodes[j]);
                }
            }
        }
        if(!pairs.empty()) {
            merge_nodes(*this, pairs);
        }
    }

    trim_leaves_from_graph(*this);
    state_ = State::Trimmed;

    RelabelNodes();
    state_ = State::Stable;
}

// LCOV_EXCL_START
TEST_CASE("[libcegk] ChainEventGraph::Generate builds the medical graph") {
    using cegk::Attribute;
    using cegk::stage_id_t;
    using cegk_testing::SINK;
    using State = ChainEventGraph::State;

    auto tree = cegk_testing::medical_staged_tree();
    ChainEventGraph ceg{tree};
    ceg.Generate();

    CHECK(ceg.state() == State::Stable);
    CHECK(ceg.NumberOfNodes() == 12);
    CHECK(ceg.NumberOfEdges() == 24);
    CHECK(ceg.root_node() == "w0");
    CHECK(ceg.sink_node() == SINK);

    std::regex pattern{"^w[0-9]+$"};
    for(auto &&name : ceg.Nodes()) {
        CAPTURE(name);
        CHECK((std::regex_match(name, pattern) || name == SINK));
    }

    auto stages = ceg.stages();
    CHECK(stages.size() == 10);
    std::size_t total = 0;
    for(auto &&kv : stages) {
        total += kv.second.size();
    }
    CHECK(total == ceg.NumberOfNodes());
    for(int i : {0, 1, 2, 3, 4, 7, 8}) {
        CAPTURE(i);
        CHECK(stages[stage_id_t{i}].size() == 1);
    }
    CHECK(stages[stage_id_t{5}].size() == 2);
    CHECK(stages[stage_id_t{6}].size() == 2);
    CHECK(stages[std::nullopt] == std::vector<std::string>{SINK});

    CHECK(ceg.Paths().size() == 24);

    // breadth first numbering: Blast w1, Non-blast w2, then their children
    CHECK(ceg.HasEdge("w0", "w1", "Blast"));
    CHECK(ceg.HasEdge("w0", "w2", "Non-blast"));
    CHECK(ceg.HasEdge("w1", "w3", "Experienced"));
    CHECK(ceg.HasEdge("w1", "w3", "Inexperienced"));
    CHECK(ceg.HasEdge("w1", "w4", "Novice"));
    CHECK(ceg.HasEdge("w2", "w5", "Experienced"));
    CHECK(ceg.HasEdge("w2", "w6", "Inexperienced"));
    CHECK(ceg.HasEdge("w2", "w6", "Novice"));
    CHECK(ceg.HasEdge("w3", "w7", "Easy"));
    CHECK(ceg.HasEdge("w4", "w8", "Hard"));
    CHECK(ceg.HasEdge("w5", "w9", "Hard"));
    CHECK(ceg.HasEdge("w6", "w10", "Hard"));

    CHECK(ceg.GetStage("w7") == stage_id_t{0});
    const auto &blast = ceg.GetEdgeData("w7", SINK, "Blast");
    CHECK(blast.get(Attribute::Count) == 27);
    CHECK(blast.get(Attribute::Prior) == doctest::Approx(0.375));
    CHECK(blast.get(Attribute::Posterior) == doctest::Approx(27.375));
    CHECK(blast.get(Attribute::Probability) == doctest::Approx(27.375 / 36.75));

    CHECK(ceg.GetStage("w5") == stage_id_t{5});
    CHECK(ceg.GetStage("w6") == stage_id_t{5});
    CHECK(ceg.GetEdgeData("w5", "w9", "Hard").get(Attribute::Count) == 12);
    CHECK(ceg.GetEdgeData("w6", "w10", "Hard").get(Attribute::Count) == 26);
    CHECK(ceg.GetEdgeData("w6", "w10", "Hard").get(Attribute::Probability) == doctest::Approx(0.5));

    CHECK(ceg.GetEdgeData("w0", "w1", "Blast").get(Attribute::Probability)
        == doctest::Approx(73.5 / 151.0));

    CHECK(ceg.GetDistance("w0") == 4);
    CHECK(ceg.GetDistance(SINK) == 0);

    CHECK_THROWS_AS(ceg.Generate(), std::logic_error);
}

TEST_CASE("[libcegk] ChainEventGraph::Generate") {
    using cegk::stage_id_t;
    using cegk_testing::make_graph;
    using cegk_testing::SINK;
    using State = ChainEventGraph::State;

    SUBCASE("generate on construction") {
        ChainEventGraph ceg{cegk_testing::medical_staged_tree(), true};
        CHECK(ceg.state() == State::Stable);
        CHECK(ceg.NumberOfNodes() == 12);
    }
    SUBCASE("custom node names") {
        ChainEventGraph ceg{cegk_testing::medical_staged_tree(), true, {"n", "_end"}};
        CHECK(ceg.root_node() == "n0");
        CHECK(ceg.sink_node() == "n_end");
    }
    SUBCASE("unstaged nodes are not merged") {
        auto ceg = make_graph({"w0", "w1", "w2", SINK}, {
            {"w0", "w1", "a"}, {"w0", "w2", "b"}, {"w1", SINK, "c"}, {"w2", SINK, "c"}
        });
        ceg.Generate();
        CHECK(ceg.NumberOfNodes() == 4);
        CHECK(ceg.NumberOfEdges() == 4);
    }
    SUBCASE("staged nodes are merged") {
        auto ceg = make_graph({"w0", "w1", "w2", SINK}, {
            {"w0", "w1", "a"}, {"w0", "w2", "b"}, {"w1", SINK, "c"}, {"w2", SINK, "c"}
        });
        ceg.SetStage("w1", stage_id_t{0});
        ceg.SetStage("w2", stage_id_t{0});
        ceg.Generate();
        CHECK(ceg.NumberOfNodes() == 3);
        CHECK(ceg.HasEdge("w0", "w1", "a"));
        CHECK(ceg.HasEdge("w0", "w1", "b"));
        CHECK(ceg.HasEdge("w1", SINK, "c"));
    }
    SUBCASE("malformed graphs fail before any change") {
        auto ceg = make_graph({"w0", "w1", SINK}, {{"w0", "w1", "a"}, {"w0", SINK, "b"}});
        CHECK_THROWS_AS(ceg.Generate(), cegk::MalformedGraph);
        CHECK(ceg.state() == State::Uninitialized);
        CHECK(ceg.NumberOfNodes() == 3);
    }
    SUBCASE("a graph without a root is left unmerged") {
        auto ceg = make_graph({"a", "b", "c", SINK}, {
            {"a", "b", "x"}, {"a", "c", "y"}, {"b", SINK, "z"}, {"c", SINK, "z"}
        }, "none");
        ceg.SetStage("b", stage_id_t{0});
        ceg.SetStage("c", stage_id_t{0});
        CHECK_THROWS_AS(ceg.Generate(), cegk::MalformedGraph);
        CHECK(ceg.state() == State::Uninitialized);
        CHECK(ceg.NumberOfNodes() == 4);
        CHECK(ceg.NumberOfEdges() == 4);
        CHECK(ceg.HasNode("c"));
    }
    SUBCASE("a numbered sink name is rejected before merging") {
        ChainEventGraph ceg{cegk_testing::medical_staged_tree(), false, {"w", "3"}};
        auto nodes = ceg.NumberOfNodes();
        CHECK_THROWS_AS(ceg.Generate(), std::invalid_argument);
        CHECK(ceg.state() == State::Uninitialized);
        CHECK(ceg.NumberOfNodes() == nodes);
    }
}
// LCOV_EXCL_STOP
