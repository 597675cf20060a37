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

#include <cegk/chain_event_graph.hpp>

using cegk::ChainEventGraph;

// Removing a leaf can expose a new one, so sweep until nothing changes.
std::vector<std::string> cegk::trim_leaves_from_graph(ChainEventGraph &ceg) {
    // a graph without a single sink would be trimmed away completely
    ceg.sink_node();

    const auto &g = ceg.graph();
    std::vector<std::string> removed;
    std::vector<std::string> leaves;
    do {
        leaves.clear();
        for(auto &&v : make_vertex_range(g)) {
            if(out_degree(v, g) == 0 && get(boost::vertex_kind, g, v) != NodeKind::Sink) {
                leaves.push_back(ceg.GetName(v));
            }
        }
        for(auto &&name : leaves) {
            ceg.RemoveNode(name);
            removed.push_back(name);
        }
    } while(!leaves.empty());

    return removed;
}

// LCOV_EXCL_START
TEST_CASE("[libcegk] trim_leaves_from_graph") {
    using cegk_testing::make_graph;
    using cegk_testing::SINK;

    SUBCASE("chains of leaves are removed") {
        auto ceg = make_graph({"w0", "w1", "w2", "w3", "w4", SINK}, {
            {"w0", "w1", "a"}, {"w0", "w3", "b"},
            {"w1", "w2", "c"}, {"w3", SINK, "d"}, {"w4", SINK, "e"}
        });
        auto removed = cegk::trim_leaves_from_graph(ceg);

        std::vector<std::string> expected_removed = {"w2", "w1"};
        CHECK_EQ_RANGES(removed, expected_removed);
        std::vector<std::string> expected_nodes = {"w0", "w3", "w4", SINK};
        CHECK_EQ_RANGES(ceg.Nodes(), expected_nodes);
        CHECK(ceg.NumberOfEdges() == 3);

        for(auto &&name : ceg.Nodes()) {
            if(name != SINK) {
                CHECK_FALSE(ceg.OutEdges(name).empty());
            }
        }
    }
    SUBCASE("the sink is kept") {
        auto ceg = make_graph({"w0", SINK}, {{"w0", SINK, "a"}});
        CHECK(cegk::trim_leaves_from_graph(ceg).empty());
        CHECK(ceg.NumberOfNodes() == 2);
    }
    SUBCASE("a sink is required") {
        auto ceg = make_graph({"w0", "w1"}, {{"w0", "w1", "a"}});
        CHECK_THROWS_AS(cegk::trim_leaves_from_graph(ceg), cegk::MalformedGraph);
        CHECK(ceg.NumberOfNodes() == 2);
    }
}
// LCOV_EXCL_STOP
