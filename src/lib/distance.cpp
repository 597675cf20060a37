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
#include <iterator>

#include <boost/graph/topological_sort.hpp>

#include <cegk/chain_event_graph.hpp>

using cegk::ChainEventGraph;
using cegk::DistanceGenerations;

// Longest path from every node to the sink. Nodes are visited in reverse
// topological order so each successor is final before its predecessors.
void cegk::update_distances_to_sink(ChainEventGraph &ceg) {
    const auto &g = ceg.graph();
    const auto sink = ceg.LookupNode(ceg.sink_node());
    if(out_degree(sink, g) != 0) {
        throw MalformedGraph("The sink node '" + ceg.GetName(sink)
            + "' has outgoing transitions.");
    }

    std::vector<ChainEventGraph::vertex_t> order;
    order.reserve(num_vertices(g));
    try {
        boost::topological_sort(g, std::back_inserter(order));
    } catch(const boost::not_a_dag &) {
        throw MalformedGraph("Chain event graph contains a cycle.");
    }

    auto index = get(boost::vertex_index, g);
    std::vector<int> distances(num_vertices(g), UNKNOWN_DISTANCE);
    for(auto &&v : order) {
        if(v == sink) {
            distances[index[v]] = 0;
            continue;
        }
        if(out_degree(v, g) == 0) {
            throw MalformedGraph("Node '" + ceg.GetName(v)
                + "' has no outgoing transitions and is not the sink.");
        }
        int d = 0;
        for(auto &&e : make_out_edge_range(v, g)) {
            d = std::max(d, distances[index[target(e, g)]]);
        }
        distances[index[v]] = d + 1;
    }

    for(auto &&v : order) {
        ceg.SetDistance(v, distances[index[v]]);
    }
}

DistanceGenerations::DistanceGenerations(const ChainEventGraph &ceg, int start) :
        next_{start}, last_{start - 1} {
    const auto &g = ceg.graph();
    for(auto &&v : make_vertex_range(g)) {
        int d = get(boost::vertex_distance, g, v);
        if(d == UNKNOWN_DISTANCE) {
            continue;
        }
        index_[d].push_back(ceg.GetName(v));
        last_ = std::max(last_, d);
    }
}

std::optional<DistanceGenerations::generation_t> DistanceGenerations::Next() {
    if(next_ > last_) {
        return std::nullopt;
    }
    auto it = index_.find(next_++);
    if(it == index_.end()) {
        return generation_t{};
    }
    generation_t ret = std::move(it->second);
    index_.erase(it);
    return ret;
}

DistanceGenerations cegk::nodes_with_increasing_distance(const ChainEventGraph &ceg, int start) {
    return DistanceGenerations{ceg, start};
}

// LCOV_EXCL_START
namespace {
cegk::ChainEventGraph make_distance_graph() {
    using cegk_testing::SINK;
    return cegk_testing::make_graph({"w0", "w1", "w2", "w3", "w4", "w5", SINK}, {
        {"w0", "w1", "a"}, {"w0", "w2", "b"},
        {"w1", "w3", "e"}, {"w1", "w4", "e"},
        {"w2", SINK, "c"}, {"w3", SINK, "d"},
        {"w4", "w5", "c"}, {"w5", SINK, "d"}
    });
}
} // namespace

TEST_CASE("[libcegk] update_distances_to_sink") {
    using cegk_testing::SINK;

    auto ceg = make_distance_graph();
    std::vector<std::pair<std::string, int>> expected = {
        {"w0", 4}, {"w1", 3}, {"w2", 1}, {"w3", 1}, {"w4", 2}, {"w5", 1}, {SINK, 0}
    };

    cegk::update_distances_to_sink(ceg);
    for(auto &&kv : expected) {
        CAPTURE(kv.first);
        CHECK(ceg.GetDistance(kv.first) == kv.second);
    }

    SUBCASE("shortcuts to the sink do not shorten the longest path") {
        ceg.AddEdge("w1", SINK, "f");
        ceg.AddEdge("w4", SINK, "f");
        cegk::update_distances_to_sink(ceg);
        for(auto &&kv : expected) {
            CAPTURE(kv.first);
            CHECK(ceg.GetDistance(kv.first) == kv.second);
        }
    }
}

TEST_CASE("[libcegk] update_distances_to_sink rejects malformed graphs") {
    using cegk::MalformedGraph;
    using cegk::NodeKind;
    using cegk_testing::make_graph;
    using cegk_testing::SINK;

    SUBCASE("cycle") {
        auto ceg = make_graph({"w0", "w1", "w2", SINK}, {
            {"w0", "w1", "a"}, {"w1", "w2", "b"}, {"w2", "w1", "c"}, {"w2", SINK, "d"}
        });
        CHECK_THROWS_AS(cegk::update_distances_to_sink(ceg), MalformedGraph);
    }
    SUBCASE("no sink") {
        auto ceg = make_graph({"w0", "w1"}, {{"w0", "w1", "a"}});
        CHECK_THROWS_AS(cegk::update_distances_to_sink(ceg), MalformedGraph);
    }
    SUBCASE("two sinks") {
        cegk::ChainEventGraph ceg;
        ceg.AddNode("w0", NodeKind::Root);
        ceg.AddNode("x", NodeKind::Sink);
        ceg.AddNode("y", NodeKind::Sink);
        ceg.AddEdge("w0", "x", "a");
        ceg.AddEdge("w0", "y", "b");
        CHECK_THROWS_AS(cegk::update_distances_to_sink(ceg), MalformedGraph);
    }
    SUBCASE("dangling leaf") {
        auto ceg = make_graph({"w0", "w1", SINK}, {{"w0", "w1", "a"}, {"w0", SINK, "b"}});
        CHECK_THROWS_AS(cegk::update_distances_to_sink(ceg), MalformedGraph);
        CHECK(ceg.GetDistance("w0") == cegk::UNKNOWN_DISTANCE);
    }
    SUBCASE("sink with outgoing transitions") {
        auto ceg = make_graph({"w0", "w1", SINK}, {{"w0", SINK, "a"}, {SINK, "w1", "b"}});
        CHECK_THROWS_AS(cegk::update_distances_to_sink(ceg), MalformedGraph);
    }
}

TEST_CASE("[libcegk] nodes_with_increasing_distance") {
    using generation_t = cegk::DistanceGenerations::generation_t;
    using cegk_testing::SINK;

    auto ceg = make_distance_graph();
    cegk::update_distances_to_sink(ceg);

    std::vector<generation_t> expected = {
        {SINK}, {"w2", "w3", "w5"}, {"w4"}, {"w1"}, {"w0"}
    };

    auto generations = cegk::nodes_with_increasing_distance(ceg);
    for(auto &&gen : expected) {
        auto next = generations.Next();
        REQUIRE(next.has_value());
        CHECK_EQ_RANGES(*next, gen);
    }
    CHECK_FALSE(generations.Next().has_value());
    CHECK_FALSE(generations.Next().has_value());

    SUBCASE("starting past the sink") {
        auto from_two = cegk::nodes_with_increasing_distance(ceg, 2);
        CHECK(from_two.next_distance() == 2);
        auto next = from_two.Next();
        REQUIRE(next.has_value());
        CHECK_EQ_RANGES(*next, expected[2]);
    }
    SUBCASE("gaps produce empty generations") {
        ceg.SetDistance("w4", 6);
        auto gapped = cegk::nodes_with_increasing_distance(ceg, 4);
        auto next = gapped.Next();
        REQUIRE(next.has_value());
        CHECK(next->size() == 1);
        next = gapped.Next();
        REQUIRE(next.has_value());
        CHECK(next->empty());
        next = gapped.Next();
        REQUIRE(next.has_value());
        CHECK(next->at(0) == "w4");
        CHECK_FALSE(gapped.Next().has_value());
    }
    SUBCASE("unknown distances are skipped") {
        cegk::ChainEventGraph empty;
        empty.AddNode("w0", cegk::NodeKind::Root);
        CHECK_FALSE(cegk::nodes_with_increasing_distance(empty).Next().has_value());
    }
}
// LCOV_EXCL_STOP
