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
#include <set>

#include <boost/algorithm/string/join.hpp>

#include <cegk/event_tree.hpp>
#include <cegk/error.hpp>

using cegk::EventTree;

namespace {
std::string path_string(const EventTree::path_t &path) {
    return path.empty() ? std::string{"."} : boost::algorithm::join(path, "/");
}
} // namespace

EventTree::path_counts_t EventTree::CountPaths(const std::vector<std::vector<std::string>> &rows) {
    path_counts_t ret;
    path_t path;
    for(auto &&row : rows) {
        path.clear();
        for(auto &&value : row) {
            if(value.empty()) {
                break;
            }
            path.push_back(value);
            ret[path] += 1;
        }
    }
    return ret;
}

EventTree::EventTree(const path_counts_t &path_counts,
        const std::vector<path_t> &sampling_zero_paths) {
    path_counts_t counts = path_counts;
    for(auto &&path : sampling_zero_paths) {
        if(path.empty()) {
            throw std::invalid_argument("Unable to build event tree; a sampling zero path is empty.");
        }
        // every prefix of a sampling zero must exist as well
        for(auto it = std::next(path.begin()); it <= path.end(); ++it) {
            counts.emplace(path_t(path.begin(), it), 0);
        }
        sampling_zeros_.push_back(path);
    }

    // order paths by length; std::map already sorted them lexicographically
    std::vector<const path_counts_t::value_type*> ordered;
    ordered.reserve(counts.size());
    for(auto &&kv : counts) {
        if(kv.first.empty()) {
            continue;
        }
        if(kv.second < 0) {
            throw std::invalid_argument("Unable to build event tree; path '"
                + path_string(kv.first) + "' has a negative count.");
        }
        ordered.push_back(&kv);
    }
    std::stable_sort(ordered.begin(), ordered.end(), [](auto a, auto b) {
        return a->first.size() < b->first.size();
    });

    auto add_node = [this](const path_t &path) {
        auto v = add_vertex(graph_);
        std::string name = "s" + std::to_string(v);
        put(boost::vertex_name, graph_, v, name);
        paths_.push_back(path);
        path_to_vertex_.emplace(path, v);
        names_.emplace(std::move(name), v);
        return v;
    };

    add_node(path_t{});
    for(auto &&kv : ordered) {
        const auto &path = kv->first;
        auto parent = path_to_vertex_.find(path_t(path.begin(), std::prev(path.end())));
        if(parent == path_to_vertex_.end()) {
            throw std::invalid_argument("Unable to build event tree; the parent of path '"
                + path_string(path) + "' is missing.");
        }
        auto v = add_node(path);
        EdgeData data{{Attribute::Count, static_cast<double>(kv->second)}};
        add_edge(parent->second, v,
            tree_graph::EdgeProp{path.back(), ceg_graph::EdgeAttributesProp{data}}, graph_);
    }
}

std::vector<std::string> EventTree::situations() const {
    std::vector<std::string> ret;
    for(auto &&v : make_vertex_range(graph_)) {
        if(!IsLeaf(v)) {
            ret.push_back(NodeName(v));
        }
    }
    return ret;
}

std::vector<std::string> EventTree::leaves() const {
    std::vector<std::string> ret;
    for(auto &&v : make_vertex_range(graph_)) {
        if(IsLeaf(v)) {
            ret.push_back(NodeName(v));
        }
    }
    return ret;
}

EventTree::vertex_t EventTree::LookupNode(const std::string &name) const {
    auto it = names_.find(name);
    if(it == names_.end()) {
        throw UnknownNode(name);
    }
    return it->second;
}

const std::string& EventTree::LookupPath(const path_t &path) const {
    auto it = path_to_vertex_.find(path);
    if(it == path_to_vertex_.end()) {
        throw UnknownNode(path_string(path), "Unknown path '" + path_string(path) + "'.");
    }
    return NodeName(it->second);
}

std::vector<std::size_t> EventTree::categories_per_variable() const {
    std::vector<std::set<std::string>> values;
    for(auto &&path : paths_) {
        if(path.size() > values.size()) {
            values.resize(path.size());
        }
        for(std::size_t i = 0; i < path.size(); ++i) {
            values[i].insert(path[i]);
        }
    }
    std::vector<std::size_t> ret;
    for(auto &&s : values) {
        ret.push_back(s.size());
    }
    return ret;
}

// LCOV_EXCL_START
TEST_CASE("[libcegk] EventTree::CountPaths") {
    std::vector<std::vector<std::string>> rows = {
        {"a", "x"}, {"a", "y"}, {"a", "x"}, {"b", ""}, {"b", "x"}
    };
    auto counts = EventTree::CountPaths(rows);

    EventTree::path_counts_t expected = {
        {{"a"}, 3}, {{"a", "x"}, 2}, {{"a", "y"}, 1}, {{"b"}, 2}, {{"b", "x"}, 1}
    };
    CHECK(counts == expected);
}

TEST_CASE("[libcegk] EventTree numbers nodes by path length") {
    using cegk::Attribute;

    EventTree::path_counts_t counts = {
        {{"b"}, 2}, {{"a"}, 3}, {{"a", "y"}, 1}, {{"a", "x"}, 2}, {{"b", "x"}, 2}
    };
    EventTree tree{counts};

    CHECK(tree.NumberOfNodes() == 6);
    CHECK(tree.NumberOfEdges() == 5);
    CHECK(tree.root() == "s0");
    CHECK(tree.LookupPath({"a"}) == "s1");
    CHECK(tree.LookupPath({"b"}) == "s2");
    CHECK(tree.LookupPath({"a", "x"}) == "s3");
    CHECK(tree.LookupPath({"a", "y"}) == "s4");
    CHECK(tree.LookupPath({"b", "x"}) == "s5");
    CHECK(tree.Path("s4") == EventTree::path_t{"a", "y"});
    CHECK(tree.Path("s0").empty());

    std::vector<std::string> situations = {"s0", "s1", "s2"};
    CHECK_EQ_RANGES(tree.situations(), situations);
    std::vector<std::string> leaves = {"s3", "s4", "s5"};
    CHECK_EQ_RANGES(tree.leaves(), leaves);

    std::vector<std::size_t> categories = {2, 2};
    CHECK_EQ_RANGES(tree.categories_per_variable(), categories);

    const auto &g = tree.graph();
    auto e = edge(1, 4, g);
    REQUIRE(e.second);
    CHECK(get(boost::edge_label, g, e.first) == "y");
    CHECK(get(boost::edge_attributes, g, e.first).get(Attribute::Count) == 1);

    CHECK_THROWS_AS(tree.LookupNode("s6"), cegk::UnknownNode);
    CHECK_THROWS_AS(tree.LookupPath({"c"}), cegk::UnknownNode);
}

TEST_CASE("[libcegk] EventTree adds sampling zeros") {
    using cegk::Attribute;

    EventTree::path_counts_t counts = {{{"a"}, 3}, {{"a", "x"}, 3}};
    EventTree tree{counts, {{"a", "y"}, {"b", "x"}}};

    CHECK(tree.NumberOfNodes() == 6);
    CHECK(tree.sampling_zeros().size() == 2);
    const auto &g = tree.graph();
    auto v = tree.LookupNode(tree.LookupPath({"b", "x"}));
    REQUIRE(in_degree(v, g) == 1);
    auto e = *in_edges(v, g).first;
    CHECK(get(boost::edge_attributes, g, e).get(Attribute::Count) == 0);

    CHECK_THROWS_AS(EventTree(counts, {{}}), std::invalid_argument);
}

TEST_CASE("[libcegk] EventTree rejects malformed paths") {
    EventTree::path_counts_t missing_parent = {{{"a"}, 3}, {{"b", "x"}, 3}};
    CHECK_THROWS_AS(EventTree{missing_parent}, std::invalid_argument);

    EventTree::path_counts_t negative = {{{"a"}, -1}};
    CHECK_THROWS_AS(EventTree{negative}, std::invalid_argument);

    EventTree empty;
    CHECK(empty.NumberOfNodes() == 1);
    CHECK(empty.categories_per_variable().empty());
}

TEST_CASE("[libcegk] EventTree from the medical rows") {
    EventTree tree{EventTree::CountPaths(cegk_testing::medical_rows())};

    CHECK(tree.NumberOfNodes() == 45);
    CHECK(tree.NumberOfEdges() == 44);
    CHECK(tree.situations().size() == 21);
    CHECK(tree.leaves().size() == 24);
    std::vector<std::size_t> categories = {2, 3, 2, 2};
    CHECK_EQ_RANGES(tree.categories_per_variable(), categories);
    CHECK(tree.LookupPath({"Non-blast"}) == "s2");
    CHECK(tree.Path("s9") == EventTree::path_t{"Blast", "Experienced", "Easy"});
    CHECK(tree.Path("s21") == EventTree::path_t{"Blast", "Experienced", "Easy", "Blast"});
}
// LCOV_EXCL_STOP
