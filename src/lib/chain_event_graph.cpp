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
#include <deque>
#include <set>
#include <tuple>

#include <cegk/chain_event_graph.hpp>
#include <cegk/staged_tree.hpp>

using cegk::ChainEventGraph;
using cegk::NodeKind;

ChainEventGraph::ChainEventGraph(const StagedTree &tree, bool generate) :
        ChainEventGraph(tree, generate, Options{}) {
}

ChainEventGraph::ChainEventGraph(const StagedTree &tree, bool generate, Options options) :
        options_{std::move(options)} {
    const auto &g = tree.graph();

    // situations keep their names; every leaf collapses into the sink
    for(auto &&v : make_vertex_range(g)) {
        if(v != 0 && tree.IsLeaf(v)) {
            continue;
        }
        AddNode(tree.NodeName(v), (v == 0) ? NodeKind::Root : NodeKind::Situation,
            get(boost::vertex_stage, g, v));
    }
    std::string sink = options_.node_prefix + options_.sink_suffix;
    AddNode(sink, NodeKind::Sink);

    for(auto &&e : boost::make_iterator_range(edges(g))) {
        auto a = source(e, g);
        auto b = target(e, g);
        const std::string &target_name = tree.IsLeaf(b) ? sink : tree.NodeName(b);
        AddEdge(tree.NodeName(a), target_name, get(boost::edge_label, g, e),
            get(boost::edge_attributes, g, e));
    }

    if(generate) {
        Generate();
    }
}

ChainEventGraph::vertex_t ChainEventGraph::AddNode(const std::string &name,
        NodeKind kind, stage_t stage) {
    if(HasNode(name)) {
        throw std::invalid_argument("Unable to add node '" + name + "'; it already exists.");
    }
    auto v = add_vertex(graph_);
    put(boost::vertex_name, graph_, v, name);
    put(boost::vertex_kind, graph_, v, kind);
    put(boost::vertex_stage, graph_, v, stage);
    put(boost::vertex_distance, graph_, v, UNKNOWN_DISTANCE);
    put(boost::vertex_index, graph_, v, num_vertices(graph_)-1);
    names_.emplace(name, v);
    return v;
}

void ChainEventGraph::RemoveNode(const std::string &name) {
    auto v = LookupNode(name);
    clear_vertex(v, graph_);
    remove_vertex(v, graph_);
    names_.erase(name);
    ReindexVertices();
}

ChainEventGraph::vertex_t ChainEventGraph::LookupNode(const std::string &name) const {
    auto it = names_.find(name);
    if(it == names_.end()) {
        throw UnknownNode(name);
    }
    return it->second;
}

std::optional<ChainEventGraph::edge_t> ChainEventGraph::FindEdge(vertex_t source,
        vertex_t target, const std::string &label) const {
    for(auto &&e : make_out_edge_range(source, graph_)) {
        if(boost::target(e, graph_) == target && get(boost::edge_label, graph_, e) == label) {
            return e;
        }
    }
    return std::nullopt;
}

void ChainEventGraph::AddEdge(const std::string &source, const std::string &target,
        const std::string &label, EdgeData data) {
    auto a = LookupNode(source);
    auto b = LookupNode(target);
    if(FindEdge(a, b, label)) {
        throw std::invalid_argument("Unable to add transition " + source + " -> " + target
            + " labelled '" + label + "'; it already exists.");
    }
    add_edge(a, b, ceg_graph::EdgeProp{label, ceg_graph::EdgeAttributesProp{std::move(data)}}, graph_);
}

void ChainEventGraph::MergeEdge(const std::string &source, const std::string &target,
        const std::string &label, const EdgeData &data) {
    auto a = LookupNode(source);
    auto b = LookupNode(target);
    auto e = FindEdge(a, b, label);
    if(!e) {
        add_edge(a, b, ceg_graph::EdgeProp{label, ceg_graph::EdgeAttributesProp{data}}, graph_);
        return;
    }
    auto &existing = get(boost::edge_attributes, graph_, *e);
    existing = merge_edge_data(existing, data);
}

namespace {
cegk::UnknownNode unknown_edge(const std::string &source, const std::string &target,
        const std::string &label) {
    return cegk::UnknownNode(source, "Unknown transition " + source + " -> " + target
        + " labelled '" + label + "'.");
}
} // namespace

cegk::EdgeData ChainEventGraph::RemoveEdge(const std::string &source, const std::string &target,
        const std::string &label) {
    auto e = FindEdge(LookupNode(source), LookupNode(target), label);
    if(!e) {
        throw unknown_edge(source, target, label);
    }
    EdgeData data = get(boost::edge_attributes, graph_, *e);
    remove_edge(*e, graph_);
    return data;
}

bool ChainEventGraph::HasEdge(const std::string &source, const std::string &target,
        const std::string &label) const {
    auto a = names_.find(source);
    auto b = names_.find(target);
    if(a == names_.end() || b == names_.end()) {
        return false;
    }
    return FindEdge(a->second, b->second, label).has_value();
}

const cegk::EdgeData& ChainEventGraph::GetEdgeData(const std::string &source,
        const std::string &target, const std::string &label) const {
    auto e = FindEdge(LookupNode(source), LookupNode(target), label);
    if(!e) {
        throw unknown_edge(source, target, label);
    }
    return get(boost::edge_attributes, graph_, *e);
}

std::vector<std::string> ChainEventGraph::Nodes() const {
    std::vector<std::string> ret;
    ret.reserve(NumberOfNodes());
    for(auto &&v : make_vertex_range(graph_)) {
        ret.push_back(GetName(v));
    }
    return ret;
}

std::vector<ChainEventGraph::edge_key_t> ChainEventGraph::Edges() const {
    std::vector<edge_key_t> ret;
    ret.reserve(NumberOfEdges());
    for(auto &&v : make_vertex_range(graph_)) {
        for(auto &&e : make_out_edge_range(v, graph_)) {
            ret.push_back({GetName(v), GetName(target(e, graph_)),
                get(boost::edge_label, graph_, e)});
        }
    }
    return ret;
}

std::vector<ChainEventGraph::edge_key_t> ChainEventGraph::OutEdges(const std::string &name) const {
    auto v = LookupNode(name);
    std::vector<edge_key_t> ret;
    for(auto &&e : make_out_edge_range(v, graph_)) {
        ret.push_back({name, GetName(target(e, graph_)), get(boost::edge_label, graph_, e)});
    }
    return ret;
}

std::vector<ChainEventGraph::edge_key_t> ChainEventGraph::InEdges(const std::string &name) const {
    auto v = LookupNode(name);
    std::vector<edge_key_t> ret;
    for(auto &&e : make_in_edge_range(v, graph_)) {
        ret.push_back({GetName(source(e, graph_)), name, get(boost::edge_label, graph_, e)});
    }
    return ret;
}

NodeKind ChainEventGraph::GetKind(const std::string &name) const {
    return get(boost::vertex_kind, graph_, LookupNode(name));
}

cegk::stage_t ChainEventGraph::GetStage(const std::string &name) const {
    return get(boost::vertex_stage, graph_, LookupNode(name));
}

void ChainEventGraph::SetStage(const std::string &name, stage_t stage) {
    put(boost::vertex_stage, graph_, LookupNode(name), stage);
}

int ChainEventGraph::GetDistance(const std::string &name) const {
    return get(boost::vertex_distance, graph_, LookupNode(name));
}

void ChainEventGraph::SetDistance(const std::string &name, int distance) {
    SetDistance(LookupNode(name), distance);
}

const std::string& ChainEventGraph::FindNodeOfKind(NodeKind kind, const char *role) const {
    const std::string *found = nullptr;
    int n = 0;
    for(auto &&v : make_vertex_range(graph_)) {
        if(get(boost::vertex_kind, graph_, v) == kind) {
            found = &GetName(v);
            n += 1;
        }
    }
    if(n != 1) {
        throw MalformedGraph("Chain event graph must have exactly one " + std::string{role}
            + " node; found " + std::to_string(n) + ".");
    }
    return *found;
}

const std::string& ChainEventGraph::root_node() const {
    return FindNodeOfKind(NodeKind::Root, "root");
}

const std::string& ChainEventGraph::sink_node() const {
    return FindNodeOfKind(NodeKind::Sink, "sink");
}

void ChainEventGraph::ReindexVertices() {
    std::size_t i = 0;
    for(auto &&v : make_vertex_range(graph_)) {
        put(boost::vertex_index, graph_, v, i++);
    }
}

void ChainEventGraph::RelabelNodes() {
    auto index = get(boost::vertex_index, graph_);
    const auto root = LookupNode(root_node());
    const auto sink = LookupNode(sink_node());
    const auto &prefix = options_.node_prefix;

    std::vector<std::string> new_names(NumberOfNodes());
    std::vector<bool> named(NumberOfNodes(), false);
    new_names[index[root]] = prefix + "0";
    new_names[index[sink]] = prefix + options_.sink_suffix;
    named[index[root]] = true;
    named[index[sink]] = true;

    int counter = 1;
    std::deque<vertex_t> queue{root};
    std::vector<std::tuple<std::string, std::size_t, vertex_t>> successors;
    while(!queue.empty()) {
        auto v = queue.front();
        queue.pop_front();
        successors.clear();
        for(auto &&e : make_out_edge_range(v, graph_)) {
            auto w = target(e, graph_);
            successors.emplace_back(get(boost::edge_label, graph_, e), index[w], w);
        }
        std::sort(successors.begin(), successors.end());
        for(auto &&[label, i, w] : successors) {
            if(named[i]) {
                continue;
            }
            named[i] = true;
            new_names[i] = prefix + std::to_string(counter++);
            queue.push_back(w);
        }
    }
    // nodes unreachable from the root keep insertion order
    for(std::size_t i = 0; i < named.size(); ++i) {
        if(!named[i]) {
            new_names[i] = prefix + std::to_string(counter++);
        }
    }

    std::set<std::string> unique_names(new_names.begin(), new_names.end());
    if(unique_names.size() != new_names.size()) {
        throw std::invalid_argument("Unable to relabel nodes; the sink name '"
            + new_names[index[sink]] + "' collides with a numbered node.");
    }

    names_.clear();
    for(auto &&v : make_vertex_range(graph_)) {
        put(boost::vertex_name, graph_, v, new_names[index[v]]);
        names_.emplace(new_names[index[v]], v);
    }
}

ChainEventGraph::stages_t ChainEventGraph::stages() const {
    stages_t ret;
    for(auto &&v : make_vertex_range(graph_)) {
        ret[get(boost::vertex_stage, graph_, v)].push_back(GetName(v));
    }
    return ret;
}

namespace {
void collect_paths(const ChainEventGraph &ceg, ChainEventGraph::vertex_t v,
        ChainEventGraph::vertex_t sink, ChainEventGraph::path_t *path,
        std::vector<ChainEventGraph::path_t> *paths) {
    if(v == sink) {
        paths->push_back(*path);
        return;
    }
    const auto &g = ceg.graph();
    for(auto &&e : cegk::make_out_edge_range(v, g)) {
        auto w = target(e, g);
        path->push_back({ceg.GetName(v), ceg.GetName(w), get(boost::edge_label, g, e)});
        collect_paths(ceg, w, sink, path, paths);
        path->pop_back();
    }
}
} // namespace

std::vector<ChainEventGraph::path_t> ChainEventGraph::Paths() const {
    std::vector<path_t> paths;
    path_t path;
    collect_paths(*this, LookupNode(root_node()), LookupNode(sink_node()), &path, &paths);
    return paths;
}

namespace {
const char* kind_name(NodeKind kind) {
    switch(kind) {
     case NodeKind::Root:
        return "root";
     case NodeKind::Sink:
        return "sink";
     case NodeKind::Situation:
        return "situation";
    };
    return "unknown";
}
} // namespace

void ChainEventGraph::PrintGraph(std::ostream &os) const {
    os << "#Node\tKind\tStage\tDistance\n";
    for(auto &&v : make_vertex_range(graph_)) {
        auto stage = get(boost::vertex_stage, graph_, v);
        os << GetName(v) << "\t" << kind_name(get(boost::vertex_kind, graph_, v)) << "\t";
        if(stage) {
            os << +*stage;
        } else {
            os << ".";
        }
        os << "\t" << get(boost::vertex_distance, graph_, v) << "\n";
    }
    os << "#Source\tTarget\tLabel\tAttributes\n";
    for(auto &&v : make_vertex_range(graph_)) {
        for(auto &&e : make_out_edge_range(v, graph_)) {
            os << GetName(v) << "\t" << GetName(target(e, graph_)) << "\t"
               << get(boost::edge_label, graph_, e) << "\t"
               << get(boost::edge_attributes, graph_, e) << "\n";
        }
    }
}

std::ostream& cegk::operator<<(std::ostream &os, const ChainEventGraph::edge_key_t &key) {
    return os << "(" << key.source << ", " << key.target << ", " << key.label << ")";
}

// LCOV_EXCL_START
TEST_CASE("[libcegk] ChainEventGraph stores nodes and transitions") {
    using cegk::Attribute;
    using cegk::EdgeData;
    using cegk::stage_id_t;
    using edge_key_t = ChainEventGraph::edge_key_t;

    ChainEventGraph ceg;
    ceg.AddNode("w0", NodeKind::Root);
    ceg.AddNode("w1", NodeKind::Situation, stage_id_t{2});
    ceg.AddNode("w&infin;", NodeKind::Sink);

    CHECK(ceg.NumberOfNodes() == 3);
    CHECK(ceg.HasNode("w1"));
    CHECK_FALSE(ceg.HasNode("w2"));
    CHECK(ceg.GetKind("w0") == NodeKind::Root);
    CHECK(ceg.GetStage("w1") == stage_id_t{2});
    CHECK_FALSE(ceg.GetStage("w0").has_value());
    CHECK(ceg.GetDistance("w1") == cegk::UNKNOWN_DISTANCE);
    CHECK(ceg.root_node() == "w0");
    CHECK(ceg.sink_node() == "w&infin;");

    CHECK_THROWS_AS(ceg.AddNode("w1"), std::invalid_argument);
    CHECK_THROWS_AS(ceg.LookupNode("w9"), cegk::UnknownNode);
    CHECK_THROWS_AS(ceg.GetStage("w9"), cegk::UnknownNode);

    ceg.AddEdge("w0", "w1", "a", EdgeData{{Attribute::Count, 3}});
    ceg.AddEdge("w0", "w1", "b");
    ceg.AddEdge("w1", "w&infin;", "c");
    CHECK(ceg.NumberOfEdges() == 3);
    CHECK(ceg.HasEdge("w0", "w1", "a"));
    CHECK(ceg.HasEdge("w0", "w1", "b"));
    CHECK_FALSE(ceg.HasEdge("w0", "w1", "c"));
    CHECK_FALSE(ceg.HasEdge("w0", "w9", "a"));
    CHECK(ceg.GetEdgeData("w0", "w1", "a").get(Attribute::Count) == 3);
    CHECK_THROWS_AS(ceg.AddEdge("w0", "w1", "a"), std::invalid_argument);
    CHECK_THROWS_AS(ceg.AddEdge("w0", "w9", "a"), cegk::UnknownNode);
    CHECK_THROWS_AS(ceg.GetEdgeData("w0", "w1", "z"), cegk::UnknownNode);

    std::vector<edge_key_t> expected = {
        {"w0", "w1", "a"}, {"w0", "w1", "b"}, {"w1", "w&infin;", "c"}
    };
    CHECK_EQ_RANGES(ceg.Edges(), expected);

    std::vector<edge_key_t> expected_in = {{"w0", "w1", "a"}, {"w0", "w1", "b"}};
    CHECK_EQ_RANGES(ceg.InEdges("w1"), expected_in);
    std::vector<edge_key_t> expected_out = {{"w1", "w&infin;", "c"}};
    CHECK_EQ_RANGES(ceg.OutEdges("w1"), expected_out);

    ceg.MergeEdge("w0", "w1", "a", EdgeData{{Attribute::Count, 4}, {Attribute::Probability, 0.5}});
    CHECK(ceg.NumberOfEdges() == 3);
    CHECK(ceg.GetEdgeData("w0", "w1", "a").get(Attribute::Count) == 7);
    CHECK(ceg.GetEdgeData("w0", "w1", "a").get(Attribute::Probability) == 0.5);

    auto data = ceg.RemoveEdge("w0", "w1", "a");
    CHECK(data.get(Attribute::Count) == 7);
    CHECK(ceg.NumberOfEdges() == 2);
    CHECK_THROWS_AS(ceg.RemoveEdge("w0", "w1", "a"), cegk::UnknownNode);

    ceg.RemoveNode("w1");
    CHECK(ceg.NumberOfNodes() == 2);
    CHECK(ceg.NumberOfEdges() == 0);
    CHECK_FALSE(ceg.HasNode("w1"));
    std::vector<std::string> expected_nodes = {"w0", "w&infin;"};
    CHECK_EQ_RANGES(ceg.Nodes(), expected_nodes);
    CHECK(get(boost::vertex_index, ceg.graph(), ceg.LookupNode("w&infin;")) == 1);
}

TEST_CASE("[libcegk] ChainEventGraph requires one root and one sink") {
    ChainEventGraph ceg;
    CHECK_THROWS_AS(ceg.sink_node(), cegk::MalformedGraph);
    ceg.AddNode("a", NodeKind::Sink);
    ceg.AddNode("b", NodeKind::Sink);
    CHECK_THROWS_AS(ceg.sink_node(), cegk::MalformedGraph);
    CHECK_THROWS_AS(ceg.root_node(), cegk::MalformedGraph);
}

TEST_CASE("[libcegk] ChainEventGraph::Paths lists every root to sink path") {
    using cegk_testing::make_graph;
    using cegk_testing::SINK;

    auto ceg = make_graph({"w0", "w1", "w2", SINK}, {
        {"w0", "w1", "a"}, {"w0", "w2", "b"}, {"w0", "w2", "c"},
        {"w1", SINK, "d"}, {"w2", SINK, "d"}, {"w2", SINK, "e"}
    });
    auto paths = ceg.Paths();
    REQUIRE(paths.size() == 5);
    ChainEventGraph::path_t first = {{"w0", "w1", "a"}, {"w1", SINK, "d"}};
    CHECK_EQ_RANGES(paths[0], first);
    ChainEventGraph::path_t last = {{"w0", "w2", "c"}, {"w2", SINK, "e"}};
    CHECK_EQ_RANGES(paths[4], last);
}

TEST_CASE("[libcegk] ChainEventGraph::RelabelNodes numbers nodes breadth first") {
    using cegk::stage_id_t;

    ChainEventGraph ceg;
    ceg.AddNode("root", NodeKind::Root);
    ceg.AddNode("x", NodeKind::Situation, stage_id_t{0});
    ceg.AddNode("y", NodeKind::Situation, stage_id_t{1});
    ceg.AddNode("z", NodeKind::Situation, stage_id_t{2});
    ceg.AddNode("end", NodeKind::Sink);
    ceg.AddEdge("root", "z", "b");
    ceg.AddEdge("root", "y", "a");
    ceg.AddEdge("y", "x", "c");
    ceg.AddEdge("z", "end", "c");
    ceg.AddEdge("x", "end", "d");

    ceg.RelabelNodes();

    std::vector<std::string> expected = {"w0", "w3", "w1", "w2", "w&infin;"};
    CHECK_EQ_RANGES(ceg.Nodes(), expected);
    CHECK(ceg.HasEdge("w0", "w1", "a"));
    CHECK(ceg.HasEdge("w1", "w3", "c"));
    CHECK(ceg.GetStage("w3") == stage_id_t{0});
    CHECK(ceg.root_node() == "w0");
    CHECK(ceg.sink_node() == "w&infin;");
    CHECK_THROWS_AS(ceg.LookupNode("root"), cegk::UnknownNode);
}

TEST_CASE("[libcegk] ChainEventGraph is built from a staged tree") {
    using cegk::Attribute;
    using cegk_testing::SINK;

    auto tree = cegk_testing::medical_staged_tree();
    ChainEventGraph ceg{tree};

    CHECK(ceg.state() == ChainEventGraph::State::Uninitialized);
    // 21 situations and the sink
    CHECK(ceg.NumberOfNodes() == 22);
    CHECK(ceg.NumberOfEdges() == 44);
    CHECK(ceg.root_node() == "s0");
    CHECK(ceg.sink_node() == SINK);
    CHECK(ceg.GetStage("s9") == ceg.GetStage("s13"));
    CHECK_FALSE(ceg.GetStage(SINK).has_value());

    // s9 is Blast/Experienced/Easy and its children are leaves
    CHECK(ceg.HasEdge("s9", SINK, "Blast"));
    CHECK(ceg.HasEdge("s9", SINK, "Non-blast"));
    CHECK(ceg.GetEdgeData("s9", SINK, "Blast").get(Attribute::Count) == 10);
    CHECK(ceg.GetEdgeData("s0", "s1", "Blast").get(Attribute::Prior) == doctest::Approx(1.5));

    auto stages = ceg.stages();
    std::size_t total = 0;
    for(auto &&kv : stages) {
        total += kv.second.size();
    }
    CHECK(total == ceg.NumberOfNodes());
    REQUIRE(stages.count(std::nullopt) == 1);
    CHECK(stages[std::nullopt].size() == 1);
}
// LCOV_EXCL_STOP
