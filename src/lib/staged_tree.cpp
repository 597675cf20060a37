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

#include <cegk/staged_tree.hpp>

using cegk::StagedTree;
using cegk::stage_id_t;

StagedTree::StagedTree(EventTree tree, std::optional<double> alpha) :
        EventTree(std::move(tree)) {
    if(alpha) {
        if(*alpha <= 0.0) {
            throw std::invalid_argument("Prior strength alpha must be positive.");
        }
        alpha_ = *alpha;
    } else {
        auto categories = categories_per_variable();
        if(!categories.empty()) {
            alpha_ = *std::max_element(categories.begin(), categories.end());
        }
    }
    UpdatePriors();
    AssignStages({});
}

void StagedTree::SetPriorStrength(double alpha) {
    if(alpha <= 0.0) {
        throw std::invalid_argument("Prior strength alpha must be positive.");
    }
    alpha_ = alpha;
    UpdatePriors();
    UpdateEstimates();
}

// The root holds alpha phantom observations and every situation splits what
// it receives equally between its children.
void StagedTree::UpdatePriors() {
    std::vector<double> mass(num_vertices(graph_), 0.0);
    if(mass.empty()) {
        return;
    }
    mass[0] = alpha_;
    // parents always precede their children
    for(auto &&v : make_vertex_range(graph_)) {
        auto n = out_degree(v, graph_);
        if(n == 0) {
            continue;
        }
        double share = mass[v] / n;
        for(auto &&e : make_out_edge_range(v, graph_)) {
            get(boost::edge_attributes, graph_, e).set(Attribute::Prior, share);
            mass[target(e, graph_)] = share;
        }
    }
}

void StagedTree::UpdateEstimates() {
    std::map<stage_id_t, std::map<std::string, double>> label_totals;
    std::map<stage_id_t, double> totals;

    for(auto &&e : boost::make_iterator_range(edges(graph_))) {
        auto &data = get(boost::edge_attributes, graph_, e);
        double posterior = data.get(Attribute::Prior) + data.get(Attribute::Count);
        data.set(Attribute::Posterior, posterior);
        auto stage = get(boost::vertex_stage, graph_, source(e, graph_));
        if(!stage) {
            continue;
        }
        label_totals[*stage][get(boost::edge_label, graph_, e)] += posterior;
        totals[*stage] += posterior;
    }

    for(auto &&e : boost::make_iterator_range(edges(graph_))) {
        auto &data = get(boost::edge_attributes, graph_, e);
        auto stage = get(boost::vertex_stage, graph_, source(e, graph_));
        if(!stage || totals[*stage] <= 0.0) {
            data.erase(Attribute::Probability);
            continue;
        }
        data.set(Attribute::Probability,
            label_totals[*stage][get(boost::edge_label, graph_, e)] / totals[*stage]);
    }
}

void StagedTree::AssignStages(const std::vector<std::vector<std::string>> &groups) {
    auto out_labels = [this](vertex_t v) {
        std::vector<std::string> ret;
        for(auto &&e : make_out_edge_range(v, graph_)) {
            ret.push_back(get(boost::edge_label, graph_, e));
        }
        std::sort(ret.begin(), ret.end());
        return ret;
    };

    std::vector<stage_t> stages(num_vertices(graph_));
    for(std::size_t k = 0; k < groups.size(); ++k) {
        const auto &group = groups[k];
        std::vector<std::string> labels;
        for(auto &&name : group) {
            auto it = names_.find(name);
            if(it == names_.end()) {
                throw std::invalid_argument("Unable to assign stage " + std::to_string(k)
                    + "; node '" + name + "' does not exist.");
            }
            auto v = it->second;
            if(IsLeaf(v)) {
                throw std::invalid_argument("Unable to assign stage " + std::to_string(k)
                    + "; node '" + name + "' is a leaf.");
            }
            if(stages[v]) {
                throw std::invalid_argument("Unable to assign stage " + std::to_string(k)
                    + "; node '" + name + "' already belongs to stage "
                    + std::to_string(+*stages[v]) + ".");
            }
            if(labels.empty()) {
                labels = out_labels(v);
            } else if(out_labels(v) != labels) {
                throw std::invalid_argument("Unable to assign stage " + std::to_string(k)
                    + "; node '" + name + "' has different outgoing labels than '"
                    + group.front() + "'.");
            }
            stages[v] = stage_id_t{static_cast<int>(k)};
        }
    }

    int next_id = static_cast<int>(groups.size());
    for(auto &&v : make_vertex_range(graph_)) {
        if(!IsLeaf(v) && !stages[v]) {
            stages[v] = stage_id_t{next_id++};
        }
        put(boost::vertex_stage, graph_, v, stages[v]);
    }
    UpdateEstimates();
}

StagedTree::stages_t StagedTree::stages() const {
    stages_t ret;
    for(auto &&v : make_vertex_range(graph_)) {
        auto stage = get(boost::vertex_stage, graph_, v);
        if(stage) {
            ret[*stage].push_back(NodeName(v));
        }
    }
    return ret;
}

// LCOV_EXCL_START
TEST_CASE("[libcegk] StagedTree default priors") {
    using cegk::Attribute;
    using cegk::EventTree;

    StagedTree tree{EventTree{EventTree::CountPaths(cegk_testing::medical_rows())}};
    CHECK(tree.alpha() == 3.0);

    const auto &g = tree.graph();
    auto prior = [&](const std::string &parent, const std::string &child) {
        auto e = edge(tree.LookupNode(parent), tree.LookupNode(child), g);
        REQUIRE(e.second);
        return get(boost::edge_attributes, g, e.first).get(Attribute::Prior);
    };
    CHECK(prior("s0", "s1") == doctest::Approx(1.5));
    CHECK(prior("s1", "s3") == doctest::Approx(0.5));
    CHECK(prior("s3", "s9") == doctest::Approx(0.25));
    CHECK(prior("s9", "s21") == doctest::Approx(0.125));

    // every situation starts in its own stage
    auto stages = tree.stages();
    CHECK(stages.size() == 21);
    CHECK(tree.GetStage("s0") == stage_id_t{0});
    CHECK(tree.GetStage("s20") == stage_id_t{20});
    CHECK_FALSE(tree.GetStage("s21").has_value());

    // probabilities of a singleton stage are its own posterior ratios
    auto e = edge(tree.LookupNode("s9"), tree.LookupNode("s21"), g);
    REQUIRE(e.second);
    CHECK(get(boost::edge_attributes, g, e.first).get(Attribute::Probability)
        == doctest::Approx(10.125 / 12.25));

    tree.SetPriorStrength(6.0);
    CHECK(prior("s0", "s1") == doctest::Approx(3.0));
    CHECK(prior("s9", "s21") == doctest::Approx(0.25));
    CHECK_THROWS_AS(tree.SetPriorStrength(0.0), std::invalid_argument);
}

TEST_CASE("[libcegk] StagedTree::AssignStages") {
    using cegk::Attribute;

    auto tree = cegk_testing::medical_staged_tree();
    const auto &g = tree.graph();

    auto stages = tree.stages();
    CHECK(stages.size() == 9);
    std::vector<std::string> stage_2 = {"s15", "s16", "s17", "s19"};
    CHECK_EQ_RANGES(stages[stage_id_t{2}], stage_2);
    std::vector<std::string> stage_7 = {"s0"};
    CHECK_EQ_RANGES(stages[stage_id_t{7}], stage_7);
    std::vector<std::string> stage_8 = {"s5"};
    CHECK_EQ_RANGES(stages[stage_id_t{8}], stage_8);

    auto data = [&](const std::string &parent, const std::string &child) {
        auto e = edge(tree.LookupNode(parent), tree.LookupNode(child), g);
        REQUIRE(e.second);
        return get(boost::edge_attributes, g, e.first);
    };
    // s9, s11 and s13 share a stage; Blast counts are 10, 9 and 8
    auto blast = data("s9", "s21");
    CHECK(blast.get(Attribute::Count) == 10);
    CHECK(blast.get(Attribute::Posterior) == doctest::Approx(10.125));
    CHECK(blast.get(Attribute::Probability) == doctest::Approx(27.375 / 36.75));
    CHECK(data("s13", "s29").get(Attribute::Probability) == doctest::Approx(27.375 / 36.75));

    CHECK(data("s0", "s1").get(Attribute::Probability) == doctest::Approx(73.5 / 151.0));
}

TEST_CASE("[libcegk] StagedTree::AssignStages rejects invalid groups") {
    auto tree = cegk_testing::medical_staged_tree();
    CHECK_THROWS_AS(tree.AssignStages({{"s9", "s99"}}), std::invalid_argument);
    CHECK_THROWS_AS(tree.AssignStages({{"s9", "s21"}}), std::invalid_argument);
    CHECK_THROWS_AS(tree.AssignStages({{"s9", "s11"}, {"s11", "s13"}}), std::invalid_argument);
    // Classification and Group have different values
    CHECK_THROWS_AS(tree.AssignStages({{"s0", "s1"}}), std::invalid_argument);

    // a failed assignment leaves the previous stages in place
    CHECK(tree.GetStage("s9") == tree.GetStage("s13"));
}
// LCOV_EXCL_STOP
