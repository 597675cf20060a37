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

#ifndef CEGK_CEG_TESTING_HPP
#define CEGK_CEG_TESTING_HPP

#include <cegk/chain_event_graph.hpp>
#include <cegk/staged_tree.hpp>

#include <array>
#include <string>
#include <vector>

namespace cegk_testing {

constexpr char SINK[] = "w&infin;";

using edge_list_t = std::vector<std::array<std::string,3>>;

// Structure useful for unit testing: nodes are added in the given order,
// `root` and `sink` are marked as such, and edges carry no attributes.
inline
cegk::ChainEventGraph make_graph(const std::vector<std::string> &nodes,
        const edge_list_t &edges, const std::string &root = "w0",
        const std::string &sink = SINK) {
    cegk::ChainEventGraph ceg;
    for(auto &&name : nodes) {
        auto kind = cegk::NodeKind::Situation;
        if(name == root) {
            kind = cegk::NodeKind::Root;
        } else if(name == sink) {
            kind = cegk::NodeKind::Sink;
        }
        ceg.AddNode(name, kind);
    }
    for(auto &&e : edges) {
        ceg.AddEdge(e[0], e[1], e[2]);
    }
    return ceg;
}

// The 45 situation medical fixture: Classification(2) x Group(3) x
// Difficulty(2) x Response(2), with every one of the 24 complete paths observed.
inline
std::vector<std::vector<std::string>> medical_rows() {
    static const char *classification[] = {"Blast", "Non-blast"};
    static const char *group[] = {"Experienced", "Inexperienced", "Novice"};
    static const char *difficulty[] = {"Easy", "Hard"};
    static const char *response[] = {"Blast", "Non-blast"};
    // counts of the complete paths in lexicographic order
    static const int counts[24] = {
        10,  2,  7,  5,   9,  3,  6,  6,   8,  4,  4,  8,
         1, 11,  3,  9,   2, 10,  5,  7,   2, 12,  6,  8
    };

    std::vector<std::vector<std::string>> rows;
    int n = 0;
    for(auto c : classification) {
        for(auto g : group) {
            for(auto d : difficulty) {
                for(auto r : response) {
                    for(int i = 0; i < counts[n]; ++i) {
                        rows.push_back({c, g, d, r});
                    }
                    ++n;
                }
            }
        }
    }
    return rows;
}

// Stage 0..6 in order; s0 and s5 become singleton stages 7 and 8.
inline
std::vector<std::vector<std::string>> medical_stage_groups() {
    return {
        {"s9", "s11", "s13"},         // Blast, easy
        {"s10", "s12", "s14"},        // Blast, hard
        {"s15", "s16", "s17", "s19"},
        {"s18", "s20"},
        {"s3", "s4"},
        {"s6", "s7", "s8"},
        {"s1", "s2"}
    };
}

inline
cegk::StagedTree medical_staged_tree() {
    cegk::EventTree tree{cegk::EventTree::CountPaths(medical_rows())};
    cegk::StagedTree staged{std::move(tree)};
    staged.AssignStages(medical_stage_groups());
    return staged;
}

} // namespace cegk_testing

#endif // CEGK_CEG_TESTING_HPP
