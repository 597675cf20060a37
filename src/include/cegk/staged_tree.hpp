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

/*

##STAGEDTREE v0.1
#Kind   Values
path    Blast   Experienced     Easy    Blast   10
path    Blast   Experienced     Easy    Non-blast       2
zero    Blast   Novice
stage   Blast/Experienced/Easy  Blast/Inexperienced/Easy
alpha   3

*/

#ifndef CEGK_STAGED_TREE_HPP
#define CEGK_STAGED_TREE_HPP

#include <cegk/event_tree.hpp>
#include <cegk/utility.hpp>

#include <map>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

namespace cegk {

// An event tree whose situations have been grouped into stages.
//
// Stage membership is supplied from outside. Each transition carries its
// Count, its default Prior, Posterior = Prior + Count, and the Probability
// estimated from the posterior totals of its stage.
class StagedTree : public EventTree {
public:
    using stages_t = std::map<stage_id_t, std::vector<std::string>>;

    StagedTree() : StagedTree(EventTree{}) { }

    // alpha defaults to the largest number of categories of any variable
    explicit StagedTree(EventTree tree, std::optional<double> alpha = std::nullopt);

    template<typename Range>
    static StagedTree parse_text(const Range &text);

    // A `path` row counts observations of a complete path; every prefix of it
    // receives the same count. Values are percent decoded.
    static StagedTree parse_table(const std::vector<std::vector<std::string>> &table);

    // Reset the phantom sample size and recompute priors and estimates.
    void SetPriorStrength(double alpha);

    double alpha() const { return alpha_; }

    // Groups receive stage ids 0..k-1 in order. Every other situation is then
    // placed in its own stage. Leaves are never staged.
    void AssignStages(const std::vector<std::vector<std::string>> &groups);

    stage_t GetStage(const std::string &name) const {
        return get(boost::vertex_stage, graph_, LookupNode(name));
    }

    stages_t stages() const;

protected:
    void UpdatePriors();
    void UpdateEstimates();

    double alpha_{0.0};
};

template<typename Range>
StagedTree StagedTree::parse_text(const Range &text) {
    using namespace std;
    // token are separated by one or more <space>s or <tab>s
    // <newline>s end the row
    auto tokens = utility::make_tokenizer_dropempty(text, "\t ", "\n");

    auto token_it = tokens.begin();
    if(token_it == tokens.end() || *token_it != "##STAGEDTREE") {
        throw std::invalid_argument("Staged tree parsing failed; "
            "unknown format; missing '##STAGEDTREE' header line.");
    }

    size_t k = 0;
    bool in_comment = false;
    vector<vector<string>> string_table;
    string_table.reserve(64);
    for(; token_it != tokens.end(); ++token_it) {
        const auto & token = *token_it;
        if(token == "\n") {
            k = 0;
            in_comment = false;
            continue;
        }
        if(in_comment) {
            continue;
        }
        if(k == 0) {
            string_table.emplace_back();
            if(token[0] == '#') {
                in_comment = true;
                continue;
            }
            string_table.back().reserve(8);
        }
        string_table.back().push_back(token);
        k += 1;
    }

    return parse_table(string_table);
}

} // namespace cegk

#endif // CEGK_STAGED_TREE_HPP
