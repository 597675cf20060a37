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

#include <cstdlib>
#include <limits>

#include <cegk/staged_tree.hpp>
#include <cegk/error.hpp>

using cegk::StagedTree;
using cegk::EventTree;
using cegk::utility::percent_decode;

namespace {
std::string row_error(int row_num, const std::string &msg) {
    return "Staged tree parsing failed. Row " + std::to_string(row_num) + " " + msg;
}

// "." is the root; other paths are '/' separated values
EventTree::path_t parse_path(const std::string &token) {
    EventTree::path_t path;
    if(token == ".") {
        return path;
    }
    auto tokens = cegk::utility::make_tokenizer_dropempty(token, "/", "");
    for(auto &&value : tokens) {
        path.push_back(percent_decode(value));
    }
    return path;
}
} // namespace

StagedTree StagedTree::parse_table(const std::vector<std::vector<std::string>> &table) {
    static const char *keys[] = {"path", "zero", "stage", "alpha"};

    EventTree::path_counts_t counts;
    std::vector<EventTree::path_t> zeros;
    std::vector<std::vector<EventTree::path_t>> stage_paths;
    std::vector<int> stage_rows;
    std::optional<double> alpha;

    int row_num = 0;
    for(auto &&row : table) {
        row_num += 1;
        if(row.empty()) {
            continue;
        }
        switch(utility::key_switch_iequals(row[0], keys)) {
        case 0: {
            if(row.size() < 3) {
                throw std::invalid_argument(row_error(row_num,
                    "has a path without values or a count."));
            }
            char *str_end;
            long count = std::strtol(row.back().c_str(), &str_end, 10);
            if(row.back().empty() || *str_end != '\0' || count < 0
                || count > std::numeric_limits<int>::max()) {
                throw std::invalid_argument(row_error(row_num,
                    "has invalid count '" + row.back() + "'."));
            }
            EventTree::path_t path;
            for(auto it = std::next(row.begin()); it != std::prev(row.end()); ++it) {
                path.push_back(percent_decode(*it));
                counts[path] += static_cast<int>(count);
            }
            break;
        }
        case 1: {
            if(row.size() < 2) {
                throw std::invalid_argument(row_error(row_num, "has an empty sampling zero."));
            }
            EventTree::path_t path;
            for(auto it = std::next(row.begin()); it != row.end(); ++it) {
                path.push_back(percent_decode(*it));
            }
            zeros.push_back(std::move(path));
            break;
        }
        case 2: {
            if(row.size() < 2) {
                throw std::invalid_argument(row_error(row_num, "has an empty stage."));
            }
            stage_paths.emplace_back();
            for(auto it = std::next(row.begin()); it != row.end(); ++it) {
                stage_paths.back().push_back(parse_path(*it));
            }
            stage_rows.push_back(row_num);
            break;
        }
        case 3: {
            if(row.size() != 2) {
                throw std::invalid_argument(row_error(row_num,
                    "has " + std::to_string(row.size()-1) + " alpha value(s) instead of 1."));
            }
            char *str_end;
            double value = std::strtod(row[1].c_str(), &str_end);
            if(*str_end != '\0' || !(value > 0.0)) {
                throw std::invalid_argument(row_error(row_num,
                    "has invalid alpha '" + row[1] + "'."));
            }
            alpha = value;
            break;
        }
        default:
            throw std::invalid_argument(row_error(row_num,
                "has unknown kind '" + row[0] + "'."));
        }
    }

    StagedTree ret{EventTree{counts, zeros}, alpha};

    std::vector<std::vector<std::string>> groups;
    for(std::size_t k = 0; k < stage_paths.size(); ++k) {
        groups.emplace_back();
        for(auto &&path : stage_paths[k]) {
            try {
                groups.back().push_back(ret.LookupPath(path));
            } catch(const UnknownNode &e) {
                throw std::invalid_argument(row_error(stage_rows[k], e.what()));
            }
        }
    }
    ret.AssignStages(groups);
    return ret;
}

// LCOV_EXCL_START
TEST_CASE("[libcegk] StagedTree::parse_text") {
    using cegk::Attribute;
    using cegk::stage_id_t;

    const char text[] =
        "##STAGEDTREE v0.1\n"
        "#Kind\tValues\n"
        "path a x 3\n"
        "path a y 1\n"
        "path\tb\tx\t2\n"
        "PATH b x 2\n"
        "zero b y\n"
        "stage a b\n"
        "alpha 4\n"
    ;
    StagedTree tree;
    REQUIRE_NOTHROW(tree = StagedTree::parse_text(text));

    CHECK(tree.NumberOfNodes() == 7);
    CHECK(tree.alpha() == 4.0);
    CHECK(tree.LookupPath({"b", "y"}) == "s6");
    CHECK(tree.sampling_zeros().size() == 1);
    CHECK(tree.GetStage("s1") == stage_id_t{0});
    CHECK(tree.GetStage("s2") == stage_id_t{0});
    CHECK(tree.GetStage("s0") == stage_id_t{1});

    const auto &g = tree.graph();
    auto e = edge(tree.LookupNode("s2"), tree.LookupNode("s5"), g);
    REQUIRE(e.second);
    const auto &data = get(boost::edge_attributes, g, e.first);
    CHECK(data.get(Attribute::Count) == 4);
    CHECK(data.get(Attribute::Prior) == doctest::Approx(1.0));
    // stage posterior totals: x = (3+1) + (4+1), y = (1+1) + (0+1)
    CHECK(data.get(Attribute::Probability) == doctest::Approx(9.0 / 12.0));

    e = edge(tree.LookupNode("s0"), tree.LookupNode("s2"), g);
    REQUIRE(e.second);
    CHECK(get(boost::edge_attributes, g, e.first).get(Attribute::Count) == 4);
}

TEST_CASE("[libcegk] StagedTree::parse_text decodes stage paths") {
    const char text[] =
        "##STAGEDTREE\n"
        "path a%2Fb x 1\n"
        "path c x 1\n"
        "stage a%2Fb c\n"
        "stage .\n"
    ;
    auto tree = StagedTree::parse_text(text);
    CHECK(tree.LookupPath({"a/b"}) == "s1");
    CHECK(tree.GetStage("s1") == tree.GetStage("s2"));
    CHECK(tree.GetStage("s0") == cegk::stage_id_t{1});
}

TEST_CASE("[libcegk] StagedTree::parse_text rejects bad input") {
    CHECK_THROWS_AS(StagedTree::parse_text(""), std::invalid_argument);
    CHECK_THROWS_AS(StagedTree::parse_text("##PEDNG\n"), std::invalid_argument);
    CHECK_THROWS_AS(StagedTree::parse_text("##STAGEDTREE\npath a\n"), std::invalid_argument);
    CHECK_THROWS_AS(StagedTree::parse_text("##STAGEDTREE\npath a x\n"), std::invalid_argument);
    CHECK_THROWS_AS(StagedTree::parse_text("##STAGEDTREE\npath a -1\n"), std::invalid_argument);
    CHECK_THROWS_AS(StagedTree::parse_text("##STAGEDTREE\npath a x 2147483648\n"),
        std::invalid_argument);
    CHECK_THROWS_AS(StagedTree::parse_text("##STAGEDTREE\npath a x 99999999999999999999\n"),
        std::invalid_argument);
    CHECK_NOTHROW(StagedTree::parse_text("##STAGEDTREE\npath a x 2147483647\n"));
    CHECK_THROWS_AS(StagedTree::parse_text("##STAGEDTREE\nzero\n"), std::invalid_argument);
    CHECK_THROWS_AS(StagedTree::parse_text("##STAGEDTREE\nalpha\n"), std::invalid_argument);
    CHECK_THROWS_AS(StagedTree::parse_text("##STAGEDTREE\nalpha 0\n"), std::invalid_argument);
    CHECK_THROWS_AS(StagedTree::parse_text("##STAGEDTREE\nedge a b\n"), std::invalid_argument);
    CHECK_THROWS_AS(StagedTree::parse_text("##STAGEDTREE\npath a x 1\nstage a q\n"),
        std::invalid_argument);
}
// LCOV_EXCL_STOP
