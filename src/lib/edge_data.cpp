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

#include <cegk/edge_data.hpp>

#include <set>

const char* cegk::attribute_name(Attribute key) {
    switch(key) {
     case Attribute::Count:
        return "count";
     case Attribute::Prior:
        return "prior";
     case Attribute::Posterior:
        return "posterior";
     case Attribute::Probability:
        return "probability";
    };
    return "unknown";
}

cegk::EdgeData cegk::merge_edge_data(const EdgeData &edge_1, const EdgeData &edge_2) {
    EdgeData ret = edge_1;
    for(auto &&[key, value] : edge_2) {
        if(key == Attribute::Probability) {
            continue;
        }
        ret.set(key, ret.get(key) + value);
    }
    return ret;
}

std::ostream& cegk::operator<<(std::ostream &os, const EdgeData &data) {
    bool first = true;
    for(auto &&[key, value] : data) {
        if(!first) {
            os << ";";
        }
        first = false;
        os << attribute_name(key) << "=" << value;
    }
    return os;
}

// LCOV_EXCL_START
namespace {
void check_edges_merged(const cegk::EdgeData &merged, const cegk::EdgeData &edge_1,
        const cegk::EdgeData &edge_2) {
    using cegk::Attribute;

    std::set<Attribute> expected_keys;
    for(auto &&kv : edge_1) {
        expected_keys.insert(kv.first);
    }
    for(auto &&kv : edge_2) {
        expected_keys.insert(kv.first);
    }
    if(!edge_1.contains(Attribute::Probability)) {
        expected_keys.erase(Attribute::Probability);
    }
    std::set<Attribute> keys;
    for(auto &&kv : merged) {
        keys.insert(kv.first);
    }
    CHECK(keys == expected_keys);

    for(auto &&kv : merged) {
        if(kv.first == Attribute::Probability) {
            CHECK(kv.second == edge_1.get(kv.first));
        } else {
            CHECK(kv.second == edge_1.get(kv.first) + edge_2.get(kv.first));
        }
    }
}
} // namespace

TEST_CASE("[libcegk] merge_edge_data") {
    using cegk::Attribute;
    using cegk::EdgeData;
    using cegk::merge_edge_data;

    SUBCASE("all attributes present") {
        EdgeData edge_1{{Attribute::Count, 250}, {Attribute::Prior, 0.5},
            {Attribute::Posterior, 250}, {Attribute::Probability, 0.8}};
        EdgeData edge_2{{Attribute::Count, 550}, {Attribute::Prior, 25},
            {Attribute::Posterior, 0.4}, {Attribute::Probability, 0.9}};

        auto merged = merge_edge_data(edge_1, edge_2);
        check_edges_merged(merged, edge_1, edge_2);
        CHECK(merged.get(Attribute::Count) == 800);
        CHECK(merged.get(Attribute::Probability) == 0.8);

        // the order of the operands decides which probability survives
        CHECK(merge_edge_data(edge_2, edge_1).get(Attribute::Probability) == 0.9);
    }
    SUBCASE("attributes missing from one edge") {
        EdgeData edge_1{{Attribute::Count, 250}, {Attribute::Prior, 0.5}};
        EdgeData edge_2{{Attribute::Count, 550}, {Attribute::Prior, 25},
            {Attribute::Posterior, 0.4}};

        auto merged = merge_edge_data(edge_1, edge_2);
        check_edges_merged(merged, edge_1, edge_2);
        CHECK(merged.size() == 3);
        CHECK(merged.get(Attribute::Posterior) == 0.4);
        CHECK_FALSE(merged.contains(Attribute::Probability));
    }
    SUBCASE("probability only on the second edge") {
        EdgeData edge_1{{Attribute::Count, 3}};
        EdgeData edge_2{{Attribute::Count, 4}, {Attribute::Probability, 0.25}};

        auto merged = merge_edge_data(edge_1, edge_2);
        check_edges_merged(merged, edge_1, edge_2);
        CHECK(merged.get(Attribute::Count) == 7);
        CHECK_FALSE(merged.contains(Attribute::Probability));
    }
    SUBCASE("empty edges") {
        CHECK(merge_edge_data(EdgeData{}, EdgeData{}).empty());
    }
}

TEST_CASE("[libcegk] EdgeData printing") {
    using cegk::Attribute;

    CHECK(std::string{cegk::attribute_name(Attribute::Posterior)} == "posterior");

    std::ostringstream os;
    os << cegk::EdgeData{{Attribute::Count, 5}, {Attribute::Probability, 0.5}};
    CHECK(os.str() == "count=5;probability=0.5");

    os.str("");
    os << cegk::EdgeData{};
    CHECK(os.str().empty());
}
// LCOV_EXCL_STOP
