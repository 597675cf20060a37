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

#ifndef CEGK_EDGE_DATA_HPP
#define CEGK_EDGE_DATA_HPP

#include <initializer_list>
#include <ostream>
#include <string>

#include <boost/container/flat_map.hpp>

namespace cegk {

// The numeric attributes that a transition can carry
enum struct Attribute : int {
    Count,       // observed occurrences
    Prior,       // phantom observations
    Posterior,   // Count+Prior
    Probability  // point estimate; never summed
};

const char* attribute_name(Attribute key);

// A small attribute map attached to every transition. Missing keys read as 0.
class EdgeData {
 public:
    using map_t = boost::container::flat_map<Attribute, double>;
    using value_type = map_t::value_type;
    using const_iterator = map_t::const_iterator;

    EdgeData() = default;

    EdgeData(std::initializer_list<value_type> init) : values_(init.begin(), init.end()) {}

    bool contains(Attribute key) const {
        return values_.find(key) != values_.end();
    }

    double get(Attribute key, double default_value = 0.0) const {
        auto it = values_.find(key);
        return (it != values_.end()) ? it->second : default_value;
    }

    void set(Attribute key, double value) { values_[key] = value; }

    void erase(Attribute key) { values_.erase(key); }

    std::size_t size() const { return values_.size(); }
    bool empty() const { return values_.empty(); }

    const_iterator begin() const { return values_.begin(); }
    const_iterator end() const { return values_.end(); }

    bool operator==(const EdgeData &other) const { return values_ == other.values_; }
    bool operator!=(const EdgeData &other) const { return values_ != other.values_; }

 private:
    map_t values_;
};

// Combine the attributes of two transitions that have collapsed into one.
//
// Additive keys are summed over the union of keys, with a key missing from one
// side read as 0. Probability is a derived ratio and is copied from edge_1, the
// first operand, or left out when edge_1 has none. Callers pass the transition
// that already exists first.
EdgeData merge_edge_data(const EdgeData &edge_1, const EdgeData &edge_2);

std::ostream& operator<<(std::ostream &os, const EdgeData &data);

} // namespace cegk

#endif // CEGK_EDGE_DATA_HPP
