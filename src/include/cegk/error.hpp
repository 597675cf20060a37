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

#ifndef CEGK_ERROR_HPP
#define CEGK_ERROR_HPP

#include <stdexcept>
#include <string>

namespace cegk {

// The graph is not a DAG with a single sink, or a distinguished node is missing.
class MalformedGraph : public std::invalid_argument {
 public:
    using std::invalid_argument::invalid_argument;
};

// A requested merge contains a pair of nodes that cannot be merged.
class IneligibleMergeRequest : public std::invalid_argument {
 public:
    using std::invalid_argument::invalid_argument;
};

// A node or transition referenced by name does not exist.
class UnknownNode : public std::out_of_range {
 public:
    explicit UnknownNode(const std::string &name) :
        std::out_of_range{"Unknown node '" + name + "'."}, name_{name} {}

    UnknownNode(const std::string &name, const std::string &what) :
        std::out_of_range{what}, name_{name} {}

    const std::string& name() const { return name_; }

 private:
    std::string name_;
};

} // namespace cegk

#endif // CEGK_ERROR_HPP
