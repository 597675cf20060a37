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
#include <cstdlib>
#include <filesystem>
#include <iostream>
#include <string>

#include <cegk/cegk.hpp>
#include <cegk/utility.hpp>

#include <CLI11.hpp>

#include "subcommand.hpp"

using namespace std::string_literals;

namespace {
struct args_t {
    double alpha{0.0};

    std::string node_prefix{"w"};
    std::string sink_suffix{"&infin;"};

    bool paths{false};

    std::filesystem::path input{};
} args;
}  // anon namespace

int main(int argc, char *argv[]) {
    CEGK_RUNTIME_CHECK_VERSION_NUMBER_OR_RETURN();

    using namespace cegk::subcommand::string_literals;

    CLI::App app{"cegk generate v" CEGK_VERSION};

    #define ADD_OPTION_(name, desc) app.add_option(#name##_opt, args.name, desc)->capture_default_str()

    ADD_OPTION_(alpha, "Prior strength (0 uses the input or the largest number of categories)")
        ->check(CLI::NonNegativeNumber);
    ADD_OPTION_(node_prefix, "Prefix of generated node names");
    ADD_OPTION_(sink_suffix, "Suffix of the sink node name");

    app.add_flag("--paths", args.paths, "Also list every root to sink path");

    app.add_option("input", args.input, "Staged tree file")->required()->check(CLI::ExistingFile);
    #undef ADD_OPTION_

    CLI11_PARSE(app, argc, argv);

    try {
        auto text = cegk::utility::slurp(args.input);
        if(!text) {
            std::cerr << "ERROR: Unable to read '" << args.input.string() << "'.\n";
            return EXIT_FAILURE;
        }
        auto tree = cegk::StagedTree::parse_text(*text);
        if(args.alpha > 0.0) {
            tree.SetPriorStrength(args.alpha);
        }

        cegk::ChainEventGraph ceg{tree, true, {args.node_prefix, args.sink_suffix}};
        ceg.PrintGraph(std::cout);

        if(args.paths) {
            std::cout << "#Path\tTransitions\n";
            int n = 0;
            for(auto &&path : ceg.Paths()) {
                std::cout << n++;
                for(auto &&key : path) {
                    std::cout << "\t" << key;
                }
                std::cout << "\n";
            }
        }
    } catch(const std::exception &e) {
        std::cerr << "ERROR: " << e.what() << "\n";
        return EXIT_FAILURE;
    }

    return EXIT_SUCCESS;
}
