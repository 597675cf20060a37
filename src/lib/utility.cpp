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

#include <cegk/utility.hpp>

// decode every %XX escape at or after `start`; invalid escapes are dropped
void cegk::utility::detail::percent_decode_core(std::string *str, size_t start) {
    auto hex_decode = [](char x) -> int {
         if('0' <= x && x <= '9') {
            return x-'0';
        }
        if('A' <= x && x <= 'F') {
            return x-'A'+10;
        }
        if('a' <= x && x <= 'f') {
            return x-'a'+10;
        }
        return -1;
    };

    auto p = str->begin()+start;
    auto q = p;
    int a, b;
    do {
        if(++p == str->end()) {
            break;
        }
        a = hex_decode(*p);
        if(++p == str->end()) {
            break;
        }
        b = hex_decode(*p);
        if(a != -1 && b != -1) {
            *q++ = a*16+b;
        }
        for(++p; p != str->end(); ++p) {
            if(*p == '%') {
                break;
            }
            *q++ = *p;
        }
    } while(p != str->end());

    str->erase(q, str->end());
}

// LCOV_EXCL_START
TEST_CASE("[libcegk] percent_decode") {
    using cegk::utility::percent_decode;

    CHECK(percent_decode("Non-blast") == "Non-blast");
    CHECK(percent_decode("a%2Fb") == "a/b");
    CHECK(percent_decode("%41%42c") == "ABc");
    CHECK(percent_decode("%2e") == ".");
    CHECK(percent_decode("x%20y%20z") == "x y z");
    CHECK(percent_decode("a%zzb") == "ab");
    CHECK(percent_decode("a%4") == "a");
}

TEST_CASE("[libcegk] key_switch_iequals") {
    using cegk::utility::key_switch_iequals;
    static const char *keys[] = {"path", "zero", "stage"};

    CHECK(key_switch_iequals("path", keys) == 0);
    CHECK(key_switch_iequals("STAGE", keys) == 2);
    CHECK(key_switch_iequals("pat", keys) == static_cast<std::size_t>(-1));
}
// LCOV_EXCL_STOP
