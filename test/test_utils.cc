// -*-mode:c++; c-style:k&r; c-basic-offset:4;-*-
//
// Copyright 2017, The sfstats developers
//
// This file is part of sfstats.
//
// sfstats is free software: you can redistribute it and/or modify
// it under the terms of the GNU General Public License as published by
// the Free Software Foundation, either version 3 of the License, or
// (at your option) any later version.
//
// sfstats is distributed in the hope that it will be useful,
// but WITHOUT ANY WARRANTY; without even the implied warranty of
// MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.  See the
// GNU General Public License for more details.
//
// You should have received a copy of the GNU General Public License
// along with sfstats.  If not, see <http://www.gnu.org/licenses/>.
//


#include <catch2/catch.hpp>

#include "utils.h"

TEST_CASE("parsing lists of indexes", "[utils]") {
    vector<size_t> list;

    CHECK(parse_size_list("0,2", list));
    CHECK(list == vector<size_t>({0, 2}));
    CHECK(parse_size_list("4,5", list, true));
    CHECK(list == vector<size_t>({4, 5}));

    CHECK_FALSE(parse_size_list("0,5", list, true));
    CHECK(list.empty());
    CHECK_FALSE(parse_size_list("", list));
    CHECK_FALSE(parse_size_list("1,,2", list));
    CHECK_FALSE(parse_size_list("1,x", list));
    CHECK_FALSE(parse_size_list("-1", list));
}

TEST_CASE("indexes wider than an int are not truncated", "[utils]") {
    vector<size_t> list;

    // 2^32 + 1 would read as 1 through an int.
    REQUIRE(parse_size_list("4294967297", list, true));
    CHECK(list == vector<size_t>({4294967297UL}));

    // 2^31 would read as a negative int.
    REQUIRE(parse_size_list("2147483648", list));
    CHECK(list == vector<size_t>({2147483648UL}));

    CHECK_FALSE(parse_size_list("99999999999999999999999", list));
}

TEST_CASE("strict number parsing", "[utils]") {
    CHECK(parse_integer("42") == 42);
    CHECK(parse_double("1e2") == 100.0);
    CHECK_THROWS_AS(parse_integer("4.2"), std::invalid_argument);
    CHECK_THROWS_AS(parse_double("1x"), std::invalid_argument);
    CHECK_THROWS_AS(parse_double(""), std::invalid_argument);
}

TEST_CASE("splitting", "[utils]") {
    CHECK(split("").empty());
    CHECK(split(" a\tb  c ") == vector<string>({"a", "b", "c"}));
    CHECK(split("a,,b", ',') == vector<string>({"a", "", "b"}));
}

TEST_CASE("binomial coefficients", "[utils]") {
    CHECK(binomial_coeff(4, 2) == Approx(6.0));
    CHECK(binomial_coeff(10, 3) == Approx(120.0));
    CHECK(binomial_coeff(2, 3) == 0.0);
}

TEST_CASE("file types", "[utils]") {
    CHECK(guess_file_type("run.sfs") == FileT::table);
    CHECK(guess_file_type("run.tsv.gz") == FileT::gztable);
    CHECK(guess_file_type("run.dat.gz") == FileT::gztable);
    CHECK(guess_file_type("run.dat") == FileT::unknown);
    CHECK(remove_suffix(FileT::gztable, "dir/run.sfs.gz") == "dir/run");
}
