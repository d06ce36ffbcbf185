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


#include <sstream>

#include <catch2/catch.hpp>

#include "Sfs.h"

namespace {

// Two populations of two chromosomes each.
const vector<double> joint_counts {10, 2, 1,
                                   3,  4, 2,
                                   1,  2, 8};
const vector<size_t> joint_dims {3, 3};

}

TEST_CASE("sample sizes follow from the shape", "[sfs]") {
    Sfs s (vector<double>{0, 3, 5, 2, 0});
    CHECK(s.npops() == 1);
    CHECK(s.is_1d());
    CHECK(s.pop_sizes() == vector<size_t>({4}));
    CHECK(s.total() == 10.0);
    CHECK_FALSE(s.has_length());

    Sfs j (joint_counts, joint_dims);
    CHECK(j.npops() == 2);
    CHECK_FALSE(j.is_1d());
    CHECK(j.pop_sizes() == vector<size_t>({2, 2}));
    CHECK(j.at(Sfs::Index{1, 2}) == 2.0);

    CHECK_THROWS_AS(Sfs(joint_counts, vector<size_t>{4, 2}), ShapeError);
}

TEST_CASE("spectra without bins are rejected", "[sfs]") {
    CHECK_THROWS_AS(Sfs(vector<double>()), ShapeError);
    CHECK_THROWS_AS(Sfs(NdArray<double>(vector<size_t>{3, 0})), ShapeError);
    CHECK_THROWS_AS(Sfs(vector<double>(), vector<size_t>{0, 4}), ShapeError);

    // A single bin is a sample of no chromosomes.
    Sfs one (vector<double>{5});
    CHECK(one.pop_sizes() == vector<size_t>({0}));
}

TEST_CASE("matching dimensions", "[sfs]") {
    Sfs flat (vector<double>(20, 1.0));
    CHECK(flat.match_dims(vector<size_t>{20}));
    CHECK(flat.match_dims(vector<size_t>{4, 5}));
    CHECK(flat.match_dims(vector<size_t>{2, 2, 5}));
    CHECK_FALSE(flat.match_dims(vector<size_t>{19}));
    CHECK_FALSE(flat.match_dims(vector<size_t>{3, 7}));

    Sfs joint (vector<double>(20, 1.0), vector<size_t>{4, 5});
    CHECK(joint.match_dims(vector<size_t>{4, 5}));
    CHECK_FALSE(joint.match_dims(vector<size_t>{5, 4}));
    CHECK_FALSE(joint.match_dims(vector<size_t>{20}));
    CHECK_FALSE(joint.match_dims(vector<size_t>{2, 2, 5}));
}

TEST_CASE("setting the sequence length", "[sfs]") {
    Sfs s (vector<double>{0, 3, 5, 2, 0});
    s.set_length(20.0);
    CHECK(s.has_length());
    CHECK(s.length() == 20.0);
    CHECK(s[0] == 10.0);
    CHECK(s.total() == 20.0);
    CHECK(s.count_segsites() == 10);

    SECTION("a length shorter than the number of sites leaves the counts as they are") {
        Sfs t (vector<double>{1, 3, 5, 2, 0});
        t.set_length(5.0);
        CHECK(t.length() == 5.0);
        CHECK(t[0] == 1.0);
        CHECK(t.total() == 11.0);
    }

    SECTION("clearing and assuming") {
        s.clear_length();
        CHECK_FALSE(s.has_length());
        CHECK(s.site_denom(true) == 1.0);
        s.assume_length();
        CHECK(s.has_length());
        CHECK(s.length() == 20.0);
        CHECK(s.site_denom(true) == 20.0);
        CHECK(s.site_denom(false) == 1.0);
    }
}

TEST_CASE("constructing with a length and repolarizing", "[sfs]") {
    // Repolarized first, then padded up to L.
    Sfs s (vector<double>{1, 3, 5, 2, 0}, vector<size_t>(), 20.0, true);
    CHECK(s.counts().data() == vector<double>({9, 2, 5, 3, 1}));
    CHECK(s.total() == 20.0);
    CHECK(s.length() == 20.0);

    Sfs j (joint_counts, joint_dims, 50.0);
    CHECK(j.at(Sfs::Index{0, 0}) == 27.0);
    CHECK(j.total() == 50.0);
}

TEST_CASE("repolarizing is an involution", "[sfs]") {
    Sfs s (joint_counts, joint_dims);
    Sfs orig (s);

    s.repolarize();
    CHECK(s.at(Sfs::Index{0, 0}) == 8.0);
    CHECK(s.at(Sfs::Index{2, 2}) == 10.0);
    CHECK(s.at(Sfs::Index{0, 1}) == 2.0);
    CHECK(s.at(Sfs::Index{1, 0}) == 2.0);
    CHECK(s.at(Sfs::Index{2, 1}) == 2.0);
    CHECK(s.counts() != orig.counts());

    s.repolarize();
    CHECK(s.counts() == orig.counts());

    Sfs r (vector<double>{0, 3, 5, 2, 0}, vector<size_t>(), true);
    CHECK(r.counts().data() == vector<double>({0, 2, 5, 3, 0}));
}

TEST_CASE("corners and segregating sites", "[sfs]") {
    Sfs s (joint_counts, joint_dims);

    pair<Sfs::Index, Sfs::Index> corners = s.corner_mask();
    CHECK(corners.first == Sfs::Index({0, 0}));
    CHECK(corners.second == Sfs::Index({2, 2}));

    CHECK(s.count_segsites() == 15);
    CHECK(s.count_segsites() == (long) (s.total() - s.at(corners.first) - s.at(corners.second)));

    Sfs m = s.mask_corners();
    CHECK(m.at(corners.first) == 0.0);
    CHECK(m.at(corners.second) == 0.0);
    CHECK(m.total() == 15.0);
    CHECK(m.count_segsites() == 15);
    // The unmasked spectrum is untouched.
    CHECK(s.at(corners.first) == 10.0);

    Sfs one (vector<double>{0, 3, 5, 2, 0});
    CHECK(one.count_segsites() == 10);
}

TEST_CASE("marginalizing", "[sfs]") {
    Sfs s (joint_counts, joint_dims, 40.0);

    Sfs pop0 = s.marginalize(vector<size_t>{0});
    CHECK(pop0.npops() == 1);
    CHECK(pop0.counts().data() == vector<double>({20, 9, 11}));
    CHECK(pop0.has_length());
    CHECK(pop0.length() == 40.0);

    Sfs pop1 = s.marginalize();
    CHECK(pop1.counts().data() == vector<double>({21, 8, 11}));

    Sfs both = s.marginalize(vector<size_t>{0, 1});
    CHECK(both.counts() == s.counts());

    Sfs all = s.marginalize(vector<size_t>());
    CHECK(all.npops() == 0);
    CHECK(all.at(Sfs::Index()) == s.total());

    CHECK_THROWS_AS(s.marginalize(vector<size_t>{2}), DomainError);
    CHECK_THROWS_AS(pop0.marginalize(), DomainError);
}

TEST_CASE("statistics check the number of populations", "[sfs]") {
    Sfs s (joint_counts, joint_dims);
    CHECK_NOTHROW(s.require_npops(2, "D_xy"));
    CHECK_THROWS_AS(s.require_npops(1, "theta_pi"), DomainError);
    CHECK_THROWS_AS(s.require_npops(1, "theta_pi"), std::domain_error);
}

TEST_CASE("printing a spectrum", "[sfs]") {
    Sfs s (vector<double>{0, 3, 5.5, 2, 0});
    stringstream ss;
    ss << s;
    CHECK(ss.str() == "0 3 5.5 2 0");
}
