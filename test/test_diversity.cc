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


#include <cmath>

#include <catch2/catch.hpp>

#include "diversity.h"

namespace {

const vector<double> four_chrom {0, 3, 5, 2, 0};

const vector<double> joint_counts {10, 2, 1,
                                   3,  4, 2,
                                   1,  2, 8};
const vector<size_t> joint_dims {3, 3};

}

TEST_CASE("coefficients", "[diversity]") {
    CHECK(harmonic_a1(4) == Approx(1.0 + 1.0/2 + 1.0/3));
    CHECK(harmonic_a2(4) == Approx(1.0 + 1.0/4 + 1.0/9));
    CHECK(harmonic_a1(1) == 0.0);
    CHECK(tajima_e1(4) == Approx(0.005509641873278212));
    CHECK(tajima_e2(4) == Approx(0.002690001620482903));
    CHECK(fuli_C(2) == 1.0);
    CHECK(fuli_C(4) == Approx(4.0 / 9.0));
}

TEST_CASE("one-population estimators", "[diversity]") {
    Sfs s (four_chrom);

    CHECK(theta_zeta(s) == 3.0);
    CHECK(theta_w(s) == Approx(10.0 / (1.0 + 1.0/2 + 1.0/3)));
    CHECK(theta_w(s) == Approx(5.4545).epsilon(1e-4));
    CHECK(theta_pi(s) == Approx(35.0 / 6.0));
    CHECK(d_xy(s) == Approx(4.75));
    CHECK(theta_pi(s, false, true) == Approx(35.0 / 6.0 / 4.75));
    CHECK(tajima_D(s) == Approx(0.6948229914578099));
    CHECK(fuli_D(s) == Approx(1.0052455376663174));
}

TEST_CASE("per-site estimates", "[diversity]") {
    SECTION("without a length, per-site estimates are unscaled") {
        Sfs s (four_chrom);
        CHECK(theta_pi(s, true) == Approx(theta_pi(s)));
        CHECK(theta_w(s, true) == Approx(theta_w(s)));
    }

    SECTION("with a length") {
        Sfs s (four_chrom, vector<size_t>(), 20.0);
        CHECK(theta_pi(s, true) == Approx(35.0 / 6.0 / 20.0));
        CHECK(theta_w(s, true) == Approx(10.0 / (1.0 + 1.0/2 + 1.0/3) / 20.0));
        CHECK(theta_zeta(s, true) == Approx(3.0 / 20.0));
        CHECK(d_xy(s, true) == Approx(4.75 / 20.0));
        // The ratio is not affected by the length.
        CHECK(theta_pi(s, true, true) == Approx(35.0 / 6.0 / 4.75));
        // Monomorphic sites are ignored by the unscaled estimators.
        CHECK(theta_pi(s) == Approx(35.0 / 6.0));
        CHECK(tajima_D(s) == Approx(0.6948229914578099));
    }
}

TEST_CASE("degenerate spectra give non-finite values", "[diversity]") {
    Sfs s (vector<double>{7, 0, 0, 0, 3});
    CHECK(theta_w(s) == 0.0);
    CHECK_FALSE(std::isfinite(tajima_D(s)));
}

TEST_CASE("Fu and Li's F is not available", "[diversity]") {
    Sfs s (four_chrom);
    double F = -1.0;
    CHECK_FALSE(fuli_F(s, F));
    CHECK(F == -1.0);
}

TEST_CASE("two-population estimators", "[diversity]") {
    Sfs s (joint_counts, joint_dims);

    CHECK(D_xy(s) == Approx(34.0 / 9.0));

    double fst  = f_st(s);
    double fstu = f_st(s, false);
    CHECK(fst == Approx(1.0 / 3.0));
    CHECK(fstu == Approx(0.24444444444444446));
    CHECK(fst >= -1.0);
    CHECK(fst <= 1.0);
    CHECK(fstu >= -1.0);
    CHECK(fstu <= 1.0);

    CHECK(wc_f_st(s) == Approx(0.2126984126984127));

    SECTION("the corners carry no weight") {
        Sfs l (joint_counts, joint_dims, 66.0);
        CHECK(f_st(l) == Approx(fst));
        CHECK(f_st(l, false) == Approx(fstu));
        CHECK(D_xy(l) == Approx(34.0 / 9.0));
        CHECK(D_xy(l, true) == Approx(34.0 / 9.0 / 66.0));
    }
}

TEST_CASE("F_st of a spectrum without polymorphism", "[diversity]") {
    Sfs s (vector<double>{5, 0, 0,
                          0, 0, 0,
                          0, 0, 7}, vector<size_t>{3, 3});
    CHECK(std::isnan(f_st(s)));
    CHECK(std::isnan(f_st(s, false)));
}

TEST_CASE("estimators check the number of populations", "[diversity]") {
    Sfs one (four_chrom);
    Sfs two (joint_counts, joint_dims);

    CHECK_THROWS_AS(theta_pi(two), DomainError);
    CHECK_THROWS_AS(theta_w(two), DomainError);
    CHECK_THROWS_AS(theta_zeta(two), DomainError);
    CHECK_THROWS_AS(tajima_D(two), DomainError);
    CHECK_THROWS_AS(fuli_D(two), DomainError);
    CHECK_THROWS_AS(d_xy(two), DomainError);

    CHECK_THROWS_AS(D_xy(one), DomainError);
    CHECK_THROWS_AS(f_st(one), DomainError);
    CHECK_THROWS_AS(wc_f_st(one), DomainError);

    Sfs three (vector<double>(27, 1.0), vector<size_t>{3, 3, 3});
    CHECK_THROWS_AS(f_st(three), DomainError);
    CHECK(std::isfinite(wc_f_st(three)));
}
