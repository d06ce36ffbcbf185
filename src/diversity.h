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

#ifndef __DIVERSITY_H__
#define __DIVERSITY_H__

#include "constants.h"
#include "Sfs.h"

//
// Diversity and differentiation estimators computed from a site
// frequency spectrum.
//
// Statistics taking a [persite] flag divide their result by the
// spectrum's length L when it is set, and leave it unscaled otherwise.
// Degenerate spectra (e.g. no segregating sites) yield NaN or Inf
// rather than an error.
//

//
// One-population statistics. DomainError if sfs.npops() != 1.
//
double d_xy(const Sfs& sfs, bool persite = false);
double theta_pi(const Sfs& sfs, bool persite = false, bool norm = false);
double theta_w(const Sfs& sfs, bool persite = false);
double theta_zeta(const Sfs& sfs, bool persite = false);
double tajima_D(const Sfs& sfs);
double fuli_D(const Sfs& sfs);

// Fu & Li's F is not implemented: always returns false and leaves [F]
// untouched.
bool   fuli_F(const Sfs& sfs, double& F);

//
// Two-population statistics. DomainError if sfs.npops() != 2.
//
double D_xy(const Sfs& sfs, bool persite = false);

// Ratio-of-averages (weighted) or average-of-ratios (unweighted) F_st,
// as in ANGSD. NaN if the spectrum has no polymorphic sites.
double f_st(const Sfs& sfs, bool weighted = true);

//
// Weir & Cockerham's (1984) F_st, averaged over the bins of the
// spectrum. Defined for two or more populations.
//
double wc_f_st(const Sfs& sfs);

//
// Coefficients, as functions of the sample size n.
//
double harmonic_a1(size_t n); // Sum_{i=1}^{n-1} 1/i
double harmonic_a2(size_t n); // Sum_{i=1}^{n-1} 1/i^2
double tajima_e1(size_t n);
double tajima_e2(size_t n);
double fuli_C(size_t n);

#endif // __DIVERSITY_H__
