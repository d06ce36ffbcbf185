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

#ifndef __SUMMARYSTATS_H__
#define __SUMMARYSTATS_H__

#include <string>
#include <utility>
#include <vector>

#include "constants.h"
#include "Sfs.h"

//
// Number of one-population statistics reported per population by
// big_summary(): theta_pi, theta_w, theta_zeta, Tajima's D, Fu & Li's D
// and d_xy.
//
const size_t PopSummarySize = 6;

// All unordered pairs of populations (i < j), in lexicographic order.
vector<pair<size_t, size_t> > population_pairs(size_t npops);

//
// Builds a flat vector of one- and two-population statistics, for use
// as a feature vector in downstream analyses:
//
//   [L,
//    per population: theta_pi, theta_w, theta_zeta, tajima_D, fuli_D, d_xy,
//    per pair:       f_st,
//    per pair:       D_xy (only if [dxy])]
//
// The length of [sfs] is first reset to its number of sites.
//
vector<double> big_summary(Sfs& sfs, bool persite = false, bool dxy = false);

// Column names matching the output of big_summary().
vector<string> summary_labels(size_t npops, bool dxy = false);

#endif // __SUMMARYSTATS_H__
