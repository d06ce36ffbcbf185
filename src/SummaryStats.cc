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

#include "diversity.h"
#include "SummaryStats.h"

vector<pair<size_t, size_t> >
population_pairs(size_t npops)
{
    vector<pair<size_t, size_t> > pairs;

    for (size_t i = 0; i < npops; i++)
        for (size_t j = i + 1; j < npops; j++)
            pairs.push_back(make_pair(i, j));

    return pairs;
}

vector<double>
big_summary(Sfs& sfs, bool persite, bool dxy)
{
    sfs.assume_length();

    vector<pair<size_t, size_t> > pairs = population_pairs(sfs.npops());

    vector<double> stats;
    stats.reserve(1 + PopSummarySize * sfs.npops() + pairs.size() * (dxy ? 2 : 1));
    stats.push_back(sfs.length());

    //
    // One-population statistics, on each marginal spectrum.
    //
    for (size_t p = 0; p < sfs.npops(); p++) {
        Sfs m = sfs.marginalize(vector<size_t>(1, p));

        stats.push_back(theta_pi(m, persite));
        stats.push_back(theta_w(m, persite));
        stats.push_back(theta_zeta(m, persite));
        stats.push_back(tajima_D(m));
        stats.push_back(fuli_D(m));
        stats.push_back(d_xy(m, persite));
    }

    //
    // Two-population statistics, on each joint spectrum.
    //
    vector<size_t> keep (2);
    for (const pair<size_t, size_t>& pp : pairs) {
        keep[0] = pp.first;
        keep[1] = pp.second;
        stats.push_back(f_st(sfs.marginalize(keep)));
    }

    if (dxy) {
        for (const pair<size_t, size_t>& pp : pairs) {
            keep[0] = pp.first;
            keep[1] = pp.second;
            stats.push_back(D_xy(sfs.marginalize(keep)));
        }
    }

    return stats;
}

vector<string>
summary_labels(size_t npops, bool dxy)
{
    static const char* pop_stats[PopSummarySize] =
        {"theta_pi", "theta_w", "theta_zeta", "tajima_D", "fuli_D", "d_xy"};

    vector<pair<size_t, size_t> > pairs = population_pairs(npops);

    vector<string> labels;
    labels.push_back("L");

    for (size_t p = 0; p < npops; p++)
        for (size_t i = 0; i < PopSummarySize; i++)
            labels.push_back(string(pop_stats[i]) + "_" + std::to_string(p));

    for (const pair<size_t, size_t>& pp : pairs)
        labels.push_back("f_st_" + std::to_string(pp.first) + "_" + std::to_string(pp.second));

    if (dxy)
        for (const pair<size_t, size_t>& pp : pairs)
            labels.push_back("D_xy_" + std::to_string(pp.first) + "_" + std::to_string(pp.second));

    return labels;
}
