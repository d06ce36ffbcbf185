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
#include <limits>

#include "utils.h"
#include "diversity.h"

//
// Below this total weight, a set of bins is considered empty.
//
const double min_bin_weight = 1e-9;

double
harmonic_a1(size_t n)
{
    double a = 0.0;
    for (size_t i = 1; i < n; i++)
        a += 1.0 / (double) i;
    return a;
}

double
harmonic_a2(size_t n)
{
    double a = 0.0;
    for (size_t i = 1; i < n; i++)
        a += 1.0 / ((double) i * (double) i);
    return a;
}

double
tajima_e1(size_t n)
{
    double a1 = harmonic_a1(n);
    double dn = (double) n;

    double b1 = (dn + 1) / (3 * (dn - 1));
    double c1 = b1 - 1.0 / a1;

    return c1 / a1;
}

double
tajima_e2(size_t n)
{
    double a1 = harmonic_a1(n);
    double a2 = harmonic_a2(n);
    double dn = (double) n;

    double b2 = (2 * (dn * dn + dn + 3)) / (9 * dn * (dn - 1));
    double c2 = b2 - (dn + 2) / (a1 * dn) + a2 / (a1 * a1);

    return c2 / (a1 * a1 + a2);
}

double
fuli_C(size_t n)
{
    if (n == 2)
        return 1.0;

    double dn = (double) n;
    return 2 * ((dn * harmonic_a1(n) - 2 * (dn - 1)) / ((dn - 1) * (dn - 2)));
}

double
d_xy(const Sfs& sfs, bool persite)
{
    sfs.require_npops(1, "d_xy");

    //
    // Mean number of derived alleles per site, relative to the sample size.
    //
    double dxy = 0.0;
    for (size_t i = 0; i < sfs.counts().size(); i++)
        dxy += sfs[i] * (double) i;
    dxy = dxy / (double) sfs.pop_sizes()[0];

    return dxy / sfs.site_denom(persite);
}

double
theta_pi(const Sfs& sfs, bool persite, bool norm)
{
    sfs.require_npops(1, "theta_pi");

    //
    // Tajima's estimator, from the average number of pairwise differences:
    //   pi = Sum_i( i * (n - i) * sfs[i] ) / (n choose 2)
    //
    size_t n     = sfs.pop_sizes()[0];
    double pairs = binomial_coeff(n, 2);

    double pihat = 0.0;
    for (size_t i = 0; i <= n; i++)
        pihat += sfs[i] * (double) (n - i) * (double) i / pairs;

    pihat = pihat / sfs.site_denom(persite);

    if (norm)
        return pihat / d_xy(sfs, persite);

    return pihat;
}

double
theta_w(const Sfs& sfs, bool persite)
{
    sfs.require_npops(1, "theta_w");

    size_t n = sfs.pop_sizes()[0];

    return ((double) sfs.count_segsites() / harmonic_a1(n)) / sfs.site_denom(persite);
}

double
theta_zeta(const Sfs& sfs, bool persite)
{
    sfs.require_npops(1, "theta_zeta");

    Sfs::Index singletons (1, 1);

    return sfs.at(singletons) / sfs.site_denom(persite);
}

double
tajima_D(const Sfs& sfs)
{
    sfs.require_npops(1, "Tajima's D");

    size_t n  = sfs.pop_sizes()[0];
    double tp = theta_pi(sfs);
    double tw = theta_w(sfs);
    double S  = (double) sfs.count_segsites();

    double denom = sqrt(tajima_e1(n) * S + tajima_e2(n) * S * (S - 1));

    return (tp - tw) / denom;
}

bool
fuli_F(const Sfs&, double&)
{
    return false;
}

double
fuli_D(const Sfs& sfs)
{
    sfs.require_npops(1, "Fu and Li's D");

    size_t n  = sfs.pop_sizes()[0];
    double dn = (double) n;
    double a1 = harmonic_a1(n);
    double a2 = harmonic_a2(n);

    double nu = 1 + (a1 * a1) / (a2 + a1 * a1) * (fuli_C(n) - (dn + 1) / (dn - 1));
    double uu = a1 - 1 - nu;

    double zeta = theta_zeta(sfs);
    double S    = (double) sfs.count_segsites();

    double num = S - zeta * a1;
    double den = sqrt(S * uu + S * S * nu);

    return num / den;
}

double
D_xy(const Sfs& sfs, bool persite)
{
    sfs.require_npops(2, "D_xy");

    //
    // Average number of pairwise differences between the two populations.
    //
    size_t nx = sfs.shape()[0];
    size_t ny = sfs.shape()[1];
    double N  = (double) nx * (double) ny;

    double pihat = 0.0;
    Sfs::Index cell (2);
    for (size_t i = 0; i < nx; i++) {
        cell[0] = i;
        for (size_t j = 0; j < ny; j++) {
            cell[1] = j;
            double S  = (double) (nx - 1 - i) * (double) j;
            double Sp = (double) i * (double) (ny - 1 - j);
            pihat += (sfs.at(cell) * S + sfs.at(cell) * Sp) / N;
        }
    }

    return pihat / sfs.site_denom(persite);
}

double
f_st(const Sfs& sfs, bool weighted)
{
    sfs.require_npops(2, "F_st");

    double N1 = (double) sfs.pop_sizes()[0];
    double N2 = (double) sfs.pop_sizes()[1];

    //
    // Weight each cell by its share of the polymorphic sites.
    //
    NdArray<double> est0 = sfs.mask_corners().counts();
    double wsum = est0.sum();
    if (fabs(wsum) < min_bin_weight)
        return numeric_limits<double>::quiet_NaN();
    est0 /= wsum;

    //
    // For allele counts (a1, a2), with p = a/N and q = 1 - p:
    //   alpha_k = 1 - (p_k^2 + q_k^2)
    //   alpha   = d - (N1 + N2) * h / (4 * N1 * N2 * (N1 + N2 - 1))
    //   ab      = d + (4 * N1 * N2 - N1 - N2) * h / (4 * N1 * N2 * (N1 + N2 - 1))
    // where d = ((p1 - p2)^2 + (q1 - q2)^2) / 2 and h = N1 * alpha_1 + N2 * alpha_2.
    //
    double fst_u = 0.0;
    double num   = 0.0;
    double den   = 0.0;
    double norm  = 4 * N1 * N2 * (N1 + N2 - 1);

    Sfs::Index cell (2);
    for (size_t a1 = 0; a1 <= sfs.pop_sizes()[0]; a1++) {
        cell[0] = a1;
        for (size_t a2 = 0; a2 <= sfs.pop_sizes()[1]; a2++) {
            cell[1] = a2;

            double p1 = (double) a1 / N1;
            double p2 = (double) a2 / N2;
            double q1 = 1 - p1;
            double q2 = 1 - p2;
            double alpha1 = 1 - (p1 * p1 + q1 * q1);
            double alpha2 = 1 - (p2 * p2 + q2 * q2);

            double d  = 0.5 * ((p1 - p2) * (p1 - p2) + (q1 - q2) * (q1 - q2));
            double h  = N1 * alpha1 + N2 * alpha2;
            double al = d - (N1 + N2) * h / norm;
            double ab = d + (4 * N1 * N2 - N1 - N2) * h / norm;

            double w = est0.at(cell);

            double gamma = w * (al / ab);
            if (std::isfinite(gamma))
                fst_u += gamma;
            if (std::isfinite(w * al))
                num += w * al;
            if (std::isfinite(w * ab))
                den += w * ab;
        }
    }

    return weighted ? num / den : fst_u;
}

double
wc_f_st(const Sfs& sfs)
{
    if (sfs.npops() < 2)
        throw DomainError("F_st is only defined for spectra of 2 or more populations (this spectrum has "
                          + std::to_string(sfs.npops()) + ")");

    //
    // Quantities determined only by the sample sizes.
    //
    const vector<size_t>& n = sfs.pop_sizes();
    double r      = (double) n.size();
    double nbar   = 0.0;
    double sum_n2 = 0.0;
    for (size_t k = 0; k < n.size(); k++) {
        nbar   += (double) n[k];
        sum_n2 += (double) n[k] * (double) n[k];
    }
    nbar = nbar / r;
    double nc = (r * nbar - sum_n2 / (r * nbar)) / (r - 1);

    //
    // Everything else is computed once per bin, where the index of each bin is
    // also its tuple of allele counts. The first and last bins are the corners
    // of the spectrum, and are left out.
    //
    const NdArray<double>& counts = sfs.counts();
    double total = counts.sum();
    double wsum  = 0.0;
    double fst   = 0.0;
    vector<double> p (n.size());

    for (size_t ii = 1; ii + 1 < counts.size(); ii++) {
        double w = counts[ii] / total;

        Sfs::Index cell = counts.unravel(ii);
        double pbar = 0.0;
        double hbar = 0.0;
        for (size_t k = 0; k < n.size(); k++) {
            p[k]  = (double) cell[k] / (double) n[k];
            pbar += p[k];
            hbar += 1 - p[k] * p[k];
        }
        pbar = pbar / r;
        hbar = hbar / r;

        double s2 = 0.0;
        for (size_t k = 0; k < n.size(); k++)
            s2 += (p[k] - pbar) * (p[k] - pbar);
        s2 = s2 / r;

        double a = (nbar / nc) * (s2 - (1 / (nbar - 1)) * (pbar * (1 - pbar) - s2 * (r - 1) / r - hbar / 4));
        double b = (nbar / (nbar - 1)) * (pbar * (1 - pbar) - s2 * (r - 1) / r - hbar * (2 * nbar - 1) / (4 * nbar));
        double c = hbar / 2;

        wsum += w;
        fst  += w * (a / (a + b + c));
    }

    if (wsum < min_bin_weight)
        return numeric_limits<double>::quiet_NaN();

    return fst / wsum;
}
