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

#ifndef __SFS_H__
#define __SFS_H__

#include <stdexcept>
#include <string>
#include <vector>
#include <utility>
#include <iostream>

#include "constants.h"
#include "NdArray.h"

//
// Thrown when a statistic is computed on a spectrum of unsupported
// dimensionality.
//
class DomainError: public std::domain_error {
public:
    explicit DomainError(const string& what) : std::domain_error(what) {}
};

/*
 * Sfs
 * ==========
 * A site frequency spectrum: one axis per population, where index i
 * along an axis counts the sites with i derived alleles out of the
 * (axis length - 1) chromosomes sampled in that population.
 *
 * The number of populations and the sample sizes are derived from the
 * shape of the count table. The total sequence length L is optional.
 */
class Sfs {
    NdArray<double> counts_;
    vector<size_t>  pop_sizes_;
    bool            has_length_;
    double          length_;

    void reset_pop_sizes();

public:
    typedef vector<size_t> Index;

    // Wraps [counts], reshaped into [dims] if [dims] is not empty
    // (ShapeError if the number of cells differs, or if an axis is
    // empty). The spectrum is then repolarized if requested.
    Sfs(const NdArray<double>& counts,
        const vector<size_t>& dims = vector<size_t>(),
        bool repolarize = false);
    Sfs(const vector<double>& counts,
        const vector<size_t>& dims = vector<size_t>(),
        bool repolarize = false);

    // As above, followed by set_length(L).
    Sfs(const vector<double>& counts,
        const vector<size_t>& dims,
        double L,
        bool repolarize = false);

    const NdArray<double>& counts()    const {return counts_;}
    const vector<size_t>&  shape()     const {return counts_.shape();}
    const vector<size_t>&  pop_sizes() const {return pop_sizes_;}
    size_t npops() const {return counts_.ndim();}
    bool   is_1d() const {return counts_.ndim() == 1;}
    double total() const {return counts_.sum();}

    bool   has_length() const {return has_length_;}
    double length()     const {return length_;}

    // Per-site denominator: L if requested and known, 1.0 otherwise.
    double site_denom(bool persite) const {return persite && has_length_ ? length_ : 1.0;}

    double operator[](size_t i) const {return counts_[i];}
    double at(const Index& idx) const {return counts_.at(idx);}

    // Throws DomainError unless the spectrum has exactly [n] populations.
    void require_npops(size_t n, const string& stat) const;

    //
    // Shape compatibility. Multi-dimensional spectra match only the same
    // dimensions, axis by axis; a 1-D spectrum also matches any dimensions
    // with the same number of cells.
    //
    bool match_dims(const vector<size_t>& query_dims) const;

    //
    // Sequence length. If L exceeds the observed number of sites, the
    // difference is added to the fixed ancestral cell.
    //
    void set_length(double L);
    void clear_length() {has_length_ = false; length_ = 0.0;}
    void assume_length() {has_length_ = true; length_ = total();}

    // Returns the {fixed ancestral, fixed derived} corner indexes.
    pair<Index, Index> corner_mask() const;
    Sfs mask_corners() const;

    // Swaps ancestral and derived states, in place.
    void repolarize();

    long count_segsites() const;

    // Sums over every population not in [keep].
    Sfs marginalize(const vector<size_t>& keep = vector<size_t>(1, 1)) const;

    friend ostream& operator<< (ostream& os, const Sfs& sfs);
};

#endif // __SFS_H__
