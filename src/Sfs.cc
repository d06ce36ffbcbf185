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

#include <algorithm>

#include "utils.h"
#include "Sfs.h"

Sfs::Sfs(const NdArray<double>& counts, const vector<size_t>& dims, bool repolarize)
    : counts_(counts), pop_sizes_(), has_length_(false), length_(0.0)
{
    if (!dims.empty())
        this->counts_.reshape(dims);

    this->reset_pop_sizes();

    if (repolarize)
        this->repolarize();
}

Sfs::Sfs(const vector<double>& counts, const vector<size_t>& dims, bool repolarize)
    : Sfs(NdArray<double>(counts), dims, repolarize)
{
}

Sfs::Sfs(const vector<double>& counts, const vector<size_t>& dims, double L, bool repolarize)
    : Sfs(NdArray<double>(counts), dims, repolarize)
{
    this->set_length(L);
}

void
Sfs::reset_pop_sizes()
{
    this->pop_sizes_.clear();
    for (size_t n : this->counts_.shape()) {
        if (n == 0)
            throw ShapeError("Spectrum axes need at least one bin, got shape "
                             + shape_str(this->counts_.shape()));
        this->pop_sizes_.push_back(n - 1);
    }
}

void
Sfs::require_npops(size_t n, const string& stat) const
{
    if (this->npops() != n)
        throw DomainError(stat + " is only defined for " + std::to_string(n)
                          + "-population spectra (this spectrum has "
                          + std::to_string(this->npops()) + ")");
}

bool
Sfs::match_dims(const vector<size_t>& query_dims) const
{
    const vector<size_t>& shape = this->shape();

    if (query_dims.size() == shape.size())
        return query_dims == shape;

    //
    // A flat spectrum can still be reshaped into [query_dims].
    //
    if (shape.size() == 1)
        return shape_product(query_dims) == shape_product(shape);

    return false;
}

void
Sfs::set_length(double L)
{
    double obs = this->total();

    if (L > obs) {
        Index fixed_anc (this->npops(), 0);
        this->counts_.at(fixed_anc) += L - obs;
    }

    this->has_length_ = true;
    this->length_     = L;
}

pair<Sfs::Index, Sfs::Index>
Sfs::corner_mask() const
{
    Index fixed_anc (this->npops(), 0);
    Index fixed_der (this->shape());
    for (size_t& i : fixed_der)
        i--;

    return make_pair(fixed_anc, fixed_der);
}

Sfs
Sfs::mask_corners() const
{
    pair<Index, Index> corners = this->corner_mask();

    Sfs masked (*this);
    masked.counts_.at(corners.first)  = 0.0;
    masked.counts_.at(corners.second) = 0.0;

    return masked;
}

void
Sfs::repolarize()
{
    this->counts_.reverse();
}

long
Sfs::count_segsites() const
{
    pair<Index, Index> corners = this->corner_mask();

    return (long) (this->total() - this->at(corners.first) - this->at(corners.second));
}

Sfs
Sfs::marginalize(const vector<size_t>& keep) const
{
    for (size_t p : keep)
        if (p >= this->npops())
            throw DomainError("Cannot keep population " + std::to_string(p)
                              + " of a " + std::to_string(this->npops()) + "-population spectrum");

    vector<size_t> sum_over;
    for (size_t p = 0; p < this->npops(); p++)
        if (find(keep.begin(), keep.end(), p) == keep.end())
            sum_over.push_back(p);

    Sfs marginal (this->counts_.sum_over(sum_over));
    marginal.has_length_ = this->has_length_;
    marginal.length_     = this->length_;

    return marginal;
}

ostream&
operator<< (ostream& os, const Sfs& sfs)
{
    const vector<double>& data = sfs.counts().data();
    join(data, " ", os);
    return os;
}
