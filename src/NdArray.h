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

#ifndef __NDARRAY_H__
#define __NDARRAY_H__

#include <stdexcept>
#include <sstream>
#include <string>
#include <vector>
#include <set>

#include "constants.h"

//
// Thrown when a buffer cannot be viewed with the requested shape.
//
class ShapeError: public std::length_error {
public:
    explicit ShapeError(const string& what) : std::length_error(what) {}
};

inline
size_t shape_product(const vector<size_t>& shape) {
    size_t n = 1;
    for (size_t d : shape)
        n *= d;
    return n;
}

// Returns e.g. "(4,5)".
inline
string shape_str(const vector<size_t>& shape) {
    stringstream ss;
    ss << "(";
    for (size_t i = 0; i < shape.size(); i++) {
        if (i > 0) ss << ",";
        ss << shape[i];
    }
    ss << ")";
    return ss.str();
}

/*
 * NdArray
 * ==========
 * A dense, row-major array whose rank is only known at runtime. A
 * rank-0 array holds exactly one element.
 */
template<typename T>
class NdArray {
    vector<size_t> shape_;
    vector<size_t> strides_;
    vector<T>      data_;

    void reset_strides();

public:
    NdArray() : shape_(), strides_(), data_(1, T()) {}
    NdArray(const vector<size_t>& shape, const T& fill = T());
    NdArray(const vector<T>& data, const vector<size_t>& shape);
    explicit NdArray(const vector<T>& data);

    const vector<size_t>& shape() const {return shape_;}
    const vector<T>&      data()  const {return data_;}
    size_t ndim() const {return shape_.size();}
    size_t size() const {return data_.size();}

    T&       operator[](size_t i)       {return data_[i];}
    const T& operator[](size_t i) const {return data_[i];}

    T&       at(const vector<size_t>& idx)       {return data_[ravel(idx)];}
    const T& at(const vector<size_t>& idx) const {return data_[ravel(idx)];}

    // Conversions between a multi-index and its flat, row-major offset.
    size_t         ravel(const vector<size_t>& idx) const;
    vector<size_t> unravel(size_t i) const;

    // Throws ShapeError unless the element count is preserved.
    void reshape(const vector<size_t>& shape);

    // Maps every index i to (shape - 1 - i), on all axes at once.
    void reverse();

    T sum() const;

    // Sums over the given axes; the remaining axes keep their order.
    NdArray<T> sum_over(const vector<size_t>& axes) const;

    NdArray<T>& operator/=(const T& x) {for (T& v : data_) v /= x; return *this;}

    bool operator==(const NdArray<T>& other) const
        {return shape_ == other.shape_ && data_ == other.data_;}
    bool operator!=(const NdArray<T>& other) const
        {return !operator==(other);}
};

template<typename T>
NdArray<T>::NdArray(const vector<size_t>& shape, const T& fill)
    : shape_(shape), strides_(), data_(shape_product(shape), fill)
{
    this->reset_strides();
}

template<typename T>
NdArray<T>::NdArray(const vector<T>& data, const vector<size_t>& shape)
    : shape_(shape), strides_(), data_(data)
{
    if (shape_product(shape_) != data_.size())
        throw ShapeError("Cannot reshape array of size " + std::to_string(data_.size())
                         + " into shape " + shape_str(shape_));
    this->reset_strides();
}

template<typename T>
NdArray<T>::NdArray(const vector<T>& data)
    : shape_(1, data.size()), strides_(), data_(data)
{
    this->reset_strides();
}

template<typename T>
void
NdArray<T>::reset_strides()
{
    this->strides_.assign(this->shape_.size(), 1);
    for (size_t i = this->shape_.size(); i > 1; i--)
        this->strides_[i - 2] = this->strides_[i - 1] * this->shape_[i - 1];
}

template<typename T>
size_t
NdArray<T>::ravel(const vector<size_t>& idx) const
{
    if (idx.size() != this->shape_.size())
        throw std::out_of_range("NdArray: index of rank " + std::to_string(idx.size())
                                + " for array of shape " + shape_str(this->shape_));
    size_t offset = 0;
    for (size_t d = 0; d < idx.size(); d++) {
        if (idx[d] >= this->shape_[d])
            throw std::out_of_range("NdArray: index " + std::to_string(idx[d])
                                    + " is out of bounds for axis " + std::to_string(d)
                                    + " of shape " + shape_str(this->shape_));
        offset += idx[d] * this->strides_[d];
    }
    return offset;
}

template<typename T>
vector<size_t>
NdArray<T>::unravel(size_t i) const
{
    vector<size_t> idx(this->shape_.size());
    for (size_t d = 0; d < this->shape_.size(); d++) {
        idx[d] = i / this->strides_[d];
        i     %= this->strides_[d];
    }
    return idx;
}

template<typename T>
void
NdArray<T>::reshape(const vector<size_t>& shape)
{
    if (shape_product(shape) != this->data_.size())
        throw ShapeError("Cannot reshape array of shape " + shape_str(this->shape_)
                         + " into shape " + shape_str(shape));
    this->shape_ = shape;
    this->reset_strides();
}

template<typename T>
void
NdArray<T>::reverse()
{
    //
    // Work from a snapshot; writing in place would read back cells that
    // have already been overwritten.
    //
    const vector<T> old (this->data_);
    size_t n = old.size();

    for (size_t i = 0; i < n; i++)
        this->data_[n - 1 - i] = old[i];
}

template<typename T>
T
NdArray<T>::sum() const
{
    T s = T();
    for (const T& v : this->data_)
        s += v;
    return s;
}

template<typename T>
NdArray<T>
NdArray<T>::sum_over(const vector<size_t>& axes) const
{
    set<size_t> summed;
    for (size_t a : axes) {
        if (a >= this->shape_.size())
            throw std::out_of_range("NdArray: axis " + std::to_string(a)
                                    + " is out of bounds for array of shape " + shape_str(this->shape_));
        summed.insert(a);
    }

    vector<size_t> kept;
    for (size_t d = 0; d < this->shape_.size(); d++)
        if (summed.count(d) == 0)
            kept.push_back(d);

    vector<size_t> new_shape;
    for (size_t d : kept)
        new_shape.push_back(this->shape_[d]);

    NdArray<T> result (new_shape, T());

    vector<size_t> sub (kept.size());
    for (size_t i = 0; i < this->data_.size(); i++) {
        vector<size_t> idx = this->unravel(i);
        for (size_t k = 0; k < kept.size(); k++)
            sub[k] = idx[kept[k]];
        result.data_[result.ravel(sub)] += this->data_[i];
    }

    return result;
}

#endif // __NDARRAY_H__
