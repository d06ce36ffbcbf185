// -*-mode:c++; c-style:k&r; c-basic-offset:4;-*-
//
// Copyright 2010-2017, Julian Catchen <jcatchen@illinois.edu>
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

//
// utils.cc -- common routines needed in multiple object files.
//
#include <cstring>
#include <cctype>
#include <new>

#include "utils.h"

int
is_integer(const char *str)
{
    //
    // Adapted from the strtol manpage.
    //
    char *endptr;

    // To distinguish success/failure after call
    errno = 0;
    long val = strtol(str, &endptr, 10);

    //
    // Check for various possible errors
    //
    if ((errno == ERANGE && (val == LONG_MAX || val == LONG_MIN))
        || (errno != 0 && val == 0)) {
        return -1;
    }

    if (endptr == str || *endptr != '\0')
        return -1;

    return (int) val;
}

double
is_double(const char *str)
{
    //
    // Adapted from the strtol manpage.
    //
    char *endptr;

    // To distinguish success/failure after call
    errno = 0;
    double val = strtod(str, &endptr);

    //
    // Check for various possible errors
    //
    if ((errno == ERANGE && (val == HUGE_VAL || val == -HUGE_VAL))
        || (errno != 0 && val == 0)) {
        return -1;
    }

    if (endptr == str || *endptr != '\0')
        return -1;

    return val;
}

long
parse_integer(const char *str)
{
    char *endptr;
    errno = 0;
    long val = strtol(str, &endptr, 10);

    if (errno == ERANGE || endptr == str || *endptr != '\0')
        throw std::invalid_argument(string("Not an integer: '") + str + "'");

    return val;
}

double
parse_double(const char *str)
{
    char *endptr;
    errno = 0;
    double val = strtod(str, &endptr);

    if ((errno == ERANGE && (val == HUGE_VAL || val == -HUGE_VAL))
        || endptr == str || *endptr != '\0')
        throw std::invalid_argument(string("Not a number: '") + str + "'");

    return val;
}

bool
parse_size_list(const string& arg, vector<size_t>& list, bool positive)
{
    list.clear();
    vector<string> parts = split(arg, ',');
    if (parts.empty())
        return false;

    for (const string& p : parts) {
        long i;
        try {
            i = parse_integer(p.c_str());
        } catch (const std::invalid_argument&) {
            list.clear();
            return false;
        }
        if (i < 0 || (positive && i == 0)) {
            list.clear();
            return false;
        }
        list.push_back((size_t) i);
    }

    return true;
}

double
binomial_coeff(double n, double k)
{
    if (n < k) return 0.0;
    //
    // Compute the binomial coefficient using the method of:
    // Y. Manolopoulos, "Binomial coefficient computation: recursion or iteration?",
    // ACM SIGCSE Bulletin, 34(4):65-67, 2002.
    //
    double r = 1.0;
    double s = (k < n - k) ? n - k + 1 : k + 1;

    for (double i = n; i >= s; i--)
        r = r * i / (n - i + 1);

    return r;
}

vector<string>
split(const string& s, char sep)
{
    vector<string> parts;

    if (s.empty())
        return parts;

    if (sep == '\0') {
        size_t i = 0;
        while (i < s.length()) {
            while (i < s.length() && isspace((unsigned char) s[i]))
                i++;
            if (i == s.length())
                break;
            size_t j = i;
            while (j < s.length() && !isspace((unsigned char) s[j]))
                j++;
            parts.push_back(s.substr(i, j - i));
            i = j;
        }
    } else {
        size_t start = 0;
        size_t pos;
        while ((pos = s.find(sep, start)) != string::npos) {
            parts.push_back(s.substr(start, pos - start));
            start = pos + 1;
        }
        parts.push_back(s.substr(start));
    }

    return parts;
}

VersatileLineReader::VersatileLineReader(const string& path)
        : path_(path)
        , line_number_(0)
        , is_gzipped_(guess_file_type(path) == FileT::gztable)
        , ifs_()
        , ifsbuffer_()
        , gzfile_(NULL)
        , gzbuffer_(NULL)
        , gzbuffer_size_(0)
        , gzline_len_(0)
{
    if (is_gzipped_) {
        gzfile_ = gzopen(path_.c_str(), "rb");
        check_open(gzfile_, path_);
        gzbuffer_size_ = gzbuffer_init_size;
        gzbuffer_ = (char *) malloc(gzbuffer_size_);
        if (gzbuffer_ == NULL) {
            gzclose(gzfile_);
            throw std::bad_alloc();
        }
        gzbuffer_[0] = '\0';
    } else {
        ifs_.open(path_);
        check_open(ifs_, path_);
    }
}

VersatileLineReader::~VersatileLineReader()
{
    if (is_gzipped_) {
        free(gzbuffer_);
        gzclose(gzfile_);
    }
}

bool
VersatileLineReader::getline(const char*& line, size_t& len)
{
    if (is_gzipped_) {
        if (gzgets(gzfile_, gzbuffer_, gzbuffer_size_) == NULL)
            return false;
        gzline_len_ = strlen(gzbuffer_);

        //
        // The line didn't fit in the buffer; grow it and keep reading.
        //
        while (gzline_len_ == gzbuffer_size_ - 1 && gzbuffer_[gzline_len_ - 1] != '\n') {
            char *p = (char *) realloc(gzbuffer_, gzbuffer_size_ * 2);
            if (p == NULL)
                throw std::bad_alloc();
            gzbuffer_       = p;
            gzbuffer_size_ *= 2;
            if (gzgets(gzfile_, gzbuffer_ + gzline_len_, gzbuffer_size_ - gzline_len_) == NULL)
                break;
            gzline_len_ += strlen(gzbuffer_ + gzline_len_);
        }

        if (gzline_len_ > 0 && gzbuffer_[gzline_len_ - 1] == '\n')
            gzbuffer_[--gzline_len_] = '\0';
        if (gzline_len_ > 0 && gzbuffer_[gzline_len_ - 1] == '\r')
            gzbuffer_[--gzline_len_] = '\0';

        line = gzbuffer_;
        len  = gzline_len_;

    } else {
        if (!std::getline(ifs_, ifsbuffer_))
            return false;
        if (!ifsbuffer_.empty() && ifsbuffer_[ifsbuffer_.length() - 1] == '\r')
            ifsbuffer_.resize(ifsbuffer_.length() - 1);

        line = ifsbuffer_.c_str();
        len  = ifsbuffer_.length();
    }

    ++line_number_;
    return true;
}

VersatileWriter::VersatileWriter(const string& path)
        : path_(path)
        , is_gzipped_(guess_file_type(path) == FileT::gztable)
        , ofs_()
        , gzfile_(NULL)
{
    if (is_gzipped_) {
        gzfile_ = gzopen(path_.c_str(), "wb");
        check_open(gzfile_, path_);
    } else {
        ofs_.open(path_);
        check_open(ofs_, path_);
    }
}
