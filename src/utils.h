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

#ifndef __UTILS_H__
#define __UTILS_H__

#include <cstdio>
#include <cstdlib>
#include <cerrno>
#include <climits>
#include <cmath>
#include <iostream>
#include <fstream>
#include <stdexcept>
#include <utility>
#include <string>
#include <vector>

#include <zlib.h>

#include "constants.h"

int    is_integer(const char *);
double is_double(const char *);

//
// Strict conversions, throwing std::invalid_argument if the whole
// string is not a number.
//
long   parse_integer(const char *);
double parse_double(const char *);

//
// Parses a comma-separated list of non-negative integers (strictly positive
// if [positive]). Returns false on an empty list or any bad token.
//
bool   parse_size_list(const string& arg, vector<size_t>& list, bool positive = false);

double binomial_coeff(double n, double k);

//
// Splits [s] on [sep], or on runs of blanks if [sep] is '\0'.
//
vector<string> split(const string& s, char sep = '\0');

//
// Join a range of elements into a stream.
//
template<typename IterableT, typename SepT>
void join(IterableT elements, const SepT& sep, ostream& os) {
    auto first = elements.begin();
    if (first != elements.end()) {
        os << *first;
        ++first;
        while (first != elements.end()) {
            os << sep << *first;
            ++first;
        }
    }
}

//
// Routines to check that files are open.
//
inline
void check_open (const std::ifstream& fs, const string& path)
    {if (!fs.is_open()) {cerr << "Error: Failed to open '" << path << "' for reading.\n"; throw exception();}}
inline
void check_open (const std::ofstream& fs, const string& path)
    {if (!fs.is_open()) {cerr << "Error: Failed to open '" << path << "' for writing.\n"; throw exception();}}
inline
void check_open (const gzFile fs, const string& path)
    {if (fs == NULL) {cerr << "Error: Failed to gz-open file '" << path << "'.\n"; throw exception();}}

//
// Class to read lines from a plain text or compressed file indifferently.
//
class VersatileLineReader {
    const string path_;
    size_t line_number_;
    bool is_gzipped_;

    ifstream ifs_;
    string ifsbuffer_;

    gzFile gzfile_;
    char* gzbuffer_;
    size_t gzbuffer_size_;
    size_t gzline_len_;
    static const size_t gzbuffer_init_size = 65536;

public:
    VersatileLineReader(const string& path);
    ~VersatileLineReader();

    VersatileLineReader(const VersatileLineReader&) = delete;
    VersatileLineReader& operator=(const VersatileLineReader&) = delete;

    // Reads one line from the file, removing the trailing '\n' (and '\r', if any).
    // Returns false on EOF. A last line lacking its '\n' is still returned.
    // e.g.:
    // const char* line; size_t len; while (file.getline(line, len)) {...}
    bool getline(const char*& line, size_t& len);

    const string& path() const {return path_;}
    size_t line_number() const {return line_number_;} // 1-based.
};

class VersatileWriter {
    const string path_;
    bool is_gzipped_;
    ofstream ofs_;
    gzFile gzfile_;

public:
    VersatileWriter(const string& path);
    ~VersatileWriter() {if(is_gzipped_) gzclose(gzfile_);}

    VersatileWriter(const VersatileWriter&) = delete;
    VersatileWriter& operator=(const VersatileWriter&) = delete;

    const string& path() const {return path_;}

    friend VersatileWriter& operator<< (VersatileWriter& w, char c)
        {if (w.is_gzipped_) gzputc(w.gzfile_, c); else w.ofs_ << c; return w;}
    friend VersatileWriter& operator<< (VersatileWriter& w, const char* s)
        {if (w.is_gzipped_) gzputs(w.gzfile_, s); else w.ofs_ << s; return w;}
    friend VersatileWriter& operator<< (VersatileWriter& w, const string& s)
        {if (w.is_gzipped_) gzwrite(w.gzfile_, s.c_str(), s.length()); else w.ofs_ << s; return w;}
    friend VersatileWriter& operator<< (VersatileWriter& w, int i);
    friend VersatileWriter& operator<< (VersatileWriter& w, size_t i);
    friend VersatileWriter& operator<< (VersatileWriter& w, double d);
};

inline
VersatileWriter& operator<< (VersatileWriter& w, int i) {
    if (w.is_gzipped_) {
        char buf[16];
        sprintf(buf, "%d", i);
        gzputs(w.gzfile_, buf);
    } else {
        w.ofs_ << i;
    }
    return w;
}

inline
VersatileWriter& operator<< (VersatileWriter& w, size_t i) {
    if (w.is_gzipped_) {
        char buf[32];
        sprintf(buf, "%zu", i);
        gzputs(w.gzfile_, buf);
    } else {
        w.ofs_ << i;
    }
    return w;
}

// Doubles are written with 12 significant digits in both modes, so
// that integral counts survive a write/read cycle.
inline
VersatileWriter& operator<< (VersatileWriter& w, double d) {
    char buf[32];
    snprintf(buf, sizeof(buf), "%.12g", d);
    if (w.is_gzipped_)
        gzputs(w.gzfile_, buf);
    else
        w.ofs_ << buf;
    return w;
}

#endif // __UTILS_H__
