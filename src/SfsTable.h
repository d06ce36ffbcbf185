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

#ifndef __SFSTABLE_H__
#define __SFSTABLE_H__

#include <cstdio>
#include <string>
#include <vector>

#include "constants.h"
#include "utils.h"
#include "Sfs.h"

//
// Recognizes a dimension hint, e.g. "#dims=4,5" (one or more leading
// '#'). Returns false if [line] is not a hint; throws
// std::invalid_argument if the dimensions are not positive integers.
//
bool sniff_dims(const string& line, vector<size_t>& dims);

/*
 * SfsTable
 * ==========
 * Reads spectra from a plain or gzipped text table: one record per line,
 * values separated by blanks (or by [delim]). Comment lines are skipped,
 * except that a "#dims=d1,d2,..." comment gives the shape of the record
 * that follows it.
 */
class SfsTable {
    VersatileLineReader file_;
    string comment_;
    char   delim_;
    vector<size_t> dims_;
    bool   dims_pending_;

public:
    SfsTable(const string& path, const string& comment = "#", char delim = '\0');

    // Reads the next data line. [dims] receives the dimensions of the
    // hint directly preceding it (comment lines aside), and is empty if
    // there is none.
    // Returns false on EOF.
    bool next_line(vector<string>& tokens, vector<size_t>& dims);

    // As next_line(), converting the tokens. A token that is not a number
    // raises std::invalid_argument.
    bool next_floats(vector<double>& values, vector<size_t>& dims);
    bool next_integers(vector<long>& values, vector<size_t>& dims);

    const string& path() const {return file_.path();}
    size_t line_number() const {return file_.line_number();}
};

//
// Writes [sfs] as a dimension hint followed by its flattened counts,
// in the format read by SfsTable. Spectra of different shapes can share
// a file.
//
template<typename OStream>
void write_sfs(OStream& os, const Sfs& sfs)
{
    const vector<size_t>& shape = sfs.shape();

    if (!shape.empty()) {
        os << "#dims=";
        for (size_t i = 0; i < shape.size(); i++) {
            if (i > 0) os << ',';
            os << shape[i];
        }
        os << '\n';
    }

    char buf[32];
    for (size_t i = 0; i < sfs.counts().size(); i++) {
        if (i > 0) os << ' ';
        snprintf(buf, sizeof(buf), "%.12g", sfs[i]);
        os << (const char *) buf;
    }
    os << '\n';
}

#endif // __SFSTABLE_H__
