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

#include <cctype>

#include "SfsTable.h"

static string
strip(const string& s)
{
    size_t first = 0;
    size_t last  = s.length();

    while (first < last && isspace((unsigned char) s[first]))
        first++;
    while (last > first && isspace((unsigned char) s[last - 1]))
        last--;

    return s.substr(first, last - first);
}

bool
sniff_dims(const string& line, vector<size_t>& dims)
{
    static const string directive = "dims=";

    size_t i = 0;
    while (i < line.length() && line[i] == '#')
        i++;
    if (i == 0 || line.compare(i, directive.length(), directive) != 0)
        return false;

    vector<string> parts = split(line.substr(i + directive.length()), ',');
    if (parts.empty())
        throw std::invalid_argument("No dimensions given in '" + line + "'");

    vector<size_t> d;
    for (const string& part : parts) {
        long n = parse_integer(strip(part).c_str());
        if (n <= 0)
            throw std::invalid_argument("Dimensions must be positive, got '" + line + "'");
        d.push_back((size_t) n);
    }

    dims = d;
    return true;
}

SfsTable::SfsTable(const string& path, const string& comment, char delim)
    : file_(path), comment_(comment), delim_(delim), dims_(), dims_pending_(false)
{
}

bool
SfsTable::next_line(vector<string>& tokens, vector<size_t>& dims)
{
    const char* line;
    size_t len;

    tokens.clear();
    dims.clear();

    try {
        while (this->file_.getline(line, len)) {
            string l (line, len);

            if (!this->comment_.empty() && l.compare(0, this->comment_.length(), this->comment_) == 0) {
                vector<size_t> d;
                if (sniff_dims(strip(l), d)) {
                    this->dims_         = d;
                    this->dims_pending_ = true;
                }
                continue;
            }

            tokens = split(strip(l), this->delim_);
            if (this->delim_ != '\0')
                for (string& t : tokens)
                    t = strip(t);

            if (this->dims_pending_)
                dims = this->dims_;
            this->dims_pending_ = false;

            return true;
        }
    } catch (const exception&) {
        cerr << "Error: At line " << this->file_.line_number()
             << " in file '" << this->file_.path() << "'.\n";
        throw;
    }

    return false;
}

bool
SfsTable::next_floats(vector<double>& values, vector<size_t>& dims)
{
    vector<string> tokens;

    values.clear();
    if (!this->next_line(tokens, dims))
        return false;

    try {
        for (const string& t : tokens)
            values.push_back(parse_double(t.c_str()));
    } catch (const exception&) {
        cerr << "Error: At line " << this->file_.line_number()
             << " in file '" << this->file_.path() << "'.\n";
        throw;
    }

    return true;
}

bool
SfsTable::next_integers(vector<long>& values, vector<size_t>& dims)
{
    vector<string> tokens;

    values.clear();
    if (!this->next_line(tokens, dims))
        return false;

    try {
        for (const string& t : tokens)
            values.push_back(parse_integer(t.c_str()));
    } catch (const exception&) {
        cerr << "Error: At line " << this->file_.line_number()
             << " in file '" << this->file_.path() << "'.\n";
        throw;
    }

    return true;
}
