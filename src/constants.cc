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

#include <regex>

#include "constants.h"

const
map<string, FileT> known_extensions = {
    {".sfs", FileT::table},
    {".txt", FileT::table},
    {".tsv", FileT::table},
    {".sfs.gz", FileT::gztable},
    {".txt.gz", FileT::gztable},
    {".tsv.gz", FileT::gztable}
};

string remove_suffix(FileT type, const string& orig) {
    string file (orig);

    size_t pos = file.find_last_of(".");
    if (pos == string::npos)
        return file;

    if (type == FileT::gztable && file.substr(pos) == ".gz") {
        file = file.substr(0, pos);
        pos  = file.find_last_of(".");
        if (pos == string::npos)
            return file;
    }

    if (type == FileT::gztable || type == FileT::table) {
        string ext = file.substr(pos);
        if (ext == ".sfs" || ext == ".txt" || ext == ".tsv")
            file = file.substr(0, pos);
    }

    return file;
}

regex init_file_ext_regex () {
    string s = "(";

    auto i = known_extensions.begin();
    assert(!known_extensions.empty());
    string ext = i->first;
    escape_char('.', ext);
    s += ext;
    ++i;
    while(i != known_extensions.end()) {
        ext = i->first;
        escape_char('.', ext);
        s += "|" + ext;
        ++i;
    }

    s += ")$";
    return regex(s);
}

FileT guess_file_type (const string& path) {

    static const regex reg = init_file_ext_regex();

    smatch m;
    regex_search(path, m, reg);

    if (m.empty()) {
        // Unrecognized extensions are read as plain tables, unless gzipped.
        if (path.size() > 3 && path.compare(path.size() - 3, 3, ".gz") == 0)
            return FileT::gztable;
        return FileT::unknown;
    } else {
        return known_extensions.at(m.str());
    }
}

void escape_char(char c, string& s) {
    vector<size_t> dots;
    size_t i = -1;
    while ((i = s.find(c, i+1)) != string::npos)
        dots.push_back(i);

    for(auto j=dots.rbegin(); j!=dots.rend(); ++j)
        s.insert(*j, 1, '\\');
}

int sfstats_handle_exceptions(const exception& e) {
    std::cerr << "Aborted.";
    if (typeid(e) != typeid(std::exception))
        std::cerr << " (" << e.what() << ")";
    std::cerr << "\n";
    return 13;
}
