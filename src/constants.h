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

#ifndef __CONSTANTS_H__
#define __CONSTANTS_H__

#include <cassert>
#include <exception>
#include <iostream>
#include <map>
#include <string>
#include <typeinfo>
#include <vector>

using namespace std;

//
// sfstats version number, set by the build system.
//
#ifndef VERSION
#define VERSION "unknown"
#endif

//
// Supported file types
//
enum class FileT {unknown, table, gztable};

FileT  guess_file_type(const string& path);
string remove_suffix(FileT type, const string& orig);
void   escape_char(char c, string& s);

//
// Marker for code paths that should be unreachable.
//
#define DOES_NOT_HAPPEN \
    do { \
        cerr << "Error: Unexpected condition at " << __FILE__ << ":" << __LINE__ << ".\n"; \
        throw exception(); \
    } while (false)

//
// In release builds, main() catches every exception, reports it and
// returns a non-zero exit code. Debug builds let exceptions through.
//
int sfstats_handle_exceptions(const exception& e);

#ifdef DEBUG
#define IF_NDEBUG_TRY
#define IF_NDEBUG_CATCH_ALL_EXCEPTIONS
#else
#define IF_NDEBUG_TRY \
    try {
#define IF_NDEBUG_CATCH_ALL_EXCEPTIONS \
    } catch (const std::exception& e) { \
        return sfstats_handle_exceptions(e); \
    }
#endif

#endif // __CONSTANTS_H__
