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

//
// sfstats -- compute summary statistics from a table of site frequency spectra.
//
#include <algorithm>
#include <cmath>
#include <cstring>
#include <iostream>
#include <fstream>
#include <memory>

#include <getopt.h>

#include "constants.h"
#include "utils.h"
#include "log_utils.h"
#include "Sfs.h"
#include "diversity.h"
#include "SummaryStats.h"
#include "SfsTable.h"

void parse_command_line(int argc, char* argv[]);
void report_options(ostream& os);
int  run();
void write_stats(VersatileWriter& out, Sfs& sfs, bool& header_done, size_t& header_npops);

//
// Argument globals.
//
bool quiet = false;
string in_path;
string out_path;
vector<size_t> dims;
bool   has_length = false;
double length     = 0.0;
bool   repolarize = false;
vector<size_t> keep_pops;
string stat_name  = "summary";
bool   persite    = false;
bool   dxy        = false;
bool   mask_corners = false;

//
// Extra globals.
//
const string prog_name = "sfstats";
unique_ptr<LogAlterator> logger = NULL;

const vector<string> known_stats = {
    "summary", "pi", "theta_w", "theta_zeta", "tajima_d", "fuli_d",
    "d_xy", "D_xy", "fst", "fst_unweighted", "fst_wc", "segsites", "sfs"
};

// main()
// ==========
int main(int argc, char* argv[]) {
    IF_NDEBUG_TRY

    // Parse arguments
    parse_command_line(argc, argv);

    // Open the log
    string lg_path = out_path + ".log";
    logger.reset(new LogAlterator(lg_path, quiet, argc, argv));
    report_options(cout);
    cout << "\n";

    // Run the program.
    int rv = run();
    if (rv != 0)
        return rv;

    // Cleanup.
    cout << "\n" << prog_name << " is done.\n";
    return 0;
    IF_NDEBUG_CATCH_ALL_EXCEPTIONS
}

int run() {
    SfsTable table (in_path);
    VersatileWriter out (out_path);

    cout << "Reading spectra from '" << in_path << "'...\n";

    vector<double> values;
    vector<size_t> rec_dims;
    vector<size_t> file_dims;
    bool   header_done  = false;
    size_t header_npops = 0;
    size_t n_spectra = 0;
    size_t n_empty   = 0;

    while (table.next_floats(values, rec_dims)) {
        if (values.empty()) {
            ++n_empty;
            continue;
        }

        //
        // The dimensions given on the command line take precedence over
        // those of the file; a spectrum without either is one-dimensional.
        //
        if (!rec_dims.empty())
            file_dims = rec_dims;
        const vector<size_t>& shape = dims.empty() ? file_dims : dims;

        Sfs flat (values);
        if (!shape.empty() && !flat.match_dims(shape)) {
            cerr << "Error: At line " << table.line_number() << " in file '" << in_path
                 << "': " << values.size() << " values cannot be shaped into "
                 << shape_str(shape) << ".\n";
            throw exception();
        }

        Sfs sfs = has_length
            ? Sfs(values, shape, length, repolarize)
            : Sfs(values, shape, repolarize);

        if (!keep_pops.empty())
            sfs = sfs.marginalize(keep_pops);

        if (mask_corners)
            sfs = sfs.mask_corners();

        write_stats(out, sfs, header_done, header_npops);
        ++n_spectra;
    }

    cout << "Processed " << n_spectra << " spectra";
    if (n_empty > 0)
        cout << " (skipped " << n_empty << " empty lines)";
    cout << ".\n"
         << "Wrote '" << out_path << "'.\n";

    return 0;
}

void write_stats(VersatileWriter& out, Sfs& sfs, bool& header_done, size_t& header_npops) {

    if (stat_name == "summary") {
        if (!header_done) {
            vector<string> labels = summary_labels(sfs.npops(), dxy);
            for (size_t i = 0; i < labels.size(); i++) {
                if (i > 0) out << '\t';
                out << labels[i];
            }
            out << '\n';
            header_done  = true;
            header_npops = sfs.npops();
        } else if (sfs.npops() != header_npops) {
            cerr << "Error: All spectra should have the same number of populations for '-s summary' (expected "
                 << header_npops << ", got " << sfs.npops() << ").\n";
            throw exception();
        }

        vector<double> stats = big_summary(sfs, persite, dxy);
        for (size_t i = 0; i < stats.size(); i++) {
            if (i > 0) out << '\t';
            out << stats[i];
        }
        out << '\n';
        return;

    } else if (stat_name == "sfs") {
        write_sfs(out, sfs);
        return;
    }

    double v;
    if (stat_name == "pi")
        v = theta_pi(sfs, persite);
    else if (stat_name == "theta_w")
        v = theta_w(sfs, persite);
    else if (stat_name == "theta_zeta")
        v = theta_zeta(sfs, persite);
    else if (stat_name == "tajima_d")
        v = tajima_D(sfs);
    else if (stat_name == "fuli_d")
        v = fuli_D(sfs);
    else if (stat_name == "d_xy")
        v = d_xy(sfs, persite);
    else if (stat_name == "D_xy")
        v = D_xy(sfs, persite);
    else if (stat_name == "fst")
        v = f_st(sfs);
    else if (stat_name == "fst_unweighted")
        v = f_st(sfs, false);
    else if (stat_name == "fst_wc")
        v = wc_f_st(sfs);
    else if (stat_name == "segsites")
        v = (double) sfs.count_segsites();
    else
        DOES_NOT_HAPPEN;

    out << v << '\n';
}

void parse_command_line(int argc, char* argv[]) {

    const string help_string = string() +
            prog_name + " " + VERSION  + "\n" +
            prog_name + " -i table [-o out_path] [-s stat] [options]\n" +
            "\n"
            "  -i,--in-path: input table of spectra, one per line (plain or gzipped).\n"
            "  -o,--out-path: output file (default: <in-path>.stats.tsv).\n"
            "  -s,--stat: statistic to report (default: summary). One of:\n"
            "             summary, pi, theta_w, theta_zeta, tajima_d, fuli_d, d_xy,\n"
            "             D_xy, fst, fst_unweighted, fst_wc, segsites, sfs.\n"
            "\n"
            "Spectrum options:\n"
            "  -d,--dims: comma-separated dimensions of the spectra (default: from a\n"
            "             '#dims=' line in the table, or one-dimensional).\n"
            "  -L,--length: total sequence length of each spectrum.\n"
            "  -r,--repolarize: swap the ancestral and derived states.\n"
            "  -m,--marginalize: comma-separated indexes of the populations to keep.\n"
            "  --mask-corners: zero the fixed ancestral and fixed derived cells.\n"
            "\n"
            "Statistic options:\n"
            "  -p,--persite: divide the estimators by the sequence length.\n"
            "  -x,--dxy: for '-s summary', also report D_xy for each pair of populations.\n"
            "\n"
            "  -q,--quiet: don't print status messages.\n"
            "  -h,--help: display this help message.\n"
            "  --version: print the version and exit.\n"
            "\n"
            ;

    const auto bad_args = [&help_string](){
        cerr << help_string;
        exit(13);
    };

    static const option long_options[] = {
        {"help",         no_argument,       NULL, 'h'},
        {"quiet",        no_argument,       NULL, 'q'},
        {"version",      no_argument,       NULL,  1000},
        {"in-path",      required_argument, NULL, 'i'},
        {"out-path",     required_argument, NULL, 'o'},
        {"stat",         required_argument, NULL, 's'},
        {"dims",         required_argument, NULL, 'd'},
        {"length",       required_argument, NULL, 'L'},
        {"repolarize",   no_argument,       NULL, 'r'},
        {"marginalize",  required_argument, NULL, 'm'},
        {"persite",      no_argument,       NULL, 'p'},
        {"dxy",          no_argument,       NULL, 'x'},
        {"mask-corners", no_argument,       NULL,  1001},
        {0, 0, 0, 0}
    };

    int c;
    int long_options_i;
    while (true) {

        c = getopt_long(argc, argv, "hqi:o:s:d:L:rm:px", long_options, &long_options_i);

        // Detect the end of the options.
        if (c == -1)
            break;

        switch (c) {
        case 'h':
            cout << help_string;
            exit(0);
            break;
        case 'q':
            quiet = true;
            break;
        case 1000: //version
            cout << prog_name << " " << VERSION << "\n";
            exit(0);
            break;
        case 'i':
            in_path = optarg;
            break;
        case 'o':
            out_path = optarg;
            break;
        case 's':
            stat_name = optarg;
            break;
        case 'd':
            if (!parse_size_list(optarg, dims, true)) {
                cerr << "Error: Illegal -d option value '" << optarg << "'.\n";
                bad_args();
            }
            break;
        case 'L':
            length = is_double(optarg);
            if (length < 0) {
                cerr << "Error: Illegal -L option value '" << optarg << "'.\n";
                bad_args();
            }
            has_length = true;
            break;
        case 'r':
            repolarize = true;
            break;
        case 'm':
            if (!parse_size_list(optarg, keep_pops)) {
                cerr << "Error: Illegal -m option value '" << optarg << "'.\n";
                bad_args();
            }
            break;
        case 'p':
            persite = true;
            break;
        case 'x':
            dxy = true;
            break;
        case 1001: // mask-corners
            mask_corners = true;
            break;
        default:
            bad_args();
            break;
        }
    }

    //
    // Check command consistency.
    //
    if (optind < argc) {
        cerr << "Error: Failed to parse command line: '" << argv[optind] << "' is seen as a positional argument. Expected no positional arguments.\n";
        bad_args();
    }

    // -i
    if (in_path.empty()) {
        cerr << "Error: An input table is required (-i).\n";
        bad_args();
    }

    // -s
    if (find(known_stats.begin(), known_stats.end(), stat_name) == known_stats.end()) {
        cerr << "Error: Unknown statistic '" << stat_name << "' (-s).\n";
        bad_args();
    }

    // -x
    if (dxy && stat_name != "summary") {
        cerr << "Error: --dxy is only meaningful with '-s summary'.\n";
        bad_args();
    }

    //
    // Process arguments.
    //
    if (out_path.empty())
        out_path = remove_suffix(guess_file_type(in_path), in_path) + ".stats.tsv";

    if (out_path == in_path) {
        cerr << "Error: The output path is the same as the input path.\n";
        bad_args();
    }
}

void report_options(ostream& os) {
    os << "Configuration for this run:\n";
    os << "  Input table: '" << in_path << "' (" << to_string(guess_file_type(in_path)) << ")\n"
       << "  Output file: '" << out_path << "'\n"
       << "  Statistic: " << stat_name << "\n";
    if (!dims.empty())
        os << "  Dimensions: " << shape_str(dims) << "\n";
    if (has_length)
        os << "  Sequence length: " << length << "\n";
    if (repolarize)
        os << "  Repolarized.\n";
    if (!keep_pops.empty()) {
        os << "  Keeping populations: ";
        join(keep_pops, ",", os);
        os << "\n";
    }
    if (mask_corners)
        os << "  Masking the monomorphic corners.\n";
    if (persite)
        os << "  Per-site estimates.\n";
    if (dxy)
        os << "  Reporting D_xy.\n";
}
