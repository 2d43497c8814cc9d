/* Copyright (C) 2013-2024 University of Southern California and
 *                         Andrew D. Smith and Timothy Daley
 *
 * Authors: Timothy Daley and Andrew Smith
 *
 * This program is free software: you can redistribute it and/or
 * modify it under the terms of the GNU General Public License as
 * published by the Free Software Foundation, either version 3 of the
 * License, or (at your option) any later version.
 *
 * This program is distributed in the hope that it will be useful, but
 * WITHOUT ANY WARRANTY; without even the implied warranty of
 * MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.  See the GNU
 * General Public License for more details.
 *
 * You should have received a copy of the GNU General Public License
 * along with this program. If not, see
 * <http://www.gnu.org/licenses/>.
 */

#include "em_iter.hpp"

#include "bounded_simplex.hpp"
#include "load_differences.hpp"
#include "mixture_em.hpp"

#include "OptionParser.hpp"

#include <cstddef>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <stdexcept>
#include <string>
#include <vector>

using std::cerr;
using std::endl;
using std::runtime_error;
using std::size_t;
using std::string;
using std::vector;

namespace fs = std::filesystem;

int
em_iter_main(const int argc, const char **argv) {
  try {
    string outfile;
    string trace_file;

    MixtureParams initial;
    initial.pi0 = 0.75;
    initial.pi1 = 0.125;
    initial.pi2 = 0.125;
    initial.delta = 0.0;
    initial.l1 = -1.0;
    initial.l2 = 1.0;
    initial.kappa1 = 1.0;
    initial.kappa2 = 1.0;

    double tol = 1e-5;
    size_t max_iter = 100;
    SimplexControl ctrl;

    /* FLAGS */
    bool VERBOSE = false;

    const string description =
      R"(Fit the three component Gaussian mixture for between-group  \
log-ratio differences by expectation maximization, starting from \
the given parameter values. Input lines are: taxon, difference,  \
variance of the difference.
)";

    /********** GET COMMAND LINE ARGUMENTS  FOR EM ITER ***********/

    OptionParser opt_parse(fs::path(argv[1]).filename(), description,
                           "<input-file>");
    opt_parse.add_opt("output", 'o', "parameter output file (default: stdout)",
                      false, outfile);
    opt_parse.add_opt("trace", 'T', "write parameters at each iteration",
                      false, trace_file);
    opt_parse.add_opt("pi0", 'p', "initial weight of null component", false,
                      initial.pi0);
    opt_parse.add_opt("pi1", 'q', "initial weight of lower component", false,
                      initial.pi1);
    opt_parse.add_opt("pi2", 'r', "initial weight of upper component", false,
                      initial.pi2);
    opt_parse.add_opt("delta", 'd', "initial bias", false, initial.delta);
    opt_parse.add_opt("l1", 'l', "initial lower shift (<= 0)", false,
                      initial.l1);
    opt_parse.add_opt("l2", 'L', "initial upper shift (>= 0)", false,
                      initial.l2);
    opt_parse.add_opt("kappa1", 'k', "initial lower extra variance (>= 0)",
                      false, initial.kappa1);
    opt_parse.add_opt("kappa2", 'K', "initial upper extra variance (>= 0)",
                      false, initial.kappa2);
    opt_parse.add_opt("tol", 't', "convergence tolerance", false, tol);
    opt_parse.add_opt("iter", 'i', "maximum iterations", false, max_iter);
    opt_parse.add_opt("simplex-tol", 's',
                      "relative tolerance of variance search", false,
                      ctrl.xtol_rel);
    opt_parse.add_opt("simplex-iter", 'S', "maximum variance search steps",
                      false, ctrl.max_iter);
    opt_parse.add_opt("verbose", 'v', "print more info", false, VERBOSE);
    opt_parse.set_show_defaults();
    vector<string> leftover_args;
    opt_parse.parse(argc - 1, argv + 1, leftover_args);
    if (argc == 2 || opt_parse.help_requested()) {
      cerr << opt_parse.help_message() << endl;
      return EXIT_SUCCESS;
    }
    if (opt_parse.about_requested()) {
      cerr << opt_parse.about_message() << endl;
      return EXIT_SUCCESS;
    }
    if (opt_parse.option_missing()) {
      cerr << opt_parse.option_missing_message() << endl;
      return EXIT_SUCCESS;
    }
    if (leftover_args.empty()) {
      cerr << opt_parse.help_message() << endl;
      return EXIT_SUCCESS;
    }
    const string input_file_name = leftover_args.front();
    /******************************************************************/

    if (initial.l1 > 0.0 || initial.l2 < 0.0)
      throw runtime_error("initial shifts must satisfy l1 <= 0 <= l2");
    if (initial.kappa1 < 0.0 || initial.kappa2 < 0.0)
      throw runtime_error("initial extra variances must be non-negative");

    vector<string> taxa;
    vector<double> Delta, nu0;
    const size_t n_taxa = load_differences(input_file_name, taxa, Delta, nu0);
    if (VERBOSE)
      cerr << "TAXA            = " << n_taxa << endl
           << "TOLERANCE       = " << tol << endl
           << "MAX ITERATIONS  = " << max_iter << endl;

    vector<MixtureParams> trace;
    const EmResult result =
      em_iter(VERBOSE, Delta, nu0, initial, tol, max_iter, ctrl, trace);

    std::ofstream of;
    if (!outfile.empty()) {
      of.open(outfile);
      if (!of)
        throw runtime_error("problem opening file: " + outfile);
    }
    std::ostream out(outfile.empty() ? std::cout.rdbuf() : of.rdbuf());
    write_em_result(out, result);

    if (!trace_file.empty()) {
      std::ofstream trace_out(trace_file);
      if (!trace_out)
        throw runtime_error("problem opening file: " + trace_file);
      write_em_trace(trace_out, trace);
    }

    if (!result.params.is_finite())
      throw runtime_error("degenerate mixture fit: undefined parameters");
  }
  catch (std::exception &e) {
    cerr << e.what() << endl;
    return EXIT_FAILURE;
  }
  return EXIT_SUCCESS;
}
