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

#include "bias_est.hpp"

#include "bias_estimation.hpp"
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

static void
write_corrected_table(const string &filename, const vector<string> &taxa,
                      const vector<double> &Delta,
                      const vector<double> &beta_hat,
                      const vector<double> &se_hat) {
  std::ofstream out(filename);
  if (!out)
    throw runtime_error("problem opening file: " + filename);

  out << "TAXON\tDIFFERENCE\tCORRECTED\tSE" << endl;
  for (size_t i = 0; i < taxa.size(); ++i)
    out << taxa[i] << '\t' << Delta[i] << '\t' << beta_hat[i] << '\t'
        << se_hat[i] << endl;
}

int
bias_est_main(const int argc, const char **argv) {
  try {
    string outfile;
    string corrected_file;

    double tol = 1e-5;
    size_t max_iter = 100;
    SimplexControl ctrl;

    /* FLAGS */
    bool VERBOSE = false;
    bool conserve = false;

    const string description =
      R"(Estimate the sampling fraction bias between two groups of    \
samples from per-taxon log-ratio differences and their variances. \
A three component Gaussian mixture separates taxa without real    \
differences from two classes of outliers; its null mean is the    \
bias. A weighted least squares bias and the variance of the bias  \
are also reported, and bias corrected differences can be written.
)";

    /********** GET COMMAND LINE ARGUMENTS  FOR BIAS EST ***********/

    OptionParser opt_parse(fs::path(argv[1]).filename(), description,
                           "<input-file>");
    opt_parse.add_opt("output", 'o', "bias output file (default: stdout)",
                      false, outfile);
    opt_parse.add_opt("corrected", 'b', "write bias corrected differences",
                      false, corrected_file);
    opt_parse.add_opt("conserve", 'c',
                      "include variance of bias in standard errors", false,
                      conserve);
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

    vector<string> taxa;
    vector<double> Delta, nu0;
    const size_t n_taxa = load_differences(input_file_name, taxa, Delta, nu0);
    if (VERBOSE)
      cerr << "TAXA            = " << n_taxa << endl
           << "TOLERANCE       = " << tol << endl
           << "MAX ITERATIONS  = " << max_iter << endl;

    if (VERBOSE)
      cerr << "[ESTIMATING BIAS]" << endl;
    const BiasEstimate est = bias_est(VERBOSE, Delta, nu0, tol, max_iter, ctrl);

    if (VERBOSE)
      cerr << "[WRITING OUTPUT]" << endl;

    std::ofstream of;
    if (!outfile.empty()) {
      of.open(outfile);
      if (!of)
        throw runtime_error("problem opening file: " + outfile);
    }
    std::ostream out(outfile.empty() ? std::cout.rdbuf() : of.rdbuf());
    write_em_result(out, est.em);
    out << "delta_em\t" << est.delta_em << endl
        << "delta_wls\t" << est.delta_wls << endl
        << "var_delta\t" << est.var_delta << endl;

    if (!corrected_file.empty()) {
      vector<double> beta_hat, se_hat;
      correct_bias(Delta, nu0, est.delta_em, est.var_delta, conserve,
                   beta_hat, se_hat);
      write_corrected_table(corrected_file, taxa, Delta, beta_hat, se_hat);
    }
  }
  catch (std::exception &e) {
    cerr << e.what() << endl;
    return EXIT_FAILURE;
  }
  return EXIT_SUCCESS;
}
