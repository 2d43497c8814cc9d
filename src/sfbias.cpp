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

#include <config.h>

// the sfbias commands
#include "bias_est.hpp"
#include "em_iter.hpp"

#include <gsl/gsl_errno.h>

#include <cstdlib>
#include <iostream>
#include <sstream>
#include <string>

static std::string
usage_message() {
  std::ostringstream oss;
  oss << "sfbias: estimate sampling fraction bias between sample groups\n"
         "Version: ";
  oss << VERSION;
  oss << "\n\n"
         "Usage: sfbias <command> [OPTIONS]\n\n"
         "<command>: em_iter    fit the bias mixture from given initial\n"
         "                      values\n"
         "           bias_est   estimate the bias and correct differences\n";
  return oss.str();
}

int
main(const int argc, const char *argv[]) {
  if (argc < 2) {
    std::cerr << usage_message() << std::endl;
    return EXIT_SUCCESS;
  }

  // GSL status codes are checked where they are returned
  gsl_set_error_handler_off();

  static const std::string cmd = argv[1];

  if (cmd == "em_iter")
    return em_iter_main(argc, argv);

  if (cmd == "bias_est")
    return bias_est_main(argc, argv);

  std::cerr << "Error: unrecognized command: " << argv[1] << std::endl
            << usage_message() << std::endl;

  return EXIT_FAILURE;
}
