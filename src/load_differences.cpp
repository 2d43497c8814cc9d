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

#include "load_differences.hpp"

#include <algorithm>
#include <cmath>
#include <cstddef>
#include <fstream>
#include <sstream>
#include <stdexcept>
#include <string>
#include <vector>

using std::begin;
using std::end;
using std::runtime_error;
using std::size_t;
using std::string;
using std::to_string;
using std::vector;

size_t
load_differences(std::istream &in, vector<string> &taxa,
                 vector<double> &Delta, vector<double> &nu0) {
  taxa.clear();
  Delta.clear();
  nu0.clear();

  size_t line_count = 0;
  string buffer;
  while (getline(in, buffer)) {
    ++line_count;
    if (find(begin(buffer), end(buffer), '\r') != end(buffer))
      throw runtime_error("carriage returns in differences file "
                          "(suggests dos or mac formatting)");

    const size_t first = buffer.find_first_not_of(" \t");
    if (first == string::npos || buffer[first] == '#')
      continue;

    string taxon;
    double diff = 0.0, variance = 0.0;
    std::istringstream iss(buffer);
    if (!(iss >> taxon >> diff >> variance))
      throw runtime_error("bad line format:\n" + buffer + "\n" + "(line " +
                          to_string(line_count) + ")");

    string extra;
    if (iss >> extra)
      throw runtime_error("extra fields on line " + to_string(line_count));
    if (!std::isfinite(diff) || !std::isfinite(variance))
      throw runtime_error("non-finite value on line " + to_string(line_count));
    if (variance <= 0.0)
      throw runtime_error("variance must be positive (line " +
                          to_string(line_count) + ")");

    taxa.push_back(taxon);
    Delta.push_back(diff);
    nu0.push_back(variance);
  }
  return taxa.size();
}

size_t
load_differences(const string &filename, vector<string> &taxa,
                 vector<double> &Delta, vector<double> &nu0) {
  std::ifstream in(filename);
  if (!in)
    throw runtime_error("problem opening file: " + filename);
  return load_differences(in, taxa, Delta, nu0);
}
