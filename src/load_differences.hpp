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

#ifndef SRC_LOAD_DIFFERENCES_HPP_
#define SRC_LOAD_DIFFERENCES_HPP_

#include <cstddef>
#include <istream>
#include <string>
#include <vector>

// Reads lines of "<taxon> <difference> <variance>", skipping blank lines
// and lines starting with '#'. Returns the number of taxa read.
std::size_t
load_differences(std::istream &in, std::vector<std::string> &taxa,
                 std::vector<double> &Delta, std::vector<double> &nu0);

std::size_t
load_differences(const std::string &filename, std::vector<std::string> &taxa,
                 std::vector<double> &Delta, std::vector<double> &nu0);

#endif  // SRC_LOAD_DIFFERENCES_HPP_
