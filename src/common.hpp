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

#ifndef SRC_COMMON_HPP_
#define SRC_COMMON_HPP_

#include <cmath>
#include <cstddef>  // std::size_t
#include <vector>

// mean over the values that are not NaN; NaN if there are none
double
mean_defined(const std::vector<double> &vals);

// sample variance (n - 1 denominator) over the values that are not NaN;
// NaN if fewer than two remain
double
variance_defined(const std::vector<double> &vals);

// quantile by linear interpolation between order statistics (the
// default "type 7" definition), ignoring NaN; NaN if nothing remains
double
quantile_defined(std::vector<double> vals,  // by val so we can sort them
                 const double p);

template <typename Pred>
std::vector<double>
select_values(const std::vector<double> &vals, Pred pred) {
  std::vector<double> selected;
  for (auto i = 0u; i < std::size(vals); ++i)
    if (!std::isnan(vals[i]) && pred(vals[i]))
      selected.push_back(vals[i]);
  return selected;
}

#endif  // SRC_COMMON_HPP_
