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

#include "common.hpp"

#include <algorithm>
#include <cmath>
#include <cstddef>
#include <iterator>
#include <limits>
#include <vector>

using std::begin;
using std::end;
using std::numeric_limits;
using std::size_t;
using std::vector;

double
mean_defined(const vector<double> &vals) {
  double total = 0.0;
  size_t n_defined = 0;
  for (size_t i = 0; i < vals.size(); ++i)
    if (!std::isnan(vals[i])) {
      total += vals[i];
      ++n_defined;
    }
  if (n_defined == 0)
    return numeric_limits<double>::quiet_NaN();
  return total / n_defined;
}

double
variance_defined(const vector<double> &vals) {
  const double mu = mean_defined(vals);
  double ss = 0.0;
  size_t n_defined = 0;
  for (size_t i = 0; i < vals.size(); ++i)
    if (!std::isnan(vals[i])) {
      ss += (vals[i] - mu) * (vals[i] - mu);
      ++n_defined;
    }
  if (n_defined < 2)
    return numeric_limits<double>::quiet_NaN();
  return ss / (n_defined - 1);
}

template <typename T>
T
quantile_from_sorted_vector(const vector<T> &sorted_data, const size_t stride,
                            const size_t n, const double f) {
  const double index = f * (n - 1);
  const size_t lhs = static_cast<size_t>(index);
  const double delta = index - lhs;

  if (lhs >= n - 1)
    return sorted_data[(n - 1) * stride];

  return (1 - delta) * sorted_data[lhs * stride] +
         delta * sorted_data[(lhs + 1) * stride];
}

double
quantile_defined(vector<double> vals, const double p) {
  vals.erase(std::remove_if(begin(vals), end(vals),
                            [](const double x) { return std::isnan(x); }),
             end(vals));
  if (vals.empty() || std::isnan(p))
    return numeric_limits<double>::quiet_NaN();

  std::sort(begin(vals), end(vals));
  const double f = std::min(std::max(p, 0.0), 1.0);
  return quantile_from_sorted_vector(vals, 1, vals.size(), f);
}
