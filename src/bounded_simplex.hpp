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

#ifndef SRC_BOUNDED_SIMPLEX_HPP_
#define SRC_BOUNDED_SIMPLEX_HPP_

#include <cstddef>
#include <functional>

// stopping rules for the simplex; defaults follow nloptr::neldermead
struct SimplexControl {
  double xtol_rel{1e-6};
  double xtol_abs{1e-10};
  std::size_t max_iter{1000};
};

// Minimize a scalar objective over [lower_bound, inf) with the
// Nelder-Mead simplex from GSL. On entry x holds the starting point
// (projected onto the feasible set if below the bound); on return it
// holds the best point found, never below lower_bound. Returns true if
// the simplex shrank below tolerance, false if the iteration cap was
// reached or GSL could make no further progress. The search is
// deterministic for a fixed objective and starting point.
bool
bounded_simplex_minimize(const std::function<double(const double)> &objective,
                         const double lower_bound, const SimplexControl &ctrl,
                         double &x);

#endif  // SRC_BOUNDED_SIMPLEX_HPP_
