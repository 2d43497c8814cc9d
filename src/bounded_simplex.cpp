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

#include "bounded_simplex.hpp"

#include "sfbias_error.hpp"

#include <gsl/gsl_errno.h>
#include <gsl/gsl_multimin.h>
#include <gsl/gsl_vector.h>

#include <algorithm>
#include <cmath>
#include <cstddef>
#include <functional>
#include <string>

using std::function;
using std::max;
using std::size_t;

// to pass parameters through
struct bounded_objective {
  const function<double(const double)> *f;
  double lower_bound;
};

// Points below the bound take the value at the bound plus their distance
// to it, so the simplex is pushed back into the feasible set without the
// objective ever being evaluated outside it.
static double
projected_objective(const gsl_vector *v, void *params) {
  const bounded_objective *p = static_cast<const bounded_objective *>(params);
  const double x = gsl_vector_get(v, 0);
  if (x >= p->lower_bound)
    return (*p->f)(x);
  return (*p->f)(p->lower_bound) + (p->lower_bound - x);
}

// same default as nlopt: 3/4 of the distance to the bound, or 1 when
// starting on the bound
static inline double
initial_step_size(const double x0, const double lower_bound) {
  return x0 > lower_bound ? 0.75 * (x0 - lower_bound) : 1.0;
}

bool
bounded_simplex_minimize(const function<double(const double)> &objective,
                         const double lower_bound, const SimplexControl &ctrl,
                         double &x) {
  x = max(x, lower_bound);

  bounded_objective params{&objective, lower_bound};

  gsl_multimin_function minimizer_function;
  minimizer_function.n = 1;
  minimizer_function.f = &projected_objective;
  minimizer_function.params = &params;

  gsl_vector *x0 = gsl_vector_alloc(1);
  gsl_vector_set(x0, 0, x);
  gsl_vector *ss = gsl_vector_alloc(1);
  gsl_vector_set(ss, 0, initial_step_size(x, lower_bound));

  gsl_multimin_fminimizer *minimizer =
    gsl_multimin_fminimizer_alloc(gsl_multimin_fminimizer_nmsimplex2, 1);

  int status =
    gsl_multimin_fminimizer_set(minimizer, &minimizer_function, x0, ss);
  if (status != GSL_SUCCESS) {
    gsl_multimin_fminimizer_free(minimizer);
    gsl_vector_free(x0);
    gsl_vector_free(ss);
    throw sfbias_error(status, "failed to start simplex at x = " +
                                 std::to_string(x));
  }

  bool converged = false;
  size_t iter = 0;
  while (iter < ctrl.max_iter) {
    ++iter;
    // a failed step leaves the best vertex in place; stop there
    status = gsl_multimin_fminimizer_iterate(minimizer);
    if (status != GSL_SUCCESS)
      break;

    const double simplex_size = gsl_multimin_fminimizer_size(minimizer);
    const double x_best =
      gsl_vector_get(gsl_multimin_fminimizer_x(minimizer), 0);
    status = gsl_multimin_test_size(
      simplex_size, ctrl.xtol_abs + ctrl.xtol_rel * std::fabs(x_best));
    if (status == GSL_SUCCESS) {
      converged = true;
      break;
    }
  }

  x = max(gsl_vector_get(gsl_multimin_fminimizer_x(minimizer), 0),
          lower_bound);

  gsl_multimin_fminimizer_free(minimizer);
  gsl_vector_free(x0);
  gsl_vector_free(ss);

  return converged;
}
