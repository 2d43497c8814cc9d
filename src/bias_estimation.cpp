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

#include "bias_estimation.hpp"

#include "common.hpp"
#include "mixture_em.hpp"

#include <algorithm>
#include <cmath>
#include <cstddef>
#include <iostream>
#include <limits>
#include <stdexcept>
#include <string>
#include <vector>

using std::begin;
using std::cerr;
using std::end;
using std::endl;
using std::runtime_error;
using std::size_t;
using std::to_string;
using std::vector;

MixtureParams
initial_params(const vector<double> &Delta) {
  MixtureParams p;
  p.pi0 = 0.75;
  p.pi1 = 0.125;
  p.pi2 = 0.125;

  const double q_25 = quantile_defined(Delta, 0.25);
  const double q_75 = quantile_defined(Delta, 0.75);
  p.delta = mean_defined(select_values(
    Delta, [&](const double x) { return x >= q_25 && x <= q_75; }));
  if (std::isnan(p.delta))
    p.delta = mean_defined(Delta);

  const vector<double> lower_tail = select_values(
    Delta,
    [q = quantile_defined(Delta, 0.125)](const double x) { return x < q; });
  const vector<double> upper_tail = select_values(
    Delta,
    [q = quantile_defined(Delta, 0.875)](const double x) { return x > q; });

  const vector<double> defined =
    select_values(Delta, [](const double) { return true; });

  p.l1 = mean_defined(lower_tail);
  if (std::isnan(p.l1) || std::isinf(p.l1))
    p.l1 = defined.empty() ? p.l1
                           : *std::min_element(begin(defined), end(defined));
  p.l2 = mean_defined(upper_tail);
  if (std::isnan(p.l2) || std::isinf(p.l2))
    p.l2 = defined.empty() ? p.l2
                           : *std::max_element(begin(defined), end(defined));

  p.kappa1 = variance_defined(lower_tail);
  if (std::isnan(p.kappa1) || p.kappa1 == 0.0)
    p.kappa1 = 1.0;
  p.kappa2 = variance_defined(upper_tail);
  if (std::isnan(p.kappa2) || p.kappa2 == 0.0)
    p.kappa2 = 1.0;

  return p;
}

double
wls_bias(const vector<double> &Delta, const vector<double> &nu0,
         const MixtureParams &fit, double &var_delta) {
  const double q_lo = quantile_defined(Delta, fit.pi1);
  const double q_hi = quantile_defined(Delta, 1.0 - fit.pi2);

  double numer = 0.0;
  double denom = 0.0;
  for (size_t i = 0; i < Delta.size(); ++i) {
    if (std::isnan(Delta[i]))
      continue;
    double nu = nu0[i];
    double centered = Delta[i];
    if (Delta[i] >= q_hi) {
      nu += fit.kappa2;
      centered -= fit.l2;
    }
    else if (Delta[i] < q_lo) {
      nu += fit.kappa1;
      centered -= fit.l1;
    }
    numer += centered / nu;
    denom += 1.0 / nu;
  }

  var_delta = 1.0 / denom;
  if (std::isnan(var_delta))
    var_delta = 0.0;
  return numer / denom;
}

BiasEstimate
bias_est(const bool VERBOSE, const vector<double> &Delta,
         const vector<double> &nu0, const double tol, const size_t max_iter,
         const SimplexControl &ctrl) {
  if (Delta.size() != nu0.size())
    throw runtime_error("differences and variances have different lengths: " +
                        to_string(Delta.size()) + " vs " +
                        to_string(nu0.size()));
  if (std::isnan(mean_defined(Delta)))
    throw runtime_error("no taxa with defined differences");

  const MixtureParams initial = initial_params(Delta);
  if (VERBOSE)
    cerr << "[INITIAL VALUES]" << endl
         << "PI0\tPI1\tPI2\tDELTA\tL1\tL2\tKAPPA1\tKAPPA2" << endl
         << initial << endl;

  BiasEstimate est;
  est.em = em_iter(VERBOSE, Delta, nu0, initial, tol, max_iter, ctrl);
  if (!est.em.params.is_finite())
    throw runtime_error("degenerate mixture fit after " +
                        to_string(est.em.n_iter) + " iterations");

  est.delta_em = est.em.params.delta;
  est.delta_wls = wls_bias(Delta, nu0, est.em.params, est.var_delta);

  if (VERBOSE)
    cerr << "DELTA_EM  = " << est.delta_em << endl
         << "DELTA_WLS = " << est.delta_wls << endl
         << "VAR_DELTA = " << est.var_delta << endl;

  return est;
}

void
correct_bias(const vector<double> &Delta, const vector<double> &nu0,
             const double delta_em, const double var_delta,
             const bool conserve, vector<double> &beta_hat,
             vector<double> &se_hat) {
  beta_hat.resize(Delta.size());
  se_hat.resize(Delta.size());
  const double extra_var = conserve ? var_delta : 0.0;
  for (size_t i = 0; i < Delta.size(); ++i) {
    beta_hat[i] = Delta[i] - delta_em;
    se_hat[i] = std::sqrt(nu0[i] + extra_var);
  }
}
