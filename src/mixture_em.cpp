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

#include "mixture_em.hpp"

#include "bounded_simplex.hpp"
#include "common.hpp"

#include <gsl/gsl_randist.h>

#include <algorithm>
#include <cmath>
#include <cstddef>
#include <iomanip>
#include <iostream>
#include <limits>
#include <stdexcept>
#include <string>
#include <vector>

using std::cerr;
using std::endl;
using std::numeric_limits;
using std::runtime_error;
using std::setw;
using std::size_t;
using std::to_string;
using std::vector;

bool
MixtureParams::is_finite() const {
  return std::isfinite(pi0) && std::isfinite(pi1) && std::isfinite(pi2) &&
         std::isfinite(delta) && std::isfinite(l1) && std::isfinite(l2) &&
         std::isfinite(kappa1) && std::isfinite(kappa2);
}

double
param_distance(const MixtureParams &a, const MixtureParams &b) {
  const double diffs[] = {a.pi0 - b.pi0,       a.pi1 - b.pi1,
                          a.pi2 - b.pi2,       a.delta - b.delta,
                          a.l1 - b.l1,         a.l2 - b.l2,
                          a.kappa1 - b.kappa1, a.kappa2 - b.kappa2};
  double ss = 0.0;
  for (const double d : diffs)
    ss += d * d;
  return std::sqrt(ss);
}

std::ostream &
operator<<(std::ostream &out, const MixtureParams &p) {
  return out << p.pi0 << '\t' << p.pi1 << '\t' << p.pi2 << '\t' << p.delta
             << '\t' << p.l1 << '\t' << p.l2 << '\t' << p.kappa1 << '\t'
             << p.kappa2;
}

double
gaussian_pdf(const double x, const double mean, const double variance) {
  return gsl_ran_gaussian_pdf(x - mean, std::sqrt(variance));
}

void
expectation_step(const vector<double> &Delta, const vector<double> &nu0,
                 const MixtureParams &params, Responsibilities &resp) {
  const size_t n_taxa = Delta.size();
  resp.r0.resize(n_taxa);
  resp.r1.resize(n_taxa);
  resp.r2.resize(n_taxa);

  for (size_t i = 0; i < n_taxa; ++i) {
    const double first_part =
      params.pi0 * gaussian_pdf(Delta[i], params.delta, nu0[i]);
    const double second_part =
      params.pi1 *
      gaussian_pdf(Delta[i], params.delta + params.l1, nu0[i] + params.kappa1);
    const double third_part =
      params.pi2 *
      gaussian_pdf(Delta[i], params.delta + params.l2, nu0[i] + params.kappa2);

    const double denom = first_part + second_part + third_part;
    if (denom > 0.0 && std::isfinite(denom)) {
      resp.r0[i] = first_part / denom;
      resp.r1[i] = second_part / denom;
      resp.r2[i] = third_part / denom;
    }
    else {
      // no usable information for this taxon
      resp.r0[i] = 0.0;
      resp.r1[i] = 0.0;
      resp.r2[i] = 0.0;
    }
  }
}

double
kappa_objective(const vector<double> &Delta, const vector<double> &nu0,
                const vector<double> &weights, const double center,
                const double x) {
  double log_lik = 0.0;
  for (size_t i = 0; i < Delta.size(); ++i) {
    const double log_pdf = std::log(gaussian_pdf(Delta[i], center, nu0[i] + x));
    // a density that underflows to zero contributes nothing
    const double term = weights[i] * (std::isinf(log_pdf) ? 0.0 : log_pdf);
    if (!std::isnan(term))
      log_lik += term;
  }
  return -log_lik;
}

// precision weighted mean of (Delta - delta) for one outlier component
static double
weighted_shift(const vector<double> &Delta, const vector<double> &nu0,
               const vector<double> &weights, const double kappa,
               const double delta) {
  double numer = 0.0;
  double denom = 0.0;
  for (size_t i = 0; i < Delta.size(); ++i) {
    const double w = weights[i] / (nu0[i] + kappa);
    const double term = w * (Delta[i] - delta);
    if (!std::isnan(term))
      numer += term;
    if (!std::isnan(w))
      denom += w;
  }
  return numer / denom;
}

static double
update_kappa(const vector<double> &Delta, const vector<double> &nu0,
             const vector<double> &weights, const double center,
             const double kappa, const SimplexControl &ctrl,
             size_t &n_simplex_capped) {
  const auto objective = [&](const double x) {
    return kappa_objective(Delta, nu0, weights, center, x);
  };
  double x = kappa;
  if (!bounded_simplex_minimize(objective, 0.0, ctrl, x))
    ++n_simplex_capped;
  return x;
}

MixtureParams
maximization_step(const vector<double> &Delta, const vector<double> &nu0,
                  const MixtureParams &params, const Responsibilities &resp,
                  const SimplexControl &ctrl, size_t &n_simplex_capped) {
  MixtureParams updated;

  updated.pi0 = mean_defined(resp.r0);
  updated.pi1 = mean_defined(resp.r1);
  updated.pi2 = mean_defined(resp.r2);

  double numer = 0.0;
  double denom = 0.0;
  for (size_t i = 0; i < Delta.size(); ++i) {
    const double nu1 = nu0[i] + params.kappa1;
    const double nu2 = nu0[i] + params.kappa2;
    const double numer_term = resp.r0[i] * Delta[i] / nu0[i] +
                              resp.r1[i] * (Delta[i] - params.l1) / nu1 +
                              resp.r2[i] * (Delta[i] - params.l2) / nu2;
    const double denom_term =
      resp.r0[i] / nu0[i] + resp.r1[i] / nu1 + resp.r2[i] / nu2;
    if (!std::isnan(numer_term))
      numer += numer_term;
    if (!std::isnan(denom_term))
      denom += denom_term;
  }
  updated.delta = numer / denom;

  // sign constraints: l1 <= 0 <= l2; an undefined shift stays undefined
  const double l1 =
    weighted_shift(Delta, nu0, resp.r1, params.kappa1, params.delta);
  const double l2 =
    weighted_shift(Delta, nu0, resp.r2, params.kappa2, params.delta);
  updated.l1 = std::isnan(l1) ? l1 : std::min(l1, 0.0);
  updated.l2 = std::isnan(l2) ? l2 : std::max(l2, 0.0);

  updated.kappa1 = update_kappa(Delta, nu0, resp.r1, params.delta + params.l1,
                                params.kappa1, ctrl, n_simplex_capped);
  updated.kappa2 = update_kappa(Delta, nu0, resp.r2, params.delta + params.l2,
                                params.kappa2, ctrl, n_simplex_capped);

  return updated;
}

static EmResult
run_em(const bool VERBOSE, const vector<double> &Delta,
       const vector<double> &nu0, const MixtureParams &initial,
       const double tol, const size_t max_iter, const SimplexControl &ctrl,
       vector<MixtureParams> *trace) {
  if (Delta.size() != nu0.size())
    throw runtime_error("differences and variances have different lengths: " +
                        to_string(Delta.size()) + " vs " +
                        to_string(nu0.size()));

  EmResult result;
  result.epsilon = numeric_limits<double>::infinity();

  if (VERBOSE)
    cerr << endl
         << setw(6) << "ITER" << setw(14) << "EPSILON" << '\t'
         << "PI0\tPI1\tPI2\tDELTA\tL1\tL2\tKAPPA1\tKAPPA2" << endl;

  Responsibilities resp;
  MixtureParams curr = initial;
  while (result.epsilon > tol && result.n_iter < max_iter) {
    expectation_step(Delta, nu0, curr, resp);
    const MixtureParams prev = curr;
    curr =
      maximization_step(Delta, nu0, prev, resp, ctrl, result.n_simplex_capped);

    // NaN here stops the loop and is left in the result for the caller
    result.epsilon = param_distance(curr, prev);
    ++result.n_iter;

    if (trace)
      trace->push_back(curr);
    if (VERBOSE)
      cerr << setw(6) << result.n_iter << setw(14) << std::setprecision(4)
           << result.epsilon << '\t' << curr << endl;
  }

  result.params = curr;
  result.converged = result.n_iter > 0 && result.epsilon <= tol;

  if (VERBOSE) {
    if (result.n_iter == 0)
      cerr << "no iterations run, returning initial values" << endl;
    else if (!result.params.is_finite())
      cerr << "degenerate fit: undefined parameter values" << endl;
    else if (!result.converged)
      cerr << "iteration limit reached (" << max_iter << ")" << endl;
    if (result.n_simplex_capped > 0)
      cerr << "variance searches stopped early: " << result.n_simplex_capped
           << endl;
  }
  return result;
}

EmResult
em_iter(const bool VERBOSE, const vector<double> &Delta,
        const vector<double> &nu0, const MixtureParams &initial,
        const double tol, const size_t max_iter, const SimplexControl &ctrl) {
  return run_em(VERBOSE, Delta, nu0, initial, tol, max_iter, ctrl, nullptr);
}

EmResult
em_iter(const bool VERBOSE, const vector<double> &Delta,
        const vector<double> &nu0, const MixtureParams &initial,
        const double tol, const size_t max_iter, const SimplexControl &ctrl,
        vector<MixtureParams> &trace) {
  trace.clear();
  return run_em(VERBOSE, Delta, nu0, initial, tol, max_iter, ctrl, &trace);
}

void
write_em_result(std::ostream &out, const EmResult &result) {
  const MixtureParams &p = result.params;
  out << "PARAMETER\tESTIMATE" << endl
      << "pi0\t" << p.pi0 << endl
      << "pi1\t" << p.pi1 << endl
      << "pi2\t" << p.pi2 << endl
      << "delta\t" << p.delta << endl
      << "l1\t" << p.l1 << endl
      << "l2\t" << p.l2 << endl
      << "kappa1\t" << p.kappa1 << endl
      << "kappa2\t" << p.kappa2 << endl
      << "iterations\t" << result.n_iter << endl
      << "epsilon\t" << result.epsilon << endl
      << "converged\t" << (result.converged ? "yes" : "no") << endl;
}

void
write_em_trace(std::ostream &out, const vector<MixtureParams> &trace) {
  out << "ITER\tPI0\tPI1\tPI2\tDELTA\tL1\tL2\tKAPPA1\tKAPPA2" << endl;
  for (size_t i = 0; i < trace.size(); ++i)
    out << i + 1 << '\t' << trace[i] << endl;
}
