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

// Checks for the E and M steps and the EM driver of the bias mixture.

#include "bounded_simplex.hpp"
#include "mixture_em.hpp"

#include <gsl/gsl_errno.h>

#include <cmath>
#include <cstddef>
#include <iostream>
#include <stdexcept>
#include <string>
#include <vector>

using std::size_t;
using std::vector;

static int
check(const bool ok, const std::string &label) {
  if (!ok) {
    std::cerr << "FAIL: " << label << "\n";
    return 1;
  }
  return 0;
}

static MixtureParams
make_params(const double pi0, const double pi1, const double pi2,
            const double delta, const double l1, const double l2,
            const double kappa1, const double kappa2) {
  MixtureParams p;
  p.pi0 = pi0;
  p.pi1 = pi1;
  p.pi2 = pi2;
  p.delta = delta;
  p.l1 = l1;
  p.l2 = l2;
  p.kappa1 = kappa1;
  p.kappa2 = kappa2;
  return p;
}

// every row sums to one or is exactly zero
static bool
rows_normalized(const Responsibilities &resp) {
  for (size_t i = 0; i < resp.r0.size(); ++i) {
    const double total = resp.r0[i] + resp.r1[i] + resp.r2[i];
    const bool zero_row =
      resp.r0[i] == 0.0 && resp.r1[i] == 0.0 && resp.r2[i] == 0.0;
    if (!zero_row && std::fabs(total - 1.0) > 1e-12)
      return false;
  }
  return true;
}

static bool
sign_valid(const MixtureParams &p) {
  return p.l1 <= 0.0 && p.l2 >= 0.0 && p.kappa1 >= 0.0 && p.kappa2 >= 0.0;
}

static int
test_expectation_step() {
  int failed = 0;
  const vector<double> Delta = {-1.0, 0.0, 0.4, 2.5};
  const vector<double> nu0 = {0.5, 1.0, 1.0, 0.2};
  const MixtureParams p = make_params(0.6, 0.2, 0.2, 0.1, -1.0, 1.5, 0.3, 0.3);

  Responsibilities resp;
  expectation_step(Delta, nu0, p, resp);
  failed += check(resp.r0.size() == Delta.size(), "e-step: one row per taxon");
  failed += check(rows_normalized(resp), "e-step: rows sum to one");

  // taxon at the upper shift mostly belongs to the upper component
  failed += check(resp.r2[3] > resp.r0[3] && resp.r2[3] > resp.r1[3],
                  "e-step: upper outlier assigned to upper component");

  // hand computed row for the second taxon
  const double w0 = 0.6 * gaussian_pdf(0.0, 0.1, 1.0);
  const double w1 = 0.2 * gaussian_pdf(0.0, -0.9, 1.3);
  const double w2 = 0.2 * gaussian_pdf(0.0, 1.6, 1.3);
  failed += check(std::fabs(resp.r0[1] - w0 / (w0 + w1 + w2)) < 1e-12,
                  "e-step: matches hand computation");

  // all densities underflow
  const vector<double> far = {1e3};
  const vector<double> tiny = {1e-6};
  const MixtureParams q = make_params(0.5, 0.25, 0.25, 0.0, 0.0, 0.0, 0.0, 0.0);
  expectation_step(far, tiny, q, resp);
  failed += check(resp.r0[0] == 0.0 && resp.r1[0] == 0.0 && resp.r2[0] == 0.0,
                  "e-step: underflow gives zero row");

  // zero weights
  const MixtureParams z = make_params(0.0, 0.0, 0.0, 0.0, 0.0, 0.0, 0.0, 0.0);
  expectation_step(Delta, nu0, z, resp);
  bool all_zero = true;
  for (size_t i = 0; i < Delta.size(); ++i)
    all_zero = all_zero && resp.r0[i] == 0.0 && resp.r1[i] == 0.0 &&
               resp.r2[i] == 0.0;
  failed += check(all_zero, "e-step: zero weights give zero rows");
  return failed;
}

static int
test_maximization_step() {
  int failed = 0;
  const vector<double> Delta = {-2.0, 0.1, -0.1, 3.0};
  const vector<double> nu0 = {1.0, 1.0, 1.0, 1.0};
  const MixtureParams p =
    make_params(0.5, 0.25, 0.25, 0.0, -1.0, 1.0, 0.5, 0.5);

  Responsibilities resp;
  resp.r0 = {0.0, 1.0, 1.0, 0.0};
  resp.r1 = {1.0, 0.0, 0.0, 0.0};
  resp.r2 = {0.0, 0.0, 0.0, 1.0};

  size_t n_capped = 0;
  const MixtureParams u =
    maximization_step(Delta, nu0, p, resp, SimplexControl(), n_capped);

  failed += check(u.pi0 == 0.5 && u.pi1 == 0.25 && u.pi2 == 0.25,
                  "m-step: weights are column means");

  // (0.1 - 0.1 + (-2 + 1)/1.5 + (3 - 1)/1.5) / (2 + 1/1.5 + 1/1.5)
  const double expected_delta = (1.0 / 1.5) / (2.0 + 2.0 / 1.5);
  failed += check(std::fabs(u.delta - expected_delta) < 1e-12,
                  "m-step: precision weighted bias");
  failed += check(std::fabs(u.l1 + 2.0) < 1e-12, "m-step: lower shift");
  failed += check(std::fabs(u.l2 - 3.0) < 1e-12, "m-step: upper shift");

  // the variance objective for the lower component is minimized where
  // nu0 + x equals the squared residual from delta + l1
  failed += check(std::fabs(u.kappa1 - 0.0) < 1e-6,
                  "m-step: lower variance at bound");
  failed += check(std::fabs(u.kappa2 - 3.0) < 1e-4,
                  "m-step: upper variance fits residual");

  // shifts with the wrong sign are clamped
  Responsibilities flipped;
  flipped.r0 = {0.0, 1.0, 1.0, 0.0};
  flipped.r1 = {0.0, 0.0, 0.0, 1.0};
  flipped.r2 = {1.0, 0.0, 0.0, 0.0};
  const MixtureParams c =
    maximization_step(Delta, nu0, p, flipped, SimplexControl(), n_capped);
  failed += check(c.l1 == 0.0 && c.l2 == 0.0, "m-step: shifts clamped to 0");
  return failed;
}

static int
test_kappa_objective() {
  int failed = 0;
  const vector<double> Delta = {3.0, 0.1};
  const vector<double> nu0 = {1.0, 1.0};

  // a density that underflows contributes nothing
  const vector<double> far = {1e4};
  const vector<double> tiny = {1e-8};
  const vector<double> one = {1.0};
  failed += check(kappa_objective(far, tiny, one, 0.0, 0.0) == 0.0,
                  "objective: underflow term is zero");

  // more weight on the taxon with the large residual moves the variance
  // up toward its squared residual
  Responsibilities low, high;
  low.r0 = {0.9, 0.0};
  low.r1 = {0.1, 1.0};
  low.r2 = {0.0, 0.0};
  high.r0 = {0.0, 0.0};
  high.r1 = {1.0, 1.0};
  high.r2 = {0.0, 0.0};
  const MixtureParams p = make_params(0.5, 0.5, 0.0, 0.0, 0.0, 0.0, 1.0, 1.0);

  size_t n_capped = 0;
  const MixtureParams u_low =
    maximization_step(Delta, nu0, p, low, SimplexControl(), n_capped);
  const MixtureParams u_high =
    maximization_step(Delta, nu0, p, high, SimplexControl(), n_capped);
  failed += check(u_low.kappa1 < u_high.kappa1,
                  "objective: heavier outlier weight raises kappa1");
  // optimum at sum(r * Delta^2) / sum(r) - nu0
  failed += check(std::fabs(u_high.kappa1 - 3.505) < 1e-3,
                  "objective: kappa1 at weighted residual variance");
  failed += check(u_low.kappa1 < 1e-6, "objective: kappa1 at bound");
  return failed;
}

static int
test_concrete_scenario() {
  int failed = 0;
  const vector<double> Delta = {0.5, 0.5, -0.5, -0.5};
  const vector<double> nu0 = {1.0, 1.0, 1.0, 1.0};
  const MixtureParams init =
    make_params(0.8, 0.1, 0.1, 0.0, -0.2, 0.2, 0.1, 0.1);
  const double tol = 1e-5;
  const size_t max_iter = 100;

  vector<MixtureParams> trace;
  const EmResult res =
    em_iter(false, Delta, nu0, init, tol, max_iter, SimplexControl(), trace);

  failed += check(res.n_iter >= 1 && res.n_iter <= max_iter,
                  "scenario: terminates within max_iter");
  failed += check(res.converged || res.n_iter == max_iter,
                  "scenario: converged or hit the cap");
  failed += check(res.epsilon >= 0.0, "scenario: epsilon non-negative");
  failed += check(res.converged && res.epsilon <= tol,
                  "scenario: converged below tol");
  failed += check(sign_valid(res.params), "scenario: sign constraints");
  failed += check(trace.size() == res.n_iter, "scenario: trace per iteration");
  failed += check(std::fabs(res.params.delta) < 1e-6,
                  "scenario: symmetric data gives zero bias");
  failed += check(std::fabs(res.params.pi0 + res.params.pi1 + res.params.pi2 -
                            1.0) < 1e-12,
                  "scenario: weights sum to one");

  Responsibilities resp;
  bool all_normalized = true;
  bool all_signs = true;
  MixtureParams prev = init;
  bool eps_ok = true;
  for (size_t i = 0; i < trace.size(); ++i) {
    expectation_step(Delta, nu0, trace[i], resp);
    all_normalized = all_normalized && rows_normalized(resp);
    all_signs = all_signs && sign_valid(trace[i]);
    eps_ok = eps_ok && param_distance(trace[i], prev) >= 0.0;
    prev = trace[i];
  }
  failed += check(all_normalized, "scenario: responsibilities normalized");
  failed += check(all_signs, "scenario: every iterate sign valid");
  failed += check(eps_ok, "scenario: every step change non-negative");
  failed += check(trace.back().delta == res.params.delta,
                  "scenario: result is the last iterate");

  // one more iteration from the converged point barely moves
  const EmResult again =
    em_iter(false, Delta, nu0, res.params, tol, 1, SimplexControl());
  failed += check(again.n_iter == 1, "fixed point: one iteration run");
  failed += check(again.epsilon <= tol, "fixed point: change within tol");
  return failed;
}

static int
test_single_component() {
  int failed = 0;
  const vector<double> Delta = {0.0, 0.0, 0.0, 0.0};
  const vector<double> nu0 = {1.0, 1.0, 1.0, 1.0};
  const MixtureParams init =
    make_params(1.0 / 3, 1.0 / 3, 1.0 / 3, 0.0, -0.2, 0.2, 0.1, 0.1);

  const EmResult res = em_iter(false, Delta, nu0, init, 1e-5, 100);
  const MixtureParams &p = res.params;
  failed += check(res.converged, "single: converged");
  failed += check(std::fabs(p.delta) < 1e-5, "single: bias at zero");
  failed += check(p.l1 == 0.0 && p.l2 == 0.0, "single: shifts collapse");
  failed += check(p.kappa1 < 1e-5 && p.kappa2 < 1e-5,
                  "single: extra variances collapse");

  // the fitted mixture is then the single null component
  const double fitted =
    p.pi0 * gaussian_pdf(0.0, p.delta, 1.0) +
    p.pi1 * gaussian_pdf(0.0, p.delta + p.l1, 1.0 + p.kappa1) +
    p.pi2 * gaussian_pdf(0.0, p.delta + p.l2, 1.0 + p.kappa2);
  failed += check(std::fabs(fitted - gaussian_pdf(0.0, 0.0, 1.0)) < 1e-5,
                  "single: mixture equals null density");
  failed += check(p.pi0 >= p.pi1 && p.pi0 >= p.pi2,
                  "single: null component keeps the largest weight");
  return failed;
}

static int
test_edge_cases() {
  int failed = 0;
  const vector<double> Delta = {0.5, -0.5};
  const vector<double> nu0 = {1.0, 1.0};
  const MixtureParams init =
    make_params(0.8, 0.1, 0.1, 0.0, -0.2, 0.2, 0.1, 0.1);

  // no iterations: initial values come back unchanged
  const EmResult none = em_iter(false, Delta, nu0, init, 1e-5, 0);
  failed += check(none.n_iter == 0, "zero iter: no iterations");
  failed += check(!none.converged, "zero iter: not converged");
  failed += check(param_distance(none.params, init) == 0.0,
                  "zero iter: initial values returned");

  // the cap is honored
  const EmResult capped = em_iter(false, Delta, nu0, init, 0.0, 3);
  failed += check(capped.n_iter == 3, "cap: stops at max_iter");

  // no taxa: undefined parameters surface in the result
  const vector<double> empty;
  const EmResult degenerate = em_iter(false, empty, empty, init, 1e-5, 10);
  failed += check(degenerate.n_iter == 1, "no taxa: stops after one step");
  failed += check(std::isnan(degenerate.params.pi0) &&
                    std::isnan(degenerate.params.delta),
                  "no taxa: undefined weights and bias");
  failed += check(!degenerate.params.is_finite(), "no taxa: not finite");
  failed += check(!degenerate.converged, "no taxa: not converged");

  // mismatched inputs are rejected
  bool threw = false;
  try {
    const vector<double> short_nu0 = {1.0};
    em_iter(false, Delta, short_nu0, init, 1e-5, 10);
  }
  catch (const std::runtime_error &) {
    threw = true;
  }
  failed += check(threw, "lengths: mismatch throws");
  return failed;
}

int
main() {
  gsl_set_error_handler_off();
  int failed = 0;

  failed += test_expectation_step();
  failed += test_maximization_step();
  failed += test_kappa_objective();
  failed += test_concrete_scenario();
  failed += test_single_component();
  failed += test_edge_cases();

  if (failed == 0) {
    std::cout << "PASS: mixture EM checks\n";
    return 0;
  }
  std::cerr << "FAILED: " << failed << " check(s)\n";
  return 1;
}
