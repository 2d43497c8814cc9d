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

#ifndef SRC_MIXTURE_EM_HPP_
#define SRC_MIXTURE_EM_HPP_

#include "bounded_simplex.hpp"

#include <cstddef>
#include <ostream>
#include <vector>

// Three component Gaussian mixture for the log-ratio differences:
// component 0 is N(delta, nu0), component 1 is N(delta + l1, nu0 +
// kappa1) with l1 <= 0 and component 2 is N(delta + l2, nu0 + kappa2)
// with l2 >= 0.
struct MixtureParams {
  double pi0{};
  double pi1{};
  double pi2{};
  double delta{};
  double l1{};
  double l2{};
  double kappa1{};
  double kappa2{};

  bool is_finite() const;
};

// Euclidean norm of the difference over all eight parameters
double
param_distance(const MixtureParams &a, const MixtureParams &b);

std::ostream &
operator<<(std::ostream &out, const MixtureParams &p);

// posterior membership probabilities, one column per component; a row
// is all zero when the mixture density at that taxon is zero or undefined
struct Responsibilities {
  std::vector<double> r0;
  std::vector<double> r1;
  std::vector<double> r2;
};

struct EmResult {
  MixtureParams params;
  std::size_t n_iter{};
  double epsilon{};
  bool converged{};
  std::size_t n_simplex_capped{};  // nested searches stopped early
};

double
gaussian_pdf(const double x, const double mean, const double variance);

void
expectation_step(const std::vector<double> &Delta,
                 const std::vector<double> &nu0, const MixtureParams &params,
                 Responsibilities &resp);

// weighted negative log-likelihood of the extra variance x for one of
// the outlier components centered at center
double
kappa_objective(const std::vector<double> &Delta,
                const std::vector<double> &nu0,
                const std::vector<double> &weights, const double center,
                const double x);

// n_simplex_capped is incremented for each of the two variance searches
// that stopped before reaching tolerance
MixtureParams
maximization_step(const std::vector<double> &Delta,
                  const std::vector<double> &nu0, const MixtureParams &params,
                  const Responsibilities &resp, const SimplexControl &ctrl,
                  std::size_t &n_simplex_capped);

// Iterate E and M steps from the initial parameters until the change in
// parameters is at most tol or max_iter iterations have been done. If no
// iteration is done, the initial parameters are returned with n_iter = 0.
EmResult
em_iter(const bool VERBOSE, const std::vector<double> &Delta,
        const std::vector<double> &nu0, const MixtureParams &initial,
        const double tol, const std::size_t max_iter,
        const SimplexControl &ctrl = SimplexControl());

// same, also recording each accepted iterate
EmResult
em_iter(const bool VERBOSE, const std::vector<double> &Delta,
        const std::vector<double> &nu0, const MixtureParams &initial,
        const double tol, const std::size_t max_iter,
        const SimplexControl &ctrl, std::vector<MixtureParams> &trace);

void
write_em_result(std::ostream &out, const EmResult &result);

void
write_em_trace(std::ostream &out, const std::vector<MixtureParams> &trace);

#endif  // SRC_MIXTURE_EM_HPP_
