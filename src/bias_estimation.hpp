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

#ifndef SRC_BIAS_ESTIMATION_HPP_
#define SRC_BIAS_ESTIMATION_HPP_

#include "bounded_simplex.hpp"
#include "mixture_em.hpp"

#include <cstddef>
#include <vector>

struct BiasEstimate {
  EmResult em;
  double delta_em{};   // bias from the mixture fit
  double delta_wls{};  // weighted least squares bias
  double var_delta{};  // variance of the bias estimate
};

// starting values for the mixture from quantiles of the differences
MixtureParams
initial_params(const std::vector<double> &Delta);

// Weighted least squares bias given a mixture fit: taxa are assigned to
// components by the quantiles at pi1 and 1 - pi2 and weighted by their
// inflated precision. Sets var_delta to the inverse of the total weight.
double
wls_bias(const std::vector<double> &Delta, const std::vector<double> &nu0,
         const MixtureParams &fit, double &var_delta);

BiasEstimate
bias_est(const bool VERBOSE, const std::vector<double> &Delta,
         const std::vector<double> &nu0, const double tol,
         const std::size_t max_iter,
         const SimplexControl &ctrl = SimplexControl());

// subtract the bias; with conserve the variance of the bias is added to
// each taxon's variance before taking the standard error
void
correct_bias(const std::vector<double> &Delta, const std::vector<double> &nu0,
             const double delta_em, const double var_delta,
             const bool conserve, std::vector<double> &beta_hat,
             std::vector<double> &se_hat);

#endif  // SRC_BIAS_ESTIMATION_HPP_
