#pragma once
#include <blp/ProductData.hpp>
#include <blp/SimulationDraws.hpp>
#include <blp/options.hpp>
#include <Eigen/Core>
#include <utility>

/** \file blp/demand.hpp demand side of the BLP model
 *
 * Model-implied market shares of the random-coefficients logit model, and the BLP contraction
 * that inverts observed shares into mean utilities.
 */

namespace blp {

/** Computes the market shares implied by mean utilities `delta` and nonlinear parameters `sigma`.
 *
 * For product \f$j\f$ in market \f$t\f$ the predicted share is
 * \f[
 *     \hat s_{jt} = \sum_r w_r \frac{\exp(\delta_j + x_{2j}' \Sigma \nu_r)}
 *                              {1 + \sum_{k \in t} \exp(\delta_k + x_{2k}' \Sigma \nu_r)}
 * \f]
 * where \f$\nu_r\f$ and \f$w_r\f$ are the nodes and weights of `draws`; the 1 in the denominator is
 * the outside option, whose utility is normalized to 0.  When the products have no nonlinear
 * characteristics the draws are ignored entirely and this is the plain logit share (i.e. a single
 * draw with weight 1).
 *
 * Markets are independent: with `options.max_threads > 1` they are divided among that many
 * threads.  Each product's share is always summed over draws in draw order by a single thread, so
 * the result is the same (to the bit) for any thread count.  If a thread can't be started (e.g.
 * because the process is out of resources), its markets and those of the remaining threads are
 * handled in the calling thread instead.
 *
 * \param delta the mean utilities, one per product
 * \param products the product data
 * \param sigma the square matrix of nonlinear parameters; ignored (and may be empty) if the
 * products have no nonlinear characteristics
 * \param draws the simulated consumer draws
 * \param options the minimum share floor and thread settings
 *
 * \throws dimension_mismatch if delta, sigma or draws don't conform to the product data
 * \throws numerical_error if an exponentiated utility isn't finite, or if a (weighted) share
 * falls below `options.minimum_share`.  If several markets fail, the failure of the first such
 * market is the one thrown.
 */
Eigen::VectorXd predict_shares(
        const Eigen::Ref<const Eigen::VectorXd> &delta,
        const ProductData &products,
        const Eigen::Ref<const Eigen::MatrixXd> &sigma,
        const SimulationDraws &draws,
        const ContractionOptions &options = ContractionOptions());

/** Solves the BLP fixed point for the mean utilities.
 *
 * Starting from the logit inversion \f$\delta_j = \ln(s_j / s_{0t})\f$, each iteration predicts
 * shares at the current delta and updates
 * \f$\delta_j \leftarrow \delta_j + \kappa \ln(s_j / \hat s_j)\f$, where \f$\kappa\f$ is
 * `options.damping`.  Iteration stops as soon as the largest absolute update of an iteration is
 * below `options.tolerance`.
 *
 * \returns the solved mean utilities and the iteration diagnostics
 *
 * \throws contraction_failure if `options.max_iterations` iterations are performed without
 * convergence (sigma and the draws are checked before the first iteration, so a shape error is
 * reported as a dimension_mismatch even when `max_iterations` is 0)
 * \throws numerical_error if a predicted share falls below `options.minimum_share`
 * \throws dimension_mismatch as for predict_shares()
 */
std::pair<Eigen::VectorXd, ContractionSummary> solve_delta(
        const ProductData &products,
        const SimulationDraws &draws,
        const Eigen::Ref<const Eigen::MatrixXd> &sigma,
        const ContractionOptions &options = ContractionOptions());

}
