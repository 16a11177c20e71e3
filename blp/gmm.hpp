#pragma once
#include <blp/ProductData.hpp>
#include <Eigen/Core>

/** \file blp/gmm.hpp linear IV/GMM step of BLP estimation
 *
 * Given solved mean utilities \f$\delta\f$, the linear parameters are the GMM estimates of
 * \f$\delta = X_1 \beta + \xi\f$ with moment conditions \f$E[Z'\xi] = 0\f$.
 */

namespace blp {

/** Returns \f$(Z'Z)^{-1}\f$, computed from a Cholesky decomposition of \f$Z'Z\f$.
 *
 * \throws singular_matrix ("Z'Z inversion") if \f$Z'Z\f$ is not positive definite, e.g. because
 * of collinear instruments.
 */
Eigen::MatrixXd inverse_ztz(const Eigen::Ref<const Eigen::MatrixXd> &Z);

/** Solves \f$(X_1'Z W Z'X_1) \beta = X_1'Z W Z'\delta\f$ for the linear parameters using a
 * Cholesky decomposition of the left-hand side matrix.
 *
 * \param products the product data providing \f$X_1\f$ and \f$Z\f$
 * \param delta the solved mean utilities
 * \param W the weighting matrix; must be square with one row per instrument
 *
 * \throws dimension_mismatch if delta or W don't conform to the product data
 * \throws singular_matrix ("X'ZWZX") if the left-hand side matrix is not positive definite: the
 * model is under-identified (fewer instruments than linear characteristics), the characteristics
 * are collinear, or W is not positive definite.
 */
Eigen::VectorXd linear_parameters(
        const ProductData &products,
        const Eigen::Ref<const Eigen::VectorXd> &delta,
        const Eigen::Ref<const Eigen::MatrixXd> &W);

/** Evaluates the GMM objective \f$(Z'\xi)' W (Z'\xi)\f$ for structural residuals `xi`.  The value
 * is non-negative whenever W is positive (semi-)definite.
 *
 * \throws dimension_mismatch if xi or W don't conform to the product data
 */
double gmm_objective(
        const ProductData &products,
        const Eigen::Ref<const Eigen::VectorXd> &xi,
        const Eigen::Ref<const Eigen::MatrixXd> &W);

}
