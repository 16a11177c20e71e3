#pragma once
#include <blp/ProductData.hpp>
#include <blp/SimulationDraws.hpp>
#include <blp/options.hpp>
#include <Eigen/Core>
#include <memory>

namespace blp {

/** The results of solving a Problem for one value of the nonlinear parameters. */
struct ProblemResults {
    /// Mean utilities recovered by the contraction
    Eigen::VectorXd delta;
    /// Linear parameter estimates
    Eigen::VectorXd beta;
    /// Structural residuals, \f$\xi = \delta - X_1\beta\f$
    Eigen::VectorXd xi;
    /// Model-implied shares at `delta`
    Eigen::VectorXd predicted_shares;
    /// GMM objective value, \f$(Z'\xi)' W (Z'\xi)\f$
    double gmm_value = 0.0;
    /// Contraction diagnostics
    ContractionSummary contraction;
    /// The weighting matrix used
    Eigen::MatrixXd weighting_matrix;
    /// The options in effect for the solve
    ProblemOptions options;
};

/** A BLP demand estimation problem: product data and simulated consumers, plus default options.
 *
 * The problem itself is immutable; solve() may be called concurrently from different threads
 * (for instance by an outer optimizer evaluating several values of \f$\Sigma\f$ at once), since
 * each call works on its own mean utilities.
 *
 * Typical use:
 *
 *     Problem problem(std::move(products), SimulationDraws::standardNormal(200, 1, 1234));
 *     auto results = problem.solve(sigma);
 *     std::cout << results.beta << "\n";
 */
class Problem final {
    public:
        class Builder;

        /** Constructs a problem.
         *
         * \throws dimension_mismatch if the draw dimension doesn't equal the number of nonlinear
         * characteristics (in particular, plain logit products need zero-dimension draws)
         */
        Problem(ProductData products, SimulationDraws draws, ProblemOptions options = ProblemOptions());

        /// The product data
        const ProductData& products() const { return products_; }
        /// The simulation draws
        const SimulationDraws& draws() const { return draws_; }
        /// The default options used by solve(sigma)
        const ProblemOptions& options() const { return options_; }

        /** Solves the problem at nonlinear parameters `sigma` using the problem's options.
         * Equivalent to `solve(sigma, options())`.
         */
        ProblemResults solve(const Eigen::Ref<const Eigen::MatrixXd> &sigma) const;

        /** Solves the problem at nonlinear parameters `sigma` using the given options: solves the
         * contraction for delta, computes the weighting matrix, estimates beta, and evaluates the
         * residuals, predicted shares and GMM objective.
         *
         * \throws dimension_mismatch if `sigma` or a supplied weighting matrix has the wrong size
         * \throws contraction_failure if the contraction doesn't converge
         * \throws numerical_error on utility overflow or share underflow
         * \throws singular_matrix if \f$Z'Z\f$ or \f$X_1'ZWZ'X_1\f$ can't be Cholesky decomposed
         */
        ProblemResults solve(const Eigen::Ref<const Eigen::MatrixXd> &sigma, const ProblemOptions &options) const;

        /** Returns the shares predicted at the given mean utilities and nonlinear parameters, using
         * the problem's contraction options.  Useful for diagnostics such as residual plots.
         *
         * \sa blp::predict_shares
         */
        Eigen::VectorXd predictShares(
                const Eigen::Ref<const Eigen::VectorXd> &delta,
                const Eigen::Ref<const Eigen::MatrixXd> &sigma) const;

    private:
        ProductData products_;
        SimulationDraws draws_;
        ProblemOptions options_;
};

/** Builds a Problem from components given one at a time.  Product data and draws are required;
 * options default to ProblemOptions().
 */
class Problem::Builder final {
    public:
        /// Sets the product data
        Builder& products(ProductData products);
        /// Sets the simulation draws
        Builder& draws(SimulationDraws draws);
        /// Sets the default options of the problem
        Builder& options(ProblemOptions options);

        /** Builds the problem.
         *
         * \throws missing_component if the product data or the draws were never given
         * \throws dimension_mismatch from the Problem constructor
         */
        Problem build() const;

    private:
        std::shared_ptr<const ProductData> products_;
        std::shared_ptr<const SimulationDraws> draws_;
        ProblemOptions options_;
};

}
