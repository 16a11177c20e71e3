#pragma once
#include <Eigen/Core>
#include <cstddef>
#include <limits>
#include <stdexcept>
#include <utility>

/** \file blp/options.hpp solver and estimator settings
 *
 * All settings are plain public members with the documented defaults, so a default-constructed
 * object gives the standard BLP configuration and individual values can simply be assigned.
 */

namespace blp {

/// Settings for the contraction mapping that recovers mean utilities.
struct ContractionOptions {
    /// Convergence tolerance on the largest absolute (damped) update of an iteration
    double tolerance = 1e-9;
    /// Maximum number of contraction iterations before giving up with a contraction_failure
    std::size_t max_iterations = 1000;
    /// Damping factor applied to the log-share update; 1 is the standard BLP contraction
    double damping = 1.0;
    /** Predicted shares below this value are treated as an underflow (numerical_error), both
     * while predicting shares and in the contraction update, to avoid taking log(0).
     */
    double minimum_share = 1e-16;
    /** Maximum number of threads to use for the market loop of a share prediction.  0 or 1 (the
     * default for 0) does all the work in the calling thread.  Results do not depend on the value.
     */
    unsigned int max_threads = 0;
};

/// Diagnostics of a converged contraction.
struct ContractionSummary {
    /// The number of iterations performed
    std::size_t iterations = 0;
    /// The largest absolute delta update of the final iteration
    double max_gap = std::numeric_limits<double>::infinity();
};

/** The weighting matrix used by the GMM estimator: either the conventional \f$(Z'Z)^{-1}\f$
 * (the default), or a matrix supplied by the caller.
 *
 * A supplied matrix is used as is.  It must be symmetric positive definite; a matrix that isn't
 * will typically show up as a singular_matrix error when solving for \f$\beta\f$.
 */
class WeightingMatrix final {
    public:
        /// How the weighting matrix is obtained
        enum class Strategy {
            /// \f$(Z'Z)^{-1}\f$, computed from the instruments at each solve
            inverse_ZtZ,
            /// A fixed, caller-supplied matrix
            supplied
        };

        /// Default constructor: uses the inverse of \f$Z'Z\f$.
        WeightingMatrix() = default;

        /// Returns a weighting matrix specification using the inverse of \f$Z'Z\f$.
        static WeightingMatrix inverseZtZ() { return WeightingMatrix(); }

        /// Returns a weighting matrix specification using the given matrix.
        static WeightingMatrix supplied(Eigen::MatrixXd W) {
            WeightingMatrix wm;
            wm.strategy_ = Strategy::supplied;
            wm.W_ = std::move(W);
            return wm;
        }

        /// The strategy of this weighting specification
        Strategy strategy() const { return strategy_; }

        /** The supplied matrix.
         *
         * \throws std::logic_error if the strategy is not Strategy::supplied
         */
        const Eigen::MatrixXd& matrix() const {
            if (strategy_ != Strategy::supplied)
                throw std::logic_error("WeightingMatrix::matrix() called for a computed weighting matrix");
            return W_;
        }

    private:
        Strategy strategy_ = Strategy::inverse_ZtZ;
        Eigen::MatrixXd W_;
};

/// Settings of the linear GMM step.
struct GmmOptions {
    /// The weighting matrix specification
    WeightingMatrix weighting;
};

/// All settings used when solving a Problem.
struct ProblemOptions {
    /// Contraction (and share prediction) settings
    ContractionOptions contraction;
    /// GMM settings
    GmmOptions gmm;

    /// Returns a copy of these options with the contraction settings replaced.
    ProblemOptions withContraction(ContractionOptions c) const {
        ProblemOptions o(*this);
        o.contraction = std::move(c);
        return o;
    }

    /// Returns a copy of these options with the weighting matrix specification replaced.
    ProblemOptions withWeighting(WeightingMatrix w) const {
        ProblemOptions o(*this);
        o.gmm.weighting = std::move(w);
        return o;
    }
};

}
