#pragma once
#include <blp/random/rng.hpp>
#include <Eigen/Core>
#include <cstddef>

namespace blp {

/** Simulated consumer heterogeneity: a matrix of integration nodes (one row per simulated
 * consumer, one column per nonlinear characteristic) and a vector of strictly positive
 * integration weights summing to one.
 *
 * Objects are immutable once constructed and are typically shared by every contraction solved for
 * a problem (e.g. for each candidate \f$\Sigma\f$ tried by an outer optimizer).
 */
class SimulationDraws final {
    public:
        /** Largest accepted absolute deviation of the weight sum from 1. */
        static constexpr double WEIGHT_TOLERANCE = 1e-8;

        /** Constructs draws from given nodes and weights (e.g. quadrature nodes).
         *
         * \throws dimension_mismatch if `nodes` has no rows, or if `weights` doesn't have one
         * element per row of `nodes`
         * \throws invalid_weights if any weight is not strictly positive (the slack is the
         * offending weight), or if the weights sum differs from 1 by more than WEIGHT_TOLERANCE
         * (the slack is the absolute difference)
         */
        SimulationDraws(Eigen::MatrixXd nodes, Eigen::VectorXd weights);

        /** Generates `draws` rows of `dimension` i.i.d. standard normal values, each with weight
         * `1/draws`.  The values are generated by a generator seeded with `seed`, so the same
         * seed always gives the same draws.  A `dimension` of 0 is allowed and gives a model
         * without consumer heterogeneity.
         *
         * \throws dimension_mismatch if `draws` is 0
         */
        static SimulationDraws standardNormal(std::size_t draws, std::size_t dimension, random::rng_t::result_type seed);

        /** Like standardNormal(draws, dimension, seed), but draws from the current thread's
         * random::rng() (which is seeded from BLP_RNG_SEED, if set).
         */
        static SimulationDraws standardNormal(std::size_t draws, std::size_t dimension);

        /// The number of draws (rows of nodes())
        std::size_t size() const { return nodes_.rows(); }
        /// The dimension of each draw (columns of nodes())
        std::size_t dimension() const { return nodes_.cols(); }
        /// The integration nodes
        const Eigen::MatrixXd& nodes() const { return nodes_; }
        /// The integration weights
        const Eigen::VectorXd& weights() const { return weights_; }

    private:
        template <class RNG>
        static SimulationDraws generate(std::size_t draws, std::size_t dimension, RNG &rng);

        Eigen::MatrixXd nodes_;
        Eigen::VectorXd weights_;
};

}
