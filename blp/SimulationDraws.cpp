#include <blp/SimulationDraws.hpp>
#include <blp/error.hpp>
#include <boost/random/normal_distribution.hpp>
#include <cmath>
#include <utility>

namespace blp {

using namespace Eigen;

constexpr double SimulationDraws::WEIGHT_TOLERANCE;

SimulationDraws::SimulationDraws(MatrixXd nodes, VectorXd weights)
    : nodes_(std::move(nodes)), weights_(std::move(weights))
{
    if (nodes_.rows() == 0) throw dimension_mismatch("simulation draws", 1, 0);
    if (nodes_.rows() != weights_.size()) throw dimension_mismatch("draw weight length", nodes_.rows(), weights_.size());

    for (int r = 0; r < weights_.size(); r++) {
        if (not (weights_[r] > 0.0)) throw invalid_weights(weights_[r]);
    }
    const double slack = std::fabs(weights_.sum() - 1.0);
    if (slack > WEIGHT_TOLERANCE) throw invalid_weights(slack);
}

template <class RNG>
SimulationDraws SimulationDraws::generate(std::size_t draws, std::size_t dimension, RNG &rng) {
    if (draws == 0) throw dimension_mismatch("simulation draws", 1, 0);

    boost::random::normal_distribution<double> stdnorm;
    MatrixXd nodes(draws, dimension);
    // Fill row by row so that the first rows of a larger set of draws match a smaller set
    for (std::size_t r = 0; r < draws; r++) {
        for (std::size_t k = 0; k < dimension; k++) {
            nodes(r, k) = stdnorm(rng);
        }
    }

    return SimulationDraws(std::move(nodes), VectorXd::Constant(draws, 1.0 / draws));
}

SimulationDraws SimulationDraws::standardNormal(std::size_t draws, std::size_t dimension, random::rng_t::result_type seed) {
    random::rng_t rng(seed);
    return generate(draws, dimension, rng);
}

SimulationDraws SimulationDraws::standardNormal(std::size_t draws, std::size_t dimension) {
    return generate(draws, dimension, random::rng());
}

}
