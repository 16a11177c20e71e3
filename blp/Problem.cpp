#include <blp/Problem.hpp>
#include <blp/debug.hpp>
#include <blp/demand.hpp>
#include <blp/error.hpp>
#include <blp/gmm.hpp>
#include <tuple>
#include <utility>

namespace blp {

using namespace Eigen;

Problem::Problem(ProductData products, SimulationDraws draws, ProblemOptions options)
    : products_(std::move(products)), draws_(std::move(draws)), options_(std::move(options))
{
    if (draws_.dimension() != products_.nonlinearDim())
        throw dimension_mismatch("draw dimension", products_.nonlinearDim(), draws_.dimension());
}

ProblemResults Problem::solve(const Ref<const MatrixXd> &sigma) const {
    return solve(sigma, options_);
}

ProblemResults Problem::solve(const Ref<const MatrixXd> &sigma, const ProblemOptions &options) const {
    ProblemResults res;
    std::tie(res.delta, res.contraction) = solve_delta(products_, draws_, sigma, options.contraction);
    BLP_DBG("contraction converged after " << res.contraction.iterations << " iterations (max gap " << res.contraction.max_gap << ")");

    if (options.gmm.weighting.strategy() == WeightingMatrix::Strategy::supplied)
        res.weighting_matrix = options.gmm.weighting.matrix();
    else
        res.weighting_matrix = inverse_ztz(products_.Z());

    res.beta = linear_parameters(products_, res.delta, res.weighting_matrix);
    res.xi = res.delta - products_.X1() * res.beta;
    res.predicted_shares = predict_shares(res.delta, products_, sigma, draws_, options.contraction);
    res.gmm_value = gmm_objective(products_, res.xi, res.weighting_matrix);
    res.options = options;
    BLP_DBGVAR(res.gmm_value);

    return res;
}

VectorXd Problem::predictShares(const Ref<const VectorXd> &delta, const Ref<const MatrixXd> &sigma) const {
    return predict_shares(delta, products_, sigma, draws_, options_.contraction);
}

Problem::Builder& Problem::Builder::products(ProductData products) {
    products_ = std::make_shared<const ProductData>(std::move(products));
    return *this;
}

Problem::Builder& Problem::Builder::draws(SimulationDraws draws) {
    draws_ = std::make_shared<const SimulationDraws>(std::move(draws));
    return *this;
}

Problem::Builder& Problem::Builder::options(ProblemOptions options) {
    options_ = std::move(options);
    return *this;
}

Problem Problem::Builder::build() const {
    if (not products_) throw missing_component("product data");
    if (not draws_) throw missing_component("simulation draws");
    return Problem(*products_, *draws_, options_);
}

}
