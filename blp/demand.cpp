#include <blp/demand.hpp>
#include <blp/debug.hpp>
#include <blp/error.hpp>
#include <algorithm>
#include <cmath>
#include <exception>
#include <new>
#include <system_error>
#include <thread>
#include <vector>

namespace blp {

using namespace Eigen;

namespace {

// Adds the predicted shares of the products of market `seg` into `shares`.  `tastes` holds one row
// of simulated taste shocks (Sigma * nu_r)' per draw; `exp_u` is scratch space.
void market_shares(
        const MarketSegment &seg,
        const Ref<const VectorXd> &delta,
        const MatrixXd &X2,
        const MatrixXd &tastes,
        const VectorXd &weights,
        double minimum_share,
        VectorXd &shares,
        VectorXd &exp_u) {

    const Index start = seg.start(), size = seg.size();
    // mu(j, r) = x2_j' Sigma nu_r
    MatrixXd mu;
    if (tastes.cols() > 0) mu.noalias() = X2.middleRows(start, size) * tastes.transpose();
    else mu.setZero(size, tastes.rows());
    exp_u.resize(size);

    shares.segment(start, size).setZero();
    for (Index r = 0; r < weights.size(); r++) {
        double denominator = 1.0;
        for (Index j = 0; j < size; j++) {
            exp_u[j] = std::exp(delta[start + j] + mu(j, r));
            if (not std::isfinite(exp_u[j])) throw numerical_error("utility exponentiation");
            denominator += exp_u[j];
        }
        for (Index j = 0; j < size; j++) {
            const double s = weights[r] * exp_u[j] / denominator;
            if (s < minimum_share) throw numerical_error("predicted share underflow");
            shares[start + j] += s;
        }
    }
}

// Sigma must be K2 x K2 and the draws K2-dimensional, unless there are no nonlinear
// characteristics, in which case both are ignored.
void check_heterogeneity(const ProductData &products, const Ref<const MatrixXd> &sigma, const SimulationDraws &draws) {
    const std::size_t k2 = products.nonlinearDim();
    if (k2 == 0) return;
    if ((std::size_t) sigma.rows() != k2 or (std::size_t) sigma.cols() != k2)
        throw dimension_mismatch("sigma dimension", k2, sigma.rows() != (Index) k2 ? sigma.rows() : sigma.cols());
    if (draws.dimension() != k2) throw dimension_mismatch("draw dimension", k2, draws.dimension());
}

}

VectorXd predict_shares(
        const Ref<const VectorXd> &delta,
        const ProductData &products,
        const Ref<const MatrixXd> &sigma,
        const SimulationDraws &draws,
        const ContractionOptions &options) {

    const std::size_t n = products.size();
    if ((std::size_t) delta.size() != n) throw dimension_mismatch("delta length", n, delta.size());
    check_heterogeneity(products, sigma, draws);

    MatrixXd tastes;
    VectorXd weights;
    if (products.nonlinearDim() == 0) {
        // Plain logit: one "draw" with no taste shock and weight 1
        tastes.resize(1, 0);
        weights = VectorXd::Ones(1);
    }
    else {
        // Row r is (Sigma nu_r)'
        tastes = draws.nodes() * sigma.transpose();
        weights = draws.weights();
    }

    const auto &markets = products.partition().markets();
    VectorXd shares(n);

    const std::size_t threads = std::min<std::size_t>(options.max_threads, markets.size());
    if (threads <= 1) {
        VectorXd exp_u;
        for (const auto &seg : markets)
            market_shares(seg, delta, products.X2(), tastes, weights, options.minimum_share, shares, exp_u);
        return shares;
    }

    // Give each thread a contiguous block of markets.  A thread stops at its first failing market;
    // since blocks are in market order, the first stored exception is from the first failing
    // market overall.
    std::vector<std::exception_ptr> failures(threads);
    auto work = [&](std::size_t t, std::size_t begin, std::size_t end) {
        VectorXd exp_u;
        try {
            for (std::size_t m = begin; m < end; m++)
                market_shares(markets[m], delta, products.X2(), tastes, weights, options.minimum_share, shares, exp_u);
        }
        catch (...) {
            failures[t] = std::current_exception();
        }
    };

    BLP_DBG("predicting shares of " << markets.size() << " markets using " << threads << " threads");
    std::vector<std::thread> pool;
    pool.reserve(threads);
    const std::size_t block = markets.size() / threads, extra = markets.size() % threads;
    std::size_t begin = 0, t = 0;
    for (; t < threads; t++) {
        const std::size_t end = begin + block + (t < extra ? 1 : 0);
        try {
            pool.emplace_back(work, t, begin, end);
        }
        catch (const std::system_error &e) {
            BLP_DBG("unable to start thread " << t << " (" << e.what() << "); finishing in the calling thread");
            break;
        }
        catch (const std::bad_alloc &) {
            BLP_DBG("unable to allocate thread " << t << "; finishing in the calling thread");
            break;
        }
        begin = end;
    }
    // Blocks t, t+1, ... whose threads couldn't be started.  Markets are still handled in order, so
    // failures[t] is still the first failure among them.
    if (t < threads) work(t, begin, markets.size());

    for (auto &thr : pool) thr.join();

    for (const auto &f : failures) {
        if (f) std::rethrow_exception(f);
    }

    return shares;
}

std::pair<VectorXd, ContractionSummary> solve_delta(
        const ProductData &products,
        const SimulationDraws &draws,
        const Ref<const MatrixXd> &sigma,
        const ContractionOptions &options) {

    check_heterogeneity(products, sigma, draws);

    const std::size_t n = products.size();
    const VectorXd &observed = products.shares();

    // Logit starting values: delta_j = ln(s_j / s_0)
    VectorXd delta(n);
    for (std::size_t j = 0; j < n; j++)
        delta[j] = std::log(observed[j] / products.outsideShare(j));

    ContractionSummary summary;
    while (summary.iterations < options.max_iterations) {
        const VectorXd predicted = predict_shares(delta, products, sigma, draws, options);

        double max_gap = 0.0;
        for (std::size_t j = 0; j < n; j++) {
            if (predicted[j] < options.minimum_share) throw numerical_error("predicted share underflow");
            const double step = options.damping * std::log(observed[j] / predicted[j]);
            delta[j] += step;
            max_gap = std::max(max_gap, std::fabs(step));
        }

        summary.iterations++;
        summary.max_gap = max_gap;
        BLP_DBG("contraction iteration " << summary.iterations << ": max gap " << max_gap);

        if (max_gap < options.tolerance)
            return {std::move(delta), summary};
    }

    throw contraction_failure(summary.iterations, summary.max_gap);
}

}
