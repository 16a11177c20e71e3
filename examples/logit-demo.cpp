/// Simple example: simulate a random-coefficients logit market, then recover its parameters

#include <blp/Problem.hpp>
#include <blp/demand.hpp>
#include <blp/error.hpp>
#include <blp/random/rng.hpp>
#include <boost/random/normal_distribution.hpp>
#include <boost/random/uniform_real_distribution.hpp>
#include <iostream>
#include <string>
#include <vector>

using namespace blp;
using Eigen::MatrixXd;
using Eigen::VectorXd;

int main() {
    // Use BLP_RNG_SEED=... to get the same data on every run
    std::cout << "RNG seed: " << random::seed() << "\n";
    auto &rng = random::rng();
    boost::random::uniform_real_distribution<double> unif(0.5, 2.0);
    boost::random::normal_distribution<double> xi_dist(0.0, 0.25);

    // 50 markets of 4 products.  Utility is 1 - 2 x + xi, plus a random coefficient on x with
    // standard deviation 0.8.  The instruments are the characteristics plus a cost shifter that
    // moves x.
    const int markets = 50, per_market = 4, n = markets * per_market;
    const double beta0 = 1.0, beta1 = -2.0, true_sigma = 0.8;

    std::vector<std::string> ids;
    MatrixXd X1(n, 2), X2(n, 1), Z(n, 3);
    VectorXd delta(n);
    for (int t = 0; t < markets; t++) {
        for (int k = 0; k < per_market; k++) {
            const int j = t*per_market + k;
            ids.push_back("market " + std::to_string(t));
            const double cost = unif(rng);
            const double x = 0.5*cost + 0.25*unif(rng);
            X1.row(j) << 1, x;
            X2(j, 0) = x;
            Z.row(j) << 1, x, cost;
            delta[j] = beta0 + beta1*x + xi_dist(rng);
        }
    }

    auto draws = SimulationDraws::standardNormal(500, 1);
    MatrixXd sigma = MatrixXd::Constant(1, 1, true_sigma);

    try {
        // The "observed" shares are the ones implied by the true parameters
        ProductData simulated(ids, VectorXd::Constant(n, 1.0 / (2*per_market)), X1, X2, Z);
        VectorXd shares = predict_shares(delta, simulated, sigma, draws);

        auto problem = Problem::Builder()
            .products(ProductData(ids, shares, X1, X2, Z))
            .draws(draws)
            .build();

        for (double s : {0.0, 0.4, true_sigma, 1.2}) {
            auto res = problem.solve(MatrixXd::Constant(1, 1, s));
            std::cout << "sigma = " << s << ":\n";
            std::cout << "    contraction iterations: " << res.contraction.iterations << "\n";
            std::cout << "    beta: [" << res.beta.transpose() << "]\n";
            std::cout << "    GMM objective: " << res.gmm_value << "\n";
        }
        std::cout << "True beta: [" << beta0 << " " << beta1 << "]\n";
    }
    catch (const error &e) {
        std::cerr << "Estimation failed: " << e.what() << "\n";
        return 1;
    }
}
