#pragma once
#include <blp/MarketPartition.hpp>
#include <Eigen/Core>
#include <cstddef>
#include <memory>
#include <string>
#include <vector>

namespace blp {

/** Immutable product-level data for a BLP problem: market labels, observed shares, linear
 * characteristics \f$X_1\f$, nonlinear characteristics \f$X_2\f$ and instruments \f$Z\f$, plus
 * the MarketPartition derived from the labels.
 *
 * Objects are created through ProductData::Builder (or the all-in-one constructor, which uses the
 * builder), which validates dimensions and market structure before anything is stored.  Rows are
 * products; the products of a market must be contiguous.
 */
class ProductData final {
    public:
        class Builder;

        /** Constructs and validates product data from all of its components.  Equivalent to
         * `ProductData::Builder(market_ids, shares).x1(X1).x2(X2).instruments(Z).build()`.
         */
        ProductData(
                std::vector<std::string> market_ids,
                Eigen::VectorXd shares,
                Eigen::MatrixXd X1,
                Eigen::MatrixXd X2,
                Eigen::MatrixXd Z);

        /// The number of products across all markets
        std::size_t size() const { return shares_.size(); }
        /// The number of linear characteristics (columns of X1)
        std::size_t linearDim() const { return X1_.cols(); }
        /// The number of nonlinear characteristics (columns of X2); 0 for a plain logit model
        std::size_t nonlinearDim() const { return X2_.cols(); }
        /// The number of instruments (columns of Z)
        std::size_t instrumentDim() const { return Z_.cols(); }

        /// Observed product shares
        const Eigen::VectorXd& shares() const { return shares_; }
        /// Linear characteristics
        const Eigen::MatrixXd& X1() const { return X1_; }
        /// Nonlinear characteristics
        const Eigen::MatrixXd& X2() const { return X2_; }
        /// Instruments
        const Eigen::MatrixXd& Z() const { return Z_; }
        /// The market partition of the product rows
        const MarketPartition& partition() const { return partition_; }

        /// The market label of product `j`
        const std::string& marketId(std::size_t j) const { return market_ids_[j]; }
        /// The outside share of the market containing product `j`
        double outsideShare(std::size_t j) const { return partition_.segmentOf(j).outsideShare(); }

    private:
        ProductData() = default;

        std::vector<std::string> market_ids_;
        Eigen::VectorXd shares_;
        Eigen::MatrixXd X1_, X2_, Z_;
        MarketPartition partition_;
};

/** Incremental constructor of ProductData.  Market labels and shares are required up front; X1
 * must be set before calling build(); X2 defaults to a matrix with zero columns (i.e. no random
 * coefficients) and the instruments default to X1.
 *
 * Example:
 *
 *     auto products = ProductData::Builder({"m1", "m1", "m2"}, shares)
 *         .x1(X1)
 *         .x2(X2)
 *         .instruments(Z)
 *         .build();
 */
class ProductData::Builder final {
    public:
        /// Starts a builder from per-product market labels and observed shares.
        Builder(std::vector<std::string> market_ids, Eigen::VectorXd shares);

        /// Sets the linear characteristics matrix
        Builder& x1(Eigen::MatrixXd X1);
        /// Sets the nonlinear characteristics matrix
        Builder& x2(Eigen::MatrixXd X2);
        /// Sets the instrument matrix
        Builder& instruments(Eigen::MatrixXd Z);

        /** Validates the data and builds the ProductData.  The builder's matrices are moved into
         * the result, so the builder should not be reused afterwards.
         *
         * \throws dimension_mismatch if shares, X1, X2 or Z don't have one row per market label,
         * or if X1 was never given
         * \throws non_positive_share if any share is not strictly positive (NaN included)
         * \throws non_contiguous_market, numerical_error, non_positive_outside_share from the
         * market partitioning
         */
        ProductData build();

    private:
        std::vector<std::string> market_ids_;
        Eigen::VectorXd shares_;
        std::unique_ptr<Eigen::MatrixXd> X1_, X2_, Z_;
};

}
