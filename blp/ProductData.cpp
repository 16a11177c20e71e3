#include <blp/ProductData.hpp>
#include <blp/error.hpp>
#include <utility>

namespace blp {

using namespace Eigen;

ProductData::ProductData(std::vector<std::string> market_ids, VectorXd shares, MatrixXd X1, MatrixXd X2, MatrixXd Z)
    : ProductData(Builder(std::move(market_ids), std::move(shares))
            .x1(std::move(X1)).x2(std::move(X2)).instruments(std::move(Z)).build())
{}

ProductData::Builder::Builder(std::vector<std::string> market_ids, VectorXd shares)
    : market_ids_(std::move(market_ids)), shares_(std::move(shares))
{}

ProductData::Builder& ProductData::Builder::x1(MatrixXd X1) {
    X1_.reset(new MatrixXd(std::move(X1)));
    return *this;
}

ProductData::Builder& ProductData::Builder::x2(MatrixXd X2) {
    X2_.reset(new MatrixXd(std::move(X2)));
    return *this;
}

ProductData::Builder& ProductData::Builder::instruments(MatrixXd Z) {
    Z_.reset(new MatrixXd(std::move(Z)));
    return *this;
}

ProductData ProductData::Builder::build() {
    const std::size_t n = market_ids_.size();
    if ((std::size_t) shares_.size() != n)
        throw dimension_mismatch("shares length", n, shares_.size());

    for (std::size_t j = 0; j < n; j++) {
        // Written so that NaN (a missing share) fails too
        if (not (shares_[j] > 0.0)) throw non_positive_share(j, shares_[j]);
    }

    if (not X1_) throw dimension_mismatch("X1", n, 0);
    if ((std::size_t) X1_->rows() != n) throw dimension_mismatch("X1 rows", n, X1_->rows());

    if (not X2_) X2_.reset(new MatrixXd(n, 0));
    if ((std::size_t) X2_->rows() != n) throw dimension_mismatch("X2 rows", n, X2_->rows());

    if (not Z_) Z_.reset(new MatrixXd(*X1_));
    if ((std::size_t) Z_->rows() != n) throw dimension_mismatch("Z rows", n, Z_->rows());

    ProductData data;
    data.partition_ = MarketPartition(market_ids_, shares_);
    data.market_ids_ = std::move(market_ids_);
    data.shares_ = std::move(shares_);
    data.X1_ = std::move(*X1_);
    data.X2_ = std::move(*X2_);
    data.Z_ = std::move(*Z_);
    return data;
}

}
