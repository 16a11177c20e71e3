#include <blp/gmm.hpp>
#include <blp/error.hpp>
#include <Eigen/Cholesky>

namespace blp {

using namespace Eigen;

namespace {
void check_weighting(const ProductData &products, const Ref<const MatrixXd> &W) {
    const std::size_t l = products.instrumentDim();
    if ((std::size_t) W.rows() != l) throw dimension_mismatch("weighting rows", l, W.rows());
    if ((std::size_t) W.cols() != l) throw dimension_mismatch("weighting cols", l, W.cols());
}
}

MatrixXd inverse_ztz(const Ref<const MatrixXd> &Z) {
    const Index l = Z.cols();
    MatrixXd ZtZ = MatrixXd::Zero(l, l);
    ZtZ.selfadjointView<Lower>().rankUpdate(Z.transpose());

    LLT<MatrixXd> llt(ZtZ); // Only the lower triangle is used
    if (llt.info() != Success) throw singular_matrix("Z'Z inversion");

    return llt.solve(MatrixXd::Identity(l, l));
}

VectorXd linear_parameters(const ProductData &products, const Ref<const VectorXd> &delta, const Ref<const MatrixXd> &W) {
    if ((std::size_t) delta.size() != products.size()) throw dimension_mismatch("delta length", products.size(), delta.size());
    check_weighting(products, W);

    const MatrixXd &Z = products.Z();
    const MatrixXd ZX = Z.transpose() * products.X1();
    const MatrixXd XZW = ZX.transpose() * W;

    const MatrixXd lhs = XZW * ZX;
    const VectorXd rhs = XZW * (Z.transpose() * delta);

    LLT<MatrixXd> llt(lhs);
    if (llt.info() != Success) throw singular_matrix("X'ZWZX");

    return llt.solve(rhs);
}

double gmm_objective(const ProductData &products, const Ref<const VectorXd> &xi, const Ref<const MatrixXd> &W) {
    if ((std::size_t) xi.size() != products.size()) throw dimension_mismatch("xi length", products.size(), xi.size());
    check_weighting(products, W);

    const VectorXd Ztxi = products.Z().transpose() * xi;
    return Ztxi.dot(W * Ztxi);
}

}
