#pragma once
#include <Eigen/Core>
#include <functional>

namespace elicit {

/** Numerically stable logistic function \f$1/(1+e^{-z})\f$: never overflows, returns exactly 0.5 for
 * `z == 0`, and `sigmoid(-z) == 1 - sigmoid(z)` up to rounding.
 */
double sigmoid(double z);

/** Computes the gradient of `f` at `x` using central finite differences with step `eps`. */
Eigen::VectorXd numerical_gradient(
        const std::function<double(const Eigen::VectorXd&)> &f,
        const Eigen::Ref<const Eigen::VectorXd> &x,
        double eps = 1e-5);

/** Computes the Hessian of `f` at `x` using central finite differences with step `eps`.  Diagonal
 * elements use the three-point second difference; off-diagonal elements use the four-point mixed
 * difference, computed once per pair and mirrored, so the returned matrix is exactly symmetric.
 */
Eigen::MatrixXd numerical_hessian(
        const std::function<double(const Eigen::VectorXd&)> &f,
        const Eigen::Ref<const Eigen::VectorXd> &x,
        double eps = 1e-5);

}
