#include <elicit/numerics.hpp>
#include <cmath>

namespace elicit {

using namespace Eigen;

double sigmoid(double z) {
    if (z >= 0) {
        return 1.0 / (1.0 + std::exp(-z));
    }
    // For negative z, exp(z) can't overflow:
    double ez = std::exp(z);
    return ez / (1.0 + ez);
}

VectorXd numerical_gradient(const std::function<double(const VectorXd&)> &f, const Ref<const VectorXd> &x, double eps) {
    const long K = x.size();
    VectorXd grad(K);
    VectorXd xp(x), xm(x);
    for (long i = 0; i < K; i++) {
        xp[i] = x[i] + eps;
        xm[i] = x[i] - eps;
        grad[i] = (f(xp) - f(xm)) / (2*eps);
        xp[i] = xm[i] = x[i];
    }
    return grad;
}

MatrixXd numerical_hessian(const std::function<double(const VectorXd&)> &f, const Ref<const VectorXd> &x, double eps) {
    const long K = x.size();
    MatrixXd H(K, K);
    const double f0 = f(x);
    VectorXd xt(x);
    for (long i = 0; i < K; i++) {
        xt[i] = x[i] + eps;
        double fp = f(xt);
        xt[i] = x[i] - eps;
        double fm = f(xt);
        xt[i] = x[i];
        H(i, i) = (fp - 2*f0 + fm) / (eps*eps);

        for (long j = i+1; j < K; j++) {
            xt[i] = x[i] + eps; xt[j] = x[j] + eps;
            double fpp = f(xt);
            xt[j] = x[j] - eps;
            double fpm = f(xt);
            xt[i] = x[i] - eps;
            double fmm = f(xt);
            xt[j] = x[j] + eps;
            double fmp = f(xt);
            xt[i] = x[i]; xt[j] = x[j];
            H(i, j) = H(j, i) = (fpp - fpm - fmp + fmm) / (4*eps*eps);
        }
    }
    return H;
}

}
