#include <elicit/belief/PosteriorDistribution.hpp>
#include <elicit/random/util.hpp>
#include <Eigen/Cholesky>
#include <Eigen/Eigenvalues>
#include <boost/format.hpp>
#include <cmath>
#include <set>
#include <sstream>
#include <stdexcept>

namespace elicit { namespace belief {

using namespace Eigen;

namespace {
std::vector<std::string> default_names(long K) {
    if (K == NUM_DIMENSIONS) return dimension_names();
    std::vector<std::string> names;
    for (long i = 0; i < K; i++) names.push_back(std::to_string(i));
    return names;
}
}

PosteriorDistribution::PosteriorDistribution(std::vector<std::string> dimensions, VectorXd mean, MatrixXd covariance)
    : dimensions_{std::move(dimensions)}, mean_{std::move(mean)}, covariance_{std::move(covariance)}
{
    const long K = dimensions_.size();
    if (K == 0) throw std::invalid_argument("PosteriorDistribution requires at least one dimension");
    if (std::set<std::string>(dimensions_.begin(), dimensions_.end()).size() != dimensions_.size())
        throw std::invalid_argument("PosteriorDistribution dimension names must be unique");
    if (mean_.size() != K) throw std::invalid_argument("PosteriorDistribution mean size does not match the number of dimensions");
    if (covariance_.rows() != K or covariance_.cols() != K)
        throw std::invalid_argument("PosteriorDistribution covariance must be a K x K matrix");
    if (not mean_.allFinite() or not covariance_.allFinite())
        throw std::invalid_argument("PosteriorDistribution mean and covariance must be finite");

    covariance_ = (0.5 * (covariance_ + covariance_.transpose())).eval();
    if ((covariance_.diagonal().array() < 0).any())
        throw std::invalid_argument("PosteriorDistribution covariance has a negative variance");
}

PosteriorDistribution::PosteriorDistribution(const VectorXd &mean, const MatrixXd &covariance)
    : PosteriorDistribution(default_names(mean.size()), mean, covariance)
{}

unsigned int PosteriorDistribution::index(const std::string &dimension) const {
    for (unsigned int i = 0; i < dimensions_.size(); i++) {
        if (dimensions_[i] == dimension) return i;
    }
    throw std::invalid_argument("Unknown preference dimension `" + dimension + "'");
}

double PosteriorDistribution::variance(const std::string &dimension) const {
    auto i = index(dimension);
    return covariance_(i, i);
}

double PosteriorDistribution::correlation(const std::string &dim_a, const std::string &dim_b) const {
    auto a = index(dim_a), b = index(dim_b);
    double va = covariance_(a, a), vb = covariance_(b, b);
    if (va <= 0 or vb <= 0) return 0.0;
    return covariance_(a, b) / std::sqrt(va * vb);
}

MatrixXd PosteriorDistribution::sample(unsigned int n) const {
    const long dims = K();
    MatrixXd L;
    LLT<MatrixXd> llt(covariance_);
    if (llt.info() == Success) {
        L = llt.matrixL();
    }
    else {
        // Singular (or numerically indefinite) covariance: factor through the eigendecomposition,
        // dropping non-positive eigenvalues
        SelfAdjointEigenSolver<MatrixXd> eig(covariance_);
        L = eig.eigenvectors() * eig.eigenvalues().cwiseMax(0.0).cwiseSqrt().asDiagonal();
    }

    MatrixXd draws(n, dims);
    VectorXd z(dims);
    for (unsigned int i = 0; i < n; i++) {
        for (long k = 0; k < dims; k++) z[k] = random::rnormal();
        draws.row(i) = (mean_ + L * z).transpose();
    }
    return draws;
}

PosteriorDistribution::operator std::string() const {
    std::ostringstream summary;
    summary << "PosteriorDistribution(K=" << K() << ")";
    for (unsigned int i = 0; i < dimensions_.size(); i++) {
        summary << "\n    " << boost::format("%-20s mean=%9.4f  sd=%9.4f") % dimensions_[i] % mean_[i] % std::sqrt(covariance_(i, i));
    }
    return summary.str();
}

std::ostream& operator<<(std::ostream &os, const PosteriorDistribution &p) {
    return os << (std::string) p;
}

}}
