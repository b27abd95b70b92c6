#include <elicit/belief/PosteriorManager.hpp>
#include <elicit/log.hpp>
#include <Eigen/Cholesky>
#include <Eigen/Eigenvalues>
#include <algorithm>
#include <stdexcept>

namespace elicit { namespace belief {

using namespace Eigen;

constexpr double PosteriorManager::min_eigenvalue;

PosteriorManager::PosteriorManager(const Ref<const VectorXd> &prior_mean, const Ref<const MatrixXd> &prior_covariance,
        std::vector<std::string> dimensions, std::shared_ptr<const MapSolver> solver)
    : PosteriorManager(dimensions.empty()
            ? PosteriorDistribution(prior_mean, prior_covariance)
            : PosteriorDistribution(std::move(dimensions), prior_mean, prior_covariance),
        std::move(solver))
{}

PosteriorManager::PosteriorManager(PosteriorDistribution prior, std::shared_ptr<const MapSolver> solver)
    : prior_{std::move(prior)}, posterior_{prior_}, solver_{std::move(solver)}
{
    if (not solver_) solver_ = std::make_shared<NewtonMapSolver>();
    if (LLT<MatrixXd>(prior_.covariance()).info() != Success)
        throw std::invalid_argument("PosteriorManager prior covariance must be positive definite");
}

const PosteriorDistribution& PosteriorManager::update(const LikelihoodFunction &likelihood, const Observation &observation) {
    const auto &current = posterior_;
    LogPosterior objective(
            [&likelihood, &observation](const VectorXd &beta) { return likelihood(observation, beta); },
            current.mean(), current.covariance());

    map_result map = solver_->solve(objective, current.mean());
    if (not map.beta.allFinite() or not map.hessian.allFinite()) {
        ELICIT_LOG(warning, "MAP search for " << observation.vignette.id() << " produced a non-finite estimate; keeping the current mean");
        map.beta = current.mean();
        map.hessian = objective.hessian(map.beta, NewtonMapSolver::default_difference_step);
    }
    else if (not map.converged) {
        ELICIT_LOG(warning, "MAP search for " << observation.vignette.id() << " did not converge after " << map.iterations << " iterations");
    }

    MatrixXd covariance = laplaceCovariance(map.hessian, current.covariance());
    ELICIT_LOG(debug, "posterior update " << updates_ + 1 << ": mean " << map.beta.transpose());

    posterior_ = PosteriorDistribution(posterior_.dimensions(), std::move(map.beta), std::move(covariance));
    updates_++;
    return posterior_;
}

void PosteriorManager::reset() {
    posterior_ = prior_;
    updates_ = 0;
}

MatrixXd PosteriorManager::laplaceCovariance(const Ref<const MatrixXd> &hessian, const Ref<const MatrixXd> &fallback) {
    const long K = hessian.rows();
    MatrixXd negH = -0.5 * (hessian + hessian.transpose());
    if (not negH.allFinite()) {
        ELICIT_LOG(warning, "Log-posterior Hessian is not finite; keeping the previous covariance");
        return 0.5 * (fallback + fallback.transpose());
    }

    LDLT<MatrixXd> ldlt(negH);
    if (ldlt.info() != Success or not ldlt.isPositive() or (ldlt.vectorD().array() <= 0).any()) {
        ELICIT_LOG(warning, "Log-posterior Hessian is singular or not negative definite; keeping the previous covariance");
        return 0.5 * (fallback + fallback.transpose());
    }

    MatrixXd cov = ldlt.solve(MatrixXd::Identity(K, K));
    cov = (0.5 * (cov + cov.transpose())).eval();
    if (not cov.allFinite()) {
        ELICIT_LOG(warning, "Laplace covariance is not finite; keeping the previous covariance");
        return 0.5 * (fallback + fallback.transpose());
    }

    // The floor never exceeds the smallest eigenvalue of the previous covariance
    double min_ev = min_eigenvalue;
    SelfAdjointEigenSolver<MatrixXd> prev(0.5 * (fallback + fallback.transpose()), EigenvaluesOnly);
    if (prev.info() == Success and prev.eigenvalues().minCoeff() > 0)
        min_ev = std::min(min_ev, prev.eigenvalues().minCoeff());

    SelfAdjointEigenSolver<MatrixXd> eig(cov);
    if (eig.info() == Success and eig.eigenvalues().minCoeff() < min_ev) {
        ELICIT_LOG(warning, "Regularizing Laplace covariance (smallest eigenvalue " << eig.eigenvalues().minCoeff() << ")");
        cov = eig.eigenvectors() * eig.eigenvalues().cwiseMax(min_ev).asDiagonal() * eig.eigenvectors().transpose();
        cov = (0.5 * (cov + cov.transpose())).eval();
    }
    return cov;
}

}}
