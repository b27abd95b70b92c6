#include <elicit/belief/MapSolver.hpp>
#include <elicit/numerics.hpp>
#include <elicit/log.hpp>
#include <algorithm>
#include <cmath>
#include <stdexcept>

namespace elicit { namespace belief {

using namespace Eigen;

constexpr double LogPosterior::likelihood_floor;
constexpr unsigned int NewtonMapSolver::default_max_iterations, NewtonMapSolver::max_backtracks;
constexpr double NewtonMapSolver::default_tolerance, NewtonMapSolver::default_difference_step;

LogPosterior::LogPosterior(std::function<double(const VectorXd&)> likelihood, const Ref<const VectorXd> &prior_mean, const Ref<const MatrixXd> &prior_covariance)
    : likelihood_{std::move(likelihood)}, prior_mean_(prior_mean)
{
    const long K = prior_mean_.size();
    if (K == 0) throw std::invalid_argument("LogPosterior requires at least one parameter");
    if (prior_covariance.rows() != K or prior_covariance.cols() != K)
        throw std::invalid_argument("LogPosterior prior covariance must be a K x K matrix");

    LLT<MatrixXd> llt(prior_covariance);
    if (llt.info() != Success)
        throw std::invalid_argument("LogPosterior prior covariance is not positive definite");
    prior_precision_ = llt.solve(MatrixXd::Identity(K, K));
    prior_precision_ = (0.5 * (prior_precision_ + prior_precision_.transpose())).eval();
}

double LogPosterior::logLikelihood(const VectorXd &beta) const {
    return std::log(likelihood_(beta) + likelihood_floor);
}

double LogPosterior::logPrior(const VectorXd &beta) const {
    VectorXd d = beta - prior_mean_;
    return -0.5 * d.dot(prior_precision_ * d);
}

double LogPosterior::operator()(const VectorXd &beta) const {
    return logLikelihood(beta) + logPrior(beta);
}

VectorXd LogPosterior::gradient(const VectorXd &beta, double eps) const {
    VectorXd g = numerical_gradient([this](const VectorXd &b) { return logLikelihood(b); }, beta, eps);
    g.noalias() -= prior_precision_ * (beta - prior_mean_);
    return g;
}

MatrixXd LogPosterior::hessian(const VectorXd &beta, double eps) const {
    MatrixXd H = numerical_hessian([this](const VectorXd &b) { return logLikelihood(b); }, beta, eps);
    H -= prior_precision_;
    return H;
}

NewtonMapSolver::NewtonMapSolver(unsigned int max_iter, double tol, double step)
    : max_iterations{max_iter}, tolerance{tol}, difference_step{step}
{
    if (max_iterations == 0) throw std::domain_error("NewtonMapSolver requires max_iterations >= 1");
    if (not (tolerance > 0)) throw std::domain_error("NewtonMapSolver requires tolerance > 0");
    if (not (difference_step > 0)) throw std::domain_error("NewtonMapSolver requires difference_step > 0");
}

map_result NewtonMapSolver::solve(const LogPosterior &objective, const VectorXd &start) const {
    const long K = objective.K();
    if (start.size() != K) throw std::invalid_argument("NewtonMapSolver: starting point has the wrong size");

    map_result result;
    result.beta = start;
    double f = objective(result.beta);
    const MatrixXd I = MatrixXd::Identity(K, K);

    while (result.iterations < max_iterations) {
        result.iterations++;
        VectorXd g = objective.gradient(result.beta, difference_step);
        MatrixXd negH = -objective.hessian(result.beta, difference_step);
        if (not g.allFinite() or not negH.allFinite()) {
            ELICIT_LOG(debug, "non-finite derivatives at iteration " << result.iterations);
            break;
        }

        // Damp until -H + lambda I is positive definite, so that the step is an ascent direction
        LLT<MatrixXd> llt(negH);
        double lambda = 0;
        for (int tries = 0; llt.info() != Success and tries < 40; tries++) {
            lambda = lambda == 0 ? 1e-6 * std::max(1.0, negH.diagonal().cwiseAbs().maxCoeff()) : 10 * lambda;
            llt.compute(negH + lambda * I);
        }
        if (llt.info() != Success) break;

        VectorXd step = llt.solve(g);
        if (not step.allFinite()) break;

        // Backtrack until the objective doesn't decrease
        double t = 1.0;
        bool accepted = false;
        VectorXd candidate;
        for (unsigned int b = 0; b <= max_backtracks; b++, t *= 0.5) {
            candidate = result.beta + t * step;
            double fc = objective(candidate);
            if (std::isfinite(fc) and fc >= f) {
                f = fc;
                accepted = true;
                break;
            }
        }

        if (not accepted) {
            // No ascent is possible at the resolution of the objective
            result.converged = step.norm() < tolerance;
            break;
        }
        result.beta = candidate;
        if (t * step.norm() < tolerance) {
            result.converged = true;
            break;
        }
    }

    ELICIT_LOG(debug, "Newton MAP search finished after " << result.iterations << " iterations; converged=" << result.converged);

    result.hessian = objective.hessian(result.beta, difference_step);
    return result;
}

}}
