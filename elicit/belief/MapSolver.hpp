#pragma once
#include <Eigen/Core>
#include <Eigen/Cholesky>
#include <functional>

namespace elicit { namespace belief {

/** The log-posterior objective maximized when finding a MAP estimate: the log of a (possibly
 * unnormalized) likelihood plus the log-density, up to a constant, of a multivariate normal prior.
 *
 * The likelihood is floored by `likelihood_floor` before taking logs so that the objective stays
 * finite where the likelihood underflows to zero.
 */
class LogPosterior {
    public:
        /// The value added to the likelihood before taking its log
        static constexpr double likelihood_floor = 1e-10;

        /** Constructs the objective.
         *
         * \param likelihood the likelihood function of the preference weights
         * \param prior_mean the prior mean
         * \param prior_covariance the prior covariance matrix, which must be positive definite
         *
         * \throws std::invalid_argument if the sizes don't agree, or if the prior covariance is not
         * positive definite.
         */
        LogPosterior(std::function<double(const Eigen::VectorXd&)> likelihood,
                const Eigen::Ref<const Eigen::VectorXd> &prior_mean,
                const Eigen::Ref<const Eigen::MatrixXd> &prior_covariance);

        /// The number of parameters
        unsigned int K() const { return prior_mean_.size(); }
        /// The prior mean
        const Eigen::VectorXd& priorMean() const { return prior_mean_; }
        /// The prior precision (the inverse of the prior covariance)
        const Eigen::MatrixXd& priorPrecision() const { return prior_precision_; }

        /// Returns `log(likelihood(beta) + likelihood_floor)`.
        double logLikelihood(const Eigen::VectorXd &beta) const;
        /// Returns the log prior density of `beta`, up to an additive constant.
        double logPrior(const Eigen::VectorXd &beta) const;
        /// Returns the objective value, `logLikelihood(beta) + logPrior(beta)`.
        double operator()(const Eigen::VectorXd &beta) const;

        /** Returns the gradient of the objective: the central-difference gradient of the
         * log-likelihood (with step `eps`) plus the analytic prior term \f$-\Sigma^{-1}(\beta-\mu)\f$.
         */
        Eigen::VectorXd gradient(const Eigen::VectorXd &beta, double eps) const;

        /** Returns the (exactly symmetric) Hessian of the objective: the central-difference Hessian
         * of the log-likelihood plus the analytic prior term \f$-\Sigma^{-1}\f$.
         */
        Eigen::MatrixXd hessian(const Eigen::VectorXd &beta, double eps) const;

    private:
        std::function<double(const Eigen::VectorXd&)> likelihood_;
        Eigen::VectorXd prior_mean_;
        Eigen::MatrixXd prior_precision_;
};

/** The outcome of a MAP search. */
struct map_result {
    /// The maximizing parameter vector (or the best point found, if not converged)
    Eigen::VectorXd beta;
    /// The Hessian of the objective at `beta`
    Eigen::MatrixXd hessian;
    /// The number of iterations used
    unsigned int iterations = 0;
    /// True if the convergence tolerance was reached within the iteration limit
    bool converged = false;
};

/** Abstract interface of a maximum a posteriori solver.  PosteriorManager uses a MapSolver to find
 * the mode (and the curvature at the mode) of each updated posterior, so alternative strategies
 * can be substituted without changing the updating logic.
 */
class MapSolver {
    public:
        /// Virtual destructor
        virtual ~MapSolver() = default;

        /** Maximizes the given objective starting from `start`.  Implementations must always return
         * within a bounded amount of work, and must return a finite `beta` if `start` is finite.
         */
        virtual map_result solve(const LogPosterior &objective, const Eigen::VectorXd &start) const = 0;
};

/** Damped Newton-Raphson MAP solver using finite-difference derivatives of the log-likelihood.
 *
 * Each iteration solves \f$(-H + \lambda I) s = g\f$ for the step \f$s\f$, where \f$\lambda\f$ is 0
 * when \f$-H\f$ is positive definite and is otherwise increased until it is, then backtracks
 * (halving the step) until the objective does not decrease.  Iteration stops when the accepted
 * step is shorter than the tolerance, or after `max_iterations` iterations.
 */
class NewtonMapSolver : public MapSolver {
    public:
        /// Default maximum number of Newton iterations
        static constexpr unsigned int default_max_iterations = 50;
        /// Default convergence tolerance on the step length
        static constexpr double default_tolerance = 1e-6;
        /// Default finite-difference step
        static constexpr double default_difference_step = 1e-5;
        /// Maximum number of step halvings per iteration
        static constexpr unsigned int max_backtracks = 30;

        /** Constructs a solver.
         *
         * \throws std::domain_error if `max_iterations` is 0 or either of `tolerance` and
         * `difference_step` is not strictly positive.
         */
        explicit NewtonMapSolver(
                unsigned int max_iterations = default_max_iterations,
                double tolerance = default_tolerance,
                double difference_step = default_difference_step);

        map_result solve(const LogPosterior &objective, const Eigen::VectorXd &start) const override;

        /// The maximum number of iterations
        const unsigned int max_iterations;
        /// The convergence tolerance on the step length
        const double tolerance;
        /// The finite-difference step used for gradients and Hessians
        const double difference_step;
};

}}
