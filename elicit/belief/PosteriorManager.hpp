#pragma once
#include <elicit/belief/PosteriorDistribution.hpp>
#include <elicit/belief/LikelihoodCalculator.hpp>
#include <elicit/belief/MapSolver.hpp>
#include <Eigen/Core>
#include <memory>
#include <string>
#include <vector>

namespace elicit { namespace belief {

/** Maintains a Gaussian belief over preference weights and updates it, one observed choice at a
 * time, by Laplace approximation.
 *
 * For each update, the current posterior serves as the prior.  The new mean is the MAP estimate of
 * the product of the likelihood and that prior, found by the configured MapSolver starting from
 * the current mean; the new covariance is the inverse of the negative Hessian of the log-posterior
 * at the MAP estimate.
 *
 * Numerical degeneracy never propagates out of update():
 * - if the MAP search yields a non-finite estimate, the current mean is kept;
 * - if the negative Hessian is not finite or not positive definite, the current covariance is kept;
 * - eigenvalues of the new covariance below `min_eigenvalue` (or below the smallest eigenvalue of the
 *   current covariance, if that is smaller) are raised to that floor.
 * Each of these is logged as a warning.
 */
class PosteriorManager {
    public:
        /** The eigenvalue floor of an updated covariance matrix; lowered to the smallest eigenvalue
         * of the current covariance when that is smaller.
         */
        static constexpr double min_eigenvalue = 1e-8;

        /** Constructs a manager from a prior mean and covariance.
         *
         * \param prior_mean the prior mean of the preference weights
         * \param prior_covariance the prior covariance; must be positive definite
         * \param dimensions the dimension names.  If empty, the canonical dimension names are used
         * for `NUM_DIMENSIONS`-element priors, and "0", "1", ... otherwise.
         * \param solver the MAP solver; if null, a NewtonMapSolver with default settings is used.
         *
         * \throws std::invalid_argument if the prior is not a valid PosteriorDistribution or its
         * covariance is not positive definite.
         */
        PosteriorManager(
                const Eigen::Ref<const Eigen::VectorXd> &prior_mean,
                const Eigen::Ref<const Eigen::MatrixXd> &prior_covariance,
                std::vector<std::string> dimensions = {},
                std::shared_ptr<const MapSolver> solver = nullptr);

        /// Constructs a manager from a prior distribution and an optional MAP solver.
        explicit PosteriorManager(PosteriorDistribution prior, std::shared_ptr<const MapSolver> solver = nullptr);

        /** Updates the posterior with a new observation.
         *
         * \param likelihood the likelihood function, typically created by
         * LikelihoodCalculator::createLikelihoodFunction()
         * \param observation the observation passed to the likelihood function
         *
         * \returns the updated posterior, which is also stored as the current posterior.
         */
        const PosteriorDistribution& update(const LikelihoodFunction &likelihood, const Observation &observation);

        /// The current posterior
        const PosteriorDistribution& posterior() const { return posterior_; }

        /// The initial prior
        const PosteriorDistribution& prior() const { return prior_; }

        /// The number of updates applied since construction or the last reset()
        unsigned int updates() const { return updates_; }

        /// Discards all updates, restoring the posterior to the initial prior.
        void reset();

        /// The MAP solver in use
        const MapSolver& solver() const { return *solver_; }

        /** Computes the Laplace covariance \f$(-H)^{-1}\f$ from the Hessian `H` of a log-posterior,
         * falling back to `fallback` if \f$-H\f$ is not finite or not positive definite, and
         * raising eigenvalues below the smaller of `min_eigenvalue` and the smallest eigenvalue of
         * `fallback`.  The result is always symmetric.
         */
        static Eigen::MatrixXd laplaceCovariance(const Eigen::Ref<const Eigen::MatrixXd> &hessian, const Eigen::Ref<const Eigen::MatrixXd> &fallback);

    private:
        PosteriorDistribution prior_, posterior_;
        std::shared_ptr<const MapSolver> solver_;
        unsigned int updates_ = 0;
};

}}
