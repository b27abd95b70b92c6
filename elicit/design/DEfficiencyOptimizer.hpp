#pragma once
#include <elicit/design/AttributeConfig.hpp>
#include <elicit/belief/LikelihoodCalculator.hpp>
#include <Eigen/Core>
#include <vector>

namespace elicit { namespace design {

/** Selects a fixed set of "static" vignettes that together maximize the determinant of the Fisher
 * information matrix (D-optimality) under a prior guess of the preference weights.
 *
 * Selection is greedy: starting from the prior information \f$I/\sigma^2_0\f$, each round adds the
 * admissible candidate pair giving the largest determinant increase.  Candidates are every pair of
 * profiles if there are at most `sample_size` pairs, and a fresh random sample of `sample_size`
 * pairs each round otherwise.  Pairs failing pairwise_dominance() or excessive_wage_gap(), and
 * pairs already selected, are not admissible.
 */
class DEfficiencyOptimizer {
    public:
        /// Default total number of static vignettes
        static constexpr unsigned int default_num_static = 6;
        /// Default number of static vignettes shown at the beginning of a session
        static constexpr unsigned int default_num_beginning = 4;
        /// Default prior variance of each preference weight
        static constexpr double default_prior_variance = 0.5;
        /// Default prior mean of each preference weight, used when no prior mean is given
        static constexpr double default_prior_weight = 0.5;
        /// Default number of candidate pairs evaluated per round
        static constexpr size_t default_sample_size = 100000;

        /// Constructs an optimizer using choice probabilities at the given temperature.
        explicit DEfficiencyOptimizer(double temperature = belief::LikelihoodCalculator::default_temperature);

        /// Static vignettes, split into those shown at the beginning and at the end of a session.
        struct static_design {
            std::vector<ProfilePair> beginning;
            std::vector<ProfilePair> end;
        };

        /** Selects `num_static` vignettes, returning the first `num_beginning` selected as the
         * beginning set and the rest as the end set.  If the candidates run out before
         * `num_static` vignettes are found, a warning is logged and the (smaller) selection so far is
         * returned.
         *
         * \param profiles the profile pool
         * \param num_static the total number of static vignettes
         * \param num_beginning the size of the beginning set
         * \param prior_mean the preference weights at which information is evaluated; if empty,
         * every weight is `default_prior_weight`.
         * \param prior_variance the prior variance of each weight
         * \param sample_size the maximum number of candidate pairs evaluated per round
         *
         * \throws std::invalid_argument if `num_beginning > num_static`, `prior_variance <= 0`, or
         * `prior_mean` is non-empty with the wrong size.
         * \throws empty_pool_error if `num_static > 0` and there are fewer than 2 profiles.
         */
        static_design selectStaticVignettes(
                const std::vector<JobProfile> &profiles,
                unsigned int num_static = default_num_static,
                unsigned int num_beginning = default_num_beginning,
                const Eigen::VectorXd &prior_mean = Eigen::VectorXd(),
                double prior_variance = default_prior_variance,
                size_t sample_size = default_sample_size) const;

        /** Returns the Fisher information of a single pair of feature vectors at the given weights. */
        Eigen::MatrixXd pairFIM(const Eigen::Ref<const Eigen::VectorXd> &xa, const Eigen::Ref<const Eigen::VectorXd> &xb,
                const Eigen::Ref<const Eigen::VectorXd> &weights) const;

        /** Returns the prior information plus the information of the given vignettes. */
        Eigen::MatrixXd designFIM(const std::vector<ProfilePair> &vignettes,
                const Eigen::VectorXd &prior_mean = Eigen::VectorXd(),
                double prior_variance = default_prior_variance) const;

        /** Returns the D-efficiency of a design: \f$\det(F)^{1/k}\f$ where \f$F\f$ is designFIM() and
         * \f$k\f$ the number of preference dimensions.
         */
        double computeDEfficiency(const std::vector<ProfilePair> &vignettes,
                const Eigen::VectorXd &prior_mean = Eigen::VectorXd(),
                double prior_variance = default_prior_variance) const;

        /// Summary statistics of a design, from optimizationStatistics().
        struct statistics {
            size_t num_vignettes;
            double fim_determinant;
            double d_efficiency;
            Eigen::VectorXd eigenvalues;
            double condition_number;
            double min_eigenvalue;
            double max_eigenvalue;
        };

        /// Returns summary statistics of designFIM() for the given vignettes.
        statistics optimizationStatistics(const std::vector<ProfilePair> &vignettes,
                const Eigen::VectorXd &prior_mean = Eigen::VectorXd(),
                double prior_variance = default_prior_variance) const;

    private:
        double temperature_;
        Eigen::VectorXd priorWeights(const Eigen::VectorXd &prior_mean) const;
};

}}
