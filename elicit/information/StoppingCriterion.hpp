#pragma once
#include <elicit/belief/PosteriorDistribution.hpp>
#include <Eigen/Core>
#include <map>
#include <string>

namespace elicit { namespace information {

/** Decides when enough vignettes have been shown.  The decision rules are applied strictly in
 * this order, the first match determining the outcome:
 *
 * 1. fewer than `min_vignettes` shown: continue;
 * 2. at least `max_vignettes` shown: stop;
 * 3. the (regularized) determinant of the information matrix exceeds `det_threshold`: stop;
 * 4. the largest posterior variance is at most `max_variance_threshold`: stop;
 * 5. otherwise: continue.
 *
 * The count bounds thus always override the information-based rules.
 */
class StoppingCriterion {
    public:
        /// Default minimum number of vignettes
        static constexpr unsigned int default_min_vignettes = 4;
        /// Default maximum number of vignettes
        static constexpr unsigned int default_max_vignettes = 12;
        /// Default information determinant above which elicitation stops
        static constexpr double default_det_threshold = 1e4;
        /// Default largest acceptable posterior variance
        static constexpr double default_max_variance_threshold = 0.65;

        /** Constructs a stopping criterion.
         *
         * \throws std::invalid_argument if `min_vignettes > max_vignettes`, or if either threshold is
         * negative or not a number.
         */
        explicit StoppingCriterion(
                unsigned int min_vignettes = default_min_vignettes,
                unsigned int max_vignettes = default_max_vignettes,
                double det_threshold = default_det_threshold,
                double max_variance_threshold = default_max_variance_threshold);

        /// The minimum number of vignettes
        unsigned int minVignettes() const { return min_vignettes_; }
        /// The maximum number of vignettes
        unsigned int maxVignettes() const { return max_vignettes_; }
        /// The determinant threshold
        double detThreshold() const { return det_threshold_; }
        /// The variance threshold
        double maxVarianceThreshold() const { return max_variance_threshold_; }

        /// The outcome of shouldContinue()
        struct decision {
            /// True if more vignettes should be shown
            bool should_continue;
            /// A human-readable reason for the decision
            std::string reason;
        };

        /** Decides whether to continue eliciting.  The reason mentions "minimum", "maximum",
         * "determinant", "variance", or "uncertainty" according to the rule that decided.
         */
        decision shouldContinue(const belief::PosteriorDistribution &posterior,
                const Eigen::Ref<const Eigen::MatrixXd> &fim, unsigned int n_vignettes_shown) const;

        /// Returns the posterior variance of each dimension, keyed by dimension name.
        std::map<std::string, double> uncertaintyReport(const belief::PosteriorDistribution &posterior) const;

        /// Diagnostic values behind a stopping decision, from stoppingDiagnostics().
        struct diagnostics {
            unsigned int n_vignettes_shown;
            double fim_determinant;
            double max_variance;
            double min_variance;
            double mean_variance;
            std::map<std::string, double> uncertainty_per_dimension;
            bool meets_det_threshold;
            bool meets_variance_threshold;
            bool within_vignette_limits;
        };

        /** Returns the quantities used by shouldContinue() along with the outcome of each test.
         * All values are finite, even for a zero information matrix.
         */
        diagnostics stoppingDiagnostics(const belief::PosteriorDistribution &posterior,
                const Eigen::Ref<const Eigen::MatrixXd> &fim, unsigned int n_vignettes_shown) const;

    private:
        unsigned int min_vignettes_, max_vignettes_;
        double det_threshold_, max_variance_threshold_;
};

}}
