#pragma once
#include <elicit/design/AttributeConfig.hpp>
#include <elicit/belief/LikelihoodCalculator.hpp>
#include <Eigen/Core>
#include <map>
#include <string>
#include <vector>

namespace elicit { namespace design {

/** Builds the library of vignettes from which adaptive selection chooses at runtime.
 *
 * The library should contain vignettes that are individually informative but also point in
 * different directions of the preference space, so selection is greedy on a combined score
 *
 * \f[
 *     (1-w) \cdot \textrm{informativeness} + w \cdot \textrm{diversity}
 * \f]
 *
 * where informativeness is \f$\det(F + 10^{-8} I)\f$ of the vignette's own Fisher information
 * \f$F\f$ at the prior mean, normalized so that the most informative candidate of the round scores
 * 1, and diversity is the smallest cosine distance \f$1 - |\cos(d, d_s)|\f$ between the candidate's
 * feature difference \f$d\f$ and that of any vignette selected so far (1 for the first selection).
 */
class AdaptiveLibraryBuilder {
    public:
        /// Default library size
        static constexpr unsigned int default_num_library = 40;
        /// Default weight of the diversity term
        static constexpr double default_diversity_weight = 0.3;
        /// Default number of candidate pairs evaluated per round
        static constexpr size_t default_sample_size = 10000;
        /// Regularization added to each candidate's information matrix
        static constexpr double informativeness_ridge = 1e-8;

        explicit AdaptiveLibraryBuilder(double temperature = belief::LikelihoodCalculator::default_temperature);

        /** Builds the adaptive library.
         *
         * Each round evaluates candidate pairs from candidate_pairs() and adds the best-scoring
         * admissible one.  A pair is admissible if it is not among `excluded` or already selected
         * (in either order), and passes the attribute_cancellation(), pairwise_dominance(), and
         * excessive_wage_gap() screens.  If a round finds no admissible pair a warning is logged
         * and the library built so far is returned.
         *
         * \param profiles the profile pool
         * \param num_library the number of vignettes to select
         * \param excluded vignettes that must not be selected (typically the static vignettes)
         * \param prior_mean the preference weights at which informativeness is evaluated; if
         * empty, every weight is 0.5.
         * \param diversity_weight the weight \f$w \in [0,1]\f$ of the diversity term
         * \param sample_size the maximum number of candidate pairs per round
         *
         * \throws std::invalid_argument if `diversity_weight` is outside [0,1] or `prior_mean` is
         * non-empty with the wrong size.
         * \throws empty_pool_error if `num_library > 0` and there are fewer than 2 profiles.
         */
        std::vector<ProfilePair> buildAdaptiveLibrary(
                const std::vector<JobProfile> &profiles,
                unsigned int num_library = default_num_library,
                const std::vector<ProfilePair> &excluded = {},
                const Eigen::VectorXd &prior_mean = Eigen::VectorXd(),
                double diversity_weight = default_diversity_weight,
                size_t sample_size = default_sample_size) const;

        /** Returns the unnormalized informativeness \f$\det(P_A P_B d d^\top + 10^{-8} I)\f$ of a
         * pair of feature vectors at the given weights.
         */
        double informativeness(const Eigen::Ref<const Eigen::VectorXd> &xa, const Eigen::Ref<const Eigen::VectorXd> &xb,
                const Eigen::Ref<const Eigen::VectorXd> &weights) const;

        /** Returns the cosine distance \f$1 - |a \cdot b| / (\|a\|\|b\| + 10^{-8})\f$ between two
         * feature differences.
         */
        static double cosineDistance(const Eigen::Ref<const Eigen::VectorXd> &a, const Eigen::Ref<const Eigen::VectorXd> &b);

        /// Diversity and coverage statistics of a library, from libraryStatistics().
        struct library_statistics {
            size_t num_vignettes;
            /// Statistics of the cosine distances between all pairs of library vignettes; all 0
            /// if there are fewer than 2 vignettes.
            double avg_pairwise_distance, min_pairwise_distance, max_pairwise_distance, std_pairwise_distance;
            /// For each attribute of the first profile, the number of library profiles with each
            /// value (keyed by value_string()).
            std::map<std::string, std::map<std::string, size_t>> attribute_coverage;
        };

        /// Returns diversity and coverage statistics of the given library.
        library_statistics libraryStatistics(const std::vector<ProfilePair> &library) const;

        /// Returns an order-insensitive identity key of a profile pair.
        static std::string pairKey(const JobProfile &a, const JobProfile &b);

    private:
        double temperature_;
};

}}
