#pragma once
#include <elicit/Vignette.hpp>
#include <elicit/belief/PosteriorDistribution.hpp>
#include <elicit/information/FisherInformation.hpp>
#include <Eigen/Core>
#include <boost/optional.hpp>
#include <set>
#include <string>
#include <utility>
#include <vector>

namespace elicit { namespace selection {

/** Selects the vignette expected to add the most information, evaluated at the posterior mean.
 *
 * With Bayesian scoring (the default), candidates are scored by
 * information::FisherInformation::computeBayesianExpectedFIM(), which also weights each candidate
 * by how uncertain the posterior is along its feature difference; otherwise the plain determinant
 * increase of information::FisherInformation::computeExpectedFIM() is used.
 */
class DOptimalSelector {
    public:
        /// Constructs a selector using the given information calculator.
        explicit DOptimalSelector(information::FisherInformation fisher = information::FisherInformation());

        /** Returns the candidate with the highest score among those whose ids are not in `shown`.
         * Ties go to the earliest candidate.  Returns an empty optional if every candidate has
         * been shown (or there are no candidates).
         */
        boost::optional<Vignette> selectNextVignette(
                const std::vector<Vignette> &candidates,
                const belief::PosteriorDistribution &posterior,
                const Eigen::Ref<const Eigen::MatrixXd> &current_fim,
                const std::set<std::string> &shown,
                bool use_bayesian = true) const;

        /** Scores every candidate and returns (candidate index, score) pairs sorted by decreasing
         * score.
         */
        std::vector<std::pair<size_t, double>> rankVignettes(
                const std::vector<Vignette> &candidates,
                const belief::PosteriorDistribution &posterior,
                const Eigen::Ref<const Eigen::MatrixXd> &current_fim,
                bool use_bayesian = true) const;

        /// Returns the score of a single candidate.
        double score(const Vignette &candidate, const belief::PosteriorDistribution &posterior,
                const Eigen::Ref<const Eigen::MatrixXd> &current_fim, bool use_bayesian = true) const;

    private:
        information::FisherInformation fisher_;
};

}}
