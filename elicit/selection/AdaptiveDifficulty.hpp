#pragma once
#include <elicit/belief/PosteriorDistribution.hpp>
#include <elicit/selection/UncertaintyAnalyzer.hpp>
#include <map>
#include <ostream>
#include <string>
#include <vector>

namespace elicit { namespace selection {

/** Vignette difficulty levels.  An easy vignette presents a stark, easily discriminated trade-off;
 * a hard one presents a subtle trade-off.
 */
enum class Difficulty { easy, medium, hard };

/// Returns "easy", "medium", or "hard".
const char* to_string(Difficulty d);

/// Parses "easy", "medium", or "hard".  \throws std::invalid_argument for any other value.
Difficulty parse_difficulty(const std::string &name);

/// Prints the difficulty name.
std::ostream& operator<<(std::ostream &os, Difficulty d);

/** Tunes vignette difficulty and trade-off strength to the posterior uncertainty of each
 * dimension.  The more uncertain a dimension, the easier the vignettes probing it should be and
 * the stronger the trade-off they present, so that answers are informative quickly.
 *
 * Variances are compared against three breakpoints: `easy_variance` (default 0.5),
 * `medium_variance` (default 0.3), and `weak_variance` (default 0.15).
 */
class AdaptiveDifficulty {
    public:
        /// Default variance above which an uncertain dimension gets easy vignettes
        static constexpr double default_easy_variance = 0.5;
        /// Default variance above which an uncertain dimension gets medium vignettes
        static constexpr double default_medium_variance = 0.3;
        /// Default variance above which the trade-off strength is 0.5 rather than 0.3
        static constexpr double default_weak_variance = 0.15;

        /** Constructs the difficulty adjuster.
         *
         * \throws std::invalid_argument unless `easy_variance >= medium_variance >= weak_variance >= 0`.
         */
        explicit AdaptiveDifficulty(
                UncertaintyAnalyzer analyzer = UncertaintyAnalyzer(),
                double easy_variance = default_easy_variance,
                double medium_variance = default_medium_variance,
                double weak_variance = default_weak_variance);

        /// The analyzer used to find the most uncertain dimensions
        const UncertaintyAnalyzer& uncertaintyAnalyzer() const { return analyzer_; }

        /** Returns the difficulty for an uncertain dimension with the given variance: easy above
         * `easy_variance`, medium above `medium_variance`, hard otherwise.
         */
        Difficulty difficultyForVariance(double variance) const;

        /** Assigns a difficulty to every dimension of the posterior.  Dimensions named in
         * `uncertain_dimensions` get difficultyForVariance() of their variance; all other
         * dimensions get Difficulty::medium.  Names in `uncertain_dimensions` that are not posterior
         * dimensions are ignored.
         */
        std::map<std::string, Difficulty> setDifficulty(const std::vector<std::string> &uncertain_dimensions,
                const belief::PosteriorDistribution &posterior) const;

        /** Returns the trade-off strength to use for vignettes probing the given dimension: 1.0 if
         * its variance exceeds `easy_variance`, 0.7 if it exceeds `medium_variance`, 0.5 if it
         * exceeds `weak_variance`, and 0.3 otherwise.
         *
         * \throws std::invalid_argument if the dimension is not a posterior dimension.
         */
        double optimalTradeOffStrength(const std::string &dimension, const belief::PosteriorDistribution &posterior) const;

        /// A combined difficulty recommendation, from difficultyRecommendation().
        struct recommendation {
            /// The (up to) three most uncertain dimensions, most uncertain first
            std::vector<std::string> uncertain_dimensions;
            /// The difficulty of every dimension, given `uncertain_dimensions`
            std::map<std::string, Difficulty> difficulty_per_dimension;
            /// The trade-off strength of every dimension
            std::map<std::string, double> trade_off_strengths;
            /// A human-readable recommendation naming the uncertain dimensions
            std::string text;
        };

        /** Combines the three most uncertain dimensions with setDifficulty() and
         * optimalTradeOffStrength() for every dimension.  The values are exactly those the
         * individual methods return for the same uncertain dimensions.
         */
        recommendation difficultyRecommendation(const belief::PosteriorDistribution &posterior) const;

    private:
        UncertaintyAnalyzer analyzer_;
        double easy_, medium_, weak_;
};

}}
