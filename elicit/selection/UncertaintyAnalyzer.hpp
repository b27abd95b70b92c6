#pragma once
#include <elicit/belief/PosteriorDistribution.hpp>
#include <map>
#include <string>
#include <utility>
#include <vector>

namespace elicit {
/// Namespace for choosing what to ask next: uncertainty analysis, difficulty, and vignette selection.
namespace selection {

/** Ranks and summarizes the posterior uncertainty of each preference dimension. */
class UncertaintyAnalyzer {
    public:
        /// Default variance above which a dimension counts as highly uncertain
        static constexpr double default_uncertainty_threshold = 0.3;

        /// Constructs an analyzer.  \throws std::invalid_argument if the threshold is negative.
        explicit UncertaintyAnalyzer(double uncertainty_threshold = default_uncertainty_threshold);

        /// The variance above which a dimension counts as highly uncertain
        double uncertaintyThreshold() const { return threshold_; }

        /** Returns the names of the `top_k` dimensions with the largest variances, in decreasing
         * order of variance (dimensions with equal variance keep their posterior order).  Returns
         * every dimension if `top_k` exceeds the number of dimensions.
         */
        std::vector<std::string> uncertainDimensions(const belief::PosteriorDistribution &posterior, unsigned int top_k = 3) const;

        /// Returns the variance of each dimension, keyed by name.
        std::map<std::string, double> uncertaintyScores(const belief::PosteriorDistribution &posterior) const;

        /// Returns the dimensions whose variance exceeds the threshold, in posterior order.
        std::vector<std::string> highUncertaintyDimensions(const belief::PosteriorDistribution &posterior) const;

        /// Returns the mean variance across all dimensions.
        double globalUncertainty(const belief::PosteriorDistribution &posterior) const;

        /// Returns the correlation of every pair of distinct dimensions (i, j), i before j.
        std::map<std::pair<std::string, std::string>, double> dimensionCorrelations(const belief::PosteriorDistribution &posterior) const;

        /// A summary of posterior uncertainty, from uncertaintyReport().
        struct report {
            double global_uncertainty;
            std::map<std::string, double> uncertainty_per_dimension;
            std::vector<std::string> top_uncertain_dimensions;
            std::vector<std::string> high_uncertainty_dimensions;
            double uncertainty_threshold;
            unsigned int n_dimensions_above_threshold;
        };

        /// Returns the full uncertainty summary, with the top 3 dimensions.
        report uncertaintyReport(const belief::PosteriorDistribution &posterior) const;

    private:
        double threshold_;
};

}}
