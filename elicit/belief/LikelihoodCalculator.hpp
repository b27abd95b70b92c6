#pragma once
#include <elicit/Vignette.hpp>
#include <Eigen/Core>
#include <functional>
#include <string>
#include <vector>

namespace elicit {
/// Namespace for classes handling beliefs about preference weights and their updating.
namespace belief {

/** The type of likelihood functions accepted by PosteriorManager::update: given an observation and
 * a candidate preference weight vector, returns the probability of the observation.
 */
using LikelihoodFunction = std::function<double(const Observation&, const Eigen::VectorXd&)>;

/** Choice probabilities under a temperature-scaled logit (Bradley-Terry) model.  The probability
 * of choosing option A over option B given preference weights \f$w\f$ is
 * \f[
 *     P(A) = \frac{1}{1 + e^{-w^\top (x_A - x_B) / T}}
 * \f]
 * where \f$x_A, x_B\f$ are the options' feature vectors (see encode_features()) and \f$T\f$ is the
 * temperature.  Higher temperatures flatten choice probabilities towards 0.5.
 */
class LikelihoodCalculator {
    public:
        /// The default choice temperature
        static constexpr double default_temperature = 1.0;

        /** Constructs a calculator with the given temperature.
         *
         * \throws std::domain_error if `temperature` is not a finite, strictly positive value.
         */
        explicit LikelihoodCalculator(double temperature = default_temperature);

        /// The choice temperature
        const double& temperature() const { return temperature_; }

        /** Returns the probability of choosing `vignette.optionA()` given the preference weights.
         *
         * \throws std::invalid_argument if `weights` does not have `NUM_DIMENSIONS` elements.
         */
        double probabilityA(const Vignette &vignette, const Eigen::Ref<const Eigen::VectorXd> &weights) const;

        /** Returns the probability that the given option of the vignette is chosen.  Always
         * exactly 0.5 when the weights are all zero.
         *
         * \throws std::invalid_argument if `chosen_option` is not the id of one of the vignette's
         * options, or if `weights` is not a `NUM_DIMENSIONS` vector.
         */
        double computeChoiceLikelihood(const Vignette &vignette, const std::string &chosen_option,
                const Eigen::Ref<const Eigen::VectorXd> &weights) const;

        /// Same as above, but takes the vignette and chosen option from an observation.
        double computeChoiceLikelihood(const Observation &observation, const Eigen::Ref<const Eigen::VectorXd> &weights) const;

        /** Returns the log-likelihood of a sequence of independent observed choices. */
        double logLikelihood(const std::vector<Observation> &observations, const Eigen::Ref<const Eigen::VectorXd> &weights) const;

        /** Creates a likelihood function suitable for passing to PosteriorManager::update().  The
         * returned function evaluates the choice probability of whichever observation it is given,
         * using this calculator's temperature; the vignette and option given here are validated
         * up front so that an invalid choice fails here rather than inside the updater.
         *
         * \throws std::invalid_argument if `chosen_option` is not one of the vignette's option ids.
         */
        LikelihoodFunction createLikelihoodFunction(const Vignette &vignette, const std::string &chosen_option) const;

    private:
        double temperature_;
};

}}
