#include <elicit/belief/LikelihoodCalculator.hpp>
#include <elicit/numerics.hpp>
#include <cmath>
#include <stdexcept>

namespace elicit { namespace belief {

using namespace Eigen;

constexpr double LikelihoodCalculator::default_temperature;

LikelihoodCalculator::LikelihoodCalculator(double temperature) : temperature_{temperature} {
    if (not std::isfinite(temperature) or temperature <= 0)
        throw std::domain_error("LikelihoodCalculator temperature must be finite and > 0");
}

double LikelihoodCalculator::probabilityA(const Vignette &vignette, const Ref<const VectorXd> &weights) const {
    if (weights.size() != NUM_DIMENSIONS)
        throw std::invalid_argument("LikelihoodCalculator: preference weights must have " + std::to_string(NUM_DIMENSIONS) + " elements");
    double delta = weights.dot(vignette.featureDifference());
    return sigmoid(delta / temperature_);
}

double LikelihoodCalculator::computeChoiceLikelihood(const Vignette &vignette, const std::string &chosen_option, const Ref<const VectorXd> &weights) const {
    bool chose_a = vignette.isOptionA(chosen_option);
    if (weights.size() != NUM_DIMENSIONS)
        throw std::invalid_argument("LikelihoodCalculator: preference weights must have " + std::to_string(NUM_DIMENSIONS) + " elements");
    double delta = weights.dot(vignette.featureDifference()) / temperature_;
    // Evaluate the chosen side directly rather than as 1-P(A) so tiny probabilities keep precision
    return sigmoid(chose_a ? delta : -delta);
}

double LikelihoodCalculator::computeChoiceLikelihood(const Observation &observation, const Ref<const VectorXd> &weights) const {
    return computeChoiceLikelihood(observation.vignette, observation.chosen_option, weights);
}

double LikelihoodCalculator::logLikelihood(const std::vector<Observation> &observations, const Ref<const VectorXd> &weights) const {
    double ll = 0;
    for (const auto &obs : observations)
        ll += std::log(computeChoiceLikelihood(obs, weights));
    return ll;
}

LikelihoodFunction LikelihoodCalculator::createLikelihoodFunction(const Vignette &vignette, const std::string &chosen_option) const {
    vignette.isOptionA(chosen_option); // Throws if the option is not valid
    LikelihoodCalculator calc(*this);
    return [calc](const Observation &obs, const VectorXd &beta) -> double {
        return calc.computeChoiceLikelihood(obs, beta);
    };
}

}}
