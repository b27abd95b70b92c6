#include <elicit/selection/UncertaintyAnalyzer.hpp>
#include <algorithm>
#include <numeric>
#include <stdexcept>

namespace elicit { namespace selection {

using namespace Eigen;

constexpr double UncertaintyAnalyzer::default_uncertainty_threshold;

UncertaintyAnalyzer::UncertaintyAnalyzer(double uncertainty_threshold) : threshold_{uncertainty_threshold} {
    if (not (threshold_ >= 0)) throw std::invalid_argument("UncertaintyAnalyzer: threshold must be non-negative");
}

std::vector<std::string> UncertaintyAnalyzer::uncertainDimensions(const belief::PosteriorDistribution &posterior, unsigned int top_k) const {
    VectorXd var = posterior.variances();
    std::vector<unsigned int> order(posterior.K());
    std::iota(order.begin(), order.end(), 0);
    std::stable_sort(order.begin(), order.end(), [&var](unsigned int a, unsigned int b) { return var[a] > var[b]; });

    std::vector<std::string> dims;
    for (unsigned int i = 0; i < order.size() and i < top_k; i++)
        dims.push_back(posterior.dimensions()[order[i]]);
    return dims;
}

std::map<std::string, double> UncertaintyAnalyzer::uncertaintyScores(const belief::PosteriorDistribution &posterior) const {
    std::map<std::string, double> scores;
    for (unsigned int i = 0; i < posterior.K(); i++)
        scores[posterior.dimensions()[i]] = posterior.covariance()(i, i);
    return scores;
}

std::vector<std::string> UncertaintyAnalyzer::highUncertaintyDimensions(const belief::PosteriorDistribution &posterior) const {
    std::vector<std::string> high;
    for (unsigned int i = 0; i < posterior.K(); i++) {
        if (posterior.covariance()(i, i) > threshold_) high.push_back(posterior.dimensions()[i]);
    }
    return high;
}

double UncertaintyAnalyzer::globalUncertainty(const belief::PosteriorDistribution &posterior) const {
    return posterior.variances().mean();
}

std::map<std::pair<std::string, std::string>, double> UncertaintyAnalyzer::dimensionCorrelations(const belief::PosteriorDistribution &posterior) const {
    std::map<std::pair<std::string, std::string>, double> corr;
    const auto &dims = posterior.dimensions();
    for (unsigned int i = 0; i < dims.size(); i++) {
        for (unsigned int j = i+1; j < dims.size(); j++) {
            corr[{dims[i], dims[j]}] = posterior.correlation(dims[i], dims[j]);
        }
    }
    return corr;
}

UncertaintyAnalyzer::report UncertaintyAnalyzer::uncertaintyReport(const belief::PosteriorDistribution &posterior) const {
    report r;
    r.global_uncertainty = globalUncertainty(posterior);
    r.uncertainty_per_dimension = uncertaintyScores(posterior);
    r.top_uncertain_dimensions = uncertainDimensions(posterior, 3);
    r.high_uncertainty_dimensions = highUncertaintyDimensions(posterior);
    r.uncertainty_threshold = threshold_;
    r.n_dimensions_above_threshold = r.high_uncertainty_dimensions.size();
    return r;
}

}}
