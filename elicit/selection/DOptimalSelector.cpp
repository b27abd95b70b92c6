#include <elicit/selection/DOptimalSelector.hpp>
#include <elicit/log.hpp>
#include <algorithm>
#include <limits>

namespace elicit { namespace selection {

using namespace Eigen;

DOptimalSelector::DOptimalSelector(information::FisherInformation fisher) : fisher_(std::move(fisher)) {}

double DOptimalSelector::score(const Vignette &candidate, const belief::PosteriorDistribution &posterior,
        const Ref<const MatrixXd> &current_fim, bool use_bayesian) const {
    if (use_bayesian)
        return fisher_.computeBayesianExpectedFIM(candidate, posterior.mean(), current_fim, posterior.covariance());
    return fisher_.computeExpectedFIM(candidate, posterior.mean(), current_fim).determinant_increase;
}

boost::optional<Vignette> DOptimalSelector::selectNextVignette(const std::vector<Vignette> &candidates,
        const belief::PosteriorDistribution &posterior, const Ref<const MatrixXd> &current_fim,
        const std::set<std::string> &shown, bool use_bayesian) const {
    const Vignette *best = nullptr;
    double best_score = -std::numeric_limits<double>::infinity();
    for (const auto &v : candidates) {
        if (shown.count(v.id())) continue;
        double s = score(v, posterior, current_fim, use_bayesian);
        if (s > best_score or not best) {
            best_score = s;
            best = &v;
        }
    }
    if (not best) return boost::none;
    ELICIT_LOG(debug, "selected " << best->id() << " with score " << best_score);
    return *best;
}

std::vector<std::pair<size_t, double>> DOptimalSelector::rankVignettes(const std::vector<Vignette> &candidates,
        const belief::PosteriorDistribution &posterior, const Ref<const MatrixXd> &current_fim, bool use_bayesian) const {
    std::vector<std::pair<size_t, double>> ranked;
    ranked.reserve(candidates.size());
    for (size_t i = 0; i < candidates.size(); i++)
        ranked.emplace_back(i, score(candidates[i], posterior, current_fim, use_bayesian));
    std::stable_sort(ranked.begin(), ranked.end(), [](const std::pair<size_t, double> &a, const std::pair<size_t, double> &b) {
            return a.second > b.second; });
    return ranked;
}

}}
