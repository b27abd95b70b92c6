#include <elicit/selection/AdaptiveDifficulty.hpp>
#include <algorithm>
#include <sstream>
#include <stdexcept>

namespace elicit { namespace selection {

constexpr double AdaptiveDifficulty::default_easy_variance, AdaptiveDifficulty::default_medium_variance, AdaptiveDifficulty::default_weak_variance;

const char* to_string(Difficulty d) {
    switch (d) {
        case Difficulty::easy: return "easy";
        case Difficulty::medium: return "medium";
        case Difficulty::hard: return "hard";
    }
    return "medium";
}

Difficulty parse_difficulty(const std::string &name) {
    if (name == "easy") return Difficulty::easy;
    if (name == "medium") return Difficulty::medium;
    if (name == "hard") return Difficulty::hard;
    throw std::invalid_argument("Unknown difficulty level `" + name + "'");
}

std::ostream& operator<<(std::ostream &os, Difficulty d) {
    return os << to_string(d);
}

AdaptiveDifficulty::AdaptiveDifficulty(UncertaintyAnalyzer analyzer, double easy_variance, double medium_variance, double weak_variance)
    : analyzer_{std::move(analyzer)}, easy_{easy_variance}, medium_{medium_variance}, weak_{weak_variance}
{
    if (not (easy_ >= medium_ and medium_ >= weak_ and weak_ >= 0))
        throw std::invalid_argument("AdaptiveDifficulty: variance breakpoints must satisfy easy >= medium >= weak >= 0");
}

Difficulty AdaptiveDifficulty::difficultyForVariance(double variance) const {
    if (variance > easy_) return Difficulty::easy;
    if (variance > medium_) return Difficulty::medium;
    return Difficulty::hard;
}

std::map<std::string, Difficulty> AdaptiveDifficulty::setDifficulty(const std::vector<std::string> &uncertain_dimensions,
        const belief::PosteriorDistribution &posterior) const {
    std::map<std::string, Difficulty> difficulty;
    for (unsigned int i = 0; i < posterior.K(); i++) {
        const auto &dim = posterior.dimensions()[i];
        bool uncertain = std::find(uncertain_dimensions.begin(), uncertain_dimensions.end(), dim) != uncertain_dimensions.end();
        difficulty[dim] = uncertain ? difficultyForVariance(posterior.covariance()(i, i)) : Difficulty::medium;
    }
    return difficulty;
}

double AdaptiveDifficulty::optimalTradeOffStrength(const std::string &dimension, const belief::PosteriorDistribution &posterior) const {
    double var = posterior.variance(dimension);
    if (var > easy_) return 1.0;
    if (var > medium_) return 0.7;
    if (var > weak_) return 0.5;
    return 0.3;
}

AdaptiveDifficulty::recommendation AdaptiveDifficulty::difficultyRecommendation(const belief::PosteriorDistribution &posterior) const {
    recommendation rec;
    rec.uncertain_dimensions = analyzer_.uncertainDimensions(posterior, 3);
    rec.difficulty_per_dimension = setDifficulty(rec.uncertain_dimensions, posterior);
    for (const auto &dim : posterior.dimensions())
        rec.trade_off_strengths[dim] = optimalTradeOffStrength(dim, posterior);

    std::ostringstream text;
    text << "Focus on dimensions: ";
    bool first = true;
    for (const auto &dim : rec.uncertain_dimensions) {
        if (first) first = false;
        else text << ", ";
        text << dim << " (" << rec.difficulty_per_dimension[dim] << ")";
    }
    rec.text = text.str();
    return rec;
}

}}
