#include <elicit/design/AdaptiveLibraryBuilder.hpp>
#include <elicit/design/PairScreen.hpp>
#include <elicit/numerics.hpp>
#include <elicit/log.hpp>
#include <boost/format.hpp>
#include <algorithm>
#include <cmath>
#include <limits>
#include <stdexcept>
#include <unordered_set>

namespace elicit { namespace design {

using namespace Eigen;
using boost::format;

constexpr unsigned int AdaptiveLibraryBuilder::default_num_library;
constexpr double AdaptiveLibraryBuilder::default_diversity_weight, AdaptiveLibraryBuilder::informativeness_ridge;
constexpr size_t AdaptiveLibraryBuilder::default_sample_size;

AdaptiveLibraryBuilder::AdaptiveLibraryBuilder(double temperature) : temperature_{temperature} {
    if (not std::isfinite(temperature) or temperature <= 0)
        throw std::domain_error("AdaptiveLibraryBuilder temperature must be finite and > 0");
}

std::string AdaptiveLibraryBuilder::pairKey(const JobProfile &a, const JobProfile &b) {
    std::string ka = attributes_key(a), kb = attributes_key(b);
    if (kb < ka) std::swap(ka, kb);
    return ka + "|" + kb;
}

double AdaptiveLibraryBuilder::informativeness(const Ref<const VectorXd> &xa, const Ref<const VectorXd> &xb, const Ref<const VectorXd> &weights) const {
    // The information matrix c d d' has a single non-zero eigenvalue c |d|^2, so
    // det(c d d' + eI) = e^(k-1) (e + c |d|^2).
    VectorXd d = xa - xb;
    double pA = sigmoid(weights.dot(d) / temperature_);
    double lambda = pA * (1 - pA) * d.squaredNorm();
    return std::pow(informativeness_ridge, d.size() - 1) * (informativeness_ridge + lambda);
}

double AdaptiveLibraryBuilder::cosineDistance(const Ref<const VectorXd> &a, const Ref<const VectorXd> &b) {
    double cos = a.dot(b) / (a.norm() * b.norm() + 1e-8);
    return 1.0 - std::fabs(cos);
}

std::vector<ProfilePair> AdaptiveLibraryBuilder::buildAdaptiveLibrary(
        const std::vector<JobProfile> &profiles, unsigned int num_library, const std::vector<ProfilePair> &excluded,
        const VectorXd &prior_mean, double diversity_weight, size_t sample_size) const {
    if (not (diversity_weight >= 0 and diversity_weight <= 1))
        throw std::invalid_argument("buildAdaptiveLibrary: diversity_weight must be in [0, 1]");
    if (prior_mean.size() != 0 and prior_mean.size() != NUM_DIMENSIONS)
        throw std::invalid_argument("buildAdaptiveLibrary: prior mean must have " + std::to_string(NUM_DIMENSIONS) + " elements");
    const VectorXd w = prior_mean.size() == 0 ? VectorXd::Constant(NUM_DIMENSIONS, 0.5) : prior_mean;

    std::vector<ProfilePair> library;
    if (num_library == 0) return library;
    if (profiles.size() < 2)
        throw empty_pool_error("Cannot build an adaptive library from a pool of " + std::to_string(profiles.size()) + " profiles");

    ELICIT_LOG(info, "Building adaptive library of " << num_library << " vignettes from " << profiles.size() << " profiles");

    std::vector<VectorXd> features;
    std::vector<std::string> keys;
    features.reserve(profiles.size());
    keys.reserve(profiles.size());
    for (const auto &p : profiles) {
        features.push_back(encode_features(p));
        keys.push_back(attributes_key(p));
    }
    auto key_of = [&keys](size_t i, size_t j) {
        return keys[i] < keys[j] ? keys[i] + "|" + keys[j] : keys[j] + "|" + keys[i];
    };

    std::unordered_set<std::string> unavailable;
    for (const auto &e : excluded) unavailable.insert(pairKey(e.first, e.second));

    std::vector<VectorXd> selected_diffs;

    struct scored { size_t i, j; double lambda; };
    std::vector<scored> admissible;

    for (unsigned int round = 0; round < num_library; round++) {
        if (round % 10 == 0) ELICIT_LOG(info, "Selecting vignette " << round + 1 << "/" << num_library);

        auto candidates = candidate_pairs(profiles.size(), sample_size);
        admissible.clear();
        double max_lambda = 0;
        for (const auto &c : candidates) {
            if (unavailable.count(key_of(c.first, c.second))) continue;
            const auto &pa = profiles[c.first], &pb = profiles[c.second];
            if (attribute_cancellation(pa, pb)) continue;
            const auto &xa = features[c.first], &xb = features[c.second];
            if (pairwise_dominance(xa, xb)) continue;
            if (excessive_wage_gap(pa, pb)) continue;

            VectorXd d = xa - xb;
            double pA = sigmoid(w.dot(d) / temperature_);
            double lambda = pA * (1 - pA) * d.squaredNorm();
            admissible.push_back({c.first, c.second, lambda});
            max_lambda = std::max(max_lambda, lambda);
        }
        ELICIT_LOG(debug, "Round " << round + 1 << ": " << admissible.size() << " of " << candidates.size() << " candidates admissible");

        if (admissible.empty()) {
            ELICIT_LOG(warning, "Could not find an admissible vignette for round " << round + 1 << ", stopping early");
            break;
        }

        // Normalizing by the round's best candidate: the common e^(k-1) factor of the
        // determinants cancels.
        double best_score = -std::numeric_limits<double>::infinity();
        const scored *best = nullptr;
        for (const auto &a : admissible) {
            double info = (informativeness_ridge + a.lambda) / (informativeness_ridge + max_lambda);
            double diversity = 1.0;
            if (not selected_diffs.empty()) {
                VectorXd d = features[a.i] - features[a.j];
                for (const auto &s : selected_diffs) diversity = std::min(diversity, cosineDistance(d, s));
            }
            double score = (1 - diversity_weight) * info + diversity_weight * diversity;
            if (score > best_score) {
                best_score = score;
                best = &a;
            }
        }

        library.emplace_back(profiles[best->i], profiles[best->j]);
        unavailable.insert(key_of(best->i, best->j));
        selected_diffs.push_back(features[best->i] - features[best->j]);
        ELICIT_LOG(debug, format("Round %d: selected pair (%d, %d), score %.4f") % (round + 1) % best->i % best->j % best_score);
    }

    ELICIT_LOG(info, "Built adaptive library with " << library.size() << " vignettes");
    return library;
}

AdaptiveLibraryBuilder::library_statistics AdaptiveLibraryBuilder::libraryStatistics(const std::vector<ProfilePair> &library) const {
    library_statistics s;
    s.num_vignettes = library.size();
    s.avg_pairwise_distance = s.min_pairwise_distance = s.max_pairwise_distance = s.std_pairwise_distance = 0;

    std::vector<VectorXd> diffs;
    diffs.reserve(library.size());
    for (const auto &v : library) diffs.push_back(encode_features(v.first) - encode_features(v.second));

    std::vector<double> distances;
    for (size_t i = 0; i < diffs.size(); i++)
        for (size_t j = i + 1; j < diffs.size(); j++)
            distances.push_back(cosineDistance(diffs[i], diffs[j]));

    if (not distances.empty()) {
        Map<const VectorXd> dist(distances.data(), distances.size());
        s.avg_pairwise_distance = dist.mean();
        s.min_pairwise_distance = dist.minCoeff();
        s.max_pairwise_distance = dist.maxCoeff();
        s.std_pairwise_distance = std::sqrt((dist.array() - s.avg_pairwise_distance).square().mean());
    }

    if (not library.empty()) {
        for (const auto &attr : library.front().first) {
            auto &counts = s.attribute_coverage[attr.first];
            for (const auto &v : library) {
                for (const JobProfile *p : {&v.first, &v.second}) {
                    auto found = p->find(attr.first);
                    if (found != p->end()) counts[value_string(found->second)]++;
                }
            }
        }
    }
    return s;
}

}}
