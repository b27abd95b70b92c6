#include <elicit/design/DEfficiencyOptimizer.hpp>
#include <elicit/design/PairScreen.hpp>
#include <elicit/numerics.hpp>
#include <elicit/log.hpp>
#include <Eigen/Cholesky>
#include <Eigen/Eigenvalues>
#include <Eigen/LU>
#include <boost/format.hpp>
#include <cmath>
#include <limits>
#include <set>
#include <stdexcept>

namespace elicit { namespace design {

using namespace Eigen;
using boost::format;

constexpr unsigned int DEfficiencyOptimizer::default_num_static, DEfficiencyOptimizer::default_num_beginning;
constexpr double DEfficiencyOptimizer::default_prior_variance, DEfficiencyOptimizer::default_prior_weight;
constexpr size_t DEfficiencyOptimizer::default_sample_size;

DEfficiencyOptimizer::DEfficiencyOptimizer(double temperature) : temperature_{temperature} {
    if (not std::isfinite(temperature) or temperature <= 0)
        throw std::domain_error("DEfficiencyOptimizer temperature must be finite and > 0");
}

VectorXd DEfficiencyOptimizer::priorWeights(const VectorXd &prior_mean) const {
    if (prior_mean.size() == 0) return VectorXd::Constant(NUM_DIMENSIONS, default_prior_weight);
    if (prior_mean.size() != NUM_DIMENSIONS)
        throw std::invalid_argument("DEfficiencyOptimizer: prior mean must have " + std::to_string(NUM_DIMENSIONS) + " elements");
    return prior_mean;
}

MatrixXd DEfficiencyOptimizer::pairFIM(const Ref<const VectorXd> &xa, const Ref<const VectorXd> &xb, const Ref<const VectorXd> &weights) const {
    VectorXd d = xa - xb;
    double pA = sigmoid(weights.dot(d) / temperature_);
    return (pA * (1 - pA)) * d * d.transpose();
}

DEfficiencyOptimizer::static_design DEfficiencyOptimizer::selectStaticVignettes(
        const std::vector<JobProfile> &profiles, unsigned int num_static, unsigned int num_beginning,
        const VectorXd &prior_mean, double prior_variance, size_t sample_size) const {
    if (num_beginning > num_static)
        throw std::invalid_argument("selectStaticVignettes: num_beginning cannot exceed num_static");
    if (not (prior_variance > 0))
        throw std::invalid_argument("selectStaticVignettes: prior_variance must be > 0");
    const VectorXd w = priorWeights(prior_mean);

    static_design design;
    if (num_static == 0) return design;
    if (profiles.size() < 2)
        throw empty_pool_error("Cannot select static vignettes from a pool of " + std::to_string(profiles.size()) + " profiles");

    ELICIT_LOG(info, "Selecting " << num_static << " static vignettes from " << profiles.size() << " profiles");

    std::vector<VectorXd> features;
    features.reserve(profiles.size());
    for (const auto &p : profiles) features.push_back(encode_features(p));

    MatrixXd current = MatrixXd::Identity(NUM_DIMENSIONS, NUM_DIMENSIONS) / prior_variance;
    std::vector<std::pair<size_t, size_t>> selected;
    std::set<std::pair<size_t, size_t>> selected_set;

    for (unsigned int round = 0; round < num_static; round++) {
        auto candidates = candidate_pairs(profiles.size(), sample_size);
        ELICIT_LOG(debug, "Round " << round + 1 << ": evaluating " << candidates.size() << " candidate pairs");

        // By the matrix determinant lemma, det(C + c d d') = det(C) (1 + c d' C^{-1} d), so the
        // determinant increase of a candidate is det(C) c d' C^{-1} d.  C is always positive
        // definite (it includes the prior information).
        LLT<MatrixXd> llt(current);
        const double det_current = current.determinant();

        double best_increase = -std::numeric_limits<double>::infinity();
        std::pair<size_t, size_t> best;
        bool found = false;
        for (const auto &c : candidates) {
            if (selected_set.count(c)) continue;
            const auto &xa = features[c.first], &xb = features[c.second];
            if (pairwise_dominance(xa, xb)) continue;
            if (excessive_wage_gap(profiles[c.first], profiles[c.second])) continue;

            VectorXd d = xa - xb;
            double pA = sigmoid(w.dot(d) / temperature_);
            double increase = det_current * pA * (1 - pA) * d.dot(llt.solve(d));
            if (increase > best_increase) {
                best_increase = increase;
                best = c;
                found = true;
            }
        }

        if (not found) {
            ELICIT_LOG(warning, "Could not find an admissible vignette for round " << round + 1 << ", stopping early");
            break;
        }

        selected.push_back(best);
        selected_set.insert(best);
        current += pairFIM(features[best.first], features[best.second], w);
        ELICIT_LOG(info, format("Round %d: selected vignette with det increase = %.2e; FIM determinant now %.2e")
                % (round + 1) % best_increase % current.determinant());
    }

    for (size_t i = 0; i < selected.size(); i++) {
        ProfilePair pair(profiles[selected[i].first], profiles[selected[i].second]);
        (i < num_beginning ? design.beginning : design.end).push_back(std::move(pair));
    }
    ELICIT_LOG(info, "Selected " << design.beginning.size() << " beginning vignettes, " << design.end.size() << " end vignettes");
    return design;
}

MatrixXd DEfficiencyOptimizer::designFIM(const std::vector<ProfilePair> &vignettes, const VectorXd &prior_mean, double prior_variance) const {
    if (not (prior_variance > 0))
        throw std::invalid_argument("designFIM: prior_variance must be > 0");
    const VectorXd w = priorWeights(prior_mean);
    MatrixXd fim = MatrixXd::Identity(NUM_DIMENSIONS, NUM_DIMENSIONS) / prior_variance;
    for (const auto &v : vignettes)
        fim += pairFIM(encode_features(v.first), encode_features(v.second), w);
    return fim;
}

double DEfficiencyOptimizer::computeDEfficiency(const std::vector<ProfilePair> &vignettes, const VectorXd &prior_mean, double prior_variance) const {
    double det = designFIM(vignettes, prior_mean, prior_variance).determinant();
    return det > 0 ? std::pow(det, 1.0 / NUM_DIMENSIONS) : 0.0;
}

DEfficiencyOptimizer::statistics DEfficiencyOptimizer::optimizationStatistics(const std::vector<ProfilePair> &vignettes,
        const VectorXd &prior_mean, double prior_variance) const {
    MatrixXd fim = designFIM(vignettes, prior_mean, prior_variance);
    statistics s;
    s.num_vignettes = vignettes.size();
    s.fim_determinant = fim.determinant();
    s.d_efficiency = s.fim_determinant > 0 ? std::pow(s.fim_determinant, 1.0 / NUM_DIMENSIONS) : 0.0;
    s.eigenvalues = SelfAdjointEigenSolver<MatrixXd>(fim, EigenvaluesOnly).eigenvalues();
    s.min_eigenvalue = s.eigenvalues.minCoeff();
    s.max_eigenvalue = s.eigenvalues.maxCoeff();
    s.condition_number = s.max_eigenvalue / s.min_eigenvalue;
    return s;
}

}}
