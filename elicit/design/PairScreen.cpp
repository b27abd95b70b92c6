#include <elicit/design/PairScreen.hpp>
#include <elicit/algorithms.hpp>
#include <elicit/random/util.hpp>
#include <unordered_set>
#include <algorithm>
#include <cmath>
#include <string>
#include <vector>

namespace elicit { namespace design {

using namespace Eigen;

bool features_dominate(const Ref<const VectorXd> &a, const Ref<const VectorXd> &b, double tolerance) {
    bool strictly_better = false;
    for (long i = 0; i < a.size(); i++) {
        double diff = a[i] - b[i];
        if (diff < -tolerance) return false;
        if (diff > tolerance) strictly_better = true;
    }
    return strictly_better;
}

bool pairwise_dominance(const Ref<const VectorXd> &xa, const Ref<const VectorXd> &xb, unsigned int threshold) {
    if (features_dominate(xa, xb) or features_dominate(xb, xa)) return true;

    unsigned int a_better = 0, b_better = 0;
    for (long i = 0; i < xa.size(); i++) {
        double diff = xa[i] - xb[i];
        if (diff > FEATURE_TOLERANCE) a_better++;
        else if (diff < -FEATURE_TOLERANCE) b_better++;
    }
    return a_better >= threshold or b_better >= threshold;
}

bool excessive_wage_gap(const JobProfile &a, const JobProfile &b, double max_ratio) {
    auto wa = attribute_value(a, "wage"), wb = attribute_value(b, "wage");
    if (not wa or not wb or *wa == 0 or *wb == 0) return false;
    double hi = std::max(*wa, *wb), lo = std::min(*wa, *wb);
    return hi / lo > max_ratio;
}

namespace {
// An attribute's contribution oriented so that larger is better, scaled as the encoder scales it
double oriented(const std::string &attr, double value) {
    if (attr == "commute_time") return commute_score(value);
    if (attr == "physical_demand") return 1.0 - value;
    return value;
}
}

bool attribute_cancellation(const JobProfile &a, const JobProfile &b) {
    static const std::vector<std::vector<std::string>> groups{
        {"physical_demand", "remote_work", "commute_time"},
        {"flexibility", "commute_time"},
        {"task_variety", "social_interaction"}};

    for (const auto &group : groups) {
        std::vector<double> diffs;
        for (const auto &attr : group) {
            auto va = attribute_value(a, attr), vb = attribute_value(b, attr);
            if (va and vb) diffs.push_back(oriented(attr, *va) - oriented(attr, *vb));
        }
        if (diffs.size() < 2) continue;

        bool positive = false, negative = false;
        unsigned int changed = 0;
        double sum = 0;
        for (double d : diffs) {
            sum += d;
            if (std::fabs(d) > 0.01) {
                changed++;
                if (d > 0) positive = true;
                else negative = true;
            }
        }
        if (changed >= 2 and positive and negative and std::fabs(sum / diffs.size()) < CANCELLATION_THRESHOLD)
            return true;
    }
    return false;
}

std::vector<std::pair<size_t, size_t>> candidate_pairs(size_t n, size_t sample_size) {
    std::vector<std::pair<size_t, size_t>> pairs;
    if (n < 2 or sample_size == 0) return pairs;

    const size_t total = n * (n - 1) / 2;
    if (total <= sample_size) {
        pairs.reserve(total);
        std::vector<size_t> pair({0, 1});
        do { pairs.emplace_back(pair[0], pair[1]); }
        while (next_increasing_integer_permutation(pair.begin(), pair.end(), n-1));
        return pairs;
    }

    pairs.reserve(sample_size);
    std::unordered_set<size_t> seen;
    // The attempt cap only matters if sample_size is close to total
    for (size_t attempts = 0; pairs.size() < sample_size and attempts < 10 * sample_size; attempts++) {
        size_t i = random::runiform_index(0, n-1), j = random::runiform_index(0, n-1);
        if (i == j) continue;
        if (i > j) std::swap(i, j);
        if (not seen.insert(i * n + j).second) continue;
        pairs.emplace_back(i, j);
    }
    return pairs;
}

}}
