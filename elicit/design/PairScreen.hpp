#pragma once
#include <elicit/design/AttributeConfig.hpp>
#include <Eigen/Core>
#include <utility>
#include <vector>

// Screens applied to candidate profile pairs by the design optimizers.  A pair that fails any
// screen makes a poor vignette: it presents no real trade-off, or one that respondents resolve by
// anchoring on a single attribute.

namespace elicit { namespace design {

/// Tolerance used when comparing feature values
constexpr double FEATURE_TOLERANCE = 1e-6;

/// Number of better dimensions (out of the feature dimensions) at which one option quasi-dominates
constexpr unsigned int QUASI_DOMINANCE_THRESHOLD = 5;

/// Largest acceptable ratio of the higher to the lower wage of a pair
constexpr double MAX_WAGE_RATIO = 1.67;

/// Net averaged difference below which opposing attribute changes cancel out
constexpr double CANCELLATION_THRESHOLD = 0.15;

/** Returns true if feature vector `a` dominates `b`: no element of `a` is worse than the
 * corresponding element of `b` by more than `tolerance`, and at least one is better by more than
 * `tolerance`.
 */
bool features_dominate(const Eigen::Ref<const Eigen::VectorXd> &a, const Eigen::Ref<const Eigen::VectorXd> &b,
        double tolerance = FEATURE_TOLERANCE);

/** Returns true if either feature vector dominates the other, or quasi-dominates it by being better
 * (by more than FEATURE_TOLERANCE) in at least `threshold` dimensions.
 */
bool pairwise_dominance(const Eigen::Ref<const Eigen::VectorXd> &xa, const Eigen::Ref<const Eigen::VectorXd> &xb,
        unsigned int threshold = QUASI_DOMINANCE_THRESHOLD);

/** Returns true if both profiles have a non-zero wage and the higher wage exceeds the lower by
 * more than the factor `max_ratio`.
 */
bool excessive_wage_gap(const JobProfile &a, const JobProfile &b, double max_ratio = MAX_WAGE_RATIO);

/** Returns true if attributes averaged into the same preference dimension change in opposite
 * directions and largely cancel out.  The groups checked are the work-environment attributes
 * (physical_demand, remote_work, commute_time), the work-life-balance attributes (flexibility,
 * commute_time), and the task-preference attributes (task_variety, social_interaction), with each
 * attribute oriented and scaled as in encode_features().  A group cancels if at least two of its
 * attributes change by more than 0.01, with mixed signs, and the mean change is smaller than
 * CANCELLATION_THRESHOLD in magnitude.
 */
bool attribute_cancellation(const JobProfile &a, const JobProfile &b);

/** Returns candidate pairs `(i, j)`, `i < j`, of indices into a pool of `n` profiles.  If the pool
 * has at most `sample_size` distinct pairs, every pair is returned in lexicographic order;
 * otherwise `sample_size` distinct pairs are drawn uniformly at random with elicit::random::rng().
 */
std::vector<std::pair<size_t, size_t>> candidate_pairs(size_t n, size_t sample_size);

}}
