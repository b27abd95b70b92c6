#pragma once
#include <elicit/design/AttributeConfig.hpp>
#include <vector>

namespace elicit { namespace design {

/** Removes globally dominated profiles using the configured attribute directions.
 *
 * Profile `a` dominates profile `b` if `a` is at least as good as `b` on every attribute with a
 * positive or negative direction, and strictly better on at least one.  Neutral attributes and
 * attributes missing from either profile are ignored.
 *
 * Global dominance is too strict a screen for choosing vignettes (a dominated profile can still
 * form a good trade-off with some other profile), so the design pipeline bypasses this filter by
 * default and screens pairs instead; see PairScreen.hpp.
 */
class DominanceFilter {
    public:
        /// Constructs a filter using the directions of the given configuration.
        explicit DominanceFilter(AttributeConfig config);

        /// Returns true if profile `a` dominates profile `b`.
        bool dominates(const JobProfile &a, const JobProfile &b) const;

        /** Returns the profiles not dominated by any other profile, in their original order. */
        std::vector<JobProfile> filterDominated(const std::vector<JobProfile> &profiles) const;

    private:
        AttributeConfig config_;
};

}}
