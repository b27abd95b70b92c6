#pragma once
#include <elicit/design/ProfileGenerator.hpp>
#include <elicit/Vignette.hpp>
#include <string>
#include <vector>

namespace elicit { namespace design {

/** Turns selected profile pairs into runtime Vignette objects: infers the preference category a
 * pair targets, and generates scenario text, option titles and option descriptions.
 */
class VignetteConverter {
    public:
        /// Category returned by inferCategory() when no attribute differs meaningfully
        static const std::string mixed_category;
        /// Normalized difference below which an attribute difference is not meaningful
        static constexpr double min_category_difference = 0.1;

        /// Constructs a converter using the attribute grid (and level labels) of `generator`.
        explicit VignetteConverter(ProfileGenerator generator);

        /** Infers the preference category of a pair from the attribute with the largest
         * normalized difference.  Ordered attributes are normalized by the range of their level
         * values; categorical attributes use the absolute difference of their values.  Missing
         * attributes count as 0.  Ties go to the attribute configured first.  Returns
         * mixed_category if the largest difference is below min_category_difference, or if the
         * attribute has no associated category.
         */
        std::string inferCategory(const JobProfile &a, const JobProfile &b) const;

        /** Returns the category associated with an attribute name, or mixed_category if there is
         * none.
         */
        static const std::string& attributeCategory(const std::string &attribute);

        /** Returns the scenario text introducing a vignette of the given category.  Categories
         * without their own text use the text of mixed_category.
         */
        static const std::string& scenarioText(const std::string &category);

        /** Returns an option title: "Option A: Job with KES 15,000/month" if the profile has a
         * non-zero wage, "Option A: Job Opportunity" otherwise.
         */
        static std::string optionTitle(const std::string &option_id, const JobProfile &profile);

        /** Converts a profile pair to a runtime vignette with options "A" (the first profile) and
         * "B".  The vignette targets its inferred category, with difficulty "medium".
         */
        Vignette convertToOnlineFormat(const ProfilePair &pair, const std::string &vignette_id) const;

        /** Converts a list of profile pairs, with ids `prefix_001`, `prefix_002`, and so on. */
        std::vector<Vignette> convertVignetteList(const std::vector<ProfilePair> &pairs, const std::string &id_prefix) const;

        /// The profile generator providing the attribute grid
        const ProfileGenerator& generator() const { return generator_; }

    private:
        ProfileGenerator generator_;
};

/// Formats an integer with comma thousands separators, such as "15,000" or "-1,250,000".
std::string thousands(long value);

}}
