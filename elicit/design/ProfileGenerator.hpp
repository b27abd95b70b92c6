#pragma once
#include <elicit/design/AttributeConfig.hpp>
#include <Eigen/Core>
#include <cstdint>
#include <string>
#include <vector>

namespace elicit { namespace design {

/** Enumerates candidate job profiles from an attribute grid. */
class ProfileGenerator {
    public:
        /// Constructs a generator for the given attribute grid.
        explicit ProfileGenerator(AttributeConfig config);

        /// The attribute grid
        const AttributeConfig& config() const { return config_; }

        /** Generates every combination of attribute levels (the Cartesian product of the levels),
         * in odometer order with the last configured attribute varying fastest.
         *
         * \param max_profiles if non-zero, stop after generating this many profiles.
         */
        std::vector<JobProfile> generateAllProfiles(size_t max_profiles = 0) const;

        /// Returns the feature vector of a profile; this is encode_features() applied to the profile.
        Eigen::VectorXd encodeProfile(const JobProfile &profile) const;

        /** Renders a profile as "Label: LevelLabel | Label: LevelLabel | ...", in configuration
         * order.  Attributes missing from the profile, or whose value matches no level, are
         * omitted.
         */
        std::string profileToString(const JobProfile &profile) const;

        /// Returns the total number of distinct profiles of the grid.
        std::uint64_t totalCombinations() const { return config_.totalCombinations(); }

        /// Summary information about one attribute, from attributeInfo().
        struct attribute_info {
            std::string name;
            AttributeType type;
            size_t num_levels;
            Direction direction;
        };

        /// Returns summary information about each attribute, in configuration order.
        std::vector<attribute_info> attributeInfo() const;

    private:
        AttributeConfig config_;
};

}}
