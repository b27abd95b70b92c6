#pragma once
#include <elicit/Vignette.hpp>
#include <nlohmann/json.hpp>
#include <cstdint>
#include <stdexcept>
#include <string>
#include <vector>

namespace elicit {
/// Namespace for the offline design optimizer: candidate profiles and vignette selection.
namespace design {

/** A job profile: one value for each configured attribute.  Ordered attributes take their level
 * value; categorical attributes take their level index (0 for the base level).
 */
using JobProfile = Attributes;

/// A candidate vignette: a pair of job profiles (option A, option B).
using ProfilePair = std::pair<JobProfile, JobProfile>;

/** Exception class thrown for malformed attribute-definition files. */
class config_error : public std::runtime_error {
    public:
        using std::runtime_error::runtime_error;
};

/** Exception class thrown when a non-empty selection is requested from a profile pool that cannot
 * supply any candidate pair.
 */
class empty_pool_error : public std::runtime_error {
    public:
        using std::runtime_error::runtime_error;
};

/// Attribute level types
enum class AttributeType { ordered, categorical };

/// Whether higher values of an attribute are better, worse, or neither.
enum class Direction { positive, negative, neutral };

/// One level of an attribute.
struct AttributeLevel {
    /// The level identifier
    std::string id;
    /// The human-readable level label
    std::string label;
    /// The profile value of the level
    AttributeValue value;
};

/// One configured job attribute.
struct AttributeSpec {
    /// The attribute name, as used in profiles and by encode_features()
    std::string name;
    /// The human-readable attribute label
    std::string label;
    /// The attribute type
    AttributeType type;
    /// The attribute levels, in configuration order
    std::vector<AttributeLevel> levels;
    /// The preference direction of the attribute
    Direction direction;

    /** Returns the level with the given profile value, or nullptr if there is none. */
    const AttributeLevel* level(const AttributeValue &value) const;
};

/** The attribute grid from which candidate job profiles are built, as read from an
 * attribute-definition file.  The file is a JSON object with:
 *
 * - "attributes": an array of objects with "name", "label", "type" ("ordered" or "categorical"),
 *   and "levels".  Ordered levels are objects with "id", "label", and a numeric "value";
 *   categorical levels have "id" and "label", and are given values 0, 1, ... in order.
 * - "attribute_directions" (optional): an object mapping attribute names to "positive",
 *   "negative", or "neutral".  Unlisted attributes are neutral.
 *
 * Other keys (such as a "model" description) are ignored.
 */
class AttributeConfig {
    public:
        /** Constructs a configuration from attribute specifications.
         *
         * \throws config_error if there are no attributes, if attribute names repeat, or if an
         * attribute has no levels.
         */
        explicit AttributeConfig(std::vector<AttributeSpec> attributes);

        /** Parses a configuration from its JSON representation.
         *
         * \throws config_error if the JSON does not describe a valid configuration.
         */
        static AttributeConfig fromJson(const nlohmann::json &config);

        /** Reads and parses a configuration file.
         *
         * \throws config_error if the file cannot be read or parsed, or is not a valid
         * configuration.
         */
        static AttributeConfig load(const std::string &path);

        /// The configured attributes, in configuration order
        const std::vector<AttributeSpec>& attributes() const { return attributes_; }

        /// Returns the named attribute, or nullptr if there is no such attribute.
        const AttributeSpec* find(const std::string &name) const;

        /** Returns the number of distinct profiles: the product of the attributes' level counts.
         * Saturates at the maximum std::uint64_t value.
         */
        std::uint64_t totalCombinations() const;

    private:
        std::vector<AttributeSpec> attributes_;
};

/// Returns "ordered" or "categorical".
const char* to_string(AttributeType t);
/// Returns "positive", "negative", or "neutral".
const char* to_string(Direction d);

}}
