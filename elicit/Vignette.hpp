#pragma once
#include <elicit/types.hpp>
#include <Eigen/Core>
#include <boost/optional.hpp>
#include <boost/variant.hpp>
#include <map>
#include <ostream>
#include <string>
#include <vector>

namespace elicit {

/** A single job attribute value: either a boolean flag, an integer level value (such as a wage or
 * a commute time in minutes), or a real value.
 */
using AttributeValue = boost::variant<bool, long, double>;

/** Named job attributes.  Job profiles produced by the offline optimizer and the attributes of
 * each vignette option share this type, and both are turned into feature vectors by
 * encode_features().
 */
using Attributes = std::map<std::string, AttributeValue>;

/// Returns the numeric value of an attribute value; booleans are 0 or 1.
double numeric_value(const AttributeValue &value);

/** Returns a string representation of an attribute value: "true" or "false" for booleans,
 * otherwise the number in decimal.
 */
std::string value_string(const AttributeValue &value);

/** Returns a canonical key for a set of attributes, "name=value;name=value;..." in name order.
 * Two attribute sets have the same key exactly when they have the same names and values.
 */
std::string attributes_key(const Attributes &attributes);

/** Looks up the named attribute and returns its numeric value, or an empty optional if the
 * attribute is not present.
 */
boost::optional<double> attribute_value(const Attributes &attributes, const std::string &name);

/** Encodes a set of job attributes as a `NUM_DIMENSIONS` feature vector, one element per
 * preference dimension.  This is the single encoding used everywhere a feature vector is needed:
 * choice likelihoods, Fisher information, and the offline design optimizer.
 *
 * Missing attributes contribute nothing; boolean attributes are 0 or 1.  The elements are:
 * - financial: `wage` (or `salary`) divided by `WAGE_SCALE`
 * - work_environment: mean of `1 - physical_demand`, `remote_work` (or `remote`), and the commute
 *   score `max(0, (60 - commute_time)/45)`
 * - career_growth: `career_growth`
 * - work_life_balance: mean of `flexibility` and the commute score
 * - job_security: `job_security`
 * - task_preference: mean of `task_variety` and `social_interaction`
 * - values_culture: `company_values` (or `culture_alignment`)
 *
 * Means are taken over the attributes that are present; the element is 0 if none are.
 */
Eigen::VectorXd encode_features(const Attributes &attributes);

/// The divisor applied to wages by encode_features()
constexpr double WAGE_SCALE = 10000.0;

/// Returns the commute score used by encode_features(): 1 at 15 minutes, 0 at 60 minutes or more.
double commute_score(double commute_minutes);

/** One of the two alternatives of a vignette.  Options are immutable once constructed; the feature
 * vector is computed at construction.
 */
class VignetteOption {
    public:
        /** Constructs a vignette option.
         *
         * \param option_id the option identifier, typically "A" or "B"
         * \param title a short title for the option
         * \param attributes the job attributes of the option
         * \param description a longer, human-readable description
         */
        VignetteOption(std::string option_id, std::string title, Attributes attributes, std::string description = "");

        /// The option identifier
        const std::string& id() const { return id_; }
        /// The option title
        const std::string& title() const { return title_; }
        /// The option's job attributes
        const Attributes& attributes() const { return attributes_; }
        /// The human-readable description
        const std::string& description() const { return description_; }
        /// The feature vector of the option's attributes, as produced by encode_features()
        const Eigen::VectorXd& features() const { return features_; }

    private:
        std::string id_, title_;
        Attributes attributes_;
        std::string description_;
        Eigen::VectorXd features_;
};

/** A forced-choice pair of job options presented to the user.  A vignette always has exactly two
 * options with distinct ids.
 */
class Vignette {
    public:
        /** Constructs a vignette.
         *
         * \throws std::invalid_argument if `options` does not contain exactly two options, or if
         * the two options have the same id.
         */
        Vignette(std::string vignette_id, std::string category, std::string scenario_text, std::vector<VignetteOption> options);

        /// The vignette identifier
        const std::string& id() const { return id_; }
        /// The preference category the vignette primarily targets
        const std::string& category() const { return category_; }
        /// The scenario text introducing the choice
        const std::string& scenarioText() const { return scenario_text_; }
        /// The two options
        const std::vector<VignetteOption>& options() const { return options_; }

        /** Returns the first alternative: the option with id "A", if there is one, otherwise the
         * first option.
         */
        const VignetteOption& optionA() const;
        /** Returns the second alternative: the option with id "B", if there is one, otherwise the
         * second option.
         */
        const VignetteOption& optionB() const;

        /** Returns true if the given id is the id of optionA(); false if it is the id of optionB().
         *
         * \throws std::invalid_argument if `option_id` is neither option's id.
         */
        bool isOptionA(const std::string &option_id) const;

        /// Returns the feature difference `optionA().features() - optionB().features()`.
        Eigen::VectorXd featureDifference() const;

        /// Follow-up questions that may be asked after the choice
        std::vector<std::string> follow_up_questions;
        /// Preference dimensions (or categories) the vignette targets
        std::vector<std::string> targeted_dimensions;
        /// The difficulty label of the vignette ("easy", "medium", or "hard")
        std::string difficulty_level = "medium";

    private:
        std::string id_, category_, scenario_text_;
        std::vector<VignetteOption> options_;
        unsigned int a_ = 0, b_ = 1;
};

/** A single observed choice: the vignette shown and the id of the option the user chose. */
struct Observation {
    /// The vignette that was shown
    Vignette vignette;
    /// The id of the chosen option
    std::string chosen_option;
};

/// Prints a short summary of a vignette, such as `Vignette[static_begin_001 (financial): A vs B]`.
std::ostream& operator<<(std::ostream &os, const Vignette &v);

}
