#pragma once
#include <elicit/Vignette.hpp>
#include <elicit/belief/PosteriorDistribution.hpp>
#include <elicit/information/StoppingCriterion.hpp>
#include <elicit/selection/UncertaintyAnalyzer.hpp>
#include <elicit/selection/AdaptiveDifficulty.hpp>
#include <elicit/session/SessionState.hpp>
#include <Eigen/Core>
#include <nlohmann/json.hpp>
#include <stdexcept>
#include <string>
#include <vector>

/** \file elicit/serialize/json.hpp
 *
 * Conversion between elicit objects and their JSON documents.  Vectors become JSON arrays and
 * matrices become arrays of rows.  The `*_from_json` functions validate the document and throw
 * parse_error, with the path of the offending element, if it is malformed.
 */

namespace elicit {
/// Namespace for JSON persistence of elicitation objects and offline artifacts
namespace serialize {

/// Exception class thrown for malformed JSON documents.
class parse_error : public std::runtime_error {
    public:
        using std::runtime_error::runtime_error;
};

nlohmann::json vector_to_json(const Eigen::Ref<const Eigen::VectorXd> &v);
Eigen::VectorXd vector_from_json(const nlohmann::json &j, const std::string &where = "vector");

nlohmann::json matrix_to_json(const Eigen::Ref<const Eigen::MatrixXd> &m);
/// Reads a matrix from an array of equal-length rows.  An empty array gives a 0x0 matrix.
Eigen::MatrixXd matrix_from_json(const nlohmann::json &j, const std::string &where = "matrix");

/** Converts an attribute value to a JSON boolean, integer, or floating-point number, and back.
 * Integers are read as `long`, other numbers as `double`.
 */
nlohmann::json attribute_value_to_json(const AttributeValue &v);
AttributeValue attribute_value_from_json(const nlohmann::json &j, const std::string &where = "value");

nlohmann::json attributes_to_json(const Attributes &a);
Attributes attributes_from_json(const nlohmann::json &j, const std::string &where = "attributes");

/** Converts a vignette option to `{"option_id", "title", "description", "attributes"}`. */
nlohmann::json option_to_json(const VignetteOption &o);
VignetteOption option_from_json(const nlohmann::json &j, const std::string &where = "option");

/** Converts a vignette to the runtime vignette document: `vignette_id`, `category`,
 * `scenario_text`, `options`, `follow_up_questions`, `targeted_dimensions`, and
 * `difficulty_level`.  The last three are optional when reading.
 */
nlohmann::json vignette_to_json(const Vignette &v);
Vignette vignette_from_json(const nlohmann::json &j, const std::string &where = "vignette");

/** Converts a posterior to `{"dimensions", "mean", "covariance"}`. */
nlohmann::json posterior_to_json(const belief::PosteriorDistribution &p);
belief::PosteriorDistribution posterior_from_json(const nlohmann::json &j, const std::string &where = "posterior");

nlohmann::json diagnostics_to_json(const information::StoppingCriterion::diagnostics &d);
nlohmann::json uncertainty_report_to_json(const selection::UncertaintyAnalyzer::report &r);
nlohmann::json recommendation_to_json(const selection::AdaptiveDifficulty::recommendation &r);

nlohmann::json response_to_json(const session::VignetteResponse &r);
session::VignetteResponse response_from_json(const nlohmann::json &j, const std::string &where = "response");

/** Converts a session to its persisted document.  session_from_json(session_to_json(s))
 * reproduces `s` exactly.  Optional strings are written as null when absent; the posterior mean,
 * covariance, and FIM are written as empty arrays until set.
 */
nlohmann::json session_to_json(const session::SessionState &s);
session::SessionState session_from_json(const nlohmann::json &j, const std::string &where = "session");

/// The contents of a vignette artifact file.
struct vignette_artifact {
    nlohmann::json metadata;
    std::vector<Vignette> vignettes;
};

/// The contents of a profile artifact file.
struct profile_artifact {
    nlohmann::json metadata;
    std::vector<Attributes> profiles;
};

/** Writes `{"metadata": metadata, "vignettes": [...]}` to the given file.
 *
 * \throws std::runtime_error if the file cannot be written
 */
void write_vignette_artifact(const std::string &path, const nlohmann::json &metadata, const std::vector<Vignette> &vignettes);

/** Writes `{"metadata": metadata, "profiles": [...]}` to the given file.
 *
 * \throws std::runtime_error if the file cannot be written
 */
void write_profile_artifact(const std::string &path, const nlohmann::json &metadata, const std::vector<Attributes> &profiles);

/** Reads a vignette artifact file.  A missing "metadata" key reads as an empty object.
 *
 * \throws parse_error if the file cannot be read or is malformed
 */
vignette_artifact read_vignette_artifact(const std::string &path);

/** Reads a profile artifact file.
 *
 * \throws parse_error if the file cannot be read or is malformed
 */
profile_artifact read_profile_artifact(const std::string &path);

}}
