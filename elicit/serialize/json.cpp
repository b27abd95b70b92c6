#include <elicit/serialize/json.hpp>
#include <fstream>
#include <utility>

namespace elicit { namespace serialize {

using json = nlohmann::json;
using namespace Eigen;

namespace {

void require_object(const json &j, const std::string &where) {
    if (not j.is_object()) throw parse_error(where + " must be an object");
}

void require_array(const json &j, const std::string &where) {
    if (not j.is_array()) throw parse_error(where + " must be an array");
}

const json& require(const json &j, const char *key, const std::string &where) {
    require_object(j, where);
    auto found = j.find(key);
    if (found == j.end()) throw parse_error(where + " missing required field: " + key);
    return *found;
}

template <typename T>
T read(const json &j, const char *key, const std::string &where) {
    const json &value = require(j, key, where);
    try {
        return value.get<T>();
    }
    catch (const json::exception &e) {
        throw parse_error(where + "." + key + ": " + e.what());
    }
}

template <typename T>
T read_or(const json &j, const char *key, T fallback, const std::string &where) {
    require_object(j, where);
    if (not j.contains(key)) return fallback;
    return read<T>(j, key, where);
}

boost::optional<std::string> read_optional_string(const json &j, const char *key, const std::string &where) {
    require_object(j, where);
    auto found = j.find(key);
    if (found == j.end() or found->is_null()) return boost::none;
    if (not found->is_string()) throw parse_error(where + "." + key + " must be a string or null");
    return found->get<std::string>();
}

json optional_string(const boost::optional<std::string> &s) {
    return s ? json(*s) : json(nullptr);
}

std::string element(const std::string &where, const char *key, size_t i) {
    return where + "." + key + "[" + std::to_string(i) + "]";
}

void write_document(const std::string &path, const json &doc) {
    std::ofstream out(path);
    if (not out) throw std::runtime_error("Unable to open `" + path + "' for writing");
    out << doc.dump(2) << "\n";
    if (not out) throw std::runtime_error("Failed writing `" + path + "'");
}

json read_document(const std::string &path) {
    std::ifstream in(path);
    if (not in) throw parse_error("Unable to open `" + path + "'");
    try {
        return json::parse(in);
    }
    catch (const json::parse_error &e) {
        throw parse_error("Invalid JSON in `" + path + "': " + e.what());
    }
}

}

json vector_to_json(const Ref<const VectorXd> &v) {
    json j = json::array();
    for (long i = 0; i < v.size(); i++) j.push_back(v[i]);
    return j;
}

VectorXd vector_from_json(const json &j, const std::string &where) {
    require_array(j, where);
    VectorXd v(j.size());
    for (size_t i = 0; i < j.size(); i++) {
        if (not j[i].is_number()) throw parse_error(where + "[" + std::to_string(i) + "] must be a number");
        v[i] = j[i].get<double>();
    }
    return v;
}

json matrix_to_json(const Ref<const MatrixXd> &m) {
    json j = json::array();
    for (long r = 0; r < m.rows(); r++) j.push_back(vector_to_json(m.row(r).transpose()));
    return j;
}

MatrixXd matrix_from_json(const json &j, const std::string &where) {
    require_array(j, where);
    if (j.empty()) return MatrixXd();
    std::string row0 = where + "[0]";
    require_array(j[0], row0);
    MatrixXd m(j.size(), j[0].size());
    for (size_t r = 0; r < j.size(); r++) {
        std::string row = where + "[" + std::to_string(r) + "]";
        VectorXd v = vector_from_json(j[r], row);
        if (v.size() != m.cols()) throw parse_error(row + " has " + std::to_string(v.size()) + " elements, expected " + std::to_string(m.cols()));
        m.row(r) = v.transpose();
    }
    return m;
}

json attribute_value_to_json(const AttributeValue &v) {
    if (const bool *b = boost::get<bool>(&v)) return *b;
    if (const long *l = boost::get<long>(&v)) return *l;
    return boost::get<double>(v);
}

AttributeValue attribute_value_from_json(const json &j, const std::string &where) {
    if (j.is_boolean()) return j.get<bool>();
    if (j.is_number_integer()) return j.get<long>();
    if (j.is_number_float()) return j.get<double>();
    throw parse_error(where + " must be a boolean or a number");
}

json attributes_to_json(const Attributes &a) {
    json j = json::object();
    for (const auto &kv : a) j[kv.first] = attribute_value_to_json(kv.second);
    return j;
}

Attributes attributes_from_json(const json &j, const std::string &where) {
    require_object(j, where);
    Attributes a;
    for (auto it = j.begin(); it != j.end(); ++it)
        a.emplace(it.key(), attribute_value_from_json(it.value(), where + "." + it.key()));
    return a;
}

json option_to_json(const VignetteOption &o) {
    return {
        {"option_id", o.id()},
        {"title", o.title()},
        {"description", o.description()},
        {"attributes", attributes_to_json(o.attributes())}
    };
}

VignetteOption option_from_json(const json &j, const std::string &where) {
    return VignetteOption(
            read<std::string>(j, "option_id", where),
            read_or<std::string>(j, "title", "", where),
            attributes_from_json(require(j, "attributes", where), where + ".attributes"),
            read_or<std::string>(j, "description", "", where));
}

json vignette_to_json(const Vignette &v) {
    json options = json::array();
    for (const auto &o : v.options()) options.push_back(option_to_json(o));
    return {
        {"vignette_id", v.id()},
        {"category", v.category()},
        {"scenario_text", v.scenarioText()},
        {"options", options},
        {"follow_up_questions", v.follow_up_questions},
        {"targeted_dimensions", v.targeted_dimensions},
        {"difficulty_level", v.difficulty_level}
    };
}

Vignette vignette_from_json(const json &j, const std::string &where) {
    const json &opts = require(j, "options", where);
    require_array(opts, where + ".options");
    std::vector<VignetteOption> options;
    for (size_t i = 0; i < opts.size(); i++) options.push_back(option_from_json(opts[i], element(where, "options", i)));

    std::string difficulty = read_or<std::string>(j, "difficulty_level", "medium", where);
    try {
        selection::parse_difficulty(difficulty);
    }
    catch (const std::invalid_argument &e) {
        throw parse_error(where + ".difficulty_level: " + e.what());
    }

    try {
        Vignette v(read<std::string>(j, "vignette_id", where), read<std::string>(j, "category", where),
                read<std::string>(j, "scenario_text", where), std::move(options));
        v.follow_up_questions = read_or<std::vector<std::string>>(j, "follow_up_questions", {}, where);
        v.targeted_dimensions = read_or<std::vector<std::string>>(j, "targeted_dimensions", {}, where);
        v.difficulty_level = difficulty;
        return v;
    }
    catch (const std::invalid_argument &e) {
        throw parse_error(where + ": " + e.what());
    }
}

json posterior_to_json(const belief::PosteriorDistribution &p) {
    return {
        {"dimensions", p.dimensions()},
        {"mean", vector_to_json(p.mean())},
        {"covariance", matrix_to_json(p.covariance())}
    };
}

belief::PosteriorDistribution posterior_from_json(const json &j, const std::string &where) {
    auto dims = read<std::vector<std::string>>(j, "dimensions", where);
    VectorXd mean = vector_from_json(require(j, "mean", where), where + ".mean");
    MatrixXd cov = matrix_from_json(require(j, "covariance", where), where + ".covariance");
    try {
        return belief::PosteriorDistribution(std::move(dims), std::move(mean), std::move(cov));
    }
    catch (const std::invalid_argument &e) {
        throw parse_error(where + ": " + e.what());
    }
}

json diagnostics_to_json(const information::StoppingCriterion::diagnostics &d) {
    return {
        {"n_vignettes_shown", d.n_vignettes_shown},
        {"fim_determinant", d.fim_determinant},
        {"max_variance", d.max_variance},
        {"min_variance", d.min_variance},
        {"mean_variance", d.mean_variance},
        {"uncertainty_per_dimension", d.uncertainty_per_dimension},
        {"meets_det_threshold", d.meets_det_threshold},
        {"meets_variance_threshold", d.meets_variance_threshold},
        {"within_vignette_limits", d.within_vignette_limits}
    };
}

json uncertainty_report_to_json(const selection::UncertaintyAnalyzer::report &r) {
    return {
        {"global_uncertainty", r.global_uncertainty},
        {"uncertainty_per_dimension", r.uncertainty_per_dimension},
        {"top_uncertain_dimensions", r.top_uncertain_dimensions},
        {"high_uncertainty_dimensions", r.high_uncertainty_dimensions},
        {"uncertainty_threshold", r.uncertainty_threshold},
        {"n_dimensions_above_threshold", r.n_dimensions_above_threshold}
    };
}

json recommendation_to_json(const selection::AdaptiveDifficulty::recommendation &r) {
    json difficulty = json::object();
    for (const auto &d : r.difficulty_per_dimension) difficulty[d.first] = selection::to_string(d.second);
    return {
        {"uncertain_dimensions", r.uncertain_dimensions},
        {"difficulty_per_dimension", difficulty},
        {"trade_off_strengths", r.trade_off_strengths},
        {"recommendation", r.text}
    };
}

json response_to_json(const session::VignetteResponse &r) {
    return {
        {"vignette_id", r.vignette_id},
        {"chosen_option_id", r.chosen_option_id},
        {"user_reasoning", r.user_reasoning},
        {"extracted_preferences", r.extracted_preferences},
        {"confidence", r.confidence},
        {"timestamp", r.timestamp}
    };
}

session::VignetteResponse response_from_json(const json &j, const std::string &where) {
    session::VignetteResponse r;
    r.vignette_id = read<std::string>(j, "vignette_id", where);
    r.chosen_option_id = read<std::string>(j, "chosen_option_id", where);
    r.user_reasoning = read_or<std::string>(j, "user_reasoning", "", where);
    r.extracted_preferences = read_or<std::map<std::string, double>>(j, "extracted_preferences", {}, where);
    r.confidence = read_or<double>(j, "confidence", 0.5, where);
    if (not (r.confidence >= 0 and r.confidence <= 1)) throw parse_error(where + ".confidence must be in [0, 1]");
    r.timestamp = read_or<std::string>(j, "timestamp", "", where);
    return r;
}

json session_to_json(const session::SessionState &s) {
    json responses = json::array();
    for (const auto &r : s.vignette_responses) responses.push_back(response_to_json(r));
    return {
        {"session_id", s.session_id},
        {"conversation_phase", session::to_string(s.phase())},
        {"conversation_turn_count", s.conversation_turn_count},
        {"completed_vignettes", s.completed_vignettes},
        {"current_vignette_id", optional_string(s.current_vignette_id)},
        {"vignette_responses", responses},
        {"categories_covered", s.categories_covered},
        {"categories_to_explore", s.categories_to_explore},
        {"needs_follow_up", s.needs_follow_up},
        {"follow_up_question", optional_string(s.follow_up_question)},
        {"follow_ups_asked", s.follow_ups_asked},
        {"user_has_indicated_completion", s.user_has_indicated_completion},
        {"minimum_vignettes_completed", s.minimum_vignettes_completed},
        {"minimum_categories", s.minimum_categories},
        {"confidence_threshold", s.confidence_threshold},
        {"confidence_score", s.confidence_score},
        {"use_adaptive_selection", s.use_adaptive_selection},
        {"posterior_mean", vector_to_json(s.posterior_mean)},
        {"posterior_covariance", matrix_to_json(s.posterior_covariance)},
        {"fim", matrix_to_json(s.fim)},
        {"uncertainty_per_dimension", s.uncertainty_per_dimension},
        {"notes", s.notes}
    };
}

session::SessionState session_from_json(const json &j, const std::string &where) {
    session::Phase phase;
    try {
        phase = session::phase_from_string(read_or<std::string>(j, "conversation_phase", "INTRO", where));
    }
    catch (const std::invalid_argument &e) {
        throw parse_error(where + ".conversation_phase: " + e.what());
    }

    auto s = session::SessionState::restore(read<long>(j, "session_id", where), phase);
    s.conversation_turn_count = read_or<unsigned int>(j, "conversation_turn_count", 0, where);
    s.completed_vignettes = read_or<std::vector<std::string>>(j, "completed_vignettes", {}, where);
    s.current_vignette_id = read_optional_string(j, "current_vignette_id", where);

    if (j.contains("vignette_responses")) {
        const json &responses = j["vignette_responses"];
        require_array(responses, where + ".vignette_responses");
        for (size_t i = 0; i < responses.size(); i++)
            s.vignette_responses.push_back(response_from_json(responses[i], element(where, "vignette_responses", i)));
    }

    s.categories_covered = read_or<std::vector<std::string>>(j, "categories_covered", {}, where);
    s.categories_to_explore = read_or<std::vector<std::string>>(j, "categories_to_explore",
            session::SessionState::defaultCategories(), where);
    s.needs_follow_up = read_or<bool>(j, "needs_follow_up", false, where);
    s.follow_up_question = read_optional_string(j, "follow_up_question", where);
    s.follow_ups_asked = read_or<std::vector<std::string>>(j, "follow_ups_asked", {}, where);
    s.user_has_indicated_completion = read_or<bool>(j, "user_has_indicated_completion", false, where);
    s.minimum_vignettes_completed = read_or<unsigned int>(j, "minimum_vignettes_completed",
            session::SessionState::default_minimum_vignettes, where);
    s.minimum_categories = read_or<unsigned int>(j, "minimum_categories", session::SessionState::default_minimum_categories, where);
    s.confidence_threshold = read_or<double>(j, "confidence_threshold", session::SessionState::default_confidence_threshold, where);
    s.confidence_score = read_or<double>(j, "confidence_score", 0.0, where);
    s.use_adaptive_selection = read_or<bool>(j, "use_adaptive_selection", true, where);
    if (j.contains("posterior_mean")) s.posterior_mean = vector_from_json(j["posterior_mean"], where + ".posterior_mean");
    if (j.contains("posterior_covariance"))
        s.posterior_covariance = matrix_from_json(j["posterior_covariance"], where + ".posterior_covariance");
    if (j.contains("fim")) s.fim = matrix_from_json(j["fim"], where + ".fim");
    s.uncertainty_per_dimension = read_or<std::map<std::string, double>>(j, "uncertainty_per_dimension", {}, where);
    s.notes = read_or<std::string>(j, "notes", "", where);
    return s;
}

void write_vignette_artifact(const std::string &path, const json &metadata, const std::vector<Vignette> &vignettes) {
    json list = json::array();
    for (const auto &v : vignettes) list.push_back(vignette_to_json(v));
    write_document(path, {{"metadata", metadata}, {"vignettes", list}});
}

void write_profile_artifact(const std::string &path, const json &metadata, const std::vector<Attributes> &profiles) {
    json list = json::array();
    for (const auto &p : profiles) list.push_back(attributes_to_json(p));
    write_document(path, {{"metadata", metadata}, {"profiles", list}});
}

vignette_artifact read_vignette_artifact(const std::string &path) {
    json doc = read_document(path);
    vignette_artifact a;
    a.metadata = read_or<json>(doc, "metadata", json::object(), path);
    const json &list = require(doc, "vignettes", path);
    require_array(list, path + ".vignettes");
    for (size_t i = 0; i < list.size(); i++) a.vignettes.push_back(vignette_from_json(list[i], element(path, "vignettes", i)));
    return a;
}

profile_artifact read_profile_artifact(const std::string &path) {
    json doc = read_document(path);
    profile_artifact a;
    a.metadata = read_or<json>(doc, "metadata", json::object(), path);
    const json &list = require(doc, "profiles", path);
    require_array(list, path + ".profiles");
    for (size_t i = 0; i < list.size(); i++) a.profiles.push_back(attributes_from_json(list[i], element(path, "profiles", i)));
    return a;
}

}}
