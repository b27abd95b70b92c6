#include <elicit/session/SessionState.hpp>
#include <elicit/clock.hpp>
#include <algorithm>
#include <stdexcept>

namespace elicit { namespace session {

constexpr unsigned int SessionState::default_minimum_vignettes, SessionState::default_minimum_categories;
constexpr double SessionState::default_confidence_threshold;

namespace {
bool contains(const std::vector<std::string> &v, const std::string &s) {
    return std::find(v.begin(), v.end(), s) != v.end();
}
}

const std::vector<std::string>& SessionState::defaultCategories() {
    static const std::vector<std::string> categories{
        "financial", "work_environment", "job_security", "career_advancement", "work_life_balance", "task_preferences"};
    return categories;
}

SessionState::SessionState(long id) : session_id{id}, categories_to_explore(defaultCategories()) {}

SessionState SessionState::restore(long id, Phase phase) {
    SessionState s(id);
    s.phase_ = phase;
    return s;
}

void SessionState::transitionTo(Phase next) {
    if (not can_transition(phase_, next))
        throw std::logic_error(std::string("Illegal session phase transition ") + to_string(phase_) + " -> " + to_string(next));
    phase_ = next;
}

bool SessionState::canComplete() const {
    return completed_vignettes.size() >= minimum_vignettes_completed
        and categories_covered.size() >= minimum_categories
        and confidence_score > confidence_threshold;
}

boost::optional<std::string> SessionState::nextCategoryToExplore() const {
    if (categories_to_explore.empty()) return boost::none;
    return categories_to_explore.front();
}

void SessionState::markCategoryCovered(const std::string &category) {
    if (not contains(categories_covered, category)) categories_covered.push_back(category);
    categories_to_explore.erase(std::remove(categories_to_explore.begin(), categories_to_explore.end(), category),
            categories_to_explore.end());
}

void SessionState::addVignetteResponse(VignetteResponse response) {
    if (not (response.confidence >= 0 and response.confidence <= 1))
        throw std::invalid_argument("Vignette response confidence must be in [0, 1]");
    if (response.timestamp.empty()) response.timestamp = utc_timestamp();
    if (not contains(completed_vignettes, response.vignette_id)) completed_vignettes.push_back(response.vignette_id);
    vignette_responses.push_back(std::move(response));
    current_vignette_id = boost::none;
}

void SessionState::markFollowUpAsked(const std::string &vignette_id) {
    if (not contains(follow_ups_asked, vignette_id)) follow_ups_asked.push_back(vignette_id);
}

bool SessionState::hasShown(const std::string &vignette_id) const {
    return contains(completed_vignettes, vignette_id) or (current_vignette_id and *current_vignette_id == vignette_id);
}

void SessionState::recordBelief(const belief::PosteriorDistribution &posterior, const Eigen::Ref<const Eigen::MatrixXd> &f) {
    posterior_mean = posterior.mean();
    posterior_covariance = posterior.covariance();
    fim = f;
    uncertainty_per_dimension.clear();
    const auto &dims = posterior.dimensions();
    for (size_t i = 0; i < dims.size(); i++)
        uncertainty_per_dimension[dims[i]] = posterior.covariance()(i, i);
}

}}
