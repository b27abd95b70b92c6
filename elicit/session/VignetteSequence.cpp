#include <elicit/session/VignetteSequence.hpp>
#include <elicit/serialize/json.hpp>
#include <elicit/log.hpp>
#include <algorithm>
#include <set>
#include <stdexcept>

namespace elicit { namespace session {

constexpr unsigned int VignetteSequence::max_adaptive;

VignetteSequence::VignetteSequence(std::vector<Vignette> beginning, std::vector<Vignette> library, std::vector<Vignette> end,
        unsigned int adaptive_count, information::StoppingCriterion stopping, selection::DOptimalSelector selector)
    : beginning_{std::move(beginning)}, library_{std::move(library)}, end_{std::move(end)},
    adaptive_count_{adaptive_count}, stopping_{std::move(stopping)}, selector_{std::move(selector)}
{
    if (adaptive_count_ > max_adaptive)
        throw std::invalid_argument("VignetteSequence adaptive_count cannot exceed " + std::to_string(max_adaptive));
    std::set<std::string> ids;
    for (const auto *block : {&beginning_, &library_, &end_}) {
        for (const auto &v : *block) {
            if (not ids.insert(v.id()).second)
                throw std::invalid_argument("VignetteSequence: duplicate vignette id `" + v.id() + "'");
        }
    }
}

VignetteSequence::Segment VignetteSequence::segmentOf(const std::string &vignette_id) const {
    auto in = [&vignette_id](const std::vector<Vignette> &block) {
        for (const auto &v : block) if (v.id() == vignette_id) return true;
        return false;
    };
    if (in(beginning_)) return Segment::beginning;
    if (in(library_)) return Segment::adaptive;
    if (in(end_)) return Segment::end;
    return Segment::none;
}

unsigned int VignetteSequence::adaptiveShown(const SessionState &state) const {
    unsigned int n = 0;
    for (const auto &v : library_) if (state.hasShown(v.id())) n++;
    return n;
}

size_t VignetteSequence::maxLength() const {
    return beginning_.size() + std::min<size_t>(adaptive_count_, library_.size()) + end_.size();
}

boost::optional<Vignette> VignetteSequence::next(const SessionState &state, const belief::PosteriorDistribution &posterior,
        const Eigen::Ref<const Eigen::MatrixXd> &fim) const {
    for (const auto &v : beginning_)
        if (not state.hasShown(v.id())) return v;

    bool end_started = false;
    for (const auto &v : end_) if (state.hasShown(v.id())) { end_started = true; break; }

    if (not end_started and adaptiveShown(state) < adaptive_count_) {
        auto decision = stopping_.shouldContinue(posterior, fim, state.completed_vignettes.size());
        if (not decision.should_continue) {
            ELICIT_LOG(info, "Session " << state.session_id << ": ending adaptive segment (" << decision.reason << ")");
        }
        else if (state.use_adaptive_selection) {
            std::set<std::string> shown(state.completed_vignettes.begin(), state.completed_vignettes.end());
            if (state.current_vignette_id) shown.insert(*state.current_vignette_id);
            auto chosen = selector_.selectNextVignette(library_, posterior, fim, shown);
            if (chosen) return chosen;
        }
        else {
            for (const auto &v : library_)
                if (not state.hasShown(v.id())) return v;
        }
    }

    for (const auto &v : end_)
        if (not state.hasShown(v.id())) return v;

    return boost::none;
}

std::vector<Vignette> load_vignettes(const std::string &path) {
    return serialize::read_vignette_artifact(path).vignettes;
}

}}
