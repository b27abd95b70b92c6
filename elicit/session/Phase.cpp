#include <elicit/session/Phase.hpp>
#include <stdexcept>

namespace elicit { namespace session {

const char* to_string(Phase p) {
    switch (p) {
        case Phase::intro: return "INTRO";
        case Phase::experience_questions: return "EXPERIENCE_QUESTIONS";
        case Phase::bws: return "BWS";
        case Phase::vignettes: return "VIGNETTES";
        case Phase::follow_up: return "FOLLOW_UP";
        case Phase::wrapup: return "WRAPUP";
        case Phase::complete: return "COMPLETE";
    }
    return "UNKNOWN";
}

Phase phase_from_string(const std::string &name) {
    for (Phase p : {Phase::intro, Phase::experience_questions, Phase::bws, Phase::vignettes,
            Phase::follow_up, Phase::wrapup, Phase::complete}) {
        if (name == to_string(p)) return p;
    }
    throw std::invalid_argument("Unknown session phase `" + name + "'");
}

bool can_transition(Phase from, Phase to) {
    switch (from) {
        case Phase::intro: return to == Phase::experience_questions;
        case Phase::experience_questions: return to == Phase::bws;
        case Phase::bws: return to == Phase::vignettes;
        case Phase::vignettes: return to == Phase::follow_up or to == Phase::wrapup;
        case Phase::follow_up: return to == Phase::vignettes or to == Phase::wrapup;
        case Phase::wrapup: return to == Phase::complete;
        case Phase::complete: return false;
    }
    return false;
}

std::ostream& operator<<(std::ostream &os, Phase p) {
    return os << to_string(p);
}

}}
