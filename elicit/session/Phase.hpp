#pragma once
#include <ostream>
#include <string>

namespace elicit {
/// Namespace for the state of a preference-elicitation session.
namespace session {

/** The phases of a preference-elicitation conversation.  A session starts in `intro` and moves
 * forward through the phases; `follow_up` alternates with `vignettes`, and `complete` is terminal.
 */
enum class Phase { intro, experience_questions, bws, vignettes, follow_up, wrapup, complete };

/// Returns the persisted name of a phase: "INTRO", "EXPERIENCE_QUESTIONS", "BWS", and so on.
const char* to_string(Phase p);

/** Parses a persisted phase name.
 *
 * \throws std::invalid_argument if the name is not a phase name
 */
Phase phase_from_string(const std::string &name);

/** Returns true if a session may move directly from phase `from` to phase `to`.  The legal
 * transitions are:
 *
 *     INTRO -> EXPERIENCE_QUESTIONS -> BWS -> VIGNETTES -> WRAPUP -> COMPLETE
 *     VIGNETTES -> FOLLOW_UP -> VIGNETTES
 *     FOLLOW_UP -> WRAPUP
 */
bool can_transition(Phase from, Phase to);

std::ostream& operator<<(std::ostream &os, Phase p);

}}
