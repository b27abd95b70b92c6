#pragma once
#include <elicit/session/Phase.hpp>
#include <elicit/belief/PosteriorDistribution.hpp>
#include <Eigen/Core>
#include <boost/optional.hpp>
#include <map>
#include <string>
#include <vector>

namespace elicit { namespace session {

/** A user's answer to one vignette. */
struct VignetteResponse {
    /// The vignette responded to
    std::string vignette_id;
    /// The id of the chosen option ("A" or "B")
    std::string chosen_option_id;
    /// The user's explanation of the choice
    std::string user_reasoning;
    /// Preference signals extracted from the response, keyed by preference dimension
    std::map<std::string, double> extracted_preferences;
    /// Confidence in the extracted signals, in [0, 1]
    double confidence = 0.5;
    /// When the response was given (ISO 8601, UTC); filled in by SessionState::addVignetteResponse()
    /// if empty.
    std::string timestamp;
};

/** The complete state of one preference-elicitation session.
 *
 * The conversation phase can only be changed through transitionTo(), which enforces the legal
 * phase transitions of can_transition().  Everything else is plain data, persisted along with the
 * phase by the session JSON serialization.
 */
class SessionState {
    public:
        /// The categories a new session sets out to explore
        static const std::vector<std::string>& defaultCategories();

        /// Default minimum number of completed vignettes before completion is allowed
        static constexpr unsigned int default_minimum_vignettes = 5;
        /// Default minimum number of covered categories before completion is allowed
        static constexpr unsigned int default_minimum_categories = 6;
        /// Default confidence that must be exceeded before completion is allowed
        static constexpr double default_confidence_threshold = 0.3;

        /// Creates a new session in the INTRO phase.
        explicit SessionState(long session_id = 0);

        /** Creates a session already in the given phase, without transition checks.  This is for
         * restoring persisted sessions; new sessions should start in INTRO.
         */
        static SessionState restore(long session_id, Phase phase);

        /// The session identifier
        long session_id;

        /// The current conversation phase
        Phase phase() const { return phase_; }

        /** Moves the session to a new phase.
         *
         * \throws std::logic_error if the transition is not legal
         */
        void transitionTo(Phase next);

        /** Returns true if the session has met all requirements for completion: at least
         * `minimum_vignettes_completed` completed vignettes, at least `minimum_categories`
         * covered categories, and a confidence score above `confidence_threshold`.
         */
        bool canComplete() const;

        /// Returns the next category still to be explored, or none if all are covered.
        boost::optional<std::string> nextCategoryToExplore() const;

        /** Marks a category as covered, removing it from the categories still to explore. */
        void markCategoryCovered(const std::string &category);

        /** Records a response: appends it to `vignette_responses`, adds its vignette to
         * `completed_vignettes` (once), and clears the current vignette.
         *
         * \throws std::invalid_argument if the response confidence is outside [0, 1]
         */
        void addVignetteResponse(VignetteResponse response);

        /// Increments the conversation turn counter.
        void incrementTurnCount() { conversation_turn_count++; }

        /// Records that a follow-up question has been asked for the given vignette.
        void markFollowUpAsked(const std::string &vignette_id);

        /// Returns true if the given vignette has been completed or is currently being shown.
        bool hasShown(const std::string &vignette_id) const;

        /** Stores the current belief: the posterior mean and covariance, the accumulated Fisher
         * information, and the posterior variance of each dimension.
         */
        void recordBelief(const belief::PosteriorDistribution &posterior, const Eigen::Ref<const Eigen::MatrixXd> &fim);

        unsigned int conversation_turn_count = 0;
        /// Ids of completed vignettes, in completion order
        std::vector<std::string> completed_vignettes;
        /// The vignette currently being shown, if any
        boost::optional<std::string> current_vignette_id;
        std::vector<VignetteResponse> vignette_responses;
        std::vector<std::string> categories_covered;
        std::vector<std::string> categories_to_explore;
        /// Whether the current vignette still needs a follow-up question
        bool needs_follow_up = false;
        boost::optional<std::string> follow_up_question;
        /// Vignettes for which a follow-up has been asked (at most one each)
        std::vector<std::string> follow_ups_asked;
        bool user_has_indicated_completion = false;

        unsigned int minimum_vignettes_completed = default_minimum_vignettes;
        unsigned int minimum_categories = default_minimum_categories;
        double confidence_threshold = default_confidence_threshold;
        /// Confidence in the current preference estimate, in [0, 1]
        double confidence_score = 0;

        /// Whether vignettes after the beginning block are chosen adaptively
        bool use_adaptive_selection = true;

        /// Posterior mean; empty until recordBelief() is first called
        Eigen::VectorXd posterior_mean;
        /// Posterior covariance; empty until recordBelief() is first called
        Eigen::MatrixXd posterior_covariance;
        /// Accumulated Fisher information; empty until recordBelief() is first called
        Eigen::MatrixXd fim;
        /// Posterior variance by dimension name
        std::map<std::string, double> uncertainty_per_dimension;

        std::string notes;

    private:
        Phase phase_ = Phase::intro;
};

}}
