#pragma once
#include <elicit/session/SessionState.hpp>
#include <elicit/selection/DOptimalSelector.hpp>
#include <elicit/information/StoppingCriterion.hpp>
#include <elicit/Vignette.hpp>
#include <boost/optional.hpp>
#include <string>
#include <vector>

namespace elicit { namespace session {

/** The hybrid vignette progression of a session: a block of static "beginning" vignettes, then up
 * to `adaptive_count` vignettes from the adaptive library, then a block of static "end" vignettes.
 *
 * The sequence holds no per-session state: next() works out the position from the vignettes the
 * session has already shown, so one sequence can serve any number of sessions.  Vignette ids must
 * be unique across the three blocks, and a shown id is never offered again.
 */
class VignetteSequence {
    public:
        /// The largest permitted adaptive segment
        static constexpr unsigned int max_adaptive = 14;

        /** Constructs a sequence.
         *
         * \param beginning the static vignettes shown first, in order
         * \param library the adaptive library
         * \param end the static vignettes shown last, in order
         * \param adaptive_count the maximum number of library vignettes shown
         * \param stopping the rule that ends the adaptive segment early
         * \param selector the rule choosing adaptive vignettes
         *
         * \throws std::invalid_argument if `adaptive_count > max_adaptive` or if a vignette id
         * appears more than once.
         */
        VignetteSequence(std::vector<Vignette> beginning, std::vector<Vignette> library, std::vector<Vignette> end,
                unsigned int adaptive_count = max_adaptive,
                information::StoppingCriterion stopping = information::StoppingCriterion(),
                selection::DOptimalSelector selector = selection::DOptimalSelector());

        /** Returns the next vignette to show in a session, or none if the session has seen the
         * whole sequence.
         *
         * Beginning vignettes come first, in order.  Library vignettes follow until the adaptive
         * segment is full, the library is exhausted, an end vignette has been shown, or the
         * stopping criterion (applied to `posterior`, `fim`, and the number of completed
         * vignettes) says to stop.  If the session uses adaptive selection the library vignette is
         * chosen by the D-optimal selector; otherwise library vignettes are taken in order.  The
         * end vignettes come last, in order.
         */
        boost::optional<Vignette> next(const SessionState &state, const belief::PosteriorDistribution &posterior,
                const Eigen::Ref<const Eigen::MatrixXd> &fim) const;

        /// The segment a vignette id belongs to.
        enum class Segment { beginning, adaptive, end, none };

        /// Returns the segment containing the given vignette id, or Segment::none.
        Segment segmentOf(const std::string &vignette_id) const;

        /// Returns the number of library vignettes the session has been shown.
        unsigned int adaptiveShown(const SessionState &state) const;

        /// The maximum total number of vignettes a session can be shown
        size_t maxLength() const;

        const std::vector<Vignette>& beginning() const { return beginning_; }
        const std::vector<Vignette>& library() const { return library_; }
        const std::vector<Vignette>& end() const { return end_; }
        unsigned int adaptiveCount() const { return adaptive_count_; }

    private:
        std::vector<Vignette> beginning_, library_, end_;
        unsigned int adaptive_count_;
        information::StoppingCriterion stopping_;
        selection::DOptimalSelector selector_;
};

/** Reads the vignettes of an offline artifact file (an object with a "vignettes" array).
 *
 * \throws serialize::parse_error if the file cannot be read or is not a valid vignette artifact
 */
std::vector<Vignette> load_vignettes(const std::string &path);

}}
