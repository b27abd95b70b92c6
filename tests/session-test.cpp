#include <elicit/session/SessionState.hpp>
#include <elicit/session/VignetteSequence.hpp>
#include <gtest/gtest.h>
#include <set>
#include <sstream>

using namespace elicit;
using namespace elicit::session;
using elicit::belief::PosteriorDistribution;
using elicit::information::StoppingCriterion;
using namespace Eigen;

static const std::vector<Phase> all_phases{Phase::intro, Phase::experience_questions, Phase::bws, Phase::vignettes,
    Phase::follow_up, Phase::wrapup, Phase::complete};

static Vignette make_vignette(const std::string &id, long wage_a, long wage_b, long security_a = 0, long security_b = 1) {
    return Vignette(id, "mixed", "", {
            VignetteOption("A", "", {{"wage", wage_a}, {"job_security", security_a}}),
            VignetteOption("B", "", {{"wage", wage_b}, {"job_security", security_b}})});
}

static VignetteResponse respond(const std::string &id, const std::string &option = "A") {
    VignetteResponse r;
    r.vignette_id = id;
    r.chosen_option_id = option;
    return r;
}

TEST(Phase, Names) {
    EXPECT_STREQ("EXPERIENCE_QUESTIONS", to_string(Phase::experience_questions));
    for (Phase p : all_phases) EXPECT_EQ(p, phase_from_string(to_string(p)));
    EXPECT_THROW(phase_from_string("intro"), std::invalid_argument);
    std::ostringstream os;
    os << Phase::wrapup;
    EXPECT_EQ("WRAPUP", os.str());
}

TEST(Phase, Transitions) {
    std::set<std::pair<Phase, Phase>> legal{
        {Phase::intro, Phase::experience_questions},
        {Phase::experience_questions, Phase::bws},
        {Phase::bws, Phase::vignettes},
        {Phase::vignettes, Phase::follow_up},
        {Phase::vignettes, Phase::wrapup},
        {Phase::follow_up, Phase::vignettes},
        {Phase::follow_up, Phase::wrapup},
        {Phase::wrapup, Phase::complete}};
    for (Phase from : all_phases) {
        for (Phase to : all_phases) {
            EXPECT_EQ(legal.count({from, to}) > 0, can_transition(from, to)) << from << " -> " << to;
        }
    }
}

TEST(SessionState, Lifecycle) {
    SessionState s(42);
    EXPECT_EQ(42, s.session_id);
    EXPECT_EQ(Phase::intro, s.phase());
    EXPECT_THROW(s.transitionTo(Phase::vignettes), std::logic_error);
    EXPECT_EQ(Phase::intro, s.phase());

    s.transitionTo(Phase::experience_questions);
    s.transitionTo(Phase::bws);
    s.transitionTo(Phase::vignettes);
    s.transitionTo(Phase::follow_up);
    s.transitionTo(Phase::vignettes);
    s.transitionTo(Phase::wrapup);
    EXPECT_THROW(s.transitionTo(Phase::vignettes), std::logic_error);
    s.transitionTo(Phase::complete);
    EXPECT_EQ(Phase::complete, s.phase());
    for (Phase p : all_phases) EXPECT_THROW(s.transitionTo(p), std::logic_error);

    auto restored = SessionState::restore(7, Phase::bws);
    EXPECT_EQ(7, restored.session_id);
    EXPECT_EQ(Phase::bws, restored.phase());
}

TEST(SessionState, Categories) {
    SessionState s;
    EXPECT_EQ(SessionState::defaultCategories(), s.categories_to_explore);
    EXPECT_EQ(6u, SessionState::defaultCategories().size());
    ASSERT_TRUE(s.nextCategoryToExplore());
    EXPECT_EQ("financial", *s.nextCategoryToExplore());

    s.markCategoryCovered("financial");
    s.markCategoryCovered("financial");
    EXPECT_EQ((std::vector<std::string>{"financial"}), s.categories_covered);
    EXPECT_EQ("work_environment", *s.nextCategoryToExplore());

    for (const auto &c : SessionState::defaultCategories()) s.markCategoryCovered(c);
    EXPECT_FALSE(s.nextCategoryToExplore());
    EXPECT_EQ(6u, s.categories_covered.size());
}

TEST(SessionState, Responses) {
    SessionState s;
    s.current_vignette_id = std::string("v1");
    EXPECT_TRUE(s.hasShown("v1"));
    EXPECT_FALSE(s.hasShown("v2"));

    s.addVignetteResponse(respond("v1"));
    EXPECT_FALSE(s.current_vignette_id);
    EXPECT_TRUE(s.hasShown("v1"));
    ASSERT_EQ(1u, s.vignette_responses.size());
    const auto &ts = s.vignette_responses[0].timestamp;
    ASSERT_EQ(20u, ts.size());
    EXPECT_EQ('T', ts[10]);
    EXPECT_EQ('Z', ts[19]);

    auto again = respond("v1", "B");
    again.timestamp = "2024-01-01T00:00:00Z";
    s.addVignetteResponse(again);
    EXPECT_EQ(1u, s.completed_vignettes.size());
    EXPECT_EQ(2u, s.vignette_responses.size());
    EXPECT_EQ("2024-01-01T00:00:00Z", s.vignette_responses[1].timestamp);

    auto bad = respond("v2");
    bad.confidence = 1.5;
    EXPECT_THROW(s.addVignetteResponse(bad), std::invalid_argument);
    EXPECT_FALSE(s.hasShown("v2"));

    s.markFollowUpAsked("v1");
    s.markFollowUpAsked("v1");
    EXPECT_EQ(1u, s.follow_ups_asked.size());
    s.incrementTurnCount();
    EXPECT_EQ(1u, s.conversation_turn_count);
}

TEST(SessionState, CanComplete) {
    SessionState s;
    EXPECT_FALSE(s.canComplete());
    for (int i = 0; i < 5; i++) s.addVignetteResponse(respond("v" + std::to_string(i)));
    EXPECT_FALSE(s.canComplete());
    for (const auto &c : SessionState::defaultCategories()) s.markCategoryCovered(c);
    EXPECT_FALSE(s.canComplete());
    s.confidence_score = 0.3;
    EXPECT_FALSE(s.canComplete());
    s.confidence_score = 0.31;
    EXPECT_TRUE(s.canComplete());
    s.minimum_vignettes_completed = 6;
    EXPECT_FALSE(s.canComplete());
}

TEST(SessionState, RecordBelief) {
    SessionState s;
    MatrixXd cov = MatrixXd::Identity(NUM_DIMENSIONS, NUM_DIMENSIONS);
    cov(3, 3) = 0.25;
    PosteriorDistribution post(VectorXd::Constant(NUM_DIMENSIONS, 0.1), cov);
    MatrixXd fim = 3 * MatrixXd::Identity(NUM_DIMENSIONS, NUM_DIMENSIONS);
    s.recordBelief(post, fim);
    EXPECT_TRUE(s.posterior_mean.isApprox(post.mean()));
    EXPECT_TRUE(s.posterior_covariance.isApprox(cov));
    EXPECT_TRUE(s.fim.isApprox(fim));
    EXPECT_EQ(7u, s.uncertainty_per_dimension.size());
    EXPECT_EQ(0.25, s.uncertainty_per_dimension["work_life_balance"]);
}

class SequenceTest : public testing::Test {
    protected:
        std::vector<Vignette> beginning{make_vignette("b1", 20000, 10000), make_vignette("b2", 15000, 10000)};
        std::vector<Vignette> library{
            make_vignette("l1", 10000, 11000),
            make_vignette("l2", 25000, 10000, 0, 1),
            make_vignette("l3", 10000, 10000, 1, 0),
            make_vignette("l4", 30000, 10000, 0, 1),
            make_vignette("l5", 12000, 10000)};
        std::vector<Vignette> end{make_vignette("e1", 18000, 10000), make_vignette("e2", 10000, 14000)};
        PosteriorDistribution posterior{VectorXd::Zero(NUM_DIMENSIONS), MatrixXd::Identity(NUM_DIMENSIONS, NUM_DIMENSIONS)};
        MatrixXd fim = MatrixXd::Zero(NUM_DIMENSIONS, NUM_DIMENSIONS);

        // Never stops on information grounds
        StoppingCriterion patient{0, 30, 1e300, 0.0};

        // Runs the sequence to exhaustion, answering every vignette
        std::vector<std::string> run(const VignetteSequence &seq, SessionState &state) {
            std::vector<std::string> ids;
            while (auto v = seq.next(state, posterior, fim)) {
                state.current_vignette_id = v->id();
                ids.push_back(v->id());
                state.addVignetteResponse(respond(v->id()));
                if (ids.size() > 20) break;
            }
            return ids;
        }
};

TEST_F(SequenceTest, AdaptiveOrder) {
    VignetteSequence seq(beginning, library, end, 3, patient);
    EXPECT_EQ(7u, seq.maxLength());
    SessionState state;
    auto ids = run(seq, state);
    ASSERT_EQ(7u, ids.size());
    EXPECT_EQ("b1", ids[0]);
    EXPECT_EQ("b2", ids[1]);
    // The largest trade-off comes first under D-optimal selection
    EXPECT_EQ("l4", ids[2]);
    for (int i = 2; i < 5; i++) EXPECT_EQ(VignetteSequence::Segment::adaptive, seq.segmentOf(ids[i]));
    EXPECT_EQ("e1", ids[5]);
    EXPECT_EQ("e2", ids[6]);
    EXPECT_EQ(7u, std::set<std::string>(ids.begin(), ids.end()).size());
    EXPECT_EQ(3u, seq.adaptiveShown(state));
    EXPECT_FALSE(seq.next(state, posterior, fim));
}

TEST_F(SequenceTest, LibraryOrder) {
    VignetteSequence seq(beginning, library, end, 4, patient);
    SessionState state;
    state.use_adaptive_selection = false;
    auto ids = run(seq, state);
    EXPECT_EQ((std::vector<std::string>{"b1", "b2", "l1", "l2", "l3", "l4", "e1", "e2"}), ids);
}

TEST_F(SequenceTest, StoppingRule) {
    // Stops adapting once three vignettes have been answered
    VignetteSequence seq(beginning, library, end, 10, StoppingCriterion(0, 3));
    SessionState state;
    auto ids = run(seq, state);
    ASSERT_EQ(5u, ids.size());
    EXPECT_EQ(VignetteSequence::Segment::adaptive, seq.segmentOf(ids[2]));
    EXPECT_EQ("e1", ids[3]);
    EXPECT_EQ("e2", ids[4]);
}

TEST_F(SequenceTest, NoAdaptiveAfterEnd) {
    VignetteSequence seq(beginning, library, end, 3, patient);
    SessionState state;
    for (const char *id : {"b1", "b2", "e1"}) state.addVignetteResponse(respond(id));
    auto v = seq.next(state, posterior, fim);
    ASSERT_TRUE(v);
    EXPECT_EQ("e2", v->id());

    // A vignette in progress is not offered again
    SessionState fresh;
    fresh.current_vignette_id = std::string("b1");
    EXPECT_EQ("b2", seq.next(fresh, posterior, fim)->id());
}

TEST_F(SequenceTest, SmallLibrary) {
    VignetteSequence seq(beginning, {library[0]}, end, 14, patient);
    EXPECT_EQ(5u, seq.maxLength());
    SessionState state;
    EXPECT_EQ((std::vector<std::string>{"b1", "b2", "l1", "e1", "e2"}), run(seq, state));
}

TEST_F(SequenceTest, Invalid) {
    EXPECT_THROW(VignetteSequence(beginning, library, end, 15), std::invalid_argument);
    EXPECT_THROW(VignetteSequence(beginning, library, {beginning[0]}), std::invalid_argument);
    EXPECT_THROW(VignetteSequence(beginning, {library[0], library[0]}, end), std::invalid_argument);
    VignetteSequence seq(beginning, library, end);
    EXPECT_EQ(VignetteSequence::Segment::none, seq.segmentOf("zz"));
    EXPECT_EQ(VignetteSequence::Segment::end, seq.segmentOf("e2"));
    EXPECT_EQ(VignetteSequence::Segment::beginning, seq.segmentOf("b1"));
    EXPECT_EQ(9u, seq.maxLength());
}

TEST(Sequence, EmptySegments) {
    VignetteSequence seq({}, {}, {});
    SessionState state;
    PosteriorDistribution post(VectorXd::Zero(NUM_DIMENSIONS), MatrixXd::Identity(NUM_DIMENSIONS, NUM_DIMENSIONS));
    EXPECT_FALSE(seq.next(state, post, MatrixXd::Zero(NUM_DIMENSIONS, NUM_DIMENSIONS)));
    EXPECT_EQ(0u, seq.maxLength());
}

int main(int argc, char **argv) {
    testing::InitGoogleTest(&argc, argv);
    return RUN_ALL_TESTS();
}
