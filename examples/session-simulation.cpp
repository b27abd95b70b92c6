/// Simulates a respondent with known preference weights going through a complete hybrid session:
/// static beginning vignettes, an adaptive segment ended by the stopping rule, and static end
/// vignettes.
///
/// Usage: session-simulation [ARTIFACT_DIR]
///
/// With ARTIFACT_DIR, the vignettes are read from the static_vignettes_beginning.json,
/// adaptive_library.json and static_vignettes_end.json files written by elicit-optimize;
/// otherwise a small design is built from the bundled attribute grid.

#include <elicit/belief/LikelihoodCalculator.hpp>
#include <elicit/belief/PosteriorManager.hpp>
#include <elicit/information/FisherInformation.hpp>
#include <elicit/information/StoppingCriterion.hpp>
#include <elicit/selection/AdaptiveDifficulty.hpp>
#include <elicit/design/ProfileGenerator.hpp>
#include <elicit/design/DEfficiencyOptimizer.hpp>
#include <elicit/design/AdaptiveLibraryBuilder.hpp>
#include <elicit/design/VignetteConverter.hpp>
#include <elicit/session/VignetteSequence.hpp>
#include <elicit/random/util.hpp>
#include <elicit/log.hpp>
#include <boost/format.hpp>
#include <algorithm>
#include <cmath>
#include <iostream>

#ifndef ELICIT_DATA_DIR
#define ELICIT_DATA_DIR "data"
#endif

using namespace elicit;
using namespace elicit::belief;
using namespace elicit::information;
using namespace elicit::selection;
using namespace elicit::session;
using boost::format;
using Eigen::VectorXd;
using Eigen::MatrixXd;

VignetteSequence build_sequence(int argc, char *argv[]) {
    if (argc > 1) {
        std::string dir(argv[1]);
        return VignetteSequence(
                load_vignettes(dir + "/static_vignettes_beginning.json"),
                load_vignettes(dir + "/adaptive_library.json"),
                load_vignettes(dir + "/static_vignettes_end.json"));
    }

    design::ProfileGenerator generator(design::AttributeConfig::load(ELICIT_DATA_DIR "/preference_parameters.json"));
    design::VignetteConverter converter(generator);
    auto profiles = generator.generateAllProfiles();
    const VectorXd prior = VectorXd::Zero(NUM_DIMENSIONS);
    auto statics = design::DEfficiencyOptimizer().selectStaticVignettes(profiles, 7, 5, prior,
            design::DEfficiencyOptimizer::default_prior_variance, 5000);
    std::vector<design::ProfilePair> excluded(statics.beginning);
    excluded.insert(excluded.end(), statics.end.begin(), statics.end.end());
    auto library = design::AdaptiveLibraryBuilder().buildAdaptiveLibrary(profiles, 20, excluded, prior, 0.3, 2000);

    return VignetteSequence(
            converter.convertVignetteList(statics.beginning, "static_begin"),
            converter.convertVignetteList(library, "adaptive"),
            converter.convertVignetteList(statics.end, "static_end"));
}

int main(int argc, char *argv[]) {
    log::threshold(log::level::warning);

    VignetteSequence sequence = build_sequence(argc, argv);
    std::cout << "Sequence: " << sequence.beginning().size() << " beginning, " << sequence.library().size()
        << " library (up to " << sequence.adaptiveCount() << " shown), " << sequence.end().size() << " end vignettes\n\n";

    // The respondent's true preferences, in canonical dimension order
    VectorXd truth(NUM_DIMENSIONS);
    truth << 0.9, 0.5, 0.7, 0.3, 0.8, 0.1, 0.4;

    LikelihoodCalculator likelihood;
    FisherInformation fisher(likelihood);
    PosteriorManager manager(VectorXd::Zero(NUM_DIMENSIONS), MatrixXd::Identity(NUM_DIMENSIONS, NUM_DIMENSIONS));
    StoppingCriterion stopping;
    UncertaintyAnalyzer analyzer;
    MatrixXd fim = MatrixXd::Zero(NUM_DIMENSIONS, NUM_DIMENSIONS);

    SessionState state(1);
    state.transitionTo(Phase::experience_questions);
    state.transitionTo(Phase::bws);
    state.transitionTo(Phase::vignettes);

    while (auto vignette = sequence.next(state, manager.posterior(), fim)) {
        state.current_vignette_id = vignette->id();
        state.incrementTurnCount();

        double pA = likelihood.probabilityA(*vignette, truth);
        std::string chosen = elicit::random::runiform() < pA ? vignette->optionA().id() : vignette->optionB().id();

        const auto &posterior = manager.update(likelihood.createLikelihoodFunction(*vignette, chosen), Observation{*vignette, chosen});
        fim += fisher.computeFIM(*vignette, posterior.mean());

        VignetteResponse response;
        response.vignette_id = vignette->id();
        response.chosen_option_id = chosen;
        response.confidence = std::max(pA, 1 - pA);
        state.addVignetteResponse(response);
        state.markCategoryCovered(vignette->category());
        state.recordBelief(posterior, fim);
        state.confidence_score = std::max(0.0, 1.0 - analyzer.globalUncertainty(posterior));

        auto decision = stopping.shouldContinue(posterior, fim, state.completed_vignettes.size());
        std::cout << format("%2d. %-16s %-20s P(A)=%.3f chose %s  mean variance %.3f  det(FIM) %.3g  [%s]\n")
            % state.completed_vignettes.size() % vignette->id() % vignette->category() % pA % chosen
            % analyzer.globalUncertainty(posterior) % FisherInformation::computeDEfficiency(fim)
            % decision.reason;
    }

    state.transitionTo(Phase::wrapup);
    state.transitionTo(Phase::complete);

    const auto &posterior = manager.posterior();
    std::cout << "\nDimension              truth   estimate   std.dev\n";
    for (size_t i = 0; i < posterior.dimensions().size(); i++) {
        std::cout << format("%-20s %7.3f %10.3f %9.3f\n") % posterior.dimensions()[i] % truth[i]
            % posterior.mean()[i] % std::sqrt(posterior.covariance()(i, i));
    }

    auto rec = AdaptiveDifficulty().difficultyRecommendation(posterior);
    std::cout << "\n" << rec.text << "\n";
    std::cout << "Categories covered: " << state.categories_covered.size() << ", confidence "
        << format("%.3f") % state.confidence_score << ", can complete: " << (state.canComplete() ? "yes" : "no") << "\n";
    std::cout << "Log-likelihood of responses at the estimate: ";
    std::vector<Observation> history;
    for (const auto &r : state.vignette_responses) {
        for (const auto *block : {&sequence.beginning(), &sequence.library(), &sequence.end()})
            for (const auto &v : *block) if (v.id() == r.vignette_id) history.push_back(Observation{v, r.chosen_option_id});
    }
    std::cout << likelihood.logLikelihood(history, posterior.mean()) << "\n";
}
