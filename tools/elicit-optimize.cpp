/// Offline vignette design: generates the profile pool, selects D-efficient static vignettes and
/// the adaptive library, and writes them as JSON artifacts for runtime sessions.

#include <elicit/design/AttributeConfig.hpp>
#include <elicit/design/ProfileGenerator.hpp>
#include <elicit/design/DominanceFilter.hpp>
#include <elicit/design/DEfficiencyOptimizer.hpp>
#include <elicit/design/AdaptiveLibraryBuilder.hpp>
#include <elicit/design/VignetteConverter.hpp>
#include <elicit/serialize/json.hpp>
#include <elicit/clock.hpp>
#include <elicit/log.hpp>
#include <boost/filesystem.hpp>
#include <boost/format.hpp>
#include <boost/program_options.hpp>
#include <iostream>
#include <string>

#ifndef ELICIT_DATA_DIR
#define ELICIT_DATA_DIR "data"
#endif

using namespace elicit;
using namespace elicit::design;
namespace po = boost::program_options;
namespace fs = boost::filesystem;
using nlohmann::json;

static json statistics_to_json(const DEfficiencyOptimizer::statistics &s) {
    return {
        {"num_vignettes", s.num_vignettes},
        {"fim_determinant", s.fim_determinant},
        {"d_efficiency", s.d_efficiency},
        {"eigenvalues", serialize::vector_to_json(s.eigenvalues)},
        {"condition_number", s.condition_number},
        {"min_eigenvalue", s.min_eigenvalue},
        {"max_eigenvalue", s.max_eigenvalue}
    };
}

static json library_statistics_to_json(const AdaptiveLibraryBuilder::library_statistics &s) {
    return {
        {"num_vignettes", s.num_vignettes},
        {"avg_pairwise_distance", s.avg_pairwise_distance},
        {"min_pairwise_distance", s.min_pairwise_distance},
        {"max_pairwise_distance", s.max_pairwise_distance},
        {"std_pairwise_distance", s.std_pairwise_distance},
        {"attribute_coverage", s.attribute_coverage}
    };
}

static void banner(const std::string &title) {
    ELICIT_LOG(info, std::string(80, '='));
    ELICIT_LOG(info, title);
    ELICIT_LOG(info, std::string(80, '='));
}

static void step(const std::string &title) {
    ELICIT_LOG(info, title);
    ELICIT_LOG(info, std::string(80, '-'));
}

int main(int argc, char *argv[]) {
    std::string output_dir, config_path, log_file;
    unsigned int num_static, num_beginning, num_library;
    double diversity_weight;
    size_t sample_size, max_profiles;

    po::options_description desc("Offline vignette optimization pipeline.\n\nOptions");
    desc.add_options()
        ("help,h", "show this help and exit")
        ("output-dir", po::value(&output_dir)->default_value("./output"), "directory for the output artifacts")
        ("config", po::value(&config_path)->default_value(ELICIT_DATA_DIR "/preference_parameters.json"),
            "attribute-definition JSON file")
        ("num-static", po::value(&num_static)->default_value(7), "number of static vignettes")
        ("num-beginning", po::value(&num_beginning)->default_value(5), "number of static vignettes shown at the beginning")
        ("num-library", po::value(&num_library)->default_value(AdaptiveLibraryBuilder::default_num_library),
            "number of adaptive library vignettes")
        ("diversity-weight", po::value(&diversity_weight)->default_value(AdaptiveLibraryBuilder::default_diversity_weight),
            "weight of the diversity term in adaptive library selection (0-1)")
        ("sample-size", po::value(&sample_size)->default_value(DEfficiencyOptimizer::default_sample_size),
            "candidate pairs evaluated per round (the adaptive library uses a tenth of this)")
        ("max-profiles", po::value(&max_profiles)->default_value(0), "cap on the number of generated profiles (0 for no cap)")
        ("filter-dominated", "remove globally dominated profiles before selecting vignettes")
        ("log-file", po::value(&log_file), "log file (default: OUTPUT_DIR/optimization.log)")
        ;

    po::variables_map vm;
    try {
        po::store(po::parse_command_line(argc, argv, desc), vm);
        po::notify(vm);
    }
    catch (const po::error &e) {
        std::cerr << "Error: " << e.what() << "\n\n" << desc << "\n";
        return 2;
    }
    if (vm.count("help")) {
        std::cout << desc << "\n";
        return 0;
    }

    try {
        fs::create_directories(output_dir);
        if (log_file.empty()) log_file = (fs::path(output_dir) / "optimization.log").string();
        log::open(log_file);
    }
    catch (const std::exception &e) {
        std::cerr << "Error: " << e.what() << "\n";
        return 1;
    }
    log::threshold(log::level::info);

    auto out = [&output_dir](const char *name) { return (fs::path(output_dir) / name).string(); };

    try {
        banner("OFFLINE VIGNETTE OPTIMIZATION PIPELINE");
        ELICIT_LOG(info, "Configuration: " << config_path);
        ELICIT_LOG(info, "Output directory: " << output_dir);
        ELICIT_LOG(info, "Static vignettes: " << num_static << " (" << num_beginning << " beginning)");
        ELICIT_LOG(info, "Adaptive library: " << num_library);
        ELICIT_LOG(info, "Diversity weight: " << diversity_weight);
        ELICIT_LOG(info, "Sample size: " << sample_size << " pairs per round");

        step("STEP 1: Generating all possible job profiles...");
        ProfileGenerator generator(AttributeConfig::load(config_path));
        auto all_profiles = generator.generateAllProfiles(max_profiles);
        VignetteConverter converter(generator);

        serialize::write_profile_artifact(out("all_profiles.json"),
                {{"timestamp", utc_timestamp()}, {"total_profiles", all_profiles.size()}}, all_profiles);
        ELICIT_LOG(info, "Saved all profiles to: " << out("all_profiles.json"));

        step("STEP 2: Preparing profiles for vignette generation...");
        std::vector<JobProfile> candidates;
        std::string note;
        if (vm.count("filter-dominated")) {
            candidates = DominanceFilter(generator.config()).filterDominated(all_profiles);
            note = "Globally dominated profiles removed";
        }
        else {
            candidates = all_profiles;
            note = "Global dominance filtering skipped; pairwise dominance is checked during vignette selection";
            ELICIT_LOG(info, "Using all " << candidates.size() << " profiles (pairwise dominance is checked during selection)");
        }
        serialize::write_profile_artifact(out("candidate_profiles.json"), {
                {"timestamp", utc_timestamp()},
                {"total_profiles_before_filtering", all_profiles.size()},
                {"total_profiles_after_filtering", candidates.size()},
                {"note", note}}, candidates);
        ELICIT_LOG(info, "Saved candidate profiles to: " << out("candidate_profiles.json"));

        step("STEP 3: Optimizing static vignettes using D-efficiency...");
        // The preference dimensions average several attributes, so start from a neutral prior.
        const Eigen::VectorXd prior_mean = Eigen::VectorXd::Zero(NUM_DIMENSIONS);
        DEfficiencyOptimizer optimizer;
        auto design = optimizer.selectStaticVignettes(candidates, num_static, num_beginning, prior_mean,
                DEfficiencyOptimizer::default_prior_variance, sample_size);

        std::vector<ProfilePair> all_static(design.beginning);
        all_static.insert(all_static.end(), design.end.begin(), design.end.end());
        auto stats = optimizer.optimizationStatistics(all_static, prior_mean);
        ELICIT_LOG(info, boost::format("Static design: D-efficiency %.4f, FIM determinant %.2e, condition number %.2f")
                % stats.d_efficiency % stats.fim_determinant % stats.condition_number);

        serialize::write_vignette_artifact(out("static_vignettes_beginning.json"), {
                {"timestamp", utc_timestamp()},
                {"type", "static_beginning"},
                {"count", design.beginning.size()},
                {"optimization_stats", statistics_to_json(stats)},
                {"format", "online_vignette_schema"}},
                converter.convertVignetteList(design.beginning, "static_begin"));
        serialize::write_vignette_artifact(out("static_vignettes_end.json"), {
                {"timestamp", utc_timestamp()},
                {"type", "static_end"},
                {"count", design.end.size()},
                {"format", "online_vignette_schema"}},
                converter.convertVignetteList(design.end, "static_end"));
        ELICIT_LOG(info, "Saved static vignettes to: " << out("static_vignettes_beginning.json") << ", " << out("static_vignettes_end.json"));

        step("STEP 4: Building adaptive library...");
        AdaptiveLibraryBuilder builder;
        auto library = builder.buildAdaptiveLibrary(candidates, num_library, all_static, prior_mean, diversity_weight, sample_size / 10);
        auto library_stats = builder.libraryStatistics(library);
        ELICIT_LOG(info, boost::format("Library pairwise distance: avg %.4f, min %.4f, max %.4f, std %.4f")
                % library_stats.avg_pairwise_distance % library_stats.min_pairwise_distance
                % library_stats.max_pairwise_distance % library_stats.std_pairwise_distance);

        serialize::write_vignette_artifact(out("adaptive_library.json"), {
                {"timestamp", utc_timestamp()},
                {"type", "adaptive_library"},
                {"count", library.size()},
                {"diversity_weight", diversity_weight},
                {"library_stats", library_statistics_to_json(library_stats)},
                {"format", "online_vignette_schema"}},
                converter.convertVignetteList(library, "adaptive"));
        ELICIT_LOG(info, "Saved adaptive library to: " << out("adaptive_library.json"));

        banner("OPTIMIZATION COMPLETE");
        ELICIT_LOG(info, "Total candidate profiles: " << all_profiles.size());
        ELICIT_LOG(info, "Profiles used for selection: " << candidates.size());
        ELICIT_LOG(info, "Static vignettes: " << all_static.size() << " (" << design.beginning.size() << " beginning, "
                << design.end.size() << " end)");
        ELICIT_LOG(info, "Adaptive library: " << library.size());
        ELICIT_LOG(info, "Log file: " << log_file);
    }
    catch (const config_error &e) {
        ELICIT_LOG(error, "Invalid attribute configuration: " << e.what());
        return 1;
    }
    catch (const empty_pool_error &e) {
        ELICIT_LOG(error, e.what());
        return 1;
    }
    catch (const std::exception &e) {
        ELICIT_LOG(error, "Optimization failed: " << e.what());
        return 1;
    }

    log::close();
    return 0;
}
