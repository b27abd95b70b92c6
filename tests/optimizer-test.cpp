#include <elicit/design/DEfficiencyOptimizer.hpp>
#include <elicit/design/AdaptiveLibraryBuilder.hpp>
#include <elicit/design/VignetteConverter.hpp>
#include <elicit/design/PairScreen.hpp>
#include <elicit/random/rng.hpp>
#include <gtest/gtest.h>
#include <algorithm>
#include <cmath>
#include <set>

using namespace elicit;
using namespace elicit::design;
using namespace Eigen;

// 16 profiles over four two-level attributes, each driving its own preference dimension.  55 of
// the 120 unordered pairs present a genuine trade-off.
static std::vector<JobProfile> binary_pool() {
    std::vector<JobProfile> pool;
    for (long w : {10000L, 15000L})
        for (long g : {0L, 1L})
            for (long s : {0L, 1L})
                for (long v : {0L, 1L})
                    pool.push_back({{"wage", w}, {"career_growth", g}, {"job_security", s}, {"company_values", v}});
    return pool;
}

static std::set<std::string> keys_of(const std::vector<ProfilePair> &pairs) {
    std::set<std::string> keys;
    for (const auto &p : pairs) keys.insert(AdaptiveLibraryBuilder::pairKey(p.first, p.second));
    return keys;
}

static void expect_tradeoffs(const std::vector<ProfilePair> &pairs) {
    for (const auto &p : pairs) {
        EXPECT_FALSE(pairwise_dominance(encode_features(p.first), encode_features(p.second)));
        EXPECT_FALSE(excessive_wage_gap(p.first, p.second));
    }
}

TEST(DEfficiency, StaticDesign) {
    elicit::random::seed(7);
    DEfficiencyOptimizer opt;
    auto pool = binary_pool();
    auto design = opt.selectStaticVignettes(pool, 5, 2, VectorXd(), 0.5, 1000);
    EXPECT_EQ(2u, design.beginning.size());
    EXPECT_EQ(3u, design.end.size());

    std::vector<ProfilePair> all(design.beginning);
    all.insert(all.end(), design.end.begin(), design.end.end());
    EXPECT_EQ(5u, keys_of(all).size());
    expect_tradeoffs(all);

    // The prior alone has D-efficiency det(2I)^(1/7) = 2
    EXPECT_NEAR(2.0, opt.computeDEfficiency({}), 1e-9);
    EXPECT_GT(opt.computeDEfficiency(all), 2.0);
    EXPECT_GE(opt.computeDEfficiency(all), opt.computeDEfficiency(design.beginning));

    auto stats = opt.optimizationStatistics(all);
    EXPECT_EQ(5u, stats.num_vignettes);
    EXPECT_EQ(NUM_DIMENSIONS, stats.eigenvalues.size());
    EXPECT_GE(stats.min_eigenvalue, 2.0 - 1e-9);
    EXPECT_GE(stats.condition_number, 1.0);
    EXPECT_NEAR(std::pow(stats.fim_determinant, 1.0 / NUM_DIMENSIONS), stats.d_efficiency, 1e-9);
    EXPECT_NEAR(opt.computeDEfficiency(all), stats.d_efficiency, 1e-9);
}

TEST(DEfficiency, GreedyFirstPick) {
    DEfficiencyOptimizer opt;
    auto pool = binary_pool();
    auto design = opt.selectStaticVignettes(pool, 1, 1, VectorXd::Zero(NUM_DIMENSIONS), 0.5, 1000);
    ASSERT_EQ(1u, design.beginning.size());
    EXPECT_TRUE(design.end.empty());

    // With zero weights every pair has p = 0.5, so the first pick maximizes |d|^2 among trade-offs
    double best = 0;
    for (size_t i = 0; i < pool.size(); i++) {
        for (size_t j = i + 1; j < pool.size(); j++) {
            VectorXd xa = encode_features(pool[i]), xb = encode_features(pool[j]);
            if (pairwise_dominance(xa, xb)) continue;
            best = std::max(best, (xa - xb).squaredNorm());
        }
    }
    const auto &pick = design.beginning.front();
    EXPECT_NEAR(best, (encode_features(pick.first) - encode_features(pick.second)).squaredNorm(), 1e-12);
}

TEST(DEfficiency, Invalid) {
    DEfficiencyOptimizer opt;
    auto pool = binary_pool();
    EXPECT_THROW(opt.selectStaticVignettes(pool, 3, 4), std::invalid_argument);
    EXPECT_THROW(opt.selectStaticVignettes(pool, 3, 1, VectorXd::Zero(3)), std::invalid_argument);
    EXPECT_THROW(opt.selectStaticVignettes(pool, 3, 1, VectorXd(), 0.0), std::invalid_argument);
    EXPECT_THROW(opt.selectStaticVignettes({pool[0]}, 3, 1), empty_pool_error);
    EXPECT_THROW(opt.selectStaticVignettes({}, 3, 1), empty_pool_error);
    EXPECT_THROW(DEfficiencyOptimizer(0.0), std::domain_error);

    auto none = opt.selectStaticVignettes({}, 0, 0);
    EXPECT_TRUE(none.beginning.empty());
    EXPECT_TRUE(none.end.empty());
}

TEST(DEfficiency, ExhaustedPool) {
    DEfficiencyOptimizer opt;
    // Two profiles where one dominates the other: nothing is admissible
    std::vector<JobProfile> pool{{{"career_growth", 1L}, {"job_security", 1L}}, {{"career_growth", 0L}, {"job_security", 0L}}};
    auto design = opt.selectStaticVignettes(pool, 3, 1, VectorXd(), 0.5, 10);
    EXPECT_TRUE(design.beginning.empty());
    EXPECT_TRUE(design.end.empty());
}

TEST(DEfficiency, PairFIM) {
    DEfficiencyOptimizer opt;
    VectorXd x = VectorXd::Zero(NUM_DIMENSIONS), y = VectorXd::Zero(NUM_DIMENSIONS);
    x[2] = 1;
    MatrixXd F = opt.pairFIM(x, y, VectorXd::Zero(NUM_DIMENSIONS));
    EXPECT_DOUBLE_EQ(0.25, F(2, 2));
    EXPECT_DOUBLE_EQ(0.25, F.sum());
    EXPECT_EQ(0.0, opt.pairFIM(x, x, VectorXd::Ones(NUM_DIMENSIONS)).cwiseAbs().maxCoeff());
}

TEST(AdaptiveLibrary, Build) {
    elicit::random::seed(11);
    auto pool = binary_pool();
    DEfficiencyOptimizer opt;
    auto design = opt.selectStaticVignettes(pool, 4, 2, VectorXd(), 0.5, 1000);
    std::vector<ProfilePair> excluded(design.beginning);
    excluded.insert(excluded.end(), design.end.begin(), design.end.end());
    auto excluded_keys = keys_of(excluded);
    ASSERT_EQ(4u, excluded_keys.size());

    AdaptiveLibraryBuilder builder;
    for (double w : {0.0, 0.3, 1.0}) {
        auto library = builder.buildAdaptiveLibrary(pool, 10, excluded, VectorXd(), w, 1000);
        ASSERT_EQ(10u, library.size()) << "diversity weight " << w;
        auto keys = keys_of(library);
        EXPECT_EQ(10u, keys.size());
        for (const auto &k : keys) EXPECT_EQ(0u, excluded_keys.count(k));
        expect_tradeoffs(library);
    }
}

TEST(AdaptiveLibrary, StopsWhenExhausted) {
    AdaptiveLibraryBuilder builder;
    auto library = builder.buildAdaptiveLibrary(binary_pool(), 100, {}, VectorXd(), 0.3, 1000);
    EXPECT_EQ(55u, library.size());
    EXPECT_EQ(55u, keys_of(library).size());
}

TEST(AdaptiveLibrary, Invalid) {
    AdaptiveLibraryBuilder builder;
    auto pool = binary_pool();
    EXPECT_THROW(builder.buildAdaptiveLibrary(pool, 5, {}, VectorXd(), 1.5), std::invalid_argument);
    EXPECT_THROW(builder.buildAdaptiveLibrary(pool, 5, {}, VectorXd(), -0.1), std::invalid_argument);
    EXPECT_THROW(builder.buildAdaptiveLibrary(pool, 5, {}, VectorXd::Zero(2)), std::invalid_argument);
    EXPECT_THROW(builder.buildAdaptiveLibrary({pool[3]}, 5), empty_pool_error);
    EXPECT_TRUE(builder.buildAdaptiveLibrary(pool, 0).empty());
    EXPECT_THROW(AdaptiveLibraryBuilder(-2.0), std::domain_error);
}

TEST(AdaptiveLibrary, Measures) {
    VectorXd a = VectorXd::Zero(3), b = VectorXd::Zero(3);
    a << 1, 2, 0;
    b << 0, 0, 5;
    EXPECT_NEAR(1.0, AdaptiveLibraryBuilder::cosineDistance(a, b), 1e-12);
    EXPECT_NEAR(0.0, AdaptiveLibraryBuilder::cosineDistance(a, -2 * a), 1e-8);
    EXPECT_NEAR(1.0, AdaptiveLibraryBuilder::cosineDistance(a, VectorXd::Zero(3)), 1e-12);

    JobProfile p{{"wage", 10000L}}, q{{"wage", 15000L}};
    EXPECT_EQ(AdaptiveLibraryBuilder::pairKey(p, q), AdaptiveLibraryBuilder::pairKey(q, p));
    EXPECT_NE(AdaptiveLibraryBuilder::pairKey(p, q), AdaptiveLibraryBuilder::pairKey(p, p));

    AdaptiveLibraryBuilder builder;
    VectorXd x = VectorXd::Zero(NUM_DIMENSIONS), y = VectorXd::Zero(NUM_DIMENSIONS);
    x[0] = 1;
    double r = AdaptiveLibraryBuilder::informativeness_ridge;
    EXPECT_NEAR(1.0, builder.informativeness(x, y, VectorXd::Zero(NUM_DIMENSIONS)) / (std::pow(r, 6) * (r + 0.25)), 1e-9);
    EXPECT_LT(builder.informativeness(x, x, VectorXd::Zero(NUM_DIMENSIONS)), builder.informativeness(x, y, VectorXd::Zero(NUM_DIMENSIONS)));
}

TEST(AdaptiveLibrary, Statistics) {
    AdaptiveLibraryBuilder builder;
    auto library = builder.buildAdaptiveLibrary(binary_pool(), 8, {}, VectorXd(), 0.5, 1000);
    ASSERT_EQ(8u, library.size());
    auto stats = builder.libraryStatistics(library);
    EXPECT_EQ(8u, stats.num_vignettes);
    EXPECT_GE(stats.min_pairwise_distance, 0.0);
    EXPECT_LE(stats.min_pairwise_distance, stats.avg_pairwise_distance);
    EXPECT_LE(stats.avg_pairwise_distance, stats.max_pairwise_distance);
    EXPECT_LE(stats.max_pairwise_distance, 1.0);
    EXPECT_GE(stats.std_pairwise_distance, 0.0);

    ASSERT_EQ(4u, stats.attribute_coverage.size());
    for (const auto &attr : stats.attribute_coverage) {
        size_t total = 0;
        for (const auto &c : attr.second) total += c.second;
        EXPECT_EQ(16u, total) << attr.first;
    }
    EXPECT_EQ(1u, stats.attribute_coverage["wage"].count("15000"));

    auto single = builder.libraryStatistics({library.front()});
    EXPECT_EQ(1u, single.num_vignettes);
    EXPECT_EQ(0.0, single.avg_pairwise_distance);
    EXPECT_EQ(0.0, single.max_pairwise_distance);
    EXPECT_TRUE(builder.libraryStatistics({}).attribute_coverage.empty());
}

static ProfileGenerator converter_generator() {
    return ProfileGenerator(AttributeConfig::fromJson(nlohmann::json::parse(R"({
        "attributes": [
            {"name": "wage", "label": "Monthly wage", "type": "ordered", "levels": [
                {"id": "w10", "label": "KES 10,000", "value": 10000},
                {"id": "w20", "label": "KES 20,000", "value": 20000},
                {"id": "w30", "label": "KES 30,000", "value": 30000}]},
            {"name": "commute_time", "label": "Commute", "type": "ordered", "levels": [
                {"id": "c15", "label": "15 minutes", "value": 15},
                {"id": "c60", "label": "60 minutes", "value": 60}]},
            {"name": "job_security", "label": "Contract", "type": "categorical", "levels": [
                {"id": "casual", "label": "Casual"},
                {"id": "permanent", "label": "Permanent"}]}
        ]
    })")));
}

TEST(VignetteConverter, Category) {
    VignetteConverter conv(converter_generator());
    JobProfile base{{"wage", 10000L}, {"commute_time", 15L}, {"job_security", 0L}};

    JobProfile richer = base;
    richer["wage"] = 30000L;
    EXPECT_EQ("financial", conv.inferCategory(richer, base));

    JobProfile secure = base;
    secure["job_security"] = 1L;
    EXPECT_EQ("job_security", conv.inferCategory(base, secure));

    JobProfile longer = base;
    longer["commute_time"] = 60L;
    longer["wage"] = 20000L;
    // Commute differs by its whole range, wage by half of its range
    EXPECT_EQ("work_environment", conv.inferCategory(longer, base));

    EXPECT_EQ(VignetteConverter::mixed_category, conv.inferCategory(base, base));
    JobProfile slightly = base;
    slightly["wage"] = 11000L;
    EXPECT_EQ("mixed", conv.inferCategory(slightly, base));

    EXPECT_EQ("task_preferences", VignetteConverter::attributeCategory("social_interaction"));
    EXPECT_EQ("mixed", VignetteConverter::attributeCategory("hobbies"));
    EXPECT_EQ(VignetteConverter::scenarioText("mixed"), VignetteConverter::scenarioText("task_preferences"));
}

TEST(VignetteConverter, Titles) {
    EXPECT_EQ("Option A: Job with KES 15,000/month", VignetteConverter::optionTitle("A", {{"wage", 15000L}}));
    EXPECT_EQ("Option B: Job with KES 12,500/month", VignetteConverter::optionTitle("B", {{"wage", 12499.6}}));
    EXPECT_EQ("Option B: Job Opportunity", VignetteConverter::optionTitle("B", {{"job_security", 1L}}));
    EXPECT_EQ("1,234,567", thousands(1234567));
    EXPECT_EQ("999", thousands(999));
    EXPECT_EQ("0", thousands(0));
    EXPECT_EQ("-1,000", thousands(-1000));
}

TEST(VignetteConverter, Convert) {
    VignetteConverter conv(converter_generator());
    std::vector<ProfilePair> pairs{
        {{{"wage", 30000L}, {"commute_time", 60L}, {"job_security", 0L}}, {{"wage", 10000L}, {"commute_time", 60L}, {"job_security", 1L}}},
        {{{"wage", 20000L}, {"commute_time", 15L}, {"job_security", 0L}}, {{"wage", 20000L}, {"commute_time", 15L}, {"job_security", 1L}}}};
    auto vs = conv.convertVignetteList(pairs, "adaptive");
    ASSERT_EQ(2u, vs.size());
    EXPECT_EQ("adaptive_001", vs[0].id());
    EXPECT_EQ("adaptive_002", vs[1].id());

    // Wage and security both differ by their full range; the first listed attribute wins
    EXPECT_EQ("financial", vs[0].category());
    EXPECT_EQ(VignetteConverter::scenarioText("financial"), vs[0].scenarioText());
    EXPECT_EQ((std::vector<std::string>{"financial"}), vs[0].targeted_dimensions);
    EXPECT_EQ("medium", vs[0].difficulty_level);
    EXPECT_EQ("job_security", vs[1].category());

    const auto &a = vs[0].optionA();
    EXPECT_EQ("A", a.id());
    EXPECT_EQ("Option A: Job with KES 30,000/month", a.title());
    EXPECT_EQ(pairs[0].first, a.attributes());
    EXPECT_EQ("Monthly wage: KES 30,000 | Commute: 60 minutes | Contract: Casual", a.description());
    EXPECT_EQ(pairs[0].second, vs[0].optionB().attributes());
    EXPECT_TRUE(conv.convertVignetteList({}, "x").empty());
}

int main(int argc, char **argv) {
    testing::InitGoogleTest(&argc, argv);
    return RUN_ALL_TESTS();
}
