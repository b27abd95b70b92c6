#include <elicit/design/VignetteConverter.hpp>
#include <elicit/log.hpp>
#include <boost/format.hpp>
#include <algorithm>
#include <cmath>
#include <limits>
#include <map>

namespace elicit { namespace design {

const std::string VignetteConverter::mixed_category = "mixed";
constexpr double VignetteConverter::min_category_difference;

namespace {
const std::map<std::string, std::string> category_of_attribute{
    {"wage", "financial"},
    {"physical_demand", "work_environment"},
    {"flexibility", "work_life_balance"},
    {"commute_time", "work_environment"},
    {"job_security", "job_security"},
    {"remote_work", "work_environment"},
    {"career_growth", "career_advancement"},
    {"task_variety", "task_preferences"},
    {"social_interaction", "task_preferences"},
    {"company_values", "values_culture"},
};

const std::map<std::string, std::string> scenario_of_category{
    {"financial", "Consider these two job opportunities with different compensation packages:"},
    {"work_environment", "Consider these two job opportunities with different work environments:"},
    {"job_security", "Consider these two job opportunities with different levels of job security:"},
    {"career_advancement", "Consider these two job opportunities with different growth potential:"},
    {"work_life_balance", "Consider these two job opportunities with different work-life balance:"},
    {"mixed", "Consider these two job opportunities with different trade-offs:"},
};
}

std::string thousands(long value) {
    std::string digits = std::to_string(value < 0 ? -value : value);
    std::string out;
    for (size_t i = 0; i < digits.size(); i++) {
        if (i > 0 and (digits.size() - i) % 3 == 0) out += ',';
        out += digits[i];
    }
    return value < 0 ? "-" + out : out;
}

VignetteConverter::VignetteConverter(ProfileGenerator generator) : generator_{std::move(generator)} {}

const std::string& VignetteConverter::attributeCategory(const std::string &attribute) {
    auto found = category_of_attribute.find(attribute);
    return found == category_of_attribute.end() ? mixed_category : found->second;
}

const std::string& VignetteConverter::scenarioText(const std::string &category) {
    auto found = scenario_of_category.find(category);
    return found == scenario_of_category.end() ? scenario_of_category.at(mixed_category) : found->second;
}

std::string VignetteConverter::inferCategory(const JobProfile &a, const JobProfile &b) const {
    const AttributeSpec *best = nullptr;
    double best_diff = -1;
    for (const auto &attr : generator_.config().attributes()) {
        double va = attribute_value(a, attr.name).value_or(0.0),
               vb = attribute_value(b, attr.name).value_or(0.0);
        double diff = std::fabs(va - vb);
        if (attr.type == AttributeType::ordered) {
            double lo = std::numeric_limits<double>::infinity(), hi = -lo;
            for (const auto &l : attr.levels) {
                lo = std::min(lo, numeric_value(l.value));
                hi = std::max(hi, numeric_value(l.value));
            }
            diff = hi > lo ? diff / (hi - lo) : 0.0;
        }
        if (diff > best_diff) {
            best_diff = diff;
            best = &attr;
        }
    }

    if (not best or best_diff < min_category_difference) return mixed_category;
    const std::string &category = attributeCategory(best->name);
    ELICIT_LOG(debug, boost::format("Inferred category '%s' from dominant attribute '%s' (diff=%.2f)") % category % best->name % best_diff);
    return category;
}

std::string VignetteConverter::optionTitle(const std::string &option_id, const JobProfile &profile) {
    auto wage = attribute_value(profile, "wage");
    if (wage and *wage != 0)
        return "Option " + option_id + ": Job with KES " + thousands(std::lround(*wage)) + "/month";
    return "Option " + option_id + ": Job Opportunity";
}

Vignette VignetteConverter::convertToOnlineFormat(const ProfilePair &pair, const std::string &vignette_id) const {
    std::string category = inferCategory(pair.first, pair.second);
    std::vector<VignetteOption> options;
    options.emplace_back("A", optionTitle("A", pair.first), pair.first, generator_.profileToString(pair.first));
    options.emplace_back("B", optionTitle("B", pair.second), pair.second, generator_.profileToString(pair.second));

    Vignette v(vignette_id, category, scenarioText(category), std::move(options));
    v.targeted_dimensions = {category};
    v.difficulty_level = "medium";
    return v;
}

std::vector<Vignette> VignetteConverter::convertVignetteList(const std::vector<ProfilePair> &pairs, const std::string &id_prefix) const {
    std::vector<Vignette> converted;
    converted.reserve(pairs.size());
    for (size_t i = 0; i < pairs.size(); i++)
        converted.push_back(convertToOnlineFormat(pairs[i], (boost::format("%s_%03d") % id_prefix % (i + 1)).str()));
    ELICIT_LOG(info, "Converted " << converted.size() << " vignettes to online format (prefix: " << id_prefix << ")");
    return converted;
}

}}
