#include <elicit/design/ProfileGenerator.hpp>
#include <elicit/algorithms.hpp>
#include <elicit/log.hpp>

namespace elicit { namespace design {

ProfileGenerator::ProfileGenerator(AttributeConfig config) : config_{std::move(config)} {}

std::vector<JobProfile> ProfileGenerator::generateAllProfiles(size_t max_profiles) const {
    const auto &attrs = config_.attributes();
    std::vector<size_t> sizes, index(attrs.size(), 0);
    for (const auto &a : attrs) sizes.push_back(a.levels.size());

    std::vector<JobProfile> profiles;
    do {
        JobProfile p;
        for (size_t i = 0; i < attrs.size(); i++)
            p[attrs[i].name] = attrs[i].levels[index[i]].value;
        profiles.push_back(std::move(p));
        if (max_profiles > 0 and profiles.size() >= max_profiles) break;
    } while (next_cartesian_index(index, sizes));

    ELICIT_LOG(info, "Generated " << profiles.size() << " candidate profiles from " << totalCombinations() << " total combinations");
    return profiles;
}

Eigen::VectorXd ProfileGenerator::encodeProfile(const JobProfile &profile) const {
    return encode_features(profile);
}

std::string ProfileGenerator::profileToString(const JobProfile &profile) const {
    std::string out;
    for (const auto &a : config_.attributes()) {
        auto found = profile.find(a.name);
        if (found == profile.end()) continue;
        const AttributeLevel *level = a.level(found->second);
        if (not level) continue;
        if (not out.empty()) out += " | ";
        out += a.label + ": " + level->label;
    }
    return out;
}

std::vector<ProfileGenerator::attribute_info> ProfileGenerator::attributeInfo() const {
    std::vector<attribute_info> info;
    for (const auto &a : config_.attributes())
        info.push_back({a.name, a.type, a.levels.size(), a.direction});
    return info;
}

}}
