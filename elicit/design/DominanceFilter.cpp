#include <elicit/design/DominanceFilter.hpp>
#include <elicit/log.hpp>

namespace elicit { namespace design {

DominanceFilter::DominanceFilter(AttributeConfig config) : config_{std::move(config)} {}

bool DominanceFilter::dominates(const JobProfile &a, const JobProfile &b) const {
    bool strictly_better = false;
    for (const auto &attr : config_.attributes()) {
        if (attr.direction == Direction::neutral) continue;
        auto va = attribute_value(a, attr.name), vb = attribute_value(b, attr.name);
        if (not va or not vb) continue;
        double diff = attr.direction == Direction::positive ? *va - *vb : *vb - *va;
        if (diff < 0) return false;
        if (diff > 0) strictly_better = true;
    }
    return strictly_better;
}

std::vector<JobProfile> DominanceFilter::filterDominated(const std::vector<JobProfile> &profiles) const {
    std::vector<JobProfile> kept;
    for (size_t i = 0; i < profiles.size(); i++) {
        bool dominated = false;
        for (size_t j = 0; j < profiles.size() and not dominated; j++) {
            if (i != j and dominates(profiles[j], profiles[i])) dominated = true;
        }
        if (not dominated) kept.push_back(profiles[i]);
    }
    ELICIT_LOG(info, "Dominance filter kept " << kept.size() << " of " << profiles.size() << " profiles");
    return kept;
}

}}
