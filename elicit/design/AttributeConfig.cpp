#include <elicit/design/AttributeConfig.hpp>
#include <elicit/log.hpp>
#include <fstream>
#include <limits>
#include <set>

namespace elicit { namespace design {

using nlohmann::json;

const AttributeLevel* AttributeSpec::level(const AttributeValue &value) const {
    double v = numeric_value(value);
    for (const auto &l : levels) {
        if (numeric_value(l.value) == v) return &l;
    }
    return nullptr;
}

AttributeConfig::AttributeConfig(std::vector<AttributeSpec> attributes) : attributes_{std::move(attributes)} {
    if (attributes_.empty()) throw config_error("Attribute configuration has no attributes");
    std::set<std::string> names;
    for (const auto &a : attributes_) {
        if (a.name.empty()) throw config_error("Attribute configuration contains an attribute without a name");
        if (not names.insert(a.name).second) throw config_error("Attribute `" + a.name + "' is defined more than once");
        if (a.levels.empty()) throw config_error("Attribute `" + a.name + "' has no levels");
    }
}

namespace {
std::string required_string(const json &j, const char *key, const std::string &context) {
    auto it = j.find(key);
    if (it == j.end() or not it->is_string())
        throw config_error(context + ": missing or non-string \"" + key + "\"");
    return it->get<std::string>();
}

Direction parse_direction(const std::string &d, const std::string &name) {
    if (d == "positive") return Direction::positive;
    if (d == "negative") return Direction::negative;
    if (d == "neutral") return Direction::neutral;
    throw config_error("Attribute `" + name + "' has invalid direction `" + d + "'");
}
}

AttributeConfig AttributeConfig::fromJson(const json &config) {
    if (not config.is_object()) throw config_error("Attribute configuration must be a JSON object");
    auto attrs = config.find("attributes");
    if (attrs == config.end() or not attrs->is_array())
        throw config_error("Attribute configuration requires an \"attributes\" array");

    json directions = json::object();
    auto dirs = config.find("attribute_directions");
    if (dirs != config.end()) {
        if (not dirs->is_object()) throw config_error("\"attribute_directions\" must be an object");
        directions = *dirs;
    }

    std::vector<AttributeSpec> specs;
    for (const auto &a : *attrs) {
        if (not a.is_object()) throw config_error("Attribute definitions must be JSON objects");
        AttributeSpec spec;
        spec.name = required_string(a, "name", "attribute");
        const std::string context = "attribute `" + spec.name + "'";
        spec.label = a.contains("label") ? required_string(a, "label", context) : spec.name;

        std::string type = required_string(a, "type", context);
        if (type == "ordered") spec.type = AttributeType::ordered;
        else if (type == "categorical") spec.type = AttributeType::categorical;
        else throw config_error(context + ": unknown type `" + type + "'");

        auto levels = a.find("levels");
        if (levels == a.end() or not levels->is_array())
            throw config_error(context + ": missing \"levels\" array");
        long index = 0;
        for (const auto &l : *levels) {
            if (not l.is_object()) throw config_error(context + ": levels must be JSON objects");
            AttributeLevel level;
            level.id = required_string(l, "id", context + " level");
            level.label = l.contains("label") ? required_string(l, "label", context + " level") : level.id;
            if (spec.type == AttributeType::ordered) {
                auto v = l.find("value");
                if (v == l.end() or not v->is_number())
                    throw config_error(context + ": ordered level `" + level.id + "' requires a numeric \"value\"");
                if (v->is_number_integer()) level.value = v->get<long>();
                else level.value = v->get<double>();
            }
            else {
                level.value = index;
            }
            index++;
            spec.levels.push_back(std::move(level));
        }

        spec.direction = Direction::neutral;
        auto dir = directions.find(spec.name);
        if (dir != directions.end()) {
            if (not dir->is_string()) throw config_error(context + ": direction must be a string");
            spec.direction = parse_direction(dir->get<std::string>(), spec.name);
        }
        specs.push_back(std::move(spec));
    }

    return AttributeConfig(std::move(specs));
}

AttributeConfig AttributeConfig::load(const std::string &path) {
    std::ifstream in(path);
    if (not in) throw config_error("Unable to open attribute configuration `" + path + "'");
    json config;
    try {
        in >> config;
    }
    catch (const json::parse_error &e) {
        throw config_error("Invalid JSON in attribute configuration `" + path + "': " + e.what());
    }
    ELICIT_LOG(debug, "Loaded attribute configuration from " << path);
    return fromJson(config);
}

const AttributeSpec* AttributeConfig::find(const std::string &name) const {
    for (const auto &a : attributes_) {
        if (a.name == name) return &a;
    }
    return nullptr;
}

std::uint64_t AttributeConfig::totalCombinations() const {
    const std::uint64_t max = std::numeric_limits<std::uint64_t>::max();
    std::uint64_t total = 1;
    for (const auto &a : attributes_) {
        std::uint64_t n = a.levels.size();
        if (total > max / n) return max;
        total *= n;
    }
    return total;
}

const char* to_string(AttributeType t) {
    return t == AttributeType::ordered ? "ordered" : "categorical";
}

const char* to_string(Direction d) {
    switch (d) {
        case Direction::positive: return "positive";
        case Direction::negative: return "negative";
        case Direction::neutral: return "neutral";
    }
    return "neutral";
}

}}
