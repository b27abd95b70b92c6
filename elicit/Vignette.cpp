#include <elicit/Vignette.hpp>
#include <algorithm>
#include <sstream>
#include <stdexcept>

namespace elicit {

using namespace Eigen;

namespace {
struct numeric_visitor : public boost::static_visitor<double> {
    double operator()(bool b) const { return b ? 1.0 : 0.0; }
    double operator()(long l) const { return static_cast<double>(l); }
    double operator()(double d) const { return d; }
};

// Accumulates a mean over whichever components are present
class partial_mean {
    public:
        void add(const boost::optional<double> &v) { if (v) { sum_ += *v; n_++; } }
        double value() const { return n_ > 0 ? sum_ / n_ : 0.0; }
    private:
        double sum_ = 0;
        int n_ = 0;
};

boost::optional<double> first_of(const Attributes &attributes, const std::string &name, const std::string &alias) {
    auto v = attribute_value(attributes, name);
    return v ? v : attribute_value(attributes, alias);
}
}

double numeric_value(const AttributeValue &value) {
    return boost::apply_visitor(numeric_visitor(), value);
}

std::string value_string(const AttributeValue &value) {
    if (const bool *b = boost::get<bool>(&value)) return *b ? "true" : "false";
    std::ostringstream os;
    if (const long *l = boost::get<long>(&value)) os << *l;
    else os << boost::get<double>(value);
    return os.str();
}

std::string attributes_key(const Attributes &attributes) {
    std::string key;
    for (const auto &a : attributes) {
        key += a.first;
        key += '=';
        key += value_string(a.second);
        key += ';';
    }
    return key;
}

boost::optional<double> attribute_value(const Attributes &attributes, const std::string &name) {
    auto found = attributes.find(name);
    if (found == attributes.end()) return boost::none;
    return numeric_value(found->second);
}

double commute_score(double commute_minutes) {
    return std::max(0.0, (60.0 - commute_minutes) / 45.0);
}

VectorXd encode_features(const Attributes &attributes) {
    VectorXd x = VectorXd::Zero(NUM_DIMENSIONS);
    auto idx = [](Dimension d) { return static_cast<unsigned int>(d); };

    auto wage = first_of(attributes, "wage", "salary");
    if (wage) x[idx(Dimension::financial)] = *wage / WAGE_SCALE;

    boost::optional<double> commute;
    if (auto c = attribute_value(attributes, "commute_time")) commute = commute_score(*c);

    partial_mean work_env;
    if (auto pd = attribute_value(attributes, "physical_demand")) work_env.add(1.0 - *pd);
    work_env.add(first_of(attributes, "remote_work", "remote"));
    work_env.add(commute);
    x[idx(Dimension::work_environment)] = work_env.value();

    if (auto g = attribute_value(attributes, "career_growth")) x[idx(Dimension::career_growth)] = *g;

    partial_mean wlb;
    wlb.add(attribute_value(attributes, "flexibility"));
    wlb.add(commute);
    x[idx(Dimension::work_life_balance)] = wlb.value();

    if (auto s = attribute_value(attributes, "job_security")) x[idx(Dimension::job_security)] = *s;

    partial_mean task;
    task.add(attribute_value(attributes, "task_variety"));
    task.add(attribute_value(attributes, "social_interaction"));
    x[idx(Dimension::task_preference)] = task.value();

    if (auto v = first_of(attributes, "company_values", "culture_alignment")) x[idx(Dimension::values_culture)] = *v;

    return x;
}

VignetteOption::VignetteOption(std::string option_id, std::string title, Attributes attributes, std::string description)
    : id_{std::move(option_id)}, title_{std::move(title)}, attributes_{std::move(attributes)},
    description_{std::move(description)}, features_(encode_features(attributes_))
{}

Vignette::Vignette(std::string vignette_id, std::string category, std::string scenario_text, std::vector<VignetteOption> options)
    : id_{std::move(vignette_id)}, category_{std::move(category)}, scenario_text_{std::move(scenario_text)},
    options_{std::move(options)}
{
    if (options_.size() != 2)
        throw std::invalid_argument("Vignette `" + id_ + "' must have exactly 2 options (found " + std::to_string(options_.size()) + ")");
    if (options_[0].id() == options_[1].id())
        throw std::invalid_argument("Vignette `" + id_ + "' options must have distinct ids");

    // Options are looked up by id, falling back to position:
    if (options_[0].id() == "B" or options_[1].id() == "A") { a_ = 1; b_ = 0; }
}

const VignetteOption& Vignette::optionA() const { return options_[a_]; }
const VignetteOption& Vignette::optionB() const { return options_[b_]; }

bool Vignette::isOptionA(const std::string &option_id) const {
    if (option_id == optionA().id()) return true;
    if (option_id == optionB().id()) return false;
    throw std::invalid_argument("Vignette `" + id_ + "' has no option `" + option_id + "'");
}

VectorXd Vignette::featureDifference() const {
    return optionA().features() - optionB().features();
}

std::ostream& operator<<(std::ostream &os, const Vignette &v) {
    return os << "Vignette[" << v.id() << " (" << v.category() << "): " << v.optionA().id() << " vs " << v.optionB().id() << "]";
}

}
