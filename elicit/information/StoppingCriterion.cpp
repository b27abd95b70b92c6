#include <elicit/information/StoppingCriterion.hpp>
#include <elicit/information/FisherInformation.hpp>
#include <boost/format.hpp>
#include <cmath>
#include <stdexcept>

namespace elicit { namespace information {

using namespace Eigen;
using boost::format;

constexpr unsigned int StoppingCriterion::default_min_vignettes, StoppingCriterion::default_max_vignettes;
constexpr double StoppingCriterion::default_det_threshold, StoppingCriterion::default_max_variance_threshold;

StoppingCriterion::StoppingCriterion(unsigned int min_vignettes, unsigned int max_vignettes, double det_threshold, double max_variance_threshold)
    : min_vignettes_{min_vignettes}, max_vignettes_{max_vignettes}, det_threshold_{det_threshold}, max_variance_threshold_{max_variance_threshold}
{
    if (min_vignettes_ > max_vignettes_)
        throw std::invalid_argument("StoppingCriterion: min_vignettes cannot exceed max_vignettes");
    if (not (det_threshold_ >= 0) or not (max_variance_threshold_ >= 0))
        throw std::invalid_argument("StoppingCriterion: thresholds must be non-negative");
}

StoppingCriterion::decision StoppingCriterion::shouldContinue(const belief::PosteriorDistribution &posterior,
        const Ref<const MatrixXd> &fim, unsigned int n) const {
    if (n < min_vignettes_)
        return {true, (format("Below minimum vignettes (%d < %d)") % n % min_vignettes_).str()};

    if (n >= max_vignettes_)
        return {false, (format("Reached maximum vignettes (%d)") % max_vignettes_).str()};

    double det = FisherInformation::computeDEfficiency(fim);
    if (det > det_threshold_)
        return {false, (format("FIM determinant threshold reached (%.2e > %.2e)") % det % det_threshold_).str()};

    double max_var = posterior.variances().maxCoeff();
    if (max_var <= max_variance_threshold_)
        return {false, (format("All variances below threshold (max variance %.3f <= %.3f)") % max_var % max_variance_threshold_).str()};

    return {true, (format("Continuing: uncertainty remains high (max variance %.3f, det %.2e)") % max_var % det).str()};
}

std::map<std::string, double> StoppingCriterion::uncertaintyReport(const belief::PosteriorDistribution &posterior) const {
    std::map<std::string, double> report;
    VectorXd var = posterior.variances();
    for (unsigned int i = 0; i < posterior.K(); i++)
        report[posterior.dimensions()[i]] = var[i];
    return report;
}

StoppingCriterion::diagnostics StoppingCriterion::stoppingDiagnostics(const belief::PosteriorDistribution &posterior,
        const Ref<const MatrixXd> &fim, unsigned int n) const {
    VectorXd var = posterior.variances();
    diagnostics d;
    d.n_vignettes_shown = n;
    d.fim_determinant = FisherInformation::computeDEfficiency(fim);
    d.max_variance = var.maxCoeff();
    d.min_variance = var.minCoeff();
    d.mean_variance = var.mean();
    d.uncertainty_per_dimension = uncertaintyReport(posterior);
    d.meets_det_threshold = d.fim_determinant > det_threshold_;
    d.meets_variance_threshold = d.max_variance <= max_variance_threshold_;
    d.within_vignette_limits = n >= min_vignettes_ and n < max_vignettes_;
    return d;
}

}}
