#include <elicit/information/FisherInformation.hpp>
#include <Eigen/LU>
#include <algorithm>
#include <cmath>
#include <stdexcept>

namespace elicit { namespace information {

using namespace Eigen;

constexpr double FisherInformation::ridge;

FisherInformation::FisherInformation(double temperature) : likelihood_(temperature) {}

FisherInformation::FisherInformation(belief::LikelihoodCalculator likelihood) : likelihood_(std::move(likelihood)) {}

MatrixXd FisherInformation::computeFIM(const Vignette &vignette, const Ref<const VectorXd> &weights) const {
    double pA = likelihood_.probabilityA(vignette, weights);
    VectorXd d = vignette.featureDifference();
    return (pA * (1 - pA)) * d * d.transpose();
}

MatrixXd FisherInformation::computeCumulativeFIM(const std::vector<Vignette> &vignettes, const Ref<const VectorXd> &weights) const {
    MatrixXd fim = MatrixXd::Zero(NUM_DIMENSIONS, NUM_DIMENSIONS);
    for (const auto &v : vignettes) fim += computeFIM(v, weights);
    return fim;
}

FisherInformation::expected_fim FisherInformation::computeExpectedFIM(const Vignette &candidate, const Ref<const VectorXd> &weights, const Ref<const MatrixXd> &current_fim) const {
    if (current_fim.rows() != NUM_DIMENSIONS or current_fim.cols() != NUM_DIMENSIONS)
        throw std::invalid_argument("computeExpectedFIM: current information matrix has the wrong size");
    expected_fim result;
    result.fim = current_fim + computeFIM(candidate, weights);
    result.determinant_increase = std::max(0.0, regularizedDeterminant(result.fim) - regularizedDeterminant(current_fim));
    return result;
}

double FisherInformation::computeBayesianExpectedFIM(const Vignette &candidate, const Ref<const VectorXd> &weights,
        const Ref<const MatrixXd> &current_fim, const Ref<const MatrixXd> &posterior_covariance) const {
    if (posterior_covariance.rows() != NUM_DIMENSIONS or posterior_covariance.cols() != NUM_DIMENSIONS)
        throw std::invalid_argument("computeBayesianExpectedFIM: posterior covariance has the wrong size");
    double increase = computeExpectedFIM(candidate, weights, current_fim).determinant_increase;
    VectorXd d = candidate.featureDifference();
    MatrixXd cov = posterior_covariance + ridge * MatrixXd::Identity(NUM_DIMENSIONS, NUM_DIMENSIONS);
    double spread = 1.0 + std::max(0.0, d.dot(cov * d));
    return increase * spread;
}

double FisherInformation::regularizedDeterminant(const Ref<const MatrixXd> &fim) {
    if (fim.rows() != fim.cols()) throw std::invalid_argument("Information matrix must be square");
    if (fim.rows() == 0) return 0.0;
    double det = (fim + ridge * MatrixXd::Identity(fim.rows(), fim.cols())).determinant();
    if (not std::isfinite(det) or det < 0) return 0.0;
    return det;
}

double FisherInformation::computeDEfficiency(const Ref<const MatrixXd> &fim, bool normalize) {
    double det = regularizedDeterminant(fim);
    if (normalize and det > 0) return std::pow(det, 1.0 / fim.rows());
    return det;
}

VectorXd FisherInformation::informationPerDimension(const Ref<const MatrixXd> &fim) {
    return fim.diagonal();
}

double FisherInformation::computeInformationGain(const Vignette &vignette, const Ref<const VectorXd> &weights, double current_uncertainty) const {
    double u = std::isfinite(current_uncertainty) ? std::max(0.0, current_uncertainty) : 0.0;
    double trace = computeFIM(vignette, weights).trace();
    return 0.5 * std::log1p(u * std::max(0.0, trace));
}

}}
