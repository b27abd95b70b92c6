#pragma once
#include <elicit/Vignette.hpp>
#include <elicit/belief/LikelihoodCalculator.hpp>
#include <Eigen/Core>
#include <vector>

namespace elicit {
/// Namespace for information-theoretic quantities: Fisher information and stopping rules.
namespace information {

/** Fisher information of pairwise choices under the logit choice model of
 * belief::LikelihoodCalculator.  The information contributed by a single vignette is the rank-one
 * matrix
 * \f[
 *     F = P(A) P(B) (x_A - x_B)(x_A - x_B)^\top
 * \f]
 * where the choice probabilities are evaluated at the given preference weights (and the
 * calculator's temperature) and \f$x_A, x_B\f$ are the options' feature vectors.  Information is
 * additive across vignettes.
 */
class FisherInformation {
    public:
        /// The ridge added to a matrix before taking its determinant
        static constexpr double ridge = 1e-8;

        /// Constructs a calculator using choice probabilities from a calculator with the given temperature.
        explicit FisherInformation(double temperature = belief::LikelihoodCalculator::default_temperature);

        /// Constructs a calculator using choice probabilities from the given likelihood calculator.
        explicit FisherInformation(belief::LikelihoodCalculator likelihood);

        /// The likelihood calculator providing choice probabilities
        const belief::LikelihoodCalculator& likelihood() const { return likelihood_; }

        /** Returns the `NUM_DIMENSIONS` square Fisher information matrix of a single vignette.  The
         * matrix is zero if the two options have identical feature vectors.
         *
         * \throws std::invalid_argument if `weights` is not a `NUM_DIMENSIONS` vector.
         */
        Eigen::MatrixXd computeFIM(const Vignette &vignette, const Eigen::Ref<const Eigen::VectorXd> &weights) const;

        /** Returns the sum of the Fisher information matrices of the given vignettes; an empty list
         * yields a zero matrix.
         */
        Eigen::MatrixXd computeCumulativeFIM(const std::vector<Vignette> &vignettes, const Eigen::Ref<const Eigen::VectorXd> &weights) const;

        /// The result of previewing the addition of a vignette, from computeExpectedFIM().
        struct expected_fim {
            /// The information matrix after adding the candidate vignette
            Eigen::MatrixXd fim;
            /// The (non-negative) increase in the regularized determinant
            double determinant_increase;
        };

        /** Previews the effect of adding a candidate vignette to the current information.  The
         * reported determinant increase is clamped at 0: the information matrix of a vignette is
         * positive semidefinite, so any negative difference is rounding noise.
         */
        expected_fim computeExpectedFIM(const Vignette &candidate, const Eigen::Ref<const Eigen::VectorXd> &weights,
                const Eigen::Ref<const Eigen::MatrixXd> &current_fim) const;

        /** Like computeExpectedFIM(), but returns the determinant increase weighted by the
         * candidate's posterior predictive spread \f$1 + d^\top (\Sigma + 10^{-8} I) d\f$, where
         * \f$d = x_A - x_B\f$ and \f$\Sigma\f$ is the posterior covariance.  Candidates whose feature
         * difference points along uncertain directions are favoured.
         */
        double computeBayesianExpectedFIM(const Vignette &candidate, const Eigen::Ref<const Eigen::VectorXd> &weights,
                const Eigen::Ref<const Eigen::MatrixXd> &current_fim, const Eigen::Ref<const Eigen::MatrixXd> &posterior_covariance) const;

        /** Returns the D-efficiency of an information matrix: the determinant of `fim + ridge * I`,
         * clamped at 0, or, if `normalize` is true, the k-th root of that determinant (the
         * geometric mean of the eigenvalues) for a k by k matrix.  Singular and near-singular
         * matrices yield finite, non-negative values.
         */
        static double computeDEfficiency(const Eigen::Ref<const Eigen::MatrixXd> &fim, bool normalize = false);

        /// Returns the information about each dimension: the diagonal of the matrix.
        static Eigen::VectorXd informationPerDimension(const Eigen::Ref<const Eigen::MatrixXd> &fim);

        /** Returns a non-negative ranking score for showing the vignette next: the expected
         * reduction in entropy of an isotropic Gaussian belief of variance `current_uncertainty`,
         * \f[
         *     \tfrac{1}{2} \log(1 + u \operatorname{tr} F) = \tfrac{1}{2} \log\det(I + u F)
         * \f]
         * (the equality holds because \f$F\f$ is rank one).  Negative uncertainties are treated as 0,
         * giving a gain of 0.
         */
        double computeInformationGain(const Vignette &vignette, const Eigen::Ref<const Eigen::VectorXd> &weights, double current_uncertainty) const;

    private:
        belief::LikelihoodCalculator likelihood_;
        static double regularizedDeterminant(const Eigen::Ref<const Eigen::MatrixXd> &fim);
};

}}
