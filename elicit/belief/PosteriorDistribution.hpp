#pragma once
#include <elicit/types.hpp>
#include <Eigen/Core>
#include <ostream>
#include <string>
#include <vector>

namespace elicit { namespace belief {

/** A multivariate normal belief over preference weights, with an ordered list of dimension names
 * giving the meaning of each element of the mean vector and each row/column of the covariance
 * matrix.
 *
 * The covariance matrix is stored symmetrized (the average of the given matrix and its transpose),
 * and its diagonal (the variances) must be non-negative.
 */
class PosteriorDistribution {
    public:
        /** Constructs a distribution from dimension names, a mean vector, and a covariance matrix.
         *
         * \throws std::invalid_argument if there are no dimensions, if the dimension names are
         * not unique, if the mean or covariance sizes don't match the number of dimensions, if any
         * value is not finite, or if any variance is negative.
         */
        PosteriorDistribution(std::vector<std::string> dimensions, Eigen::VectorXd mean, Eigen::MatrixXd covariance);

        /** Constructs a distribution over the canonical dimensions (see elicit::dimension_names())
         * if `mean` has `NUM_DIMENSIONS` elements, and over dimensions named "0", "1", ... otherwise.
         */
        PosteriorDistribution(const Eigen::VectorXd &mean, const Eigen::MatrixXd &covariance);

        /// The dimension names, in vector order
        const std::vector<std::string>& dimensions() const { return dimensions_; }
        /// The mean vector
        const Eigen::VectorXd& mean() const { return mean_; }
        /// The (symmetric) covariance matrix
        const Eigen::MatrixXd& covariance() const { return covariance_; }
        /// The number of dimensions
        unsigned int K() const { return dimensions_.size(); }

        /** Returns the position of the named dimension.
         *
         * \throws std::invalid_argument if there is no dimension with the given name.
         */
        unsigned int index(const std::string &dimension) const;

        /// Returns the variance (the diagonal covariance element) of the named dimension.
        double variance(const std::string &dimension) const;

        /// Returns the vector of variances (the covariance diagonal).
        Eigen::VectorXd variances() const { return covariance_.diagonal(); }

        /** Returns the correlation between the two named dimensions: their covariance divided by
         * the geometric mean of their variances.  Returns 0 if either variance is 0.
         */
        double correlation(const std::string &dim_a, const std::string &dim_b) const;

        /** Draws `n` values from the distribution.  Each row of the returned `n` by `K()` matrix is
         * an independent draw.  Positive semi-definite (singular) covariance matrices are handled
         * by drawing only along the directions of positive variance.
         */
        Eigen::MatrixXd sample(unsigned int n) const;

        /// Returns a short summary of the distribution, suitable for logging.
        operator std::string() const;

    private:
        std::vector<std::string> dimensions_;
        Eigen::VectorXd mean_;
        Eigen::MatrixXd covariance_;
};

/// Prints the summary of the distribution to the given stream.
std::ostream& operator<<(std::ostream &os, const PosteriorDistribution &p);

}}
