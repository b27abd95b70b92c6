#pragma once
#include <elicit/types.hpp>
#include <elicit/random/rng.hpp>
#include <boost/random/normal_distribution.hpp>
#include <boost/random/uniform_int_distribution.hpp>
#include <boost/random/uniform_real_distribution.hpp>

// Utility/shortcut methods for drawing from common distributions with the thread's rng().

namespace elicit { namespace random {

/** Convenience method for obtaining a double draw from a normal distribution using
 * elicit::random::rng().
 *
 * \param mean the mean of the normal distribution; defaults to 0 if omitted.
 * \param stdev the standard deviation of the normal distribution; defaults to 1 if omitted.
 */
inline double rnormal(double mean = 0.0, double stdev = 1.0) {
    return boost::random::normal_distribution<double>(mean, stdev)(rng());
}

/** Convenience method for obtaining a double draw from a uniform [a,b) distribution.
 *
 * \param a the minimum value; defaults to 0 if omitted
 * \param b the maximum (actually, the supremum) value; defaults to 1 if omitted
 */
inline double runiform(double a = 0.0, double b = 1.0) {
    return boost::random::uniform_real_distribution<double>(a, b)(rng());
}

/// Draws an integer uniformly from the closed range [a,b].
inline size_t runiform_index(size_t a, size_t b) {
    return boost::random::uniform_int_distribution<size_t>(a, b)(rng());
}

}}
