#pragma once
#include <boost/random/mersenne_twister.hpp>

namespace elicit {
/// Namespace for random number generation
namespace random {

/// The engine behind posterior sampling, pair screening and simulated respondents
using rng_t = boost::random::mt19937_64;

/** Returns the calling thread's random engine.  On first use in a thread the engine is seeded from
 * the ELICIT_RNG_SEED environment variable if it is set (plus the number of threads seeded before
 * this one, so that threads draw different streams), and from std::random_device otherwise.
 *
 * \throws std::invalid_argument if ELICIT_RNG_SEED is set but is not an unsigned integer
 */
rng_t& rng();

/** Reseeds the calling thread's engine, for reproducible sampling and design search. */
void seed(rng_t::result_type s);

}}
