#include <elicit/random/rng.hpp>
#include <atomic>
#include <cstdlib>
#include <random>
#include <stdexcept>
#include <string>

namespace elicit { namespace random {

namespace {
std::atomic<unsigned int> threads_seeded_{0};

rng_t::result_type initial_seed() {
    unsigned int offset = threads_seeded_++;
    const char *env = std::getenv("ELICIT_RNG_SEED");
    if (env and *env) {
        std::string str(env);
        std::size_t used = 0;
        rng_t::result_type s = 0;
        try { s = std::stoull(str, &used); }
        catch (const std::logic_error&) { used = 0; }
        if (used != str.size()) throw std::invalid_argument("ELICIT_RNG_SEED `" + str + "' is not an unsigned integer");
        return s + offset;
    }
    return (static_cast<rng_t::result_type>(std::random_device{}()) << 32) ^ std::random_device{}();
}
}

rng_t& rng() {
    thread_local rng_t engine{initial_seed()};
    return engine;
}

void seed(rng_t::result_type s) { rng().seed(s); }

}}
