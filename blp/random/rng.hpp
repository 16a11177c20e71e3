#pragma once
#include <boost/random/mersenne_twister.hpp>

namespace blp {
/// Random number generation for simulating consumer heterogeneity
namespace random {

/** Generator type used for simulation draws.  Non-copyable so that a stream of draws can't be
 * duplicated by accident.
 */
class rng_t : public boost::random::mt19937_64 {
    public:
        rng_t() = default;
        explicit rng_t(result_type s) : boost::random::mt19937_64(s) {}
        rng_t(const rng_t&) = delete;
        rng_t& operator=(const rng_t&) = delete;
};

namespace detail {
/// Generator and seed of one thread.  The generator is unseeded until `seeded` is set.
struct thread_stream {
    rng_t engine;
    rng_t::result_type seed = 0;
    bool seeded = false;
};

extern thread_local thread_stream stream_;
}

/** The seed of the calling thread's generator.  A thread that hasn't been seeded with seed(s) is
 * seeded here: the first such thread of the process takes BLP_RNG_SEED (or a std::random_device
 * value if that isn't set), and each later one takes the previous thread's seed plus one.
 *
 * \throws std::invalid_argument if BLP_RNG_SEED is not a number
 */
rng_t::result_type seed();

/// Reseeds the calling thread's generator with `s`.
void seed(rng_t::result_type s);

/** The calling thread's generator, used by SimulationDraws::standardNormal(draws, dimension).
 * Draws taken with an explicit seed use their own generator and leave this one untouched.
 */
inline rng_t& rng() {
    if (not detail::stream_.seeded) seed();
    return detail::stream_.engine;
}

}}
