#include <blp/random/rng.hpp>
#include <cstdlib>
#include <mutex>
#include <random>
#include <string>

namespace blp { namespace random {

thread_local detail::thread_stream detail::stream_;

namespace {

std::mutex seed_mutex;
bool have_base = false;
rng_t::result_type last_seed = 0;

rng_t::result_type base_seed() {
    const char *env = std::getenv("BLP_RNG_SEED");
    if (env and *env) return std::stoull(env);
    return std::random_device{}();
}

// Hands out the seed of a thread that wasn't seeded explicitly.  The caller holds seed_mutex.
rng_t::result_type next_thread_seed() {
    if (have_base) return ++last_seed;
    last_seed = base_seed();
    have_base = true;
    return last_seed;
}

void reseed(rng_t::result_type s) {
    auto &stream = detail::stream_;
    stream.seed = s;
    stream.engine.seed(s);
    stream.seeded = true;
}

}

rng_t::result_type seed() {
    if (not detail::stream_.seeded) {
        rng_t::result_type s;
        {
            std::lock_guard<std::mutex> lock(seed_mutex);
            s = next_thread_seed();
        }
        reseed(s);
    }
    return detail::stream_.seed;
}

void seed(rng_t::result_type s) {
    {
        // An explicit seed in the first thread also becomes the base for automatic seeds
        std::lock_guard<std::mutex> lock(seed_mutex);
        if (not have_base) {
            last_seed = s;
            have_base = true;
        }
    }
    reseed(s);
}

}}
