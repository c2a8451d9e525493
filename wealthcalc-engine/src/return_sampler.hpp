#ifndef WEALTHCALC_RETURN_SAMPLER_HPP
#define WEALTHCALC_RETURN_SAMPLER_HPP

#include "asset_class.hpp"
#include <cstdint>
#include <random>

namespace wealthcalc {

// Source of bounded-normal annual returns.
//
// Each sampler owns its random stream. The same seed always yields the same
// sequence of draws, so a batch run from one sampler is reproducible
// bit-for-bit on a given standard library.
class ReturnSampler {
public:
    explicit ReturnSampler(uint64_t seed);

    // Independent stream for one path of a batch, derived from the batch seed
    // and the path index. Used when paths run in parallel.
    static ReturnSampler for_path(uint64_t batch_seed, uint64_t path_index);

    // Draw from N(median, std_dev) and clamp into [min_return, max_return]
    double sample(double median, double std_dev, double min_return, double max_return);
    double sample(const AssetClass& asset);

    uint64_t seed() const { return seed_; }

private:
    uint64_t seed_;
    std::mt19937_64 rng_;
    std::normal_distribution<double> normal_;
};

} // namespace wealthcalc

#endif // WEALTHCALC_RETURN_SAMPLER_HPP
