#include "return_sampler.hpp"
#include <algorithm>

namespace wealthcalc {

namespace {

// SplitMix64 finalizer: spreads adjacent path indices across the seed space
uint64_t mix_seed(uint64_t x) {
    x += 0x9E3779B97F4A7C15ULL;
    x = (x ^ (x >> 30)) * 0xBF58476D1CE4E5B9ULL;
    x = (x ^ (x >> 27)) * 0x94D049BB133111EBULL;
    return x ^ (x >> 31);
}

} // anonymous namespace

ReturnSampler::ReturnSampler(uint64_t seed)
    : seed_(seed), rng_(seed), normal_(0.0, 1.0) {}

ReturnSampler ReturnSampler::for_path(uint64_t batch_seed, uint64_t path_index) {
    return ReturnSampler(mix_seed(mix_seed(batch_seed) ^ path_index));
}

double ReturnSampler::sample(double median, double std_dev,
                             double min_return, double max_return) {
    double z = normal_(rng_);
    double value = median + std_dev * z;
    return std::max(min_return, std::min(max_return, value));
}

double ReturnSampler::sample(const AssetClass& asset) {
    return sample(asset.median_return, asset.std_deviation,
                  asset.min_return, asset.max_return);
}

} // namespace wealthcalc
