#pragma once
#include <banditry_bits/util/macros.hpp>
#include <random>

namespace banditry {
namespace distribution {

template <class IntType>
struct Binomial {
    using value_t = IntType;

   private:
    std::binomial_distribution<value_t> binom_dist_;

   public:
    Binomial(value_t n, double p) : binom_dist_(n, p) {}

    value_t n() const { return binom_dist_.t(); }
    double p() const { return binom_dist_.p(); }

    /*
     * Samples a single Binomial sample with parameter n, p.
     * With n = 1 this is a Bernoulli trial: 1 is a success.
     */
    template <class GenType>
    BANDITRY_STRONG_INLINE auto sample(GenType&& gen) {
        return binom_dist_(gen);
    }

    /*
     * Computes the mean n * p of the distribution.
     */
    template <class NType, class PType>
    BANDITRY_STRONG_INLINE static auto mean(const NType& n, const PType& p) {
        return n * p;
    }
};

}  // namespace distribution
}  // namespace banditry
