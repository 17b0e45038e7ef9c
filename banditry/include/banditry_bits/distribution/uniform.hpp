#pragma once
#include <banditry_bits/util/macros.hpp>
#include <random>

namespace banditry {
namespace distribution {

template <class ValueType>
struct Uniform {
    using value_t = ValueType;

   private:
    std::uniform_real_distribution<value_t> unif_;

   public:
    Uniform(value_t min, value_t max) : unif_(min, max) {}

    value_t min() const { return unif_.a(); }
    value_t max() const { return unif_.b(); }

    /*
     * Samples a single uniform value in [min, max) using the RNG gen.
     */
    template <class GenType>
    BANDITRY_STRONG_INLINE value_t sample(GenType&& gen) {
        return unif_(gen);
    }
};

}  // namespace distribution
}  // namespace banditry
