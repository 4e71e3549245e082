//
// Created by Malik T on 14/10/2025.
//

#include "Random.hpp"

namespace cardsim::core
{
    SeededSource::SeededSource(std::uint64_t seed):
        rng_(seed) {}

    auto SeededSource::operator()() -> result_type
    {
        return rng_();
    }

    auto MakeSeededSource(std::uint64_t seed) -> RandomSP
    {
        return std::make_shared<SeededSource>(seed);
    }
}
