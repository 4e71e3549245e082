//
// Created by Malik T on 14/10/2025.
//

#ifndef CARDSIM_RANDOM_HPP
#define CARDSIM_RANDOM_HPP

#include <cstdint>
#include <limits>
#include <memory>
#include <random>

namespace cardsim::core
{
    // Uniform random bit generator seam. Every deck draws its shuffles from one of these so
    // tests can substitute a fixed sequence.
    class RandomSource
    {
    public:
        using result_type = std::uint64_t;

        virtual ~RandomSource() = default;

        static constexpr auto min() -> result_type { return std::numeric_limits<result_type>::min(); }
        static constexpr auto max() -> result_type { return std::numeric_limits<result_type>::max(); }

        virtual auto operator()() -> result_type = 0;
    };

    class SeededSource final : public RandomSource
    {
    public:
        explicit SeededSource(std::uint64_t seed);

        auto operator()() -> result_type override;

    private:
        std::mt19937_64 rng_;
    };

    using RandomSP = std::shared_ptr<RandomSource>;

    auto MakeSeededSource(std::uint64_t seed) -> RandomSP;
}

#endif //CARDSIM_RANDOM_HPP
