//
// Created by Malik T on 14/10/2025.
//

#ifndef CARDSIM_TYPES_HPP
#define CARDSIM_TYPES_HPP

#define CSIM_ENABLE_TEST_HOOKS true

#include <cstdint>
#include <memory>
#include <optional>
#include <vector>
#include <array>
#include <chrono>
#include <random>
#include <variant>
namespace cardsim::core::constants
{
    inline constexpr size_t StandardDeckSize = 52;
    inline constexpr size_t SuitSize = 13;
    inline constexpr size_t SuitCount = 4;

    inline constexpr int BlackjackLimit = 21;
    inline constexpr int DealerStandsOn = 17;
    inline constexpr size_t CardsPerDeal = 4;

    // Slap timer menu offered to the player, in milliseconds.
    inline constexpr std::array<int64_t, 5> ReactionWindowMenuMs{1000, 1500, 2000, 2500, 3000};
}
namespace cardsim::core
{
    enum class Suit : uint8_t
    {
        Hearts = 0,
        Diamonds,
        Clubs,
        Spades
    };
    enum class Rank : uint8_t
    {
        Two = 0,
        Three,
        Four,
        Five,
        Six,
        Seven,
        Eight,
        Nine,
        Ten,
        Jack,
        Queen,
        King,
        Ace
    };
    struct Card
    {
        Card() = delete;
        constexpr Card(Suit suit, Rank rank) : suit(suit), rank(rank) {}

        Suit suit;
        Rank rank;
    };
    constexpr auto operator==(Card const& a, Card const& b) -> bool { return a.suit == b.suit && a.rank == b.rank; }

    enum class GameKind : uint8_t
    {
        Blackjack,
        HighCard,
        Slapjack,
        GuessTheCard
    };

    struct Config
    {
        uint64_t seed{std::random_device{}()};
        // Slapjack cadences
        std::chrono::milliseconds flip_interval{1500};
        std::chrono::milliseconds reaction_window{2000};
        // print refused actions to stderr
        bool log_violations{false};
    };
}

#endif //CARDSIM_TYPES_HPP
