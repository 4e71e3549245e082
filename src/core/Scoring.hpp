//
// Created by Malik T on 15/10/2025.
//

#ifndef CARDSIM_SCORING_HPP
#define CARDSIM_SCORING_HPP

#include <span>
#include <string_view>

#include "Types.hpp"

namespace cardsim::core::scoring
{
    enum class Comparison : uint8_t
    {
        PlayerHigher,
        DealerHigher,
        Tie
    };

    // Face value, J/Q/K count 10, Aces count 11 and drop to 1 one at a time while the total busts.
    auto BlackjackScore(std::span<Card const> cards) -> int;

    auto IsBust(std::span<Card const> cards) -> bool;

    // Ace high: 14, King 13, Queen 12, Jack 11, pips at face value
    auto HighCardValue(Card const& c) -> int;

    auto CompareHighCard(Card const& player, Card const& dealer) -> Comparison;

    auto IsSlapTarget(Card const& c) -> bool;

    // Case-insensitive against the rank name ("ace", "10", "KING"); surrounding whitespace ignored.
    auto GuessMatches(std::string_view guess, Card const& c) -> bool;
}

#endif //CARDSIM_SCORING_HPP
