//
// Created by Malik T on 15/10/2025.
//

#include "Scoring.hpp"

#include <utility>

#include "Util.hpp"

namespace cardsim::core::scoring
{
    static auto PipValue(Rank const r) -> int
    {
        // Two is index 0
        return static_cast<int>(std::to_underlying(r)) + 2;
    }

    auto BlackjackScore(std::span<Card const> cards) -> int
    {
        int score{};
        int soft_aces{};
        for (Card const& c : cards)
        {
            switch (c.rank)
            {
            case Rank::Ace:
                score += 11;
                ++soft_aces;
                break;
            case Rank::Jack:
            case Rank::Queen:
            case Rank::King:
                score += 10;
                break;
            default:
                score += PipValue(c.rank);
                break;
            }
        }
        while (score > constants::BlackjackLimit && soft_aces > 0)
        {
            score -= 10;
            --soft_aces;
        }
        return score;
    }

    auto IsBust(std::span<Card const> cards) -> bool
    {
        return BlackjackScore(cards) > constants::BlackjackLimit;
    }

    auto HighCardValue(Card const& c) -> int
    {
        return PipValue(c.rank);
    }

    auto CompareHighCard(Card const& player, Card const& dealer) -> Comparison
    {
        int const p = HighCardValue(player);
        int const d = HighCardValue(dealer);
        if (p > d) return Comparison::PlayerHigher;
        if (d > p) return Comparison::DealerHigher;
        return Comparison::Tie;
    }

    auto IsSlapTarget(Card const& c) -> bool
    {
        return c.rank == Rank::Jack;
    }

    auto GuessMatches(std::string_view guess, Card const& c) -> bool
    {
        return util::EqualsIgnoreCase(util::Trim(guess), util::RankName(c.rank));
    }
}
