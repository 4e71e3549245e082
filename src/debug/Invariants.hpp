//
// Created by Malik T on 18/10/2025.
//

#ifndef CARDSIM_INVARIANTS_HPP
#define CARDSIM_INVARIANTS_HPP

#include "../core/Table.hpp"
#include "../core/Util.hpp"
#include "Inspector.hpp"
#include <algorithm>
#include <format>

namespace cardsim::core::debug
{
    // Checked after every step of the self-play runs. Throws AssertionError on the first breach.
    inline auto CheckInvariants(Table const& t) -> void
    {
#if CSIM_ENABLE_TEST_HOOKS == false
        (void)t;
#else
    Inspector::SnapshotAll const s = Inspector::Gather(t);

    // 1) Deck never exceeds its full size
    CSIM_ASSERT(s.deck.size() <= s.max_deck_size,
                std::format("Deck holds {} cards, limit {}", s.deck.size(), s.max_deck_size));

    // 2) No card is in two places at once
    {
        util::CardUniqueChecker checker{};
        for (Card const& c : s.deck)   checker.Add(c);
        for (Card const& c : s.player) checker.Add(c);
        for (Card const& c : s.dealer) checker.Add(c);
        if (s.face_up && std::ranges::find(s.player, *s.face_up) == s.player.end()
                      && std::ranges::find(s.deck, *s.face_up) == s.deck.end())
        {
            checker.Add(*s.face_up);
        }
        CSIM_ASSERT(!checker.ContainsDup(), "Duplicate card across deck and hands");
    }

    // 3) Per game limits
    switch (s.kind)
    {
    case GameKind::HighCard:
        CSIM_ASSERT(s.player.size() <= 1 && s.dealer.size() <= 1, "High Card hands hold one card each");
        break;
    case GameKind::GuessTheCard:
        CSIM_ASSERT(s.player.empty() && s.dealer.size() <= 1, "Guess the Card hides exactly one card");
        break;
    case GameKind::Slapjack:
        CSIM_ASSERT(s.slap_score >= 0, "Slapjack score went negative");
        CSIM_ASSERT(std::ranges::all_of(s.deck, [&](Card const& c) { return c.suit == s.active_suit; }),
                    "Slapjack sub-deck mixes suits");
        CSIM_ASSERT(std::ranges::all_of(s.player, [](Card const& c) { return c.rank == Rank::Jack; }),
                    "Slapjack pile holds a non-Jack");
        break;
    case GameKind::Blackjack:
        CSIM_ASSERT(s.dealer.empty() || s.dealer.size() >= 2, "Blackjack dealer holds a single card");
        break;
    }
#endif // CSIM_ENABLE_TEST_HOOKS == true
    }
}
#endif //CARDSIM_INVARIANTS_HPP
