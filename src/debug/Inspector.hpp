//
// Created by Malik T on 18/10/2025.
//

#ifndef CARDSIM_INSPECTOR_HPP
#define CARDSIM_INSPECTOR_HPP

#include <vector>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <utility>

#include "../core/Types.hpp"
#include "../core/Table.hpp"
#include "../core/Slapjack.hpp"

namespace cardsim::core::debug
{
    // White-box access for tests and invariant checks. Never used by the engine itself.
    struct Inspector
    {
        struct SnapshotAll
        {
            GameKind kind{};
            std::vector<Card> deck;
            std::vector<Card> player;
            std::vector<Card> dealer;
            std::optional<Card> face_up{};
            std::optional<Suit> active_suit{};
            int slap_score{};
            size_t max_deck_size{};
        };

        static inline auto Gather(Table const& t) -> SnapshotAll
        {
            SnapshotAll ret{};
            ret.kind = t.rules_->Kind();
            ret.deck.assign(t.deck_.Cards().begin(), t.deck_.Cards().end());
            ret.player.assign(t.player_.Cards().begin(), t.player_.Cards().end());
            ret.dealer.assign(t.dealer_.Cards().begin(), t.dealer_.Cards().end());
            ret.max_deck_size = constants::StandardDeckSize;

            if (auto const* slap = dynamic_cast<SlapjackRules const*>(t.rules_.get()))
            {
                ret.face_up = slap->face_up_;
                ret.active_suit = slap->ActiveSuit();
                ret.slap_score = slap->score_;
                ret.max_deck_size = constants::SuitSize;
            }
            return ret;
        }

        // Replace the deck with a known order (front card is dealt first).
        static inline auto StackDeck(Table& t, std::vector<Card> cards) -> void
        {
            t.deck_.Reset(std::move(cards));
        }

        // Swap the face-down card of Guess the Card.
        static inline auto PlantHidden(Table& t, Card const c) -> void
        {
            t.dealer_.Clear();
            t.dealer_.Add(c);
        }

        static inline auto HiddenCard(Table const& t) -> std::optional<Card>
        {
            if (t.dealer_.Empty()) return std::nullopt;
            return t.dealer_.At(0);
        }
    };
}

#endif //CARDSIM_INSPECTOR_HPP
