//
// Created by Malik T on 14/10/2025.
//

#include "Deck.hpp"

#include <iterator>

namespace cardsim::core
{
    auto MakeSuitDeck(Suit const suit) -> std::vector<Card>
    {
        std::vector<Card> cards;
        cards.reserve(constants::SuitSize);
        for (size_t j{}; j < constants::SuitSize; ++j)
        {
            cards.emplace_back(suit, static_cast<Rank>(j));
        }
        return cards;
    }

    auto MakeStandardDeck() -> std::vector<Card>
    {
        std::vector<Card> cards;
        cards.reserve(constants::StandardDeckSize);
        for (size_t i{}; i < constants::SuitCount; ++i)
        {
            std::ranges::move(MakeSuitDeck(static_cast<Suit>(i)), std::back_inserter(cards));
        }
        return cards;
    }
}
