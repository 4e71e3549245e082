//
// Created by Malik T on 14/10/2025.
//

#ifndef CARDSIM_DECK_HPP
#define CARDSIM_DECK_HPP

#include <algorithm>
#include <deque>
#include <optional>
#include <span>
#include <vector>

#include "Exception.hpp"
#include "Random.hpp"
#include "Types.hpp"

namespace cardsim::core
{
    // FIFO over the remaining cards. Only sequential draws from the front are needed by
    // any of the games, so no random access is offered.
    template <typename T>
    class Deck
    {
    public:
        Deck() = delete;
        Deck(std::vector<T> cards, RandomSP rng) :
            cards_(std::make_move_iterator(cards.begin()), std::make_move_iterator(cards.end())),
            rng_(std::move(rng))
        {
            CSIM_ASSERT(rng_ != nullptr, "Deck constructed without a random source");
        }

        auto Shuffle() -> void
        {
            std::ranges::shuffle(cards_, *rng_);
        }

        // nullopt when the deck ran dry; callers must check
        [[nodiscard]]
        auto DealCard() -> std::optional<T>
        {
            if (cards_.empty()) return std::nullopt;
            std::optional<T> top{std::move(cards_.front())};
            cards_.pop_front();
            return top;
        }

        auto Reset(std::vector<T> new_cards) -> void
        {
            cards_.assign(std::make_move_iterator(new_cards.begin()), std::make_move_iterator(new_cards.end()));
        }

        [[nodiscard]] auto IsEmpty() const noexcept -> bool { return cards_.empty(); }
        [[nodiscard]] auto Size() const noexcept -> size_t { return cards_.size(); }
        auto Cards() const noexcept -> std::deque<T> const& { return cards_; }

    private:
        std::deque<T> cards_;
        RandomSP rng_;
    };

    using CardDeck = Deck<Card>;

    // 52 cards, Hearts, Diamonds, Clubs, Spades, each Two..Ace
    auto MakeStandardDeck() -> std::vector<Card>;
    auto MakeSuitDeck(Suit suit) -> std::vector<Card>;
}

#endif //CARDSIM_DECK_HPP
