//
// Created by Malik T on 15/10/2025.
//

#ifndef CARDSIM_TABLE_HPP
#define CARDSIM_TABLE_HPP

#include <memory>
#include <string>
#include <string_view>
#include <vector>
#include "Types.hpp"
#include "Actions.hpp"
#include "Deck.hpp"
#include "Hand.hpp"
#include "Random.hpp"
#include "Rules.hpp"
#include "State.hpp"

namespace cardsim::core::debug {struct Inspector;}
namespace cardsim::core
{
    // Authoritative owner of the cards for one game session: one deck, the player's hand and
    // the dealer's hand. Every action goes through Step, one at a time.
    class Table
    {
    public:
        Table() = delete;
        Table(Config const& config,
              std::unique_ptr<Rules> rules,
              RandomSP rng = nullptr);

        Table(Table const&) = delete;
        auto operator=(Table const&) -> Table& = delete;

        // One state-machine step: validate/apply/advance.
        auto Step(PlayerAction const& action) -> ActionResult;
        auto Snapshot() const -> std::shared_ptr<TableSnapshot const>;

        auto Kind() const noexcept        -> GameKind          { return rules_->Kind(); }
        auto Settings() const noexcept    -> Config const&     { return cfg_; }
        auto DeckView() const noexcept    -> CardDeck const&   { return deck_; }
        auto PlayerHand() const noexcept  -> CardHand const&   { return player_; }
        auto DealerHand() const noexcept  -> CardHand const&   { return dealer_; }

        //allows rules to directly access private data on an instance
        friend class BlackjackRules;
        friend class HighCardRules;
        friend class SlapjackRules;
        friend class GuessRules;
        friend struct debug::Inspector;

    private:
        // Moves the front card into hand; false when the deck is empty.
        auto DealTo(CardHand& hand) -> bool;
        auto RecycleDeck(std::vector<Card> cards, bool shuffle) -> void;
        auto Announce(std::string message) -> void;
        auto Settle(Verdict verdict, std::string message) -> void;
        auto ValidateConfig() const -> void;

    private:
        Config cfg_;
        RandomSP rng_;
        std::unique_ptr<Rules> rules_;

        // Authoritative state
        CardDeck deck_;
        CardHand player_;
        CardHand dealer_;

        // Output of the step in flight
        std::vector<std::string> messages_;
        Verdict verdict_{Verdict::None};
    };
}
#endif //CARDSIM_TABLE_HPP
