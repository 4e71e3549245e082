//
// Created by Malik T on 16/10/2025.
//

#include "Blackjack.hpp"

#include "Scoring.hpp"

namespace
{
    inline auto Viol(cardsim::core::error::RuleViolationCode code) -> cardsim::core::error::RuleViolation
    {
        return cardsim::core::error::RuleViolation{ .code = code };
    }
}

namespace cardsim::core
{
    auto BlackjackRules::PhaseName() const noexcept -> std::string_view
    {
        switch (phase_)
        {
        case BlackjackPhase::AwaitingDeal: return "AwaitingDeal";
        case BlackjackPhase::PlayerTurn:   return "PlayerTurn";
        case BlackjackPhase::DealerTurn:   return "DealerTurn";
        case BlackjackPhase::RoundOver:    return "RoundOver";
        }
        return "?";
    }

    auto BlackjackRules::Setup(Table& table) -> void
    {
        // fresh deck comes in factory order; the player shuffles it
        table.RecycleDeck(MakeStandardDeck(), false);
        table.player_.Clear();
        table.dealer_.Clear();
        phase_ = BlackjackPhase::AwaitingDeal;
    }

    auto BlackjackRules::Validate(Table const& table, PlayerAction const& a) const -> CheckResult
    {
        using RVC = ::cardsim::core::error::RuleViolationCode;

        return std::visit([&]<typename T0>(T0 const&) -> CheckResult
        {
            using T = std::decay_t<T0>;

            if constexpr (std::is_same_v<T, DealAction>)
            {
                if (phase_ == BlackjackPhase::PlayerTurn || phase_ == BlackjackPhase::DealerTurn)
                    return std::unexpected(Viol(RVC::WrongPhase_RoundInProgress).with_phase(PhaseName()));

                if (table.deck_.Size() < constants::CardsPerDeal)
                    return std::unexpected(Viol(RVC::Deck_NotEnoughCards)
                                           .with_deck(table.deck_.Size())
                                           .with_required(constants::CardsPerDeal));
                return {};
            }
            else if constexpr (std::is_same_v<T, HitAction>)
            {
                // out of turn is ignored in Apply, only a live hit needs a card
                if (phase_ == BlackjackPhase::PlayerTurn && table.deck_.IsEmpty())
                    return std::unexpected(Viol(RVC::Deck_NotEnoughCards)
                                           .with_phase(PhaseName())
                                           .with_deck(0)
                                           .with_required(1));
                return {};
            }
            else if constexpr (std::is_same_v<T, StandAction> ||
                               std::is_same_v<T, ShuffleAction> ||
                               std::is_same_v<T, ResetDeckAction>)
            {
                return {};
            }
            else
            {
                CSIM_THROW(error::Code::Rules, "Action not supported by Blackjack");
            }
        }, a);
    }

    auto BlackjackRules::Apply(Table& table, PlayerAction const& a) -> bool
    {
        return std::visit([&]<typename T0>(T0 const&) -> bool
            {
                using T = std::decay_t<T0>;
                if constexpr (std::is_same_v<T, DealAction>)
                {
                    table.player_.Clear();
                    table.dealer_.Clear();
                    for (size_t i{}; i < constants::CardsPerDeal / 2; ++i)
                    {
                        bool const dealt = table.DealTo(table.player_) && table.DealTo(table.dealer_);
                        CSIM_ASSERT(dealt, "Deck ran out during a validated deal");
                    }
                    phase_ = BlackjackPhase::PlayerTurn;
                    return true;
                }
                else if constexpr (std::is_same_v<T, HitAction>)
                {
                    if (phase_ != BlackjackPhase::PlayerTurn) return false;
                    bool const dealt = table.DealTo(table.player_);
                    CSIM_ASSERT(dealt, "Deck ran out during a validated hit");
                    return true;
                }
                else if constexpr (std::is_same_v<T, StandAction>)
                {
                    if (phase_ != BlackjackPhase::PlayerTurn) return false;
                    phase_ = BlackjackPhase::DealerTurn;

                    // dealer stands on 17 or more
                    while (scoring::BlackjackScore(table.dealer_.Cards()) < constants::DealerStandsOn)
                    {
                        if (!table.DealTo(table.dealer_))
                        {
                            table.Announce(std::format("Deck exhausted, dealer stands on {}.",
                                                       scoring::BlackjackScore(table.dealer_.Cards())));
                            break;
                        }
                    }
                    return true;
                }
                else if constexpr (std::is_same_v<T, ShuffleAction>)
                {
                    table.deck_.Shuffle();
                    table.Announce("Deck shuffled!");
                    return true;
                }
                else if constexpr (std::is_same_v<T, ResetDeckAction>)
                {
                    table.RecycleDeck(MakeStandardDeck(), false);
                    table.Announce("Deck reset to full 52 cards.");
                    return true;
                }
                else
                {
                    ::cardsim::core::error::fail(::cardsim::core::error::Code::Rules, "Action not supported by Blackjack");
                }
            }, a);
    }

    auto BlackjackRules::Settle(Table& table) -> void
    {
        int const p_score = scoring::BlackjackScore(table.player_.Cards());
        int const d_score = scoring::BlackjackScore(table.dealer_.Cards());

        if (d_score > constants::BlackjackLimit || p_score > d_score)
            table.Settle(Verdict::PlayerWins, "Player 1 wins!");
        else if (p_score < d_score)
            table.Settle(Verdict::DealerWins, "Dealer wins!");
        else
            table.Settle(Verdict::Tie, "It's a tie!");
    }

    auto BlackjackRules::Advance(Table& table) -> MoveOutcome
    {
        switch (phase_)
        {
        case BlackjackPhase::PlayerTurn:
            if (!scoring::IsBust(table.player_.Cards())) return MoveOutcome::Applied;
            phase_ = BlackjackPhase::RoundOver;
            table.Settle(Verdict::DealerWins, "Player 1 busts! Dealer wins.");
            return MoveOutcome::RoundEnded;

        case BlackjackPhase::DealerTurn:
            phase_ = BlackjackPhase::RoundOver;
            Settle(table);
            return MoveOutcome::RoundEnded;

        case BlackjackPhase::AwaitingDeal:
        case BlackjackPhase::RoundOver:
            return MoveOutcome::Applied;
        }
        CSIM_THROW(error::Code::State, "Unknown Blackjack phase");
    }

    auto BlackjackRules::Describe(Table const& table, TableSnapshot& snap) const -> void
    {
        snap.phase = PhaseName();
        snap.player.score = scoring::BlackjackScore(table.player_.Cards());
        snap.dealer.score = scoring::BlackjackScore(table.dealer_.Cards());
    }

    BlackjackGame::BlackjackGame(Config const& config, RandomSP rng) :
        BlackjackGame(config, std::make_unique<BlackjackRules>(), std::move(rng))
    {
    }

    BlackjackGame::BlackjackGame(Config const& config, std::unique_ptr<BlackjackRules> rules, RandomSP rng) :
        rules_(rules.get()),
        table_(config, std::move(rules), std::move(rng))
    {
    }

    auto BlackjackGame::PlayerScore() const -> int
    {
        return scoring::BlackjackScore(table_.PlayerHand().Cards());
    }

    auto BlackjackGame::DealerScore() const -> int
    {
        return scoring::BlackjackScore(table_.DealerHand().Cards());
    }
}
