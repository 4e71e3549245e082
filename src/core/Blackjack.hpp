//
// Created by Malik T on 16/10/2025.
//

#ifndef CARDSIM_BLACKJACK_HPP
#define CARDSIM_BLACKJACK_HPP
#include "Rules.hpp"
#include "Table.hpp"

namespace cardsim::core
{
    // AwaitingDeal -> PlayerTurn -> DealerTurn -> RoundOver. Dealing is refused outright when it
    // cannot proceed, hit/stand out of turn are silently ignored.
    class BlackjackRules final : public Rules
    {
    public:
        auto Kind() const noexcept -> GameKind override { return GameKind::Blackjack; }
        auto PhaseName() const noexcept -> std::string_view override;
        auto PlayerName() const noexcept -> std::string_view override { return "Player 1"; }

        auto Setup(Table& table) -> void override;
        auto Validate(Table const& table, PlayerAction const& a) const -> CheckResult override;
        auto Apply(Table& table, PlayerAction const& a) -> bool override;
        auto Advance(Table& table) -> MoveOutcome override;
        auto Describe(Table const& table, TableSnapshot& snap) const -> void override;

        auto PhaseNow() const noexcept -> BlackjackPhase { return phase_; }

    private:
        auto Settle(Table& table) -> void;

        BlackjackPhase phase_{BlackjackPhase::AwaitingDeal};
    };

    class BlackjackGame
    {
    public:
        explicit BlackjackGame(Config const& config = {}, RandomSP rng = nullptr);

        auto Deal() -> ActionResult      { return table_.Step(DealAction{}); }
        auto Hit() -> ActionResult       { return table_.Step(HitAction{}); }
        auto Stand() -> ActionResult     { return table_.Step(StandAction{}); }
        auto Shuffle() -> ActionResult   { return table_.Step(ShuffleAction{}); }
        auto ResetDeck() -> ActionResult { return table_.Step(ResetDeckAction{}); }

        auto PhaseNow() const noexcept -> BlackjackPhase { return rules_->PhaseNow(); }
        auto PlayerScore() const -> int;
        auto DealerScore() const -> int;

        auto Snapshot() const -> std::shared_ptr<TableSnapshot const> { return table_.Snapshot(); }
        auto TableRef() noexcept -> Table& { return table_; }
        auto TableRef() const noexcept -> Table const& { return table_; }

    private:
        BlackjackGame(Config const& config, std::unique_ptr<BlackjackRules> rules, RandomSP rng);

        BlackjackRules* rules_; // owned by table_
        Table table_;
    };
}

#endif //CARDSIM_BLACKJACK_HPP
