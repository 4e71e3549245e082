//
// Created by Malik T on 16/10/2025.
//

#ifndef CARDSIM_HIGHCARD_HPP
#define CARDSIM_HIGHCARD_HPP
#include "Rules.hpp"
#include "Table.hpp"

namespace cardsim::core
{
    class HighCardRules final : public Rules
    {
    public:
        auto Kind() const noexcept -> GameKind override { return GameKind::HighCard; }
        auto PhaseName() const noexcept -> std::string_view override;

        auto Setup(Table& table) -> void override;
        auto Validate(Table const& table, PlayerAction const& a) const -> CheckResult override;
        auto Apply(Table& table, PlayerAction const& a) -> bool override;
        auto Advance(Table& table) -> MoveOutcome override;
        auto Describe(Table const& table, TableSnapshot& snap) const -> void override;

        auto PhaseNow() const noexcept -> HighCardPhase { return phase_; }

    private:
        // An exhausted deck is replaced so play can go on indefinitely.
        static auto RecycleIfEmpty(Table& table) -> void;

        HighCardPhase phase_{HighCardPhase::Idle};
    };

    class HighCardGame
    {
    public:
        explicit HighCardGame(Config const& config = {}, RandomSP rng = nullptr);

        auto DrawForPlayer() -> ActionResult { return table_.Step(DrawPlayerAction{}); }
        auto DrawForDealer() -> ActionResult { return table_.Step(DrawDealerAction{}); }
        // "play again" after a round; leaving is up to the caller
        auto Rematch() -> ActionResult       { return table_.Step(NewGameAction{}); }

        auto PhaseNow() const noexcept -> HighCardPhase { return rules_->PhaseNow(); }

        auto Snapshot() const -> std::shared_ptr<TableSnapshot const> { return table_.Snapshot(); }
        auto TableRef() noexcept -> Table& { return table_; }
        auto TableRef() const noexcept -> Table const& { return table_; }

    private:
        HighCardGame(Config const& config, std::unique_ptr<HighCardRules> rules, RandomSP rng);

        HighCardRules* rules_; // owned by table_
        Table table_;
    };
}

#endif //CARDSIM_HIGHCARD_HPP
