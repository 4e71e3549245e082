//
// Created by Malik T on 17/10/2025.
//

#ifndef CARDSIM_GUESSTHECARD_HPP
#define CARDSIM_GUESSTHECARD_HPP
#include <string>
#include <string_view>
#include "Rules.hpp"
#include "Table.hpp"

namespace cardsim::core
{
    // The hidden card sits in the dealer's hand until a guess reveals it.
    class GuessRules final : public Rules
    {
    public:
        auto Kind() const noexcept -> GameKind override { return GameKind::GuessTheCard; }
        auto PhaseName() const noexcept -> std::string_view override;

        auto Setup(Table& table) -> void override;
        auto Validate(Table const& table, PlayerAction const& a) const -> CheckResult override;
        auto Apply(Table& table, PlayerAction const& a) -> bool override;
        auto Advance(Table& table) -> MoveOutcome override;
        auto Describe(Table const& table, TableSnapshot& snap) const -> void override;

        auto PhaseNow() const noexcept -> GuessPhase { return phase_; }

    private:
        GuessPhase phase_{GuessPhase::AwaitingDraw};
        bool just_revealed_{false};
    };

    class GuessTheCardGame
    {
    public:
        explicit GuessTheCardGame(Config const& config = {}, RandomSP rng = nullptr);

        // Picks a card uniformly from a fresh 52-card deck and keeps it face down.
        auto Draw() -> ActionResult { return table_.Step(DealAction{}); }
        // A blank guess is refused and the same card stays up for another try.
        auto SubmitGuess(std::string_view text) -> ActionResult
        {
            return table_.Step(GuessAction{std::string(text)});
        }
        auto Play(std::string_view text) -> ActionResult;

        auto PhaseNow() const noexcept -> GuessPhase { return rules_->PhaseNow(); }
        // only once revealed
        auto Revealed() const -> std::optional<Card>;

        auto Snapshot() const -> std::shared_ptr<TableSnapshot const> { return table_.Snapshot(); }
        auto TableRef() noexcept -> Table& { return table_; }
        auto TableRef() const noexcept -> Table const& { return table_; }

    private:
        GuessTheCardGame(Config const& config, std::unique_ptr<GuessRules> rules, RandomSP rng);

        GuessRules* rules_; // owned by table_
        Table table_;
    };
}

#endif //CARDSIM_GUESSTHECARD_HPP
