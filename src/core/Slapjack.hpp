//
// Created by Malik T on 17/10/2025.
//

#ifndef CARDSIM_SLAPJACK_HPP
#define CARDSIM_SLAPJACK_HPP
#include <chrono>
#include <optional>
#include <vector>
#include "Rules.hpp"
#include "Table.hpp"

namespace cardsim::core
{
    // One 13-card sub-deck per suit, Hearts to Spades. A revealed Jack stays live until it is
    // slapped, replaced by the next flip, or its reaction countdown runs out (which ends the game).
    class SlapjackRules final : public Rules
    {
    public:
        auto Kind() const noexcept -> GameKind override { return GameKind::Slapjack; }
        auto PhaseName() const noexcept -> std::string_view override;

        auto Setup(Table& table) -> void override;
        auto Validate(Table const& table, PlayerAction const& a) const -> CheckResult override;
        auto Apply(Table& table, PlayerAction const& a) -> bool override;
        auto Advance(Table& table) -> MoveOutcome override;
        auto Describe(Table const& table, TableSnapshot& snap) const -> void override;

        auto PhaseNow() const noexcept -> SlapjackPhase { return phase_; }
        auto IsOver() const noexcept -> bool
        {
            return phase_ == SlapjackPhase::AllSuitsComplete || phase_ == SlapjackPhase::MissedJack;
        }
        auto Score() const noexcept -> int { return score_; }
        auto ActiveSuit() const noexcept -> Suit { return static_cast<Suit>(suit_idx_); }
        auto FaceUp() const noexcept -> std::optional<Card> const& { return face_up_; }
        auto JackLive() const noexcept -> bool { return jack_live_; }
        auto ReactionRemaining() const noexcept -> std::optional<std::chrono::milliseconds> { return reaction_left_; }
        auto Window() const noexcept -> std::chrono::milliseconds { return window_; }

        friend struct debug::Inspector;

    private:
        auto Restart(Table& table) -> void;
        auto Disarm() noexcept -> void;
        auto FlipNext(Table& table) -> void;
        auto NextSuit(Table& table) -> void;

        SlapjackPhase phase_{SlapjackPhase::Running};
        size_t suit_idx_{0};
        std::optional<Card> face_up_{};
        bool jack_live_{false};
        std::optional<std::chrono::milliseconds> reaction_left_{};
        std::chrono::milliseconds window_{2000};
        int score_{0};

        // set by Apply, consumed by Advance
        bool just_ended_{false};
        bool suit_changed_{false};
    };

    // A step fired by one of the clocks, with the action that was dispatched.
    struct ClockEvent
    {
        PlayerAction action;
        StepReport report;
    };

    class SlapjackGame
    {
    public:
        explicit SlapjackGame(Config const& config = {}, RandomSP rng = nullptr);

        // One flip cadence tick.
        auto Flip() -> ActionResult  { return table_.Step(FlipAction{}); }
        auto Slap() -> ActionResult  { return table_.Step(SlapAction{}); }
        auto SetReactionWindow(std::chrono::milliseconds window) -> ActionResult
        {
            return table_.Step(SetWindowAction{window});
        }
        auto NewGame() -> ActionResult;

        // Logical clocks standing in for the two timers. Each elapsed flip interval dispatches one
        // Flip; the flip cadence stops once the game is over.
        auto AdvanceFlipClock(std::chrono::milliseconds elapsed) -> std::vector<StepReport>;
        auto AdvanceReactionClock(std::chrono::milliseconds elapsed) -> ActionResult
        {
            return table_.Step(ReactionTickAction{elapsed});
        }
        // Both clocks together, in timestamp order: time is cut at every flip and at the expiry of
        // an armed countdown, so a Jack revealed mid-way can still be missed. Countdown ticks are
        // reported only when they expire. An expiry due at the same instant as a flip goes first.
        auto AdvanceTime(std::chrono::milliseconds elapsed) -> std::vector<ClockEvent>;

        auto PhaseNow() const noexcept -> SlapjackPhase { return rules_->PhaseNow(); }
        auto IsOver() const noexcept -> bool { return rules_->IsOver(); }
        auto Score() const noexcept -> int { return rules_->Score(); }
        auto ActiveSuit() const noexcept -> Suit { return rules_->ActiveSuit(); }
        auto FaceUp() const noexcept -> std::optional<Card> const& { return rules_->FaceUp(); }
        auto JackLive() const noexcept -> bool { return rules_->JackLive(); }
        auto ReactionRemaining() const noexcept { return rules_->ReactionRemaining(); }
        auto Window() const noexcept -> std::chrono::milliseconds { return rules_->Window(); }
        auto Collected() const noexcept -> size_t { return table_.PlayerHand().Size(); }

        auto Snapshot() const -> std::shared_ptr<TableSnapshot const> { return table_.Snapshot(); }
        auto TableRef() noexcept -> Table& { return table_; }
        auto TableRef() const noexcept -> Table const& { return table_; }

    private:
        SlapjackGame(Config const& config, std::unique_ptr<SlapjackRules> rules, RandomSP rng);

        SlapjackRules* rules_; // owned by table_
        Table table_;
        std::chrono::milliseconds flip_clock_{0};
    };
}

#endif //CARDSIM_SLAPJACK_HPP
