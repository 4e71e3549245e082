//
// Created by Malik T on 17/10/2025.
//

#include "Slapjack.hpp"

#include <algorithm>
#include <utility>

#include "Scoring.hpp"
#include "Util.hpp"

namespace
{
    inline auto Viol(cardsim::core::error::RuleViolationCode code) -> cardsim::core::error::RuleViolation
    {
        return cardsim::core::error::RuleViolation{ .code = code };
    }
}

namespace cardsim::core
{
    auto SlapjackRules::PhaseName() const noexcept -> std::string_view
    {
        switch (phase_)
        {
        case SlapjackPhase::Running:          return "Running";
        case SlapjackPhase::SuitExhausted:    return "SuitExhausted";
        case SlapjackPhase::AllSuitsComplete: return "AllSuitsComplete";
        case SlapjackPhase::MissedJack:       return "MissedJack";
        }
        return "?";
    }

    auto SlapjackRules::Setup(Table& table) -> void
    {
        window_ = table.cfg_.reaction_window;
        Restart(table);
    }

    auto SlapjackRules::Restart(Table& table) -> void
    {
        suit_idx_ = 0;
        table.RecycleDeck(MakeSuitDeck(ActiveSuit()), true);
        table.player_.Clear();
        table.dealer_.Clear();
        face_up_.reset();
        Disarm();
        score_ = 0;
        phase_ = SlapjackPhase::Running;
        just_ended_ = false;
        suit_changed_ = false;
    }

    auto SlapjackRules::Disarm() noexcept -> void
    {
        jack_live_ = false;
        reaction_left_.reset();
    }

    auto SlapjackRules::Validate(Table const&, PlayerAction const& a) const -> CheckResult
    {
        using RVC = ::cardsim::core::error::RuleViolationCode;

        return std::visit([&]<typename T0>(T0 const& act) -> CheckResult
        {
            using T = std::decay_t<T0>;

            if constexpr (std::is_same_v<T, SetWindowAction>)
            {
                if (std::ranges::find(constants::ReactionWindowMenuMs, act.window.count()) ==
                    std::end(constants::ReactionWindowMenuMs))
                    return std::unexpected(Viol(RVC::Slapjack_WindowNotOffered).with_window(act.window.count()));
                return {};
            }
            else if constexpr (std::is_same_v<T, FlipAction> ||
                               std::is_same_v<T, SlapAction> ||
                               std::is_same_v<T, ReactionTickAction> ||
                               std::is_same_v<T, NewGameAction>)
            {
                return {};
            }
            else
            {
                CSIM_THROW(error::Code::Rules, "Action not supported by Slapjack");
            }
        }, a);
    }

    auto SlapjackRules::NextSuit(Table& table) -> void
    {
        if (suit_idx_ + 1 < constants::SuitCount)
        {
            ++suit_idx_;
            table.RecycleDeck(MakeSuitDeck(ActiveSuit()), true);
            phase_ = SlapjackPhase::Running;
            suit_changed_ = true;
            table.Announce(std::format("Moving to {} suit!", util::SuitName(ActiveSuit())));
            return;
        }
        Disarm();
        phase_ = SlapjackPhase::AllSuitsComplete;
        just_ended_ = true;
        table.Announce("All suits completed! Game Over!");
    }

    auto SlapjackRules::FlipNext(Table& table) -> void
    {
        std::optional<Card> card = table.deck_.DealCard();
        if (!card)
        {
            NextSuit(table);
            return;
        }

        face_up_ = card;
        table.Announce(std::format("Card flipped: {}", util::ToString(*card)));
        if (scoring::IsSlapTarget(*card))
        {
            // every Jack re-arms with the window selected right now
            jack_live_ = true;
            reaction_left_ = window_;
            table.Announce("JACK! SLAP NOW!");
        }
        else
        {
            Disarm();
        }

        if (table.deck_.IsEmpty()) phase_ = SlapjackPhase::SuitExhausted;
    }

    auto SlapjackRules::Apply(Table& table, PlayerAction const& a) -> bool
    {
        return std::visit([&]<typename T0>(T0 const& act) -> bool
            {
                using T = std::decay_t<T0>;
                if constexpr (std::is_same_v<T, FlipAction>)
                {
                    if (IsOver()) return false;
                    FlipNext(table);
                    return true;
                }
                else if constexpr (std::is_same_v<T, SlapAction>)
                {
                    if (IsOver()) return false;
                    if (!jack_live_ || !face_up_)
                    {
                        score_ = std::max(0, score_ - 1);
                        table.Announce("No Jack to slap! -1 point penalty");
                        return true;
                    }
                    // countdown cancelled inside the same step as the slap
                    Disarm();
                    table.player_.Add(*face_up_);
                    face_up_.reset();
                    ++score_;
                    table.Announce("Great slap! +1 point");
                    return true;
                }
                else if constexpr (std::is_same_v<T, ReactionTickAction>)
                {
                    if (IsOver() || !reaction_left_) return false;
                    *reaction_left_ -= act.elapsed;
                    if (reaction_left_->count() > 0) return true;

                    Disarm();
                    phase_ = SlapjackPhase::MissedJack;
                    just_ended_ = true;
                    table.Announce("Too slow! You missed the Jack!");
                    return true;
                }
                else if constexpr (std::is_same_v<T, SetWindowAction>)
                {
                    window_ = act.window;
                    table.Announce(std::format("Slap timer set to {}ms", window_.count()));
                    return true;
                }
                else if constexpr (std::is_same_v<T, NewGameAction>)
                {
                    Restart(table);
                    table.Announce("New game started! Watch for Jacks and SLAP!");
                    table.Announce(std::format("Current suit: {}", util::SuitName(ActiveSuit())));
                    return true;
                }
                else
                {
                    ::cardsim::core::error::fail(::cardsim::core::error::Code::Rules, "Action not supported by Slapjack");
                }
            }, a);
    }

    auto SlapjackRules::Advance(Table& table) -> MoveOutcome
    {
        if (std::exchange(just_ended_, false))
        {
            table.Announce(std::format("Final Score: {} points", score_));
            table.Announce(std::format("Cards collected: {}", table.player_.Size()));
            return MoveOutcome::GameEnded;
        }
        if (std::exchange(suit_changed_, false)) return MoveOutcome::RoundEnded;
        return MoveOutcome::Applied;
    }

    auto SlapjackRules::Describe(Table const&, TableSnapshot& snap) const -> void
    {
        snap.phase = PhaseName();
        snap.player.score = score_;
        snap.face_up = face_up_;
        snap.active_suit = ActiveSuit();
        snap.reaction_live = jack_live_;
    }

    SlapjackGame::SlapjackGame(Config const& config, RandomSP rng) :
        SlapjackGame(config, std::make_unique<SlapjackRules>(), std::move(rng))
    {
    }

    SlapjackGame::SlapjackGame(Config const& config, std::unique_ptr<SlapjackRules> rules, RandomSP rng) :
        rules_(rules.get()),
        table_(config, std::move(rules), std::move(rng))
    {
    }

    auto SlapjackGame::NewGame() -> ActionResult
    {
        ActionResult res = table_.Step(NewGameAction{});
        if (res) flip_clock_ = std::chrono::milliseconds{0};
        return res;
    }

    auto SlapjackGame::AdvanceFlipClock(std::chrono::milliseconds const elapsed) -> std::vector<StepReport>
    {
        std::vector<StepReport> fired;
        if (rules_->IsOver()) return fired;

        auto const interval = table_.Settings().flip_interval;
        flip_clock_ += elapsed;
        while (flip_clock_ >= interval)
        {
            flip_clock_ -= interval;
            ActionResult res = table_.Step(FlipAction{});
            if (!res)
                CSIM_THROW(error::Code::State, std::format("Flip refused: {}", error::describe(res.error())));

            fired.push_back(std::move(*res));
            if (rules_->IsOver())
            {
                flip_clock_ = std::chrono::milliseconds{0};
                break;
            }
        }
        return fired;
    }

    auto SlapjackGame::AdvanceTime(std::chrono::milliseconds elapsed) -> std::vector<ClockEvent>
    {
        std::vector<ClockEvent> fired;
        auto const interval = table_.Settings().flip_interval;

        auto dispatch = [&](PlayerAction action) -> ActionResult
        {
            ActionResult res = table_.Step(action);
            if (!res)
                CSIM_THROW(error::Code::State, std::format("Clock step refused: {}", error::describe(res.error())));
            return res;
        };

        while (elapsed.count() > 0 && !rules_->IsOver())
        {
            std::chrono::milliseconds chunk = std::min(elapsed, interval - flip_clock_);
            std::optional<std::chrono::milliseconds> const armed = rules_->ReactionRemaining();
            if (armed) chunk = std::min(chunk, *armed);

            elapsed -= chunk;
            flip_clock_ += chunk;

            if (armed)
            {
                ReactionTickAction const tick{chunk};
                ActionResult res = dispatch(tick);
                if (!res->messages.empty()) fired.push_back(ClockEvent{tick, std::move(*res)});
                if (rules_->IsOver()) break;
            }

            if (flip_clock_ >= interval)
            {
                flip_clock_ -= interval;
                ActionResult res = dispatch(FlipAction{});
                fired.push_back(ClockEvent{FlipAction{}, std::move(*res)});
            }
        }
        if (rules_->IsOver()) flip_clock_ = std::chrono::milliseconds{0};
        return fired;
    }
}
