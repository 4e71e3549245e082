//
// Created by Malik T on 17/10/2025.
//

#include "GuessTheCard.hpp"

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
    auto GuessRules::PhaseName() const noexcept -> std::string_view
    {
        switch (phase_)
        {
        case GuessPhase::AwaitingDraw:  return "AwaitingDraw";
        case GuessPhase::AwaitingGuess: return "AwaitingGuess";
        case GuessPhase::Revealed:      return "Revealed";
        }
        return "?";
    }

    auto GuessRules::Setup(Table& table) -> void
    {
        table.RecycleDeck(MakeStandardDeck(), false);
        table.player_.Clear();
        table.dealer_.Clear();
        phase_ = GuessPhase::AwaitingDraw;
        just_revealed_ = false;
    }

    auto GuessRules::Validate(Table const&, PlayerAction const& a) const -> CheckResult
    {
        using RVC = ::cardsim::core::error::RuleViolationCode;

        return std::visit([&]<typename T0>(T0 const& act) -> CheckResult
        {
            using T = std::decay_t<T0>;

            if constexpr (std::is_same_v<T, DealAction>)
            {
                return {};
            }
            else if constexpr (std::is_same_v<T, GuessAction>)
            {
                if (phase_ != GuessPhase::AwaitingGuess)
                    return std::unexpected(Viol(RVC::Guess_NoCardDrawn).with_phase(PhaseName()));
                if (util::Trim(act.text).empty())
                    return std::unexpected(Viol(RVC::Guess_EmptyInput).with_phase(PhaseName()));
                return {};
            }
            else
            {
                CSIM_THROW(error::Code::Rules, "Action not supported by Guess the Card");
            }
        }, a);
    }

    auto GuessRules::Apply(Table& table, PlayerAction const& a) -> bool
    {
        return std::visit([&]<typename T0>(T0 const& act) -> bool
            {
                using T = std::decay_t<T0>;
                if constexpr (std::is_same_v<T, DealAction>)
                {
                    // shuffle then take the top card: a uniform pick over all 52
                    table.RecycleDeck(MakeStandardDeck(), true);
                    table.player_.Clear();
                    table.dealer_.Clear();
                    bool const dealt = table.DealTo(table.dealer_);
                    CSIM_ASSERT(dealt, "Fresh deck yielded no card");
                    phase_ = GuessPhase::AwaitingGuess;
                    table.Announce("Guess the rank of the card (e.g., Ace, 2, King):");
                    return true;
                }
                else if constexpr (std::is_same_v<T, GuessAction>)
                {
                    Card const& secret = table.dealer_.At(0);
                    phase_ = GuessPhase::Revealed;
                    just_revealed_ = true;
                    if (scoring::GuessMatches(act.text, secret))
                        table.Settle(Verdict::Correct, std::format("Correct! It was: {}", util::ToString(secret)));
                    else
                        table.Settle(Verdict::Wrong, std::format("Wrong! It was: {}", util::ToString(secret)));
                    return true;
                }
                else
                {
                    ::cardsim::core::error::fail(::cardsim::core::error::Code::Rules, "Action not supported by Guess the Card");
                }
            }, a);
    }

    auto GuessRules::Advance(Table&) -> MoveOutcome
    {
        return std::exchange(just_revealed_, false) ? MoveOutcome::RoundEnded : MoveOutcome::Applied;
    }

    auto GuessRules::Describe(Table const&, TableSnapshot& snap) const -> void
    {
        snap.phase = PhaseName();
        // face down until guessed
        if (phase_ == GuessPhase::AwaitingGuess) snap.dealer.cards.clear();
    }

    GuessTheCardGame::GuessTheCardGame(Config const& config, RandomSP rng) :
        GuessTheCardGame(config, std::make_unique<GuessRules>(), std::move(rng))
    {
    }

    GuessTheCardGame::GuessTheCardGame(Config const& config, std::unique_ptr<GuessRules> rules, RandomSP rng) :
        rules_(rules.get()),
        table_(config, std::move(rules), std::move(rng))
    {
    }

    auto GuessTheCardGame::Play(std::string_view text) -> ActionResult
    {
        ActionResult drawn = Draw();
        if (!drawn) return drawn;
        return SubmitGuess(text);
    }

    auto GuessTheCardGame::Revealed() const -> std::optional<Card>
    {
        if (rules_->PhaseNow() != GuessPhase::Revealed || table_.DealerHand().Empty()) return std::nullopt;
        return table_.DealerHand().At(0);
    }
}
