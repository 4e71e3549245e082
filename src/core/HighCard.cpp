//
// Created by Malik T on 16/10/2025.
//

#include "HighCard.hpp"

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
    auto HighCardRules::PhaseName() const noexcept -> std::string_view
    {
        switch (phase_)
        {
        case HighCardPhase::Idle:        return "Idle";
        case HighCardPhase::PlayerDrawn: return "PlayerDrawn";
        case HighCardPhase::RoundOver:   return "RoundOver";
        }
        return "?";
    }

    auto HighCardRules::Setup(Table& table) -> void
    {
        table.RecycleDeck(MakeStandardDeck(), true);
        table.player_.Clear();
        table.dealer_.Clear();
        phase_ = HighCardPhase::Idle;
    }

    auto HighCardRules::RecycleIfEmpty(Table& table) -> void
    {
        if (!table.deck_.IsEmpty()) return;
        table.RecycleDeck(MakeStandardDeck(), true);
        table.Announce("Deck exhausted, reshuffled a fresh 52 cards.");
    }

    auto HighCardRules::Validate(Table const& table, PlayerAction const& a) const -> CheckResult
    {
        using RVC = ::cardsim::core::error::RuleViolationCode;

        return std::visit([&]<typename T0>(T0 const&) -> CheckResult
        {
            using T = std::decay_t<T0>;

            if constexpr (std::is_same_v<T, DrawPlayerAction>)
            {
                if (phase_ == HighCardPhase::PlayerDrawn)
                    return std::unexpected(Viol(RVC::HighCard_PlayerAlreadyDrew).with_phase(PhaseName()));
                return {};
            }
            else if constexpr (std::is_same_v<T, DrawDealerAction>)
            {
                // the dealer's card stays on the table until the next player draw or a rematch
                if (!table.dealer_.Empty())
                    return std::unexpected(Viol(RVC::HighCard_DealerAlreadyDrew).with_phase(PhaseName()));

                if (phase_ != HighCardPhase::PlayerDrawn)
                    return std::unexpected(Viol(RVC::HighCard_PlayerMustDrawFirst).with_phase(PhaseName()));
                return {};
            }
            else if constexpr (std::is_same_v<T, NewGameAction>)
            {
                return {};
            }
            else
            {
                CSIM_THROW(error::Code::Rules, "Action not supported by High Card");
            }
        }, a);
    }

    auto HighCardRules::Apply(Table& table, PlayerAction const& a) -> bool
    {
        return std::visit([&]<typename T0>(T0 const&) -> bool
            {
                using T = std::decay_t<T0>;
                if constexpr (std::is_same_v<T, DrawPlayerAction>)
                {
                    // first draw of a round starts it over
                    table.player_.Clear();
                    table.dealer_.Clear();

                    RecycleIfEmpty(table);
                    bool const dealt = table.DealTo(table.player_);
                    CSIM_ASSERT(dealt, "No card for the player after recycling");
                    table.Announce(std::format("Player drew {}", util::ToString(table.player_.At(0))));
                    phase_ = HighCardPhase::PlayerDrawn;
                    return true;
                }
                else if constexpr (std::is_same_v<T, DrawDealerAction>)
                {
                    RecycleIfEmpty(table);
                    bool const dealt = table.DealTo(table.dealer_);
                    CSIM_ASSERT(dealt, "No card for the dealer after recycling");
                    table.Announce(std::format("Dealer drew {}", util::ToString(table.dealer_.At(0))));
                    return true;
                }
                else if constexpr (std::is_same_v<T, NewGameAction>)
                {
                    table.player_.Clear();
                    table.dealer_.Clear();
                    phase_ = HighCardPhase::Idle;
                    return true;
                }
                else
                {
                    ::cardsim::core::error::fail(::cardsim::core::error::Code::Rules, "Action not supported by High Card");
                }
            }, a);
    }

    auto HighCardRules::Advance(Table& table) -> MoveOutcome
    {
        if (phase_ != HighCardPhase::PlayerDrawn || table.dealer_.Empty())
            return MoveOutcome::Applied;

        Card const& mine = table.player_.At(0);
        Card const& theirs = table.dealer_.At(0);

        switch (scoring::CompareHighCard(mine, theirs))
        {
        case scoring::Comparison::PlayerHigher:
            table.Settle(Verdict::PlayerWins,
                         std::format("Player wins with {} vs {}!", util::ToString(mine), util::ToString(theirs)));
            break;
        case scoring::Comparison::DealerHigher:
            table.Settle(Verdict::DealerWins,
                         std::format("Dealer wins with {} vs {}!", util::ToString(theirs), util::ToString(mine)));
            break;
        case scoring::Comparison::Tie:
            table.Settle(Verdict::Tie, std::format("It's a tie! Both have {}!", util::RankName(mine.rank)));
            break;
        }
        phase_ = HighCardPhase::RoundOver;
        return MoveOutcome::RoundEnded;
    }

    auto HighCardRules::Describe(Table const& table, TableSnapshot& snap) const -> void
    {
        snap.phase = PhaseName();
        snap.player.score = table.player_.Empty() ? 0 : scoring::HighCardValue(table.player_.At(0));
        snap.dealer.score = table.dealer_.Empty() ? 0 : scoring::HighCardValue(table.dealer_.At(0));
    }

    HighCardGame::HighCardGame(Config const& config, RandomSP rng) :
        HighCardGame(config, std::make_unique<HighCardRules>(), std::move(rng))
    {
    }

    HighCardGame::HighCardGame(Config const& config, std::unique_ptr<HighCardRules> rules, RandomSP rng) :
        rules_(rules.get()),
        table_(config, std::move(rules), std::move(rng))
    {
    }
}
