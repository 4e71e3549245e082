//
// Created by Malik T on 15/10/2025.
//
#include "Table.hpp"

#include <algorithm>
#include <cstdio>
#include <print>
#include <utility>

#include "Exception.hpp"

namespace cardsim::core
{
    static auto RequireRules(std::unique_ptr<Rules> rules) -> std::unique_ptr<Rules>
    {
        if (!rules) CSIM_THROW(error::Code::Config, "Table requires a rules object");
        return rules;
    }

    Table::Table(Config const& config,
                 std::unique_ptr<Rules> rules,
                 RandomSP rng) :
        cfg_(config),
        rng_(rng ? std::move(rng) : MakeSeededSource(cfg_.seed)),
        rules_(RequireRules(std::move(rules))),
        deck_({}, rng_),
        player_(std::string(rules_->PlayerName())),
        dealer_("Dealer")
    {
        ValidateConfig();
        rules_->Setup(*this);
    }

    auto Table::ValidateConfig() const -> void
    {
        using error::Code;
        if (cfg_.flip_interval.count() <= 0)
            CSIM_THROW(Code::Config, std::format("Flip interval must be positive, got {}ms", cfg_.flip_interval.count()));

        if (std::ranges::find(constants::ReactionWindowMenuMs, cfg_.reaction_window.count()) ==
            std::end(constants::ReactionWindowMenuMs))
            CSIM_THROW(Code::Config, std::format("Reaction window {}ms is not on the slap timer menu",
                                                 cfg_.reaction_window.count()));
    }

    auto Table::DealTo(CardHand& hand) -> bool
    {
        std::optional<Card> card = deck_.DealCard();
        if (!card) return false;
        hand.Add(*card);
        return true;
    }

    auto Table::RecycleDeck(std::vector<Card> cards, bool const shuffle) -> void
    {
        deck_.Reset(std::move(cards));
        if (shuffle) deck_.Shuffle();
    }

    auto Table::Announce(std::string message) -> void
    {
        messages_.push_back(std::move(message));
    }

    auto Table::Settle(Verdict const verdict, std::string message) -> void
    {
        verdict_ = verdict;
        messages_.push_back(std::move(message));
    }

    //helpers for snapshot
    static auto ViewSeat(CardHand const& hand) -> SeatView
    {
        SeatView seat{};
        seat.owner = std::string(hand.Owner());
        seat.cards.assign(hand.Cards().begin(), hand.Cards().end());
        return seat;
    }

    auto Table::Snapshot() const -> std::shared_ptr<TableSnapshot const>
    {
        std::shared_ptr<TableSnapshot> snap = std::make_shared<TableSnapshot>();
        snap->kind = rules_->Kind();
        snap->deck_size = deck_.Size();
        snap->player = ViewSeat(player_);
        snap->dealer = ViewSeat(dealer_);
        rules_->Describe(*this, *snap);
        return snap;
    }

    auto Table::Step(PlayerAction const& action) -> ActionResult
    {
        messages_.clear();
        verdict_ = Verdict::None;

        if (auto const ok = rules_->Validate(*this, action); !ok.has_value())
        {
            if (cfg_.log_violations)
            {
                std::print(stderr, "[cardsim] refused: {}\n", error::describe(ok.error()));
            }
            return std::unexpected(ok.error());
        }

        StepReport report{};
        if (rules_->Apply(*this, action))
        {
            report.outcome = rules_->Advance(*this);
            report.verdict = verdict_;
            report.messages = std::exchange(messages_, {});
        }
        report.snapshot = Snapshot();
        return report;
    }
}
