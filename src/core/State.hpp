//
// Created by Malik T on 15/10/2025.
//

#ifndef CARDSIM_STATE_HPP
#define CARDSIM_STATE_HPP

#include <expected>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "Types.hpp"
#include "Actions.hpp"
#include "Exception.hpp"

namespace cardsim::core
{
    struct SeatView
    {
        std::string owner;
        std::vector<Card> cards;
        int score{};
    };

    // Immutable snapshot handed to the presentation layer after every step
    struct TableSnapshot
    {
        GameKind kind{};
        std::string_view phase{};
        size_t deck_size{};

        SeatView player;
        SeatView dealer;

        // Slapjack
        std::optional<Card> face_up{};
        std::optional<Suit> active_suit{};
        bool reaction_live{false};
    };

    struct StepReport
    {
        MoveOutcome outcome{MoveOutcome::Ignored};
        Verdict verdict{Verdict::None};
        std::vector<std::string> messages;
        std::shared_ptr<TableSnapshot const> snapshot;
    };

    using ActionResult = std::expected<StepReport, error::RuleViolation>;

} // namespace cardsim::core

#endif //CARDSIM_STATE_HPP
