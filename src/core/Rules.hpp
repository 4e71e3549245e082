//
// Created by Malik T on 15/10/2025.
//

#ifndef CARDSIM_RULES_HPP
#define CARDSIM_RULES_HPP

#include <string_view>

#include "Actions.hpp"
#include "Types.hpp"
#include "Exception.hpp"
#include "State.hpp"

namespace cardsim::core
{
    //forward declaration
    class Table;

    // Round lifecycle shared by every game. Rules objects own the per-game round state;
    // the Table owns the cards.
    class Rules
    {
    public:
        using CheckResult = error::ValidateResult;

        virtual ~Rules() = default;

        virtual auto Kind() const noexcept -> GameKind = 0;
        virtual auto PhaseName() const noexcept -> std::string_view = 0;
        virtual auto PlayerName() const noexcept -> std::string_view { return "Player"; }

        // Fill the deck and reset round state. Called once by the Table constructor.
        virtual auto Setup(Table& table) -> void = 0;

        // Returns unexpected(reason) for ordinary refusals (NOT exceptions).
        // Throw only for engine misuse / broken invariants.
        virtual auto Validate(Table const& table, PlayerAction const& a) const -> CheckResult = 0;

        // Mutate authoritative state. Returns false when the action is ignored in this phase.
        virtual auto Apply(Table& table, PlayerAction const& a) -> bool = 0;

        virtual auto Advance(Table& table) -> MoveOutcome = 0;

        // Game specific parts of the snapshot (phase, scores, hidden cards)
        virtual auto Describe(Table const& table, TableSnapshot& snap) const -> void = 0;
    };
}

#endif //CARDSIM_RULES_HPP
