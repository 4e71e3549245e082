//
// Created by Malik T on 15/10/2025.
//

#ifndef CARDSIM_ACTIONS_HPP
#define CARDSIM_ACTIONS_HPP

#include <string>
#include "Types.hpp"

namespace cardsim::core
{
    // Blackjack
    struct DealAction      {}; // also draws the hidden card in Guess the Card
    struct HitAction       {};
    struct StandAction     {};
    struct ShuffleAction   {};
    struct ResetDeckAction {};

    // High Card
    struct DrawPlayerAction {};
    struct DrawDealerAction {};

    // Slapjack
    struct FlipAction {};
    struct SlapAction {};
    struct ReactionTickAction { std::chrono::milliseconds elapsed; };
    struct SetWindowAction    { std::chrono::milliseconds window; };

    // Guess the Card
    struct GuessAction { std::string text; };

    // "Play again" in High Card and Slapjack
    struct NewGameAction {};

    using PlayerAction = std::variant<
      DealAction, HitAction, StandAction, ShuffleAction, ResetDeckAction,
      DrawPlayerAction, DrawDealerAction,
      FlipAction, SlapAction, ReactionTickAction, SetWindowAction,
      GuessAction, NewGameAction>;

    enum class MoveOutcome : uint8_t
    {
        Ignored,
        Applied,
        RoundEnded,
        GameEnded
    };

    enum class Verdict : uint8_t
    {
        None,
        PlayerWins,
        DealerWins,
        Tie,
        Correct,
        Wrong
    };

    enum class BlackjackPhase : uint8_t
    {
        AwaitingDeal,
        PlayerTurn,
        DealerTurn,
        RoundOver
    };

    enum class HighCardPhase : uint8_t
    {
        Idle,
        PlayerDrawn,
        RoundOver
    };

    enum class SlapjackPhase : uint8_t
    {
        Running,
        SuitExhausted,
        AllSuitsComplete,
        MissedJack
    };

    enum class GuessPhase : uint8_t
    {
        AwaitingDraw,
        AwaitingGuess,
        Revealed
    };
} // namespace cardsim::core

#endif //CARDSIM_ACTIONS_HPP
