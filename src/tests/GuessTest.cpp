//
// Created by Malik T on 19/10/2025.
//

#include <gtest/gtest.h>
#include <memory>

#include "../core/GuessTheCard.hpp"
#include "../debug/Inspector.hpp"
#include "../debug/Invariants.hpp"

using namespace cardsim::core;
using cardsim::core::debug::Inspector;

namespace
{
auto drawn_game(Card planted) -> std::unique_ptr<GuessTheCardGame>
{
    Config cfg{};
    cfg.seed = 31;
    auto g = std::make_unique<GuessTheCardGame>(cfg);
    if (!g->Draw().has_value()) return nullptr;
    Inspector::PlantHidden(g->TableRef(), planted);
    return g;
}
} // anonymous namespace

TEST(GuessTheCard, Draw_Hides_One_Card)
{
    Config cfg{};
    cfg.seed = 31;
    GuessTheCardGame g(cfg);
    EXPECT_EQ(g.PhaseNow(), GuessPhase::AwaitingDraw);

    ActionResult r = g.Draw();
    ASSERT_TRUE(r.has_value());
    ASSERT_EQ(r->messages.size(), 1u);
    EXPECT_EQ(r->messages.front(), "Guess the rank of the card (e.g., Ace, 2, King):");
    EXPECT_EQ(g.PhaseNow(), GuessPhase::AwaitingGuess);

    // the snapshot never shows the face-down card
    EXPECT_TRUE(r->snapshot->dealer.cards.empty());
    EXPECT_TRUE(g.Snapshot()->dealer.cards.empty());
    EXPECT_TRUE(Inspector::HiddenCard(g.TableRef()).has_value());
    EXPECT_FALSE(g.Revealed().has_value());
    EXPECT_EQ(g.TableRef().DeckView().Size(), constants::StandardDeckSize - 1);
    debug::CheckInvariants(g.TableRef());
}

TEST(GuessTheCard, Correct_Guess_Ignores_Case)
{
    auto g = drawn_game(Card(Suit::Spades, Rank::Ace));
    ASSERT_NE(g, nullptr);

    ActionResult r = g->SubmitGuess("ace");
    ASSERT_TRUE(r.has_value());
    EXPECT_EQ(r->outcome, MoveOutcome::RoundEnded);
    EXPECT_EQ(r->verdict, Verdict::Correct);
    ASSERT_EQ(r->messages.size(), 1u);
    EXPECT_EQ(r->messages.front(), "Correct! It was: Ace of Spades");
    EXPECT_EQ(g->PhaseNow(), GuessPhase::Revealed);

    ASSERT_TRUE(g->Revealed().has_value());
    EXPECT_EQ(*g->Revealed(), Card(Suit::Spades, Rank::Ace));
    ASSERT_EQ(r->snapshot->dealer.cards.size(), 1u);
}

TEST(GuessTheCard, Wrong_Guess_Reveals)
{
    auto g = drawn_game(Card(Suit::Hearts, Rank::Seven));
    ASSERT_NE(g, nullptr);

    ActionResult r = g->SubmitGuess("King");
    ASSERT_TRUE(r.has_value());
    EXPECT_EQ(r->verdict, Verdict::Wrong);
    EXPECT_EQ(r->messages.front(), "Wrong! It was: 7 of Hearts");
}

TEST(GuessTheCard, Blank_Guess_Keeps_Card)
{
    auto g = drawn_game(Card(Suit::Clubs, Rank::Ten));
    ASSERT_NE(g, nullptr);

    ActionResult blank = g->SubmitGuess("   ");
    ASSERT_FALSE(blank.has_value());
    EXPECT_EQ(blank.error().code, error::RuleViolationCode::Guess_EmptyInput);
    EXPECT_EQ(error::to_string(blank.error().code), "Guess cannot be empty");
    EXPECT_EQ(g->PhaseNow(), GuessPhase::AwaitingGuess);

    ActionResult retry = g->SubmitGuess(" 10 ");
    ASSERT_TRUE(retry.has_value());
    EXPECT_EQ(retry->verdict, Verdict::Correct);
}

TEST(GuessTheCard, Guess_Needs_A_Card)
{
    GuessTheCardGame g{};

    ActionResult r = g.SubmitGuess("Queen");
    ASSERT_FALSE(r.has_value());
    EXPECT_EQ(r.error().code, error::RuleViolationCode::Guess_NoCardDrawn);

    auto done = drawn_game(Card(Suit::Hearts, Rank::Queen));
    ASSERT_NE(done, nullptr);
    ASSERT_TRUE(done->SubmitGuess("Queen").has_value());

    ActionResult twice = done->SubmitGuess("Queen");
    ASSERT_FALSE(twice.has_value());
    EXPECT_EQ(twice.error().code, error::RuleViolationCode::Guess_NoCardDrawn);
}

TEST(GuessTheCard, Each_Draw_Uses_Full_Deck)
{
    auto g = drawn_game(Card(Suit::Hearts, Rank::Two));
    ASSERT_NE(g, nullptr);
    ASSERT_TRUE(g->SubmitGuess("2").has_value());

    ASSERT_TRUE(g->Draw().has_value());
    EXPECT_EQ(g->TableRef().DeckView().Size(), constants::StandardDeckSize - 1);
    EXPECT_EQ(g->PhaseNow(), GuessPhase::AwaitingGuess);
    debug::CheckInvariants(g->TableRef());
}

TEST(GuessTheCard, Play_Draws_And_Guesses)
{
    Config cfg{};
    cfg.seed = 8;
    GuessTheCardGame g(cfg);

    ActionResult r = g.Play("Jack");
    ASSERT_TRUE(r.has_value());
    EXPECT_EQ(r->outcome, MoveOutcome::RoundEnded);
    ASSERT_TRUE(g.Revealed().has_value());
    EXPECT_EQ(r->verdict, g.Revealed()->rank == Rank::Jack ? Verdict::Correct : Verdict::Wrong);
}
