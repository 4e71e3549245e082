//
// Created by Malik T on 19/10/2025.
//

#include <gtest/gtest.h>
#include <memory>
#include <vector>

#include "../core/HighCard.hpp"
#include "../debug/Inspector.hpp"
#include "../debug/Invariants.hpp"

using namespace cardsim::core;
using cardsim::core::debug::Inspector;

namespace
{
// Games own their table and do not move, so the fixture hands out a pointer.
auto make_game(std::vector<Card> stacked) -> std::unique_ptr<HighCardGame>
{
    Config cfg{};
    cfg.seed = 5;
    auto g = std::make_unique<HighCardGame>(cfg);
    Inspector::StackDeck(g->TableRef(), std::move(stacked));
    return g;
}
} // anonymous namespace

TEST(HighCard, Starts_With_Shuffled_Full_Deck)
{
    Config cfg{};
    cfg.seed = 5;
    HighCardGame g(cfg);
    EXPECT_EQ(g.PhaseNow(), HighCardPhase::Idle);
    EXPECT_EQ(g.TableRef().DeckView().Size(), constants::StandardDeckSize);
    debug::CheckInvariants(g.TableRef());
}

TEST(HighCard, Higher_Rank_Wins)
{
    auto g = make_game({Card(Suit::Hearts, Rank::King), Card(Suit::Spades, Rank::Queen)});

    ActionResult p = g->DrawForPlayer();
    ASSERT_TRUE(p.has_value());
    EXPECT_EQ(p->outcome, MoveOutcome::Applied);
    EXPECT_EQ(p->messages.front(), "Player drew King of Hearts");
    EXPECT_EQ(g->PhaseNow(), HighCardPhase::PlayerDrawn);

    ActionResult d = g->DrawForDealer();
    ASSERT_TRUE(d.has_value());
    EXPECT_EQ(d->outcome, MoveOutcome::RoundEnded);
    EXPECT_EQ(d->verdict, Verdict::PlayerWins);
    ASSERT_EQ(d->messages.size(), 2u);
    EXPECT_EQ(d->messages[0], "Dealer drew Queen of Spades");
    EXPECT_EQ(d->messages[1], "Player wins with King of Hearts vs Queen of Spades!");
    EXPECT_EQ(d->snapshot->player.score, 13);
    EXPECT_EQ(d->snapshot->dealer.score, 12);
    EXPECT_EQ(g->PhaseNow(), HighCardPhase::RoundOver);
}

TEST(HighCard, Dealer_Wins_With_Higher)
{
    auto g = make_game({Card(Suit::Hearts, Rank::Three), Card(Suit::Spades, Rank::Ace)});
    ASSERT_TRUE(g->DrawForPlayer().has_value());

    ActionResult d = g->DrawForDealer();
    ASSERT_TRUE(d.has_value());
    EXPECT_EQ(d->verdict, Verdict::DealerWins);
    EXPECT_EQ(d->messages.back(), "Dealer wins with Ace of Spades vs 3 of Hearts!");
}

TEST(HighCard, Same_Rank_Ties)
{
    auto g = make_game({Card(Suit::Hearts, Rank::King), Card(Suit::Clubs, Rank::King)});
    ASSERT_TRUE(g->DrawForPlayer().has_value());

    ActionResult d = g->DrawForDealer();
    ASSERT_TRUE(d.has_value());
    EXPECT_EQ(d->verdict, Verdict::Tie);
    EXPECT_EQ(d->messages.back(), "It's a tie! Both have King!");
}

TEST(HighCard, Player_Cannot_Draw_Twice)
{
    auto g = make_game({Card(Suit::Hearts, Rank::King), Card(Suit::Clubs, Rank::Two)});
    ASSERT_TRUE(g->DrawForPlayer().has_value());

    ActionResult r = g->DrawForPlayer();
    ASSERT_FALSE(r.has_value());
    EXPECT_EQ(r.error().code, error::RuleViolationCode::HighCard_PlayerAlreadyDrew);
    EXPECT_EQ(error::to_string(r.error().code), "Player already drew a card!");
    EXPECT_EQ(g->TableRef().PlayerHand().Size(), 1u);
    EXPECT_EQ(g->TableRef().DeckView().Size(), 1u);
}

TEST(HighCard, Dealer_Needs_Player_First)
{
    auto g = make_game({Card(Suit::Hearts, Rank::King), Card(Suit::Clubs, Rank::Two)});

    ActionResult r = g->DrawForDealer();
    ASSERT_FALSE(r.has_value());
    EXPECT_EQ(r.error().code, error::RuleViolationCode::HighCard_PlayerMustDrawFirst);
    EXPECT_EQ(error::to_string(r.error().code), "Player must draw first!");
    EXPECT_TRUE(g->TableRef().DealerHand().Empty());
}

TEST(HighCard, Dealer_Cannot_Draw_After_Round)
{
    auto g = make_game({Card(Suit::Hearts, Rank::King), Card(Suit::Clubs, Rank::Two),
                        Card(Suit::Clubs, Rank::Three)});
    ASSERT_TRUE(g->DrawForPlayer().has_value());
    ASSERT_TRUE(g->DrawForDealer().has_value());

    ActionResult r = g->DrawForDealer();
    ASSERT_FALSE(r.has_value());
    EXPECT_EQ(r.error().code, error::RuleViolationCode::HighCard_DealerAlreadyDrew);
    EXPECT_EQ(error::to_string(r.error().code), "Dealer already drew a card!");
    EXPECT_EQ(g->TableRef().DealerHand().Size(), 1u);
    EXPECT_EQ(g->TableRef().DeckView().Size(), 1u);
}

TEST(HighCard, Dealer_After_Rematch_Needs_Player)
{
    auto g = make_game({Card(Suit::Hearts, Rank::King), Card(Suit::Clubs, Rank::Two),
                        Card(Suit::Clubs, Rank::Three)});
    ASSERT_TRUE(g->DrawForPlayer().has_value());
    ASSERT_TRUE(g->DrawForDealer().has_value());
    ASSERT_TRUE(g->Rematch().has_value());

    ActionResult r = g->DrawForDealer();
    ASSERT_FALSE(r.has_value());
    EXPECT_EQ(r.error().code, error::RuleViolationCode::HighCard_PlayerMustDrawFirst);
}

TEST(HighCard, Next_Round_Clears_Hands)
{
    auto g = make_game({Card(Suit::Hearts, Rank::King), Card(Suit::Clubs, Rank::Two),
                        Card(Suit::Hearts, Rank::Four), Card(Suit::Clubs, Rank::Five)});
    ASSERT_TRUE(g->DrawForPlayer().has_value());
    ASSERT_TRUE(g->DrawForDealer().has_value());

    ActionResult r = g->DrawForPlayer();
    ASSERT_TRUE(r.has_value());
    ASSERT_EQ(g->TableRef().PlayerHand().Size(), 1u);
    EXPECT_EQ(g->TableRef().PlayerHand().At(0), Card(Suit::Hearts, Rank::Four));
    EXPECT_TRUE(g->TableRef().DealerHand().Empty());
    debug::CheckInvariants(g->TableRef());
}

TEST(HighCard, Empty_Deck_Is_Recycled)
{
    auto g = make_game({});

    ActionResult r = g->DrawForPlayer();
    ASSERT_TRUE(r.has_value());
    ASSERT_EQ(r->messages.size(), 2u);
    EXPECT_EQ(r->messages[0], "Deck exhausted, reshuffled a fresh 52 cards.");
    EXPECT_EQ(g->TableRef().DeckView().Size(), constants::StandardDeckSize - 1);
    debug::CheckInvariants(g->TableRef());
}

TEST(HighCard, Rematch_Returns_To_Idle)
{
    auto g = make_game({Card(Suit::Hearts, Rank::King), Card(Suit::Clubs, Rank::Two)});
    ASSERT_TRUE(g->DrawForPlayer().has_value());
    ASSERT_TRUE(g->DrawForDealer().has_value());

    ActionResult r = g->Rematch();
    ASSERT_TRUE(r.has_value());
    EXPECT_EQ(g->PhaseNow(), HighCardPhase::Idle);
    EXPECT_TRUE(g->TableRef().PlayerHand().Empty());
    EXPECT_TRUE(g->TableRef().DealerHand().Empty());
    // the deck is not refilled by a rematch
    EXPECT_EQ(g->TableRef().DeckView().Size(), 0u);
}
