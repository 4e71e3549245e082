//
// Created by Malik T on 19/10/2025.
//

#include <gtest/gtest.h>
#include <vector>

#include "../core/Scoring.hpp"

using namespace cardsim::core;

namespace
{
auto score(std::vector<Card> const& cards) -> int
{
    return scoring::BlackjackScore(cards);
}
} // anonymous namespace

TEST(Scoring, Blackjack_Face_Cards_Count_Ten)
{
    EXPECT_EQ(score({Card(Suit::Hearts, Rank::King), Card(Suit::Clubs, Rank::Queen)}), 20);
    EXPECT_EQ(score({Card(Suit::Hearts, Rank::Jack), Card(Suit::Clubs, Rank::Ten)}), 20);
    EXPECT_EQ(score({}), 0);
}

TEST(Scoring, Blackjack_Aces_Drop_One_At_A_Time)
{
    // 11 + 1 + 9
    EXPECT_EQ(score({Card(Suit::Hearts, Rank::Ace), Card(Suit::Spades, Rank::Ace), Card(Suit::Clubs, Rank::Nine)}), 21);
    // 1 + 10 + 2
    EXPECT_EQ(score({Card(Suit::Hearts, Rank::Ace), Card(Suit::Spades, Rank::King), Card(Suit::Clubs, Rank::Two)}), 13);
    EXPECT_EQ(score({Card(Suit::Hearts, Rank::Ace), Card(Suit::Spades, Rank::King)}), 21);
    EXPECT_EQ(score({Card(Suit::Hearts, Rank::Ace), Card(Suit::Spades, Rank::Ace)}), 12);
}

TEST(Scoring, Blackjack_Bust)
{
    std::vector<Card> const hand{Card(Suit::Hearts, Rank::King), Card(Suit::Clubs, Rank::Queen), Card(Suit::Spades, Rank::Two)};
    EXPECT_EQ(score(hand), 22);
    EXPECT_TRUE(scoring::IsBust(hand));
    EXPECT_FALSE(scoring::IsBust(std::vector<Card>{Card(Suit::Hearts, Rank::Ace), Card(Suit::Clubs, Rank::King)}));
}

TEST(Scoring, HighCard_Values_Ace_High)
{
    EXPECT_EQ(scoring::HighCardValue(Card(Suit::Hearts, Rank::Two)), 2);
    EXPECT_EQ(scoring::HighCardValue(Card(Suit::Hearts, Rank::Ten)), 10);
    EXPECT_EQ(scoring::HighCardValue(Card(Suit::Hearts, Rank::Jack)), 11);
    EXPECT_EQ(scoring::HighCardValue(Card(Suit::Hearts, Rank::King)), 13);
    EXPECT_EQ(scoring::HighCardValue(Card(Suit::Hearts, Rank::Ace)), 14);
}

TEST(Scoring, HighCard_Ignores_Suit)
{
    using scoring::Comparison;
    EXPECT_EQ(scoring::CompareHighCard(Card(Suit::Hearts, Rank::King), Card(Suit::Spades, Rank::Queen)),
              Comparison::PlayerHigher);
    EXPECT_EQ(scoring::CompareHighCard(Card(Suit::Hearts, Rank::Two), Card(Suit::Spades, Rank::Ace)),
              Comparison::DealerHigher);
    EXPECT_EQ(scoring::CompareHighCard(Card(Suit::Hearts, Rank::Seven), Card(Suit::Clubs, Rank::Seven)),
              Comparison::Tie);
}

TEST(Scoring, Only_Jacks_Are_Slap_Targets)
{
    EXPECT_TRUE(scoring::IsSlapTarget(Card(Suit::Diamonds, Rank::Jack)));
    EXPECT_FALSE(scoring::IsSlapTarget(Card(Suit::Diamonds, Rank::Queen)));
    EXPECT_FALSE(scoring::IsSlapTarget(Card(Suit::Diamonds, Rank::Ten)));
}

TEST(Scoring, Guess_Matches_Rank_Name)
{
    Card const ace(Suit::Spades, Rank::Ace);
    EXPECT_TRUE(scoring::GuessMatches("ace", ace));
    EXPECT_TRUE(scoring::GuessMatches("  ACE ", ace));
    EXPECT_FALSE(scoring::GuessMatches("A", ace));
    EXPECT_FALSE(scoring::GuessMatches("Ace of Spades", ace));

    EXPECT_TRUE(scoring::GuessMatches("10", Card(Suit::Hearts, Rank::Ten)));
    EXPECT_FALSE(scoring::GuessMatches("ten", Card(Suit::Hearts, Rank::Ten)));
    EXPECT_TRUE(scoring::GuessMatches("king", Card(Suit::Clubs, Rank::King)));
    EXPECT_FALSE(scoring::GuessMatches("", Card(Suit::Clubs, Rank::King)));
}
