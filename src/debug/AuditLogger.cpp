#include "AuditLogger.hpp"

#include <array>
#include <format>
#include <string_view>
#include <vector>

using namespace cardsim::core;

namespace
{

auto s_suit(Suit const s) -> std::string_view
{
    switch (s)
    {
        case Suit::Clubs:    return "C";
        case Suit::Diamonds: return "D";
        case Suit::Hearts:   return "H";
        case Suit::Spades:   return "S";
    }
    return "?";
}

auto s_rank(Rank const r) -> std::string_view
{
    static constexpr std::array<std::string_view, 13> map{
        "2","3","4","5","6","7","8","9","T","J","Q","K","A"
    };
    return map[static_cast<size_t>(r)];
}

auto s_kind(GameKind const k) -> std::string_view
{
    switch (k)
    {
        case GameKind::Blackjack:    return "Blackjack";
        case GameKind::HighCard:     return "HighCard";
        case GameKind::Slapjack:     return "Slapjack";
        case GameKind::GuessTheCard: return "GuessTheCard";
    }
    return "?";
}

auto s_outcome(MoveOutcome const m) -> std::string_view
{
    switch (m)
    {
        case MoveOutcome::Ignored:    return "Ignored";
        case MoveOutcome::Applied:    return "Applied";
        case MoveOutcome::RoundEnded: return "RoundEnded";
        case MoveOutcome::GameEnded:  return "GameEnded";
    }
    return "?";
}

auto s_verdict(Verdict const v) -> std::string_view
{
    switch (v)
    {
        case Verdict::None:       return "-";
        case Verdict::PlayerWins: return "PlayerWins";
        case Verdict::DealerWins: return "DealerWins";
        case Verdict::Tie:        return "Tie";
        case Verdict::Correct:    return "Correct";
        case Verdict::Wrong:      return "Wrong";
    }
    return "?";
}

auto s_cards(std::vector<Card> const& cards) -> std::string
{
    std::string body;
    for (size_t i{}; i < cards.size(); ++i)
    {
        body += (i ? "," : "");
        body += cardsim::core::debug::ShortCard(cards[i]);
    }
    return body;
}

} // anonymous namespace

namespace cardsim::core::debug
{

auto ShortCard(Card const& c) -> std::string
{
    return std::format("{}{}", s_rank(c.rank), s_suit(c.suit));
}

auto DescribeAction(PlayerAction const& a) -> std::string
{
    return std::visit(
        [&]<typename T0>(T0 const& act) -> std::string
        {
            using T = std::decay_t<T0>;

            if constexpr (std::is_same_v<T, DealAction>)             return "Deal";
            else if constexpr (std::is_same_v<T, HitAction>)         return "Hit";
            else if constexpr (std::is_same_v<T, StandAction>)       return "Stand";
            else if constexpr (std::is_same_v<T, ShuffleAction>)     return "Shuffle";
            else if constexpr (std::is_same_v<T, ResetDeckAction>)   return "ResetDeck";
            else if constexpr (std::is_same_v<T, DrawPlayerAction>)  return "DrawForPlayer";
            else if constexpr (std::is_same_v<T, DrawDealerAction>)  return "DrawForDealer";
            else if constexpr (std::is_same_v<T, FlipAction>)        return "Flip";
            else if constexpr (std::is_same_v<T, SlapAction>)        return "Slap";
            else if constexpr (std::is_same_v<T, ReactionTickAction>)
                return std::format("ReactionTick({}ms)", act.elapsed.count());
            else if constexpr (std::is_same_v<T, SetWindowAction>)
                return std::format("SetWindow({}ms)", act.window.count());
            else if constexpr (std::is_same_v<T, GuessAction>)
                return std::format("Guess(\"{}\")", act.text);
            else
                return "NewGame";
        },
        a
    );
}

auto DescribeSnapshot(TableSnapshot const& s) -> std::string
{
    std::string line = std::format(
        "phase={} deck={} {}=[{}]({}) {}=[{}]({})",
        s.phase,
        s.deck_size,
        s.player.owner, s_cards(s.player.cards), s.player.score,
        s.dealer.owner, s_cards(s.dealer.cards), s.dealer.score
    );
    if (s.active_suit) line += std::format(" suit={}", s_suit(*s.active_suit));
    if (s.face_up) line += std::format(" up={}{}", ShortCard(*s.face_up), s.reaction_live ? "*" : "");
    return line;
}

AuditLogger::AuditLogger(std::string path)
    : out_(std::move(path), std::ios::out | std::ios::trunc)
{
}

AuditLogger::~AuditLogger() = default;

auto AuditLogger::start(Table const& table, std::uint64_t seed) -> void
{
    out_ << std::format("Game={}\n", s_kind(table.Kind()));
    out_ << std::format("Seed={}\n", seed);
    out_ << std::format("Deck={}\n", table.DeckView().Size());
    out_.flush();
}

auto AuditLogger::action(PlayerAction const& a) -> void
{
    out_ << std::format("Action: {}\n", DescribeAction(a));
}

auto AuditLogger::result(ActionResult const& r) -> void
{
    if (!r)
    {
        out_ << std::format("Refused: {}\n", cardsim::core::error::describe(r.error()));
        return;
    }

    out_ << std::format("Outcome: {} verdict={}\n", s_outcome(r->outcome), s_verdict(r->verdict));
    for (std::string const& m : r->messages)
    {
        out_ << std::format("  > {}\n", m);
    }
    if (r->snapshot)
    {
        out_ << std::format("Table: {}\n", DescribeSnapshot(*r->snapshot));
    }
}

auto AuditLogger::end(Table const& table) -> void
{
    out_ << std::format("Final: {}\n", DescribeSnapshot(*table.Snapshot()));
    out_.flush();
}

} // namespace cardsim::core::debug
