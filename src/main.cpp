//
// Created by Malik T on 18/10/2025.
//

//
// main.cpp: headless harness, one command per stdin line drives a single game
//

#include <charconv>
#include <chrono>
#include <cstdint>
#include <cstdio>
#include <format>
#include <iostream>
#include <memory>
#include <optional>
#include <print>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

#include "core/Blackjack.hpp"
#include "core/HighCard.hpp"
#include "core/Slapjack.hpp"
#include "core/GuessTheCard.hpp"
#include "core/Exception.hpp"
#include "core/Util.hpp"
#include "debug/AuditLogger.hpp"

namespace
{
    using namespace cardsim::core;

    struct HarnessConfig
    {
        GameKind game{GameKind::Blackjack};
        std::optional<std::uint64_t> seed{};
        std::chrono::milliseconds reaction_window{2000};
        std::chrono::milliseconds flip_interval{1500};
        std::string log_path{};
        bool verbose{false};
        bool help{false};
    };

    auto ParseGame(std::string_view name) -> std::optional<GameKind>
    {
        if (name == "blackjack") return GameKind::Blackjack;
        if (name == "highcard")  return GameKind::HighCard;
        if (name == "slapjack")  return GameKind::Slapjack;
        if (name == "guess")     return GameKind::GuessTheCard;
        return std::nullopt;
    }

    auto ParseUint(std::string_view s) -> std::optional<std::uint64_t>
    {
        std::uint64_t v{};
        auto res = std::from_chars(s.data(), s.data() + s.size(), v);
        if (res.ec != std::errc{} || res.ptr != s.data() + s.size()) return std::nullopt;
        return v;
    }

    auto ParseArgs(int argc, char** argv) -> HarnessConfig
    {
        HarnessConfig cfg{};

        for (int i = 1; i < argc; ++i)
        {
            std::string_view arg = argv[i];

            auto next_uint = [&](std::uint64_t& out)
            {
                if (i + 1 >= argc) { return false; }
                std::optional<std::uint64_t> v = ParseUint(argv[++i]);
                if (!v) { return false; }
                out = *v;
                return true;
            };

            if (arg == "--game")
            {
                std::optional<GameKind> kind = (i + 1 < argc) ? ParseGame(argv[++i]) : std::nullopt;
                if (!kind) CSIM_THROW(error::Code::Config, "--game expects blackjack, highcard, slapjack or guess");
                cfg.game = *kind;
            }
            else if (arg == "--seed")
            {
                std::uint64_t v{};
                if (!next_uint(v)) CSIM_THROW(error::Code::Config, "--seed expects an unsigned integer");
                cfg.seed = v;
            }
            else if (arg == "--window_ms")
            {
                std::uint64_t v{};
                if (!next_uint(v)) CSIM_THROW(error::Code::Config, "--window_ms expects milliseconds");
                cfg.reaction_window = std::chrono::milliseconds(v);
            }
            else if (arg == "--flip_ms")
            {
                std::uint64_t v{};
                if (!next_uint(v)) CSIM_THROW(error::Code::Config, "--flip_ms expects milliseconds");
                cfg.flip_interval = std::chrono::milliseconds(v);
            }
            else if (arg == "--log")
            {
                if (i + 1 >= argc) CSIM_THROW(error::Code::Config, "--log expects a path");
                cfg.log_path = argv[++i];
            }
            else if (arg == "--verbose")
            {
                cfg.verbose = true;
            }
            else if (arg == "--help" || arg == "-h")
            {
                cfg.help = true;
            }
            else
            {
                CSIM_THROW(error::Code::Config, std::format("Unknown argument '{}'", arg));
            }
        }
        return cfg;
    }

    auto PrintUsage() -> void
    {
        std::print("usage: cardsim [--game blackjack|highcard|slapjack|guess] [--seed N]\n"
                   "               [--window_ms N] [--flip_ms N] [--log PATH] [--verbose]\n"
                   "commands:\n"
                   "  blackjack: deal hit stand shuffle reset\n"
                   "  highcard:  draw dealer rematch\n"
                   "  slapjack:  flip slap wait <ms> window <ms> newgame\n"
                   "  guess:     draw guess <rank>\n"
                   "  any:       show help quit\n");
    }

    // Command verbs map onto the actions of the running game only.
    auto ParseCommand(GameKind kind, std::string_view verb, std::string_view arg) -> std::optional<PlayerAction>
    {
        switch (kind)
        {
        case GameKind::Blackjack:
            if (verb == "deal")    return DealAction{};
            if (verb == "hit")     return HitAction{};
            if (verb == "stand")   return StandAction{};
            if (verb == "shuffle") return ShuffleAction{};
            if (verb == "reset")   return ResetDeckAction{};
            break;
        case GameKind::HighCard:
            if (verb == "draw")    return DrawPlayerAction{};
            if (verb == "dealer")  return DrawDealerAction{};
            if (verb == "rematch") return NewGameAction{};
            break;
        case GameKind::Slapjack:
            if (verb == "flip")    return FlipAction{};
            if (verb == "slap")    return SlapAction{};
            if (verb == "newgame") return NewGameAction{};
            if (verb == "window")
            {
                std::optional<std::uint64_t> ms = ParseUint(arg);
                if (!ms) return std::nullopt;
                return SetWindowAction{std::chrono::milliseconds(*ms)};
            }
            break;
        case GameKind::GuessTheCard:
            if (verb == "draw")  return DealAction{};
            if (verb == "guess") return GuessAction{std::string(arg)};
            break;
        }
        return std::nullopt;
    }

    auto RenderSeat(SeatView const& seat, bool with_score) -> void
    {
        if (with_score) std::print("{} ({}):", seat.owner, seat.score);
        else std::print("{}:", seat.owner);

        if (seat.cards.empty()) std::print(" -");
        for (size_t i{}; i < seat.cards.size(); ++i)
        {
            std::print("{} {}", i ? "," : "", util::ToString(seat.cards[i]));
        }
        std::print("\n");
    }

    auto RenderSnapshot(TableSnapshot const& s) -> void
    {
        switch (s.kind)
        {
        case GameKind::Blackjack:
        case GameKind::HighCard:
            RenderSeat(s.player, true);
            RenderSeat(s.dealer, true);
            break;
        case GameKind::Slapjack:
            std::print("Score: {} | collected: {} | suit: {} | cards left: {}\n",
                       s.player.score, s.player.cards.size(),
                       s.active_suit ? util::SuitName(*s.active_suit) : "-", s.deck_size);
            break;
        case GameKind::GuessTheCard:
            break;
        }
        std::print("[{} | deck {}]\n", s.phase, s.deck_size);
    }

    auto Report(ActionResult const& r, debug::AuditLogger* log) -> void
    {
        if (log) log->result(r);
        if (!r)
        {
            std::print("{}\n", error::to_string(r.error().code));
            return;
        }
        for (std::string const& m : r->messages)
        {
            std::print("{}\n", m);
        }
        if (r->outcome != MoveOutcome::Ignored && r->snapshot) RenderSnapshot(*r->snapshot);
    }

    using GameHandle = std::variant<std::unique_ptr<BlackjackGame>,
                                    std::unique_ptr<HighCardGame>,
                                    std::unique_ptr<SlapjackGame>,
                                    std::unique_ptr<GuessTheCardGame>>;

    auto MakeGame(GameKind kind, Config const& cfg) -> GameHandle
    {
        switch (kind)
        {
        case GameKind::Blackjack:    return std::make_unique<BlackjackGame>(cfg);
        case GameKind::HighCard:     return std::make_unique<HighCardGame>(cfg);
        case GameKind::Slapjack:     return std::make_unique<SlapjackGame>(cfg);
        case GameKind::GuessTheCard: return std::make_unique<GuessTheCardGame>(cfg);
        }
        CSIM_THROW(error::Code::Config, "Unknown game");
    }

    auto TableOf(GameHandle& game) -> Table&
    {
        return std::visit([](auto& g) -> Table& { return g->TableRef(); }, game);
    }

    auto Run(HarnessConfig const& hc) -> int
    {
        Config cfg{};
        if (hc.seed) cfg.seed = *hc.seed;
        cfg.reaction_window = hc.reaction_window;
        cfg.flip_interval = hc.flip_interval;
        cfg.log_violations = hc.verbose;

        GameHandle game = MakeGame(hc.game, cfg);
        Table& table = TableOf(game);

        std::unique_ptr<debug::AuditLogger> log;
        if (!hc.log_path.empty())
        {
            log = std::make_unique<debug::AuditLogger>(hc.log_path);
            if (!log->IsOpen())
            {
                std::print(stderr, "[cardsim] cannot open log file '{}'\n", hc.log_path);
                return 1;
            }
            log->start(table, cfg.seed);
        }

        if (hc.game == GameKind::Slapjack)
        {
            std::print("Game started! Watch for Jacks and SLAP!\n");
            std::print("Current suit: {}\n", util::SuitName(table.Snapshot()->active_suit.value_or(Suit::Hearts)));
        }

        std::string line;
        while (std::getline(std::cin, line))
        {
            std::string_view text = util::Trim(line);
            if (text.empty()) continue;

            size_t const split = text.find(' ');
            std::string_view const verb = text.substr(0, split);
            std::string_view const arg = split == std::string_view::npos ? std::string_view{} : util::Trim(text.substr(split + 1));

            if (verb == "quit" || verb == "exit") break;
            if (verb == "help") { PrintUsage(); continue; }
            if (verb == "show") { RenderSnapshot(*table.Snapshot()); continue; }

            if (verb == "wait")
            {
                auto* slap = std::get_if<std::unique_ptr<SlapjackGame>>(&game);
                std::optional<std::uint64_t> ms = ParseUint(arg);
                if (!slap || !ms)
                {
                    std::print("wait <ms> is only available in slapjack\n");
                    continue;
                }
                for (ClockEvent& ev : (*slap)->AdvanceTime(std::chrono::milliseconds{*ms}))
                {
                    if (log) log->action(ev.action);
                    Report(ActionResult{std::move(ev.report)}, log.get());
                }
                continue;
            }

            std::optional<PlayerAction> action = ParseCommand(hc.game, verb, arg);
            if (!action)
            {
                std::print("unknown command '{}', try help\n", text);
                continue;
            }
            if (log) log->action(*action);
            Report(table.Step(*action), log.get());
        }

        if (log) log->end(table);
        return 0;
    }
}

int main(int argc, char** argv)
{
    using namespace cardsim::core;

    try
    {
        HarnessConfig const hc = ParseArgs(argc, argv);
        if (hc.help)
        {
            PrintUsage();
            return 0;
        }
        return Run(hc);
    }
    catch (error::ConfigError const& e)
    {
        std::print(stderr, "[cardsim] {}\n", e.what());
        PrintUsage();
        return 2;
    }
    catch (OmegaException<error::Code> const& e)
    {
        std::print(stderr, "[cardsim] {}", e);
        return 1;
    }
}
