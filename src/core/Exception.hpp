//
// Created by Malik T on 14/10/2025.
//

#ifndef CARDSIM_EXCEPTION_HPP
#define CARDSIM_EXCEPTION_HPP

#include "OmegaException.hpp"

#include <expected>
#include <stdexcept>
#include <format>
#include <string_view>
#include <utility>
#include "Types.hpp"

namespace cardsim::core::error
{
    enum class Code : unsigned
    {
        Unknown, // unknown error
        Rules, // rules engine misuse (action routed to the wrong game)
        State, // state engine misuse (not a refused user action)
        Config, // configuration rejected at construction
        Assertion // internal assertion failed
    };

    struct UnknownError : public OmegaException<Code>
    {
        using OmegaException<Code>::OmegaException;
    };

    struct RulesError : public OmegaException<Code>
    {
        using OmegaException<Code>::OmegaException;
    };

    struct StateError : public OmegaException<Code>
    {
        using OmegaException<Code>::OmegaException;
    };

    struct ConfigError : public OmegaException<Code>
    {
        using OmegaException<Code>::OmegaException;
    };

    struct AssertionError : public OmegaException<Code>
    {
        using OmegaException<Code>::OmegaException;
    };

    [[noreturn]]
    inline auto fail(Code c, std::string msg,
                     std::source_location const& loc = std::source_location::current()) -> void
    {
        switch (c)
        {
        case Code::Unknown: throw UnknownError(std::move(msg), c, loc);
        case Code::Rules: throw RulesError(std::move(msg), c, loc);
        case Code::State: throw StateError(std::move(msg), c, loc);
        case Code::Config: throw ConfigError(std::move(msg), c, loc);
        case Code::Assertion: throw AssertionError(std::move(msg), c, loc);
        }
        throw std::runtime_error(msg);
    }

#define CSIM_THROW(code_enum, msg) ::cardsim::core::error::fail((code_enum), (msg))
#define CSIM_ASSERT(cond, msg) do { if(!(cond)) ::cardsim::core::error::fail(::cardsim::core::error::Code::Assertion, (msg)); } while(0)

    // Ordinary refusals the presentation layer shows to the user.
    enum class RuleViolationCode : std::uint16_t
    {
        // Generic/flow
        WrongPhase_RoundInProgress,

        // Deck
        Deck_NotEnoughCards,

        // High Card
        HighCard_PlayerAlreadyDrew,
        HighCard_PlayerMustDrawFirst,
        HighCard_DealerAlreadyDrew,

        // Slapjack
        Slapjack_WindowNotOffered,

        // Guess the Card
        Guess_EmptyInput,
        Guess_NoCardDrawn
    };

    struct RuleViolation
    {
        RuleViolationCode code{};
        std::optional<std::string_view> phase{};

        std::optional<std::size_t> deck_size{};
        std::optional<std::size_t> required{}; // cards the action needs
        std::optional<std::int64_t> window_ms{};

        auto with_phase(std::string_view p) -> RuleViolation&
        {
            phase = p;
            return *this;
        }

        auto with_deck(std::size_t n) -> RuleViolation&
        {
            deck_size = n;
            return *this;
        }

        auto with_required(std::size_t n) -> RuleViolation&
        {
            required = n;
            return *this;
        }

        auto with_window(std::int64_t ms) -> RuleViolation&
        {
            window_ms = ms;
            return *this;
        }
    };

    inline auto to_string(RuleViolationCode c) -> std::string_view
    {
        using E = RuleViolationCode;
        switch (c)
        {
        case E::WrongPhase_RoundInProgress: return "Round already in progress";

        case E::Deck_NotEnoughCards: return "Not enough cards. Please shuffle or reset.";

        case E::HighCard_PlayerAlreadyDrew: return "Player already drew a card!";
        case E::HighCard_PlayerMustDrawFirst: return "Player must draw first!";
        case E::HighCard_DealerAlreadyDrew: return "Dealer already drew a card!";

        case E::Slapjack_WindowNotOffered: return "Slap timer must be one of 1, 1.5, 2, 2.5 or 3 seconds";

        case E::Guess_EmptyInput: return "Guess cannot be empty";
        case E::Guess_NoCardDrawn: return "Draw a card first";
        }
        return "Unknown";
    }

    inline auto describe(RuleViolation const& v) -> std::string
    {
        auto s = std::format("{}", to_string(v.code));
        if (v.phase) s += std::format(" | phase={}", *v.phase);
        if (v.deck_size) s += std::format(" | deck={}", *v.deck_size);
        if (v.required) s += std::format(" | required={}", *v.required);
        if (v.window_ms) s += std::format(" | window={}ms", *v.window_ms);
        return s;
    }

    using ValidateResult = std::expected<void, RuleViolation>;
}

#endif //CARDSIM_EXCEPTION_HPP
