//
// Created by Malik T on 14/10/2025.
//

#ifndef CARDSIM_UTIL_HPP
#define CARDSIM_UTIL_HPP

#include <algorithm>
#include <array>
#include <cctype>
#include <format>
#include <string>
#include <string_view>
#include "Types.hpp"

namespace cardsim::core::util
{
    inline auto RankName(Rank const r) -> std::string_view
    {
        static constexpr std::array<std::string_view, constants::SuitSize> map{
            "2", "3", "4", "5", "6", "7", "8", "9", "10", "Jack", "Queen", "King", "Ace"
        };
        return map[static_cast<size_t>(r)];
    }

    inline auto SuitName(Suit const s) -> std::string_view
    {
        switch (s)
        {
            case Suit::Hearts:   return "Hearts";
            case Suit::Diamonds: return "Diamonds";
            case Suit::Clubs:    return "Clubs";
            case Suit::Spades:   return "Spades";
        }
        return "?";
    }

    inline auto ToString(Card const& c) -> std::string
    {
        return std::format("{} of {}", RankName(c.rank), SuitName(c.suit));
    }

    inline auto Trim(std::string_view s) -> std::string_view
    {
        auto const is_space = [](char ch) { return std::isspace(static_cast<unsigned char>(ch)) != 0; };
        while (!s.empty() && is_space(s.front())) s.remove_prefix(1);
        while (!s.empty() && is_space(s.back())) s.remove_suffix(1);
        return s;
    }

    inline auto EqualsIgnoreCase(std::string_view a, std::string_view b) -> bool
    {
        return std::ranges::equal(a, b, [](char x, char y)
        {
            return std::tolower(static_cast<unsigned char>(x)) == std::tolower(static_cast<unsigned char>(y));
        });
    }

    inline auto CardToUID(Card const& c) -> uint64_t
    {
        return static_cast<uint64_t>(c.suit) * constants::SuitSize + static_cast<uint64_t>(c.rank);
    }
    class CardUniqueChecker
    {
    public:
        CardUniqueChecker():
            cards_(0), contains_dup_(false), count_(0) {}
        auto Add(Card const& c) -> void
        {
            uint64_t const card = uint64_t{1} << CardToUID(c);
            contains_dup_ |= static_cast<bool>(cards_ & card);
            cards_ |= card;
            ++count_;
        }
        [[nodiscard]]
        auto ContainsDup() const -> bool
        {
            return contains_dup_;
        }
        [[nodiscard]]
        auto Count() const -> size_t
        {
            return count_;
        }
    private:
        uint64_t cards_;
        bool contains_dup_;
        size_t count_;
    };
}

#endif //CARDSIM_UTIL_HPP
