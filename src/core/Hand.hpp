//
// Created by Malik T on 14/10/2025.
//

#ifndef CARDSIM_HAND_HPP
#define CARDSIM_HAND_HPP

#include <span>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "Types.hpp"

namespace cardsim::core
{
    // Cards held by one participant. Insertion order is kept for display only.
    template <typename T>
    class Hand
    {
    public:
        explicit Hand(std::string owner) : owner_(std::move(owner)) {}

        auto Add(T card) -> void { cards_.push_back(std::move(card)); }
        auto Clear() noexcept -> void { cards_.clear(); }

        [[nodiscard]] auto Owner() const noexcept -> std::string_view { return owner_; }
        [[nodiscard]] auto Size() const noexcept -> size_t { return cards_.size(); }
        [[nodiscard]] auto Empty() const noexcept -> bool { return cards_.empty(); }
        auto Cards() const noexcept -> std::span<T const> { return cards_; }
        auto At(size_t idx) const -> T const& { return cards_.at(idx); }

    private:
        std::string owner_;
        std::vector<T> cards_;
    };

    using CardHand = Hand<Card>;
}

#endif //CARDSIM_HAND_HPP
