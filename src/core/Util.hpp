//
// Util.hpp
//

#ifndef MINDGAME_UTIL_HPP
#define MINDGAME_UTIL_HPP

#include <algorithm>
#include <bitset>
#include <format>
#include <functional>
#include <span>
#include <string>
#include "Types.hpp"

namespace mind::core::util
{
    inline auto IsStrictlyIncreasing(std::span<CardT const> cards) -> bool
    {
        return std::ranges::adjacent_find(cards, std::greater_equal<>{}) == cards.end();
    }

    // "3,17,42"
    inline auto JoinCards(std::span<CardT const> cards) -> std::string
    {
        std::string body;
        for (size_t i{}; i < cards.size(); ++i)
        {
            body += (i ? "," : "");
            body += std::format("{}", static_cast<int>(cards[i]));
        }
        return body;
    }

    class CardUniqueChecker
    {
    public:
        CardUniqueChecker():
            contains_dup_(false), out_of_range_(false) {}
        auto Add(CardT const c) -> void
        {
            if (!ValidCard(c))
            {
                out_of_range_ = true;
                return;
            }
            contains_dup_ |= cards_.test(c);
            cards_.set(c);
        }
        [[nodiscard]]
        auto ContainsDup() const -> bool
        {
            return contains_dup_;
        }
        [[nodiscard]]
        auto OutOfRange() const -> bool
        {
            return out_of_range_;
        }
        [[nodiscard]]
        auto Count() const -> size_t
        {
            return cards_.count();
        }
    private:
        std::bitset<constants::CardMax + 1> cards_;
        bool contains_dup_;
        bool out_of_range_;
    };
}

#endif //MINDGAME_UTIL_HPP
