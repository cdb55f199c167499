//
// Types.hpp
//

#ifndef MINDGAME_TYPES_HPP
#define MINDGAME_TYPES_HPP

#define MND_ENABLE_TEST_HOOKS true

#include <cstdint>
#include <cstddef>
#include <memory>
#include <optional>
#include <vector>
#include <array>
#include <chrono>
#include <random>
#include <variant>

namespace mind::core::constants
{
    inline constexpr std::uint8_t CardMin = 1;
    inline constexpr std::uint8_t CardMax = 100;
    inline constexpr std::size_t DeckSize = CardMax - CardMin + 1;

    inline constexpr std::uint8_t MaxLevel = 12;
    inline constexpr std::uint8_t MinPlayers = 2;
    inline constexpr std::uint8_t MaxPlayers = 4;
}

namespace mind::core
{
    // A card is just its face value, 1..100
    using CardT = std::uint8_t;
    using HandT = std::vector<CardT>;
    using PlyrIdxT = std::uint8_t;

    struct PlayerLimits
    {
        std::uint8_t lives;
        std::uint8_t stars;
    };

    // Indexed by player count; only 2..4 are valid
    inline constexpr std::array<PlayerLimits, constants::MaxPlayers + 1> LimitsByPlayers{{
        {0, 0},
        {0, 0},
        {2, 1},
        {3, 1},
        {4, 1},
    }};

    struct Config
    {
        std::uint32_t n_players{2};
        std::uint8_t  start_level{1};
        std::uint64_t seed{std::random_device{}()};
    };

    inline auto ValidPlayerCount(std::uint32_t n) noexcept -> bool
    {
        return n >= constants::MinPlayers && n <= constants::MaxPlayers;
    }

    inline auto ValidCard(int c) noexcept -> bool
    {
        return c >= constants::CardMin && c <= constants::CardMax;
    }
}

#endif //MINDGAME_TYPES_HPP
