//
// RandomAi.cpp
//

#include "RandomAi.hpp"
#include <algorithm>
#include <random>

#include "Exception.hpp"

namespace mind::core
{
    RandomAI::RandomAI(uint64_t rng_seed, double blunder_rate, double star_rate):
        rng_(static_cast<std::mt19937::result_type>(rng_seed)),
        blunder_rate_(blunder_rate),
        star_rate_(star_rate) {}

    auto RandomAI::Choose(GameSnapshot const& s) -> PlayerAction
    {
        if (s.status == GameStatus::LevelClear)
        {
            return AdvanceLevelAction{};
        }

        if (s.status != GameStatus::InProgress || s.my_hand.empty())
        {
            // nothing sensible to do; the engine will reject it
            return AdvanceLevelAction{};
        }

        if (s.stars > 0 && roll() < star_rate_)
        {
            return ThrowStarAction{};
        }

        if (roll() < blunder_rate_)
        {
            return PlayCardAction{s.my_hand[pick(s.my_hand)]};
        }

        MND_ASSERT(std::ranges::is_sorted(s.my_hand), "Snapshot hand should be sorted");
        return PlayCardAction{s.my_hand.front()};
    }
}
