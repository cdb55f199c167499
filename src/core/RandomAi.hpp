//
// RandomAi.hpp
//

#ifndef MINDGAME_RANDOMAI_HPP
#define MINDGAME_RANDOMAI_HPP

#include "Actions.hpp"
#include "State.hpp"
#include "Types.hpp"

namespace mind::core
{
    // Seeded bot driving self-play. Mostly plays its own lowest card, sometimes a
    // random one (to provoke mistakes), and occasionally throws a star.
    class RandomAI final
    {
    public:
        explicit RandomAI(uint64_t rng_seed, double blunder_rate = 0.15, double star_rate = 0.05);

        auto Choose(GameSnapshot const& snapshot) -> PlayerAction;

    private:
        template <class Vec>
        auto pick(Vec const& v) -> size_t
        {
            return std::uniform_int_distribution<size_t>{0, v.size() - 1}(rng_);
        }

        auto roll() -> double { return std::uniform_real_distribution<double>{0.0, 1.0}(rng_); }

    private:
        std::mt19937 rng_;
        double blunder_rate_;
        double star_rate_;
    };
}

#endif //MINDGAME_RANDOMAI_HPP
