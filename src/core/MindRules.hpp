//
// MindRules.hpp
//

#ifndef MINDGAME_MINDRULES_HPP
#define MINDGAME_MINDRULES_HPP
#include "Rules.hpp"

namespace mind::core
{
    // Cooperative ascending-order rules: any seat may act at any time.
    class MindRules final : public Rules
    {
    public:
        auto Validate(GameImpl const& game, PlyrIdxT actor, PlayerAction const& a) const -> CheckResult override;
        auto Apply(GameImpl& game, PlyrIdxT actor, PlayerAction const& a) -> MoveEffect override;
        auto Advance(GameImpl& game, MoveEffect const& effect) -> MoveOutcome override;
    };
}

#endif //MINDGAME_MINDRULES_HPP
