//
// Rules.hpp
//

#ifndef MINDGAME_RULES_HPP
#define MINDGAME_RULES_HPP

#include "Actions.hpp"
#include "State.hpp"
#include "Types.hpp"
#include "Exception.hpp"

namespace mind::core
{
    //forward declaration
    class GameImpl;

    class Rules
    {
    public:
        using CheckResult = error::ValidateResult;

        virtual ~Rules() = default;

        // Returns unexpected(reason) for ordinary rule violations (NOT exceptions).
        // Throw only for engine misuse / broken invariants.
        virtual auto Validate(GameImpl const& game, PlyrIdxT actor, PlayerAction const& a) const -> CheckResult = 0;

        // Mutate authoritative state (hand -> pile / discard). Only called after Validate succeeded.
        virtual auto Apply(GameImpl& game, PlyrIdxT actor, PlayerAction const& a) -> MoveEffect = 0;

        // Settle status transitions caused by the applied effect.
        virtual auto Advance(GameImpl& game, MoveEffect const& effect) -> MoveOutcome = 0;
    };
}

#endif //MINDGAME_RULES_HPP
