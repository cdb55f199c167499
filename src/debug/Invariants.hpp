//
// Invariants.hpp
//

#ifndef MINDGAME_INVARIANTS_HPP
#define MINDGAME_INVARIANTS_HPP

#include "../core/Game.hpp"
#include "../core/Util.hpp"
#include "Inspector.hpp"
#include <algorithm>
#include <format>

namespace mind::core::debug
{
    // A second layer of checks run by self-play after every step. Throws AssertionError
    // so a failing seed reports the broken rule instead of aborting the test binary.
    inline auto CheckInvariants(GameImpl const& g) -> void
    {
#if MND_ENABLE_TEST_HOOKS == false
        (void)g;
#else
    Inspector::SnapshotAll const s = Inspector::Gather(g);

    // 1) Pile strictly increasing
    MND_ASSERT(util::IsStrictlyIncreasing(s.pile), std::format("Pile not increasing: [{}]", util::JoinCards(s.pile)));

    // 2) Hands sorted
    for (auto const& h : s.hands)
    {
        MND_ASSERT(std::ranges::is_sorted(h), "Hand not sorted");
    }

    // 3) Counters within limits
    MND_ASSERT(s.lives <= LimitsByPlayers[s.n_players].lives, "Lives above start value");
    MND_ASSERT(s.stars <= LimitsByPlayers[s.n_players].stars, "Stars above start value");
    MND_ASSERT(s.level >= 1 && s.level <= constants::MaxLevel, "Level outside 1..12");
    MND_ASSERT((s.lives == 0) == (s.status == GameStatus::Lost), "Lives/Lost status disagree");

    // 4) Status matches hand contents
    size_t in_hands{};
    for (auto const& h : s.hands) in_hands += h.size();
    if (s.status == GameStatus::LevelClear)
        MND_ASSERT(in_hands == 0, "Level clear with cards still in hand");
    if (s.status == GameStatus::InProgress)
        MND_ASSERT(in_hands > 0, "In progress with every hand empty");

    // 5) Deep: no duplicate card across zones + total equals deck size
    if (s.status != GameStatus::Setup)
    {
        util::CardUniqueChecker checker{};
        for (CardT c : s.deck)      checker.Add(c);
        for (CardT c : s.pile)      checker.Add(c);
        for (CardT c : s.discarded) checker.Add(c);
        for (auto const& h : s.hands) for (CardT c : h) checker.Add(c);

        MND_ASSERT(!checker.ContainsDup(), "Duplicate card across zones");
        MND_ASSERT(!checker.OutOfRange(), "Card outside 1..100");
        MND_ASSERT(checker.Count() == constants::DeckSize, "Materialized card count != deck size");
    }
#endif // MND_ENABLE_TEST_HOOKS == true
    }
}
#endif //MINDGAME_INVARIANTS_HPP
