#include "AuditLogger.hpp"

#include <format>
#include <string_view>
#include <vector>

#include "../core/Util.hpp"

using namespace mind::core;

namespace
{

auto s_outcome(MoveOutcome const m) -> std::string_view
{
    switch (m)
    {
        case MoveOutcome::Invalid:      return "Invalid";
        case MoveOutcome::Applied:      return "Applied";
        case MoveOutcome::Mistake:      return "Mistake";
        case MoveOutcome::LevelCleared: return "LevelCleared";
        case MoveOutcome::LevelStarted: return "LevelStarted";
        case MoveOutcome::GameWon:      return "GameWon";
        case MoveOutcome::GameLost:     return "GameLost";
    }
    return "?";
}

auto s_action(PlayerAction const& a) -> std::string
{
    return std::visit(
        [&]<typename T0>(T0 const& act) -> std::string
        {
            using T = std::decay_t<T0>;

            if constexpr (std::is_same_v<T, PlayCardAction>)
            {
                return std::format("Play({})", act.card);
            }
            else if constexpr (std::is_same_v<T, ThrowStarAction>)
            {
                return "Star";
            }
            else
            {
                return "Advance";
            }
        },
        a
    );
}

auto s_seat_cards(std::vector<SeatCard> const& cards) -> std::string
{
    std::string body;
    for (size_t i{}; i < cards.size(); ++i)
    {
        body += std::format("{}P{}:{}", (i ? "," : ""), cards[i].seat, cards[i].card);
    }
    return body;
}

} // anonymous namespace

namespace mind::core::debug
{

AuditLogger::AuditLogger(std::string path)
    : out_(std::move(path), std::ios::out | std::ios::trunc)
{
}

AuditLogger::~AuditLogger() = default;

auto AuditLogger::start(GameImpl const& game) -> void
{
    out_ << std::format("Seed={}\n", game.Seed());
    out_ << std::format("Players={}\n", static_cast<int>(game.PlayerCount()));
    out_ << std::format("Lives={} Stars={}\n", game.Lives(), game.Stars());
    out_.flush();
}

auto AuditLogger::level(GameImpl const& game) -> void
{
    out_ << std::format("Level {}\n", game.Level());
    for (PlyrIdxT i = 0; i < game.PlayerCount(); ++i)
    {
        out_ << std::format("  P{}=[{}]\n", i, util::JoinCards(game.HandOf(i)));
    }
}

auto AuditLogger::action(std::uint8_t actor, PlayerAction const& a) -> void
{
    out_ << std::format("Action P{}: {}\n", actor, s_action(a));
}

auto AuditLogger::outcome(MoveResult const& r, GameImpl const& game) -> void
{
    out_ << std::format(
        "Outcome: {} pile=[{}] lives={} stars={}",
        s_outcome(r.outcome),
        util::JoinCards(game.Pile()),
        game.Lives(),
        game.Stars()
    );
    if (!r.effect.discarded.empty())
    {
        out_ << std::format(" discarded=[{}]", s_seat_cards(r.effect.discarded));
    }
    out_ << '\n';

    if (r.outcome == MoveOutcome::LevelStarted)
    {
        level(game);
    }
}

auto AuditLogger::rejected(error::RuleViolation const& v) -> void
{
    out_ << std::format("Rejected: {}\n", error::describe(v));
}

auto AuditLogger::end(GameImpl const& game) -> void
{
    out_ << std::format("Result={} level={} lives={}\n",
                        error::to_string(game.Status()), game.Level(), game.Lives());
    out_.flush();
}

auto AuditLogger::flush() -> void
{
    out_.flush();
}

}
