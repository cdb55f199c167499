//
// AuditLogger.hpp
//

#ifndef MINDGAME_AUDITLOGGER_HPP
#define MINDGAME_AUDITLOGGER_HPP

#include <cstdint>
#include <fstream>
#include <string>

#include "../core/Game.hpp"
#include "../core/State.hpp"
#include "../core/Actions.hpp"
#include "../core/Types.hpp"

namespace mind::core::debug
{
    // Plain-text transcript of one game; one line per event.
    class AuditLogger
    {
    public:
        explicit AuditLogger(std::string path);
        ~AuditLogger();

        AuditLogger(AuditLogger const&) = delete;
        auto operator=(AuditLogger const&) -> AuditLogger& = delete;

        AuditLogger(AuditLogger&&) noexcept = default;
        auto operator=(AuditLogger&&) noexcept -> AuditLogger& = default;

        [[nodiscard]]
        auto is_open() const -> bool { return out_.is_open(); }

        // Session header (seed, player count, lives/stars)
        auto start(GameImpl const& game) -> void;

        // Hands as dealt, written whenever a level starts
        auto level(GameImpl const& game) -> void;

        // Per action (before Submit): actor seat and proposed action
        auto action(std::uint8_t actor, PlayerAction const& a) -> void;

        // Per accepted action (after Submit)
        auto outcome(MoveResult const& r, GameImpl const& game) -> void;

        // Rejected action
        auto rejected(error::RuleViolation const& v) -> void;

        // Game end footer
        auto end(GameImpl const& game) -> void;

        // Manual flush
        auto flush() -> void;

    private:
        std::ofstream out_;
    };
}

#endif //MINDGAME_AUDITLOGGER_HPP
