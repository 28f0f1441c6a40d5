//
// Created by Malik T on 10/10/2025.
//

#ifndef TENNISSIM_MATCHLOGGER_HPP
#define TENNISSIM_MATCHLOGGER_HPP

#include <cstdint>
#include <fstream>
#include <string>

#include "../core/Match.hpp"
#include "../core/State.hpp"
#include "../core/Actions.hpp"
#include "../core/Exception.hpp"
#include "../core/Types.hpp"

namespace tennis::core::debug
{
    // Plain-text match transcript. Driven by the caller, the engine never logs.
    class MatchLogger
    {
    public:
        explicit MatchLogger(std::string path);
        ~MatchLogger();

        MatchLogger(MatchLogger const&) = delete;
        auto operator=(MatchLogger const&) -> MatchLogger& = delete;

        MatchLogger(MatchLogger&&) noexcept = default;
        auto operator=(MatchLogger&&) noexcept -> MatchLogger& = default;

        [[nodiscard]]
        auto is_open() const -> bool { return out_.is_open(); }

        // Header (seed, format, first server, both profiles)
        auto start(Match const& match) -> void;

        // One line per resolved shot, plus a score line when a point ends
        auto update(RallyUpdate const& u) -> void;

        // Rejected call
        auto violation(error::RuleViolation const& v) -> void;

        // Engine exception that ended the match early
        auto internal_error(std::string const& what) -> void;

        // Footer (winner, statistics)
        auto end(Match const& match) -> void;

        // Manual flush
        auto flush() -> void;

    private:
        std::ofstream out_;
    };
}

#endif //TENNISSIM_MATCHLOGGER_HPP
