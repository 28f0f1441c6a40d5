//
// Created by Malik T on 02/10/2025.
//

#ifndef TENNISSIM_EXCEPTION_HPP
#define TENNISSIM_EXCEPTION_HPP

#include "OmegaException.hpp"

#include <cstdint>
#include <expected>
#include <optional>
#include <source_location>
#include <stdexcept>
#include <string>
#include <string_view>
#include <utility>
#include "Types.hpp"
#include "Actions.hpp"
#include "Util.hpp"

namespace tennis::core::error
{
    enum class Code : unsigned
    {
        Unknown, // unknown error
        Rules, // rules engine misuse (not user invalid move)
        State, // state engine misuse (not user invalid move)
        MalformedProfile, // attribute struct rejected at match start
        Assertion // internal assertion failed
    };

    struct UnknownError : public OmegaException<Code>
    {
        using OmegaException<Code>::OmegaException;
    };

    struct RulesError : public OmegaException<Code>
    {
        using OmegaException<Code>::OmegaException;
    };

    struct StateError : public OmegaException<Code>
    {
        using OmegaException<Code>::OmegaException;
    };

    struct MalformedProfileError : public OmegaException<Code>
    {
        using OmegaException<Code>::OmegaException;
    };

    struct AssertionError : public OmegaException<Code>
    {
        using OmegaException<Code>::OmegaException;
    };

    [[noreturn]]
    inline auto fail(Code c, std::string msg,
                     std::source_location const& loc = std::source_location::current()) -> void
    {
        switch (c)
        {
        case Code::Unknown: throw UnknownError(std::move(msg), c, loc);
        case Code::Rules: throw RulesError(std::move(msg), c, loc);
        case Code::State: throw StateError(std::move(msg), c, loc);
        case Code::MalformedProfile: throw MalformedProfileError(std::move(msg), c, loc);
        case Code::Assertion: throw AssertionError(std::move(msg), c, loc);
        }
        throw std::runtime_error(msg);
    }

#define TNS_THROW(code_enum, msg) ::tennis::core::error::fail((code_enum), (msg))
#define TNS_ASSERT(cond, msg) do { if(!(cond)) ::tennis::core::error::fail(::tennis::core::error::Code::Assertion, (msg)); } while(0)

    // The two kinds a caller has to tell apart.
    enum class ViolationKind : std::uint8_t
    {
        InvalidShotForZone, // resubmit a different shot
        InvalidOperation // nothing the caller can play fixes it right now
    };

    // Fine-grained reasons; grouped by action type.
    enum class RuleViolationCode : std::uint16_t
    {
        // Match/flow
        Match_Finished,
        WrongActor_HumanRequired,
        WrongActor_OpponentRequired,

        // Serve
        Serve_NotServing,
        Serve_FirstRequired,
        Serve_SecondRequired,

        // Shot
        Shot_ServeRequired,
        Shot_ServeInRally,
        Shot_IllegalFromZone,

        // Safety net
        Internal_Unreachable
    };

    inline constexpr auto KindOf(RuleViolationCode const c) noexcept -> ViolationKind
    {
        return (c == RuleViolationCode::Shot_IllegalFromZone || c == RuleViolationCode::Shot_ServeInRally)
                   ? ViolationKind::InvalidShotForZone
                   : ViolationKind::InvalidOperation;
    }

    // Compact, optional context carried with the violation.
    struct RuleViolation
    {
        RuleViolationCode code{};
        std::optional<Phase> phase{};
        std::optional<PlayerId> actor{};
        std::optional<ShotType> shot{};
        std::optional<CourtZone> zone{};
        std::optional<ServeKind> serve{};

        [[nodiscard]]
        auto kind() const noexcept -> ViolationKind { return KindOf(code); }

        auto with_phase(Phase p) -> RuleViolation&
        {
            phase = p;
            return *this;
        }

        auto with_actor(PlayerId p) -> RuleViolation&
        {
            actor = p;
            return *this;
        }

        auto with_shot(ShotType s) -> RuleViolation&
        {
            shot = s;
            return *this;
        }

        auto with_zone(CourtZone z) -> RuleViolation&
        {
            zone = z;
            return *this;
        }

        auto with_serve(ServeKind k) -> RuleViolation&
        {
            serve = k;
            return *this;
        }
    };

    inline auto to_string(RuleViolationCode c) -> std::string_view
    {
        using E = RuleViolationCode;
        switch (c)
        {
        case E::Match_Finished: return "Match: already finished";
        case E::WrongActor_HumanRequired: return "Wrong actor (player to play)";
        case E::WrongActor_OpponentRequired: return "Wrong actor (opponent to play)";

        case E::Serve_NotServing: return "Serve: rally already in progress";
        case E::Serve_FirstRequired: return "Serve: first serve expected";
        case E::Serve_SecondRequired: return "Serve: second serve expected";

        case E::Shot_ServeRequired: return "Shot: a serve is expected";
        case E::Shot_ServeInRally: return "Shot: serves cannot be played in a rally";
        case E::Shot_IllegalFromZone: return "Shot: illegal from current zone";

        case E::Internal_Unreachable: return "Internal: unreachable";
        }
        return "Unknown";
    }

    inline auto to_string(ViolationKind k) -> std::string_view
    {
        return k == ViolationKind::InvalidShotForZone ? "InvalidShotForZone" : "InvalidOperation";
    }

    inline auto describe(RuleViolation const& v) -> std::string
    {
        // Build a compact, reproducible message for logs/tests.
        std::string s{to_string(v.kind())};
        s += ": ";
        s += to_string(v.code);
        if (v.phase) { s += " | phase="; s += util::ToString(*v.phase); }
        if (v.actor) { s += " | actor="; s += util::ToString(*v.actor); }
        if (v.shot) { s += " | shot="; s += util::ToString(*v.shot); }
        if (v.zone) { s += " | zone="; s += util::ToString(*v.zone); }
        if (v.serve) { s += " | serve="; s += util::ToString(*v.serve); }
        return s;
    }

    using ValidateResult = std::expected<void, RuleViolation>;

    template <typename T>
    using Result = std::expected<T, RuleViolation>;
}

#endif //TENNISSIM_EXCEPTION_HPP
