#ifndef TENNISSIM_CODEC_HPP
#define TENNISSIM_CODEC_HPP

#include <cstddef>   // std::byte
#include <cstdint>
#include <optional>
#include <span>
#include <variant>
#include <vector>
#include <string>
#include <expected>
#include <flatbuffers/flatbuffers.h>

#include "../core/Types.hpp"
#include "../core/Actions.hpp"
#include "../core/State.hpp"
#include "../core/Profile.hpp"
#include "../core/Exception.hpp"

#include "generated/flatbuffers/tennis_net_generated.h"

namespace tennis::core::net
{
    // Lightweight local parse error
    struct ParseError
    {
        std::string message;
    };

    // ----- Decoded client commands -----

    // Empty optionals fall back to the server defaults.
    struct StartCommand
    {
        std::uint64_t msg_id{};
        std::optional<std::uint8_t> best_of_sets{};
        std::optional<std::uint64_t> seed{};
        bool final_set_tiebreak{true};
        // Drawn from the seed when empty
        std::optional<PlayerId> first_server{PlayerId::Human};
        std::optional<Profile> player{};
        std::optional<Profile> opponent{};
        std::optional<PlayStyle> opponent_style{};
    };

    struct ServeCommand
    {
        std::uint64_t msg_id{};
        ServeKind kind{};
    };

    struct ShotCommand
    {
        std::uint64_t msg_id{};
        ShotType shot{};
    };

    struct ContinueCommand
    {
        std::uint64_t msg_id{};
    };

    using Command = std::variant<StartCommand, ServeCommand, ShotCommand, ContinueCommand>;

    // ----- Decoded server replies -----

    struct UpdateReply
    {
        std::uint64_t msg_id{};
        RallyUpdate update{};
    };

    struct ViolationReply
    {
        std::uint64_t msg_id{};
        error::RuleViolationCode code{};
        error::ViolationKind kind{};
        std::string text;
    };

    struct ErrorReply
    {
        std::uint64_t msg_id{};
        std::string text;
    };

    using Reply = std::variant<UpdateReply, ViolationReply, ErrorReply>;

    // Enum mapping. Inbound values are range checked: FlatBuffers does not.
    auto ToFbShot(ShotType s) noexcept -> tennis::gen::net::ShotType;
    auto ToFbZone(CourtZone z) noexcept -> tennis::gen::net::CourtZone;
    auto ToFbStyle(PlayStyle s) noexcept -> tennis::gen::net::PlayStyle;
    auto ToFbPlayer(PlayerId p) noexcept -> tennis::gen::net::PlayerId;
    auto ToFbPhase(Phase p) noexcept -> tennis::gen::net::Phase;

    auto FromFbShot(tennis::gen::net::ShotType s) noexcept -> std::optional<ShotType>;
    auto FromFbZone(tennis::gen::net::CourtZone z) noexcept -> std::optional<CourtZone>;
    auto FromFbStyle(tennis::gen::net::PlayStyle s) noexcept -> std::optional<PlayStyle>;
    auto FromFbPlayer(tennis::gen::net::PlayerId p) noexcept -> std::optional<PlayerId>;
    auto FromFbPhase(tennis::gen::net::Phase p) noexcept -> std::optional<Phase>;

    // --- Client -> server builders ---

    auto BuildStartMatch(StartCommand const& cmd) -> flatbuffers::DetachedBuffer;
    auto BuildServe(ServeKind kind, std::uint64_t msg_id) -> flatbuffers::DetachedBuffer;
    auto BuildShot(ShotType shot, std::uint64_t msg_id) -> flatbuffers::DetachedBuffer;
    auto BuildContinue(std::uint64_t msg_id) -> flatbuffers::DetachedBuffer;

    // --- Server -> client builders ---

    auto BuildUpdate(RallyUpdate const& u, std::uint64_t msg_id) -> flatbuffers::DetachedBuffer;
    auto BuildViolation(error::RuleViolation const& v, std::uint64_t msg_id) -> flatbuffers::DetachedBuffer;
    auto BuildError(std::string const& text, std::uint64_t msg_id) -> flatbuffers::DetachedBuffer;

    // --- Inbound decode (verified envelope -> value types) ---

    auto DecodeCommand(std::span<std::byte const> bytes) -> std::expected<Command, ParseError>;
    auto DecodeReply(std::span<std::byte const> bytes) -> std::expected<Reply, ParseError>;

    inline auto AsBytes(flatbuffers::DetachedBuffer const& buf) -> std::span<std::byte const>
    {
        return {reinterpret_cast<std::byte const*>(buf.data()), buf.size()};
    }
} // namespace tennis::core::net


#endif //TENNISSIM_CODEC_HPP
