//
// Created by Malik T on 12/10/2025.
//

#ifndef TENNISSIM_SESSION_HPP
#define TENNISSIM_SESSION_HPP

#include <cstddef>
#include <cstdint>
#include <memory>
#include <optional>
#include <span>
#include <string>

#include <flatbuffers/flatbuffers.h>

#include "../core/Match.hpp"
#include "../debug/MatchLogger.hpp"
#include "codec.hpp"

namespace tennis::core::net
{
    // Server-side defaults a StartMatchMsg may override.
    struct SessionOptions
    {
        std::uint8_t best_of_sets{3};
        std::optional<std::uint64_t> seed{};
        bool final_set_tiebreak{true};
        // Transcripts go here when set, one file per match.
        std::optional<std::string> log_dir{};
    };

    // One connection: decodes a command, makes exactly one engine call and
    // builds the reply. Owns at most one match at a time. No sockets here.
    class Session
    {
    public:
        Session(std::uint64_t id, SessionOptions opts);

        auto Handle(std::span<std::byte const> bytes) -> flatbuffers::DetachedBuffer;

        [[nodiscard]]
        auto HasMatch() const noexcept -> bool { return match_ != nullptr; }

        // nullptr before the first StartMatchMsg, and after an internal error
        [[nodiscard]]
        auto CurrentMatch() const noexcept -> Match const* { return match_.get(); }

        [[nodiscard]]
        auto Id() const noexcept -> std::uint64_t { return id_; }

#if TNS_ENABLE_TEST_HOOKS == true
        // Test-only
        auto MutableMatch() noexcept -> Match* { return match_.get(); }
#endif

    private:
        auto Dispatch(Command const& command) -> flatbuffers::DetachedBuffer;
        auto OnStart(StartCommand const& cmd) -> flatbuffers::DetachedBuffer;
        auto Reply(error::Result<RallyUpdate> const& r, std::uint64_t msg_id) -> flatbuffers::DetachedBuffer;

    private:
        std::uint64_t id_;
        SessionOptions opts_;
        MatchHandle match_;
        std::unique_ptr<debug::MatchLogger> log_;
    };
}

#endif //TENNISSIM_SESSION_HPP
