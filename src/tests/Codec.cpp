#include <gtest/gtest.h>
#include <cstddef>
#include <expected>
#include <span>
#include <string>
#include <variant>
#include <vector>

#include "../core/Exception.hpp"
#include "../core/Profile.hpp"
#include "../core/Types.hpp"
#include "../debug/Inspector.hpp"
#include "../net/Session.hpp"
#include "../net/codec.hpp"

using namespace tennis::core;
using namespace tennis::core::net;

namespace
{
    auto Ask(Session& s, flatbuffers::DetachedBuffer const& msg) -> Reply
    {
        flatbuffers::DetachedBuffer const out = s.Handle(AsBytes(msg));
        std::expected<Reply, ParseError> r = DecodeReply(AsBytes(out));
        EXPECT_TRUE(r.has_value()) << (r ? "" : r.error().message);
        return r ? *r : Reply{ErrorReply{0, "undecodable reply"}};
    }

    auto Start(std::uint64_t seed) -> StartCommand
    {
        StartCommand cmd{};
        cmd.msg_id = 1;
        cmd.seed = seed;
        cmd.first_server = PlayerId::Human;
        return cmd;
    }
}

TEST(Codec, StartCommandSurvivesTheWire)
{
    StartCommand cmd = Start(99);
    cmd.best_of_sets = 5;
    cmd.final_set_tiebreak = false;
    cmd.player = DefaultHumanProfile();
    cmd.opponent_style = PlayStyle::NetRusher;

    flatbuffers::DetachedBuffer const buf = BuildStartMatch(cmd);
    std::expected<Command, ParseError> const decoded = DecodeCommand(AsBytes(buf));
    ASSERT_TRUE(decoded.has_value());
    ASSERT_TRUE(std::holds_alternative<StartCommand>(*decoded));

    StartCommand const& got = std::get<StartCommand>(*decoded);
    EXPECT_EQ(got.best_of_sets, std::optional<std::uint8_t>{5});
    EXPECT_EQ(got.seed, std::optional<std::uint64_t>{99});
    EXPECT_FALSE(got.final_set_tiebreak);
    EXPECT_EQ(got.first_server, PlayerId::Human);
    EXPECT_EQ(got.opponent_style, PlayStyle::NetRusher);
    EXPECT_FALSE(got.opponent.has_value());
    ASSERT_TRUE(got.player.has_value());
    EXPECT_EQ(got.player->strengths, cmd.player->strengths);
    EXPECT_NEAR(got.player->Skill(ShotType::ForehandCrossCourt), 0.8, 1e-6);
}

TEST(Codec, OmittedFieldsUseServerDefaults)
{
    StartCommand cmd{};
    cmd.first_server = std::nullopt;
    std::expected<Command, ParseError> const decoded = DecodeCommand(AsBytes(BuildStartMatch(cmd)));
    ASSERT_TRUE(decoded.has_value());

    StartCommand const& got = std::get<StartCommand>(*decoded);
    EXPECT_FALSE(got.best_of_sets.has_value());
    EXPECT_FALSE(got.seed.has_value());
    EXPECT_FALSE(got.first_server.has_value());
    EXPECT_FALSE(got.player.has_value());
}

TEST(Codec, GarbageIsRejected)
{
    std::vector<std::byte> junk(32, std::byte{0x5A});
    std::expected<Command, ParseError> const decoded = DecodeCommand(junk);
    EXPECT_FALSE(decoded.has_value());

    // A server reply is not a client command.
    flatbuffers::DetachedBuffer const err = BuildError("x", 3);
    EXPECT_FALSE(DecodeCommand(AsBytes(err)).has_value());
}

TEST(Session, StartReturnsInitialState)
{
    Session s{1, SessionOptions{}};
    Reply const r = Ask(s, BuildStartMatch(Start(5)));
    ASSERT_TRUE(std::holds_alternative<UpdateReply>(r));

    UpdateReply const& u = std::get<UpdateReply>(r);
    EXPECT_EQ(u.msg_id, 1u);
    EXPECT_EQ(u.update.phase, Phase::FirstServe);
    EXPECT_EQ(u.update.next_actor, PlayerId::Human);
    EXPECT_EQ(u.update.status, RallyStatus::InProgress);
    EXPECT_FALSE(u.update.last_shot.has_value());
    EXPECT_EQ(u.update.legal_shots, std::vector<ShotType>{ShotType::FirstServe});
    EXPECT_TRUE(s.HasMatch());
}

TEST(Session, CommandsBeforeStartAreErrors)
{
    Session s{2, SessionOptions{}};
    Reply const r = Ask(s, BuildServe(ServeKind::First, 7));
    ASSERT_TRUE(std::holds_alternative<ErrorReply>(r));
    EXPECT_EQ(std::get<ErrorReply>(r).msg_id, 7u);
    EXPECT_FALSE(s.HasMatch());
}

TEST(Session, RuleViolationsComeBackTyped)
{
    Session s{3, SessionOptions{}};
    (void)Ask(s, BuildStartMatch(Start(6)));

    Reply const r = Ask(s, BuildShot(ShotType::Lob, 8));
    ASSERT_TRUE(std::holds_alternative<ViolationReply>(r));
    ViolationReply const& v = std::get<ViolationReply>(r);
    EXPECT_EQ(v.msg_id, 8u);
    EXPECT_EQ(v.code, error::RuleViolationCode::Shot_ServeRequired);
    EXPECT_EQ(v.kind, error::ViolationKind::InvalidOperation);
    EXPECT_FALSE(v.text.empty());

    Reply const c = Ask(s, BuildContinue(9));
    ASSERT_TRUE(std::holds_alternative<ViolationReply>(c));
    EXPECT_EQ(std::get<ViolationReply>(c).code, error::RuleViolationCode::WrongActor_HumanRequired);
}

TEST(Session, ServeProducesAnUpdate)
{
    Session s{4, SessionOptions{}};
    (void)Ask(s, BuildStartMatch(Start(10)));

    Reply const r = Ask(s, BuildServe(ServeKind::First, 11));
    ASSERT_TRUE(std::holds_alternative<UpdateReply>(r));
    RallyUpdate const& u = std::get<UpdateReply>(r).update;
    ASSERT_TRUE(u.last_shot.has_value());
    EXPECT_EQ(u.last_shot->type, ShotType::FirstServe);
    EXPECT_EQ(u.last_shot->hitter, PlayerId::Human);
}

TEST(Session, BadStartsAreReportedNotThrown)
{
    Session s{5, SessionOptions{}};

    StartCommand bad_format = Start(1);
    bad_format.best_of_sets = 4;
    Reply const f = Ask(s, BuildStartMatch(bad_format));
    EXPECT_TRUE(std::holds_alternative<ErrorReply>(f));

    StartCommand bad_profile = Start(1);
    Profile p = DefaultHumanProfile();
    p.skills.erase(ShotType::Volley);
    bad_profile.opponent = p;
    Reply const m = Ask(s, BuildStartMatch(bad_profile));
    EXPECT_TRUE(std::holds_alternative<ErrorReply>(m));

    EXPECT_FALSE(s.HasMatch());
}

TEST(Session, SessionsAreIndependent)
{
    Session a{6, SessionOptions{}};
    Session b{7, SessionOptions{}};
    (void)Ask(a, BuildStartMatch(Start(12)));
    (void)Ask(b, BuildStartMatch(Start(12)));

    (void)Ask(a, BuildServe(ServeKind::First, 2));
    ASSERT_NE(b.CurrentMatch(), nullptr);
    EXPECT_EQ(b.CurrentMatch()->Stats().players[0].first_serves_attempted, 0);
}

TEST(Session, EngineFailureAbandonsOnlyThatMatch)
{
    Session s{8, SessionOptions{}};
    (void)Ask(s, BuildStartMatch(Start(13)));

    // Rally phase with no rally on record: the shot trips an internal assertion.
    ASSERT_NE(s.MutableMatch(), nullptr);
    tennis::core::debug::Inspector::ForcePhase(*s.MutableMatch(), Phase::Rally);

    Reply const r = Ask(s, BuildShot(ShotType::ForehandCrossCourt, 21));
    ASSERT_TRUE(std::holds_alternative<ErrorReply>(r));
    EXPECT_EQ(std::get<ErrorReply>(r).msg_id, 21u);
    EXPECT_NE(std::get<ErrorReply>(r).text.find("match abandoned"), std::string::npos);
    EXPECT_FALSE(s.HasMatch());

    // The connection stays usable.
    Reply const again = Ask(s, BuildStartMatch(Start(14)));
    EXPECT_TRUE(std::holds_alternative<UpdateReply>(again));
    EXPECT_TRUE(s.HasMatch());
}
