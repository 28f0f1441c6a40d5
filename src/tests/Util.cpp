#include <gtest/gtest.h>

#include "../core/Exception.hpp"
#include "../core/Util.hpp"

using namespace tennis::core;

TEST(Util, NamesRoundTrip)
{
    for (ShotType const s : AllShots)
    {
        EXPECT_EQ(util::ParseShot(util::ToString(s)), s);
    }
    EXPECT_EQ(util::ParseZone("Net"), CourtZone::Net);
    EXPECT_EQ(util::ParseStyle("Counter-puncher"), PlayStyle::CounterPuncher);
}

TEST(Util, UnknownNamesAreRejected)
{
    EXPECT_FALSE(util::ParseShot("Tweener").has_value());
    EXPECT_FALSE(util::ParseZone("").has_value());
    EXPECT_FALSE(util::ParseStyle("Pusher").has_value());
}

TEST(Util, ViolationDescriptionNamesTheContext)
{
    error::RuleViolation v{ .code = error::RuleViolationCode::Shot_IllegalFromZone };
    v.with_shot(ShotType::Lob).with_zone(CourtZone::Net);

    std::string const text = error::describe(v);
    EXPECT_NE(text.find("InvalidShotForZone"), std::string::npos);
    EXPECT_NE(text.find("Lob"), std::string::npos);
    EXPECT_NE(text.find("Net"), std::string::npos);
}

TEST(Errors, EachCodeThrowsItsOwnType)
{
    using error::Code;
    EXPECT_THROW(TNS_THROW(Code::Unknown, "u"), error::UnknownError);
    EXPECT_THROW(TNS_THROW(Code::Rules, "r"), error::RulesError);
    EXPECT_THROW(TNS_THROW(Code::State, "s"), error::StateError);
    EXPECT_THROW(TNS_THROW(Code::MalformedProfile, "m"), error::MalformedProfileError);
    EXPECT_THROW(TNS_ASSERT(false, "a"), error::AssertionError);
    EXPECT_NO_THROW(TNS_ASSERT(true, "a"));

    try
    {
        TNS_THROW(Code::State, "carried");
    }
    catch (error::StateError const& e)
    {
        EXPECT_EQ(e.what(), "carried");
        EXPECT_EQ(e.data(), Code::State);
        EXPECT_GT(e.where().line(), 0u);
    }
}
