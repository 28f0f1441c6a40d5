//
// Created by Malik T on 08/10/2025.
//

#ifndef TENNISSIM_STANDARDRULES_HPP
#define TENNISSIM_STANDARDRULES_HPP
#include "Rules.hpp"

namespace tennis::core
{
    class StandardRules final : public Rules
    {
    public:
        auto Validate(Match const& match, PlayerId actor, PlayerAction const& a) const -> CheckResult override;
        auto Apply(Match& match, PlayerId actor, PlayerAction const& a) -> void override;
        auto Advance(Match& match) -> RallyStatus override;

    private:
        static auto ApplyServe(Match& match, PlayerId server, ServeKind kind) -> void;
        static auto ApplyShot(Match& match, PlayerId hitter, ShotType shot) -> void;
    };
}

#endif //TENNISSIM_STANDARDRULES_HPP
