#include "graft/role.hpp"

namespace graft {

const char *to_string(RoleKind k)
{
    switch (k)
    {
    case RoleKind::None: return "none";
    case RoleKind::Statement: return "statement";
    case RoleKind::Argument: return "argument";
    case RoleKind::TypeMember: return "type-member";
    case RoleKind::TypeParameter: return "type-parameter";
    case RoleKind::Parameter: return "parameter";
    case RoleKind::Thrown: return "thrown";
    case RoleKind::Other: return "other";
    }
    return "?";
}

std::string to_string(const Role &r)
{
    if (r.kind == RoleKind::Other)
        return "other:" + r.slot;
    return to_string(r.kind);
}

const char *container_key(RoleKind k)
{
    switch (k)
    {
    case RoleKind::Statement: return "statements";
    case RoleKind::Argument: return "args";
    case RoleKind::TypeMember: return "members";
    case RoleKind::TypeParameter: return "type-params";
    case RoleKind::Parameter: return "params";
    case RoleKind::Thrown: return "thrown";
    case RoleKind::None:
    case RoleKind::Other:
        return "";
    }
    return "";
}

std::optional<RoleKind> role_for_key(std::string_view key)
{
    static const RoleKind keyed[] = {RoleKind::Statement, RoleKind::Argument, RoleKind::TypeMember,
                                     RoleKind::TypeParameter, RoleKind::Parameter, RoleKind::Thrown};
    for (auto k : keyed)
        if (key == container_key(k))
            return k;
    return std::nullopt;
}

} // namespace graft
