// Roles: how a node relates to its parent, and the container shape each role implies.
#pragma once
#include <optional>
#include <string>
#include <string_view>
#include <utility>

namespace graft
{

    enum class RoleKind
    {
        None, // root, or currently detached
        Statement,
        Argument,
        TypeMember,
        TypeParameter,
        Parameter,
        Thrown,
        Other
    };

    // Container kinds a node tag can own. Ordered kinds mirror the ordered roles one-to-one.
    enum class ContainerKind : unsigned
    {
        Statements = 1u << 0,
        Arguments = 1u << 1,
        TypeMembers = 1u << 2,
        TypeParameters = 1u << 3,
        Parameters = 1u << 4,
        ThrownSet = 1u << 5
    };

    struct Role
    {
        RoleKind kind = RoleKind::None;
        std::string slot; // key for RoleKind::Other, empty otherwise

        static Role none() { return {}; }
        static Role of(RoleKind k) { return Role{k, {}}; }
        static Role in_slot(std::string key) { return Role{RoleKind::Other, std::move(key)}; }
        bool operator==(const Role &o) const { return kind == o.kind && slot == o.slot; }
    };

    inline bool is_ordered(RoleKind k)
    {
        switch (k)
        {
        case RoleKind::Statement:
        case RoleKind::Argument:
        case RoleKind::TypeMember:
        case RoleKind::TypeParameter:
        case RoleKind::Parameter:
            return true;
        case RoleKind::None:
        case RoleKind::Thrown:
        case RoleKind::Other:
            return false;
        }
        return false;
    }

    // Container a role lives in; nullopt for None and Other (slots are not containers).
    inline std::optional<ContainerKind> container_of(RoleKind k)
    {
        switch (k)
        {
        case RoleKind::Statement: return ContainerKind::Statements;
        case RoleKind::Argument: return ContainerKind::Arguments;
        case RoleKind::TypeMember: return ContainerKind::TypeMembers;
        case RoleKind::TypeParameter: return ContainerKind::TypeParameters;
        case RoleKind::Parameter: return ContainerKind::Parameters;
        case RoleKind::Thrown: return ContainerKind::ThrownSet;
        case RoleKind::None:
        case RoleKind::Other:
            return std::nullopt;
        }
        return std::nullopt;
    }

    const char *to_string(RoleKind k);
    std::string to_string(const Role &r);

    // EDN key of a container (":statements" without the colon) and its inverse.
    const char *container_key(RoleKind k);
    std::optional<RoleKind> role_for_key(std::string_view key);

} // namespace graft
