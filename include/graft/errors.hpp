// Patch application failures. Every one of these aborts the whole application pass.
#pragma once
#include "graft/forest.hpp"
#include <stdexcept>
#include <string>

namespace graft
{

    struct patch_error : std::runtime_error
    {
        patch_error(std::string code, const std::string &msg, NodeId node)
            : std::runtime_error(msg), code_(std::move(code)), node_(node) {}
        const std::string &code() const noexcept { return code_; }
        NodeId node() const noexcept { return node_; }

    private:
        std::string code_;
        NodeId node_;
    };

    // E2001: the node has no parent (already deleted, or never attached).
    struct detached_node_error : patch_error
    {
        explicit detached_node_error(NodeId n, const std::string &what)
            : patch_error("E2001", what + ": node #" + std::to_string(n) + " has no parent", n) {}
    };

    // E2002: insertion index outside [0, len] of the target container.
    struct invalid_position_error : patch_error
    {
        invalid_position_error(NodeId target, size_t position, size_t len)
            : patch_error("E2002", "position " + std::to_string(position) + " out of range [0, " + std::to_string(len) +
                                       "] for node #" + std::to_string(target),
                          target),
              position(position), length(len) {}
        size_t position;
        size_t length;
    };

    // E2003: the target does not own the container kind the role requires.
    struct structural_mismatch_error : patch_error
    {
        structural_mismatch_error(NodeId target, const std::string &msg) : patch_error("E2003", msg, target) {}
    };

    // E2004: no handler and no generic fallback for the role.
    struct unsupported_role_error : patch_error
    {
        unsupported_role_error(NodeId n, const std::string &msg) : patch_error("E2004", msg, n) {}
    };

} // namespace graft
