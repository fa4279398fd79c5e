// Patch descriptors. Nodes are identities in the Forest that holds both revisions.
#pragma once
#include "graft/forest.hpp"
#include <cstddef>
#include <vector>

namespace graft
{

    struct DeletePatch
    {
        NodeId node;
    };

    struct UpdatePatch
    {
        NodeId old_node; // in the previous revision
        NodeId new_node; // in the new revision
    };

    struct InsertPatch
    {
        size_t position; // ignored for Thrown and slot roles
        NodeId node;     // in the new revision; its role there selects the container
        NodeId target;   // in the previous revision
    };

    struct PatchSet
    {
        std::vector<DeletePatch> deletes;
        std::vector<UpdatePatch> updates;
        std::vector<InsertPatch> inserts;

        bool empty() const { return deletes.empty() && updates.empty() && inserts.empty(); }
    };

} // namespace graft
