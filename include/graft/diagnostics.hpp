// Reporting a failed patch application at the tool boundary (text and JSON).
#pragma once
#include "graft/errors.hpp"
#include "graft/forest.hpp"
#include <string>

namespace graft {

struct PatchFailure {
    std::string prev_source;
    std::string new_source;
    std::string code;
    std::string message;
    NodeId node = kNoNode;
    std::string node_tag;
    std::string node_path; // within the tree the node hangs in at failure time
    Origin origin;
};

PatchFailure describe_failure(const Forest& forest, const patch_error& e,
                              std::string prev_source, std::string new_source);

// "patch application failed for revision pair A -> B" followed by error[CODE] and notes.
std::string format_failure(const PatchFailure& f);

// Escape a string for safe JSON output.
std::string json_escape(const std::string& s);

std::string diagnostics_to_json(const PatchFailure& f);

// If GRAFT_DIAG_JSON is enabled, print the failure as JSON to stderr.
void maybe_print_json(const PatchFailure& f);

} // namespace graft
