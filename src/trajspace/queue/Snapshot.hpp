#pragma once
#include "core/Error.hpp"
#include "core/NodeTree.hpp"
#include "explore/Exploration.hpp"

#include <cstdint>
#include <string>
#include <vector>

namespace TS {

// Flat, value-only copy of one node. JSON fields are kept as text.
struct SnapshotEntry {
    std::string  fullName;
    std::uint8_t kind = 0; // 0 group, 1 leaf
    std::string  itemType;
    std::string  comment;
    std::string  annotations;
    std::string  payload;
    bool         locked = false;
    bool         stored = false;
};

struct SnapshotLink {
    std::string owner;
    std::string name;
    std::string target;
};

struct SnapshotRun {
    std::uint64_t index = 0;
    std::string   name;
    bool          completed = false;
};

/**
 * @brief Immutable message form of (part of) a trajectory.
 *
 * Entries are ordered parents first. Workers get the whole skeleton this way
 * and send their new nodes back the same way; nothing is shared by pointer.
 */
struct TreeSnapshot {
    std::string                name;
    std::string                version;
    std::vector<SnapshotRun>   runs;
    std::vector<SnapshotEntry> entries;
    std::vector<SnapshotLink>  links;
};

struct GraftResult {
    std::vector<Node*> tops;       // grafted nodes whose parent was not part of the snapshot
    std::vector<Node*> linkOwners; // owners of links the graft added
};

[[nodiscard]] auto captureTree(NodeTree& tree) -> TreeSnapshot;
// Captures every node below and including `tops`, plus all links of the tree.
[[nodiscard]] auto captureSubtrees(NodeTree& tree, std::vector<Node*> const& tops) -> TreeSnapshot;
// Adds missing nodes and links; existing leaves keep their payload.
[[nodiscard]] auto graftSnapshot(NodeTree& tree, TreeSnapshot const& snapshot) -> Expected<GraftResult>;

[[nodiscard]] auto encodeSnapshot(TreeSnapshot const& snapshot) -> Expected<std::vector<std::uint8_t>>;
[[nodiscard]] auto decodeSnapshot(std::vector<std::uint8_t> const& bytes) -> Expected<TreeSnapshot>;

[[nodiscard]] auto runsToSnapshot(std::vector<RunInfo> const& runs) -> std::vector<SnapshotRun>;
[[nodiscard]] auto runsFromSnapshot(std::vector<SnapshotRun> const& runs) -> std::vector<RunInfo>;

} // namespace TS
