#pragma once
#include "core/Error.hpp"
#include "core/NodeTree.hpp"
#include "explore/Exploration.hpp"
#include "storage/StorageBackend.hpp"

#include <cstddef>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace TS {

inline constexpr std::size_t DefaultMaxOverviewRows = 1000;

enum class StoreLevel {
    Skeleton,    // structure and metadata only
    Payload,     // full item for leaves never stored before
    Incremental, // never stored fields plus overwriteFields
    Overwrite    // rewrite everything
};

enum class LoadLevel {
    Skeleton,  // create missing nodes, metadata only on new nodes
    Data,      // also payloads of new or empty leaves
    Overwrite  // reload metadata and payloads unconditionally
};

struct StoreOptions {
    bool                       recursive = true;
    std::optional<std::size_t> maxDepth;
    StoreLevel                 level = StoreLevel::Payload;
    std::vector<std::string>   overwriteFields;
    bool                       withLinks = true;
};

struct LoadOptions {
    bool                       recursive = true;
    std::optional<std::size_t> maxDepth;
    LoadLevel                  level = LoadLevel::Data;
    std::vector<std::string>   loadOnly;
    std::vector<std::string>   loadExcept;
    bool                       withLinks = true;
    bool                       force     = false;
};

struct DeleteOptions {
    bool                     recursive         = false;
    bool                     removeFromStorage = true;
    bool                     removeLinks       = true;
    std::vector<std::string> deleteOnly;
};

// Contents of the trajectory root record.
struct TrajectoryRecord {
    std::string          name;
    std::string          version;
    std::string          comment;
    std::vector<RunInfo> runs;

    auto skeleton() const -> Value;
    auto payload() const -> Value;
    static auto fromRecord(NodeRecord const& record) -> Expected<TrajectoryRecord>;
};

/**
 * @brief Depth-limited store, load and delete of tree nodes against a backend.
 *
 * Every node is kept under "<trajectory name>.<full name>"; the trajectory
 * name alone addresses the root record. Links are written as records of kind
 * "link" under their owner. Depth counts ownership levels below the addressed
 * node; a link record sits one level below its owner and is never followed.
 */
class StorageCoordinator {
public:
    StorageCoordinator(StorageBackend& backend, std::string trajectoryName, std::string version,
                       std::size_t maxOverviewRows = DefaultMaxOverviewRows);

    auto backend() -> StorageBackend& { return *this->storage; }
    auto trajectoryName() const -> std::string const& { return this->name; }
    auto version() const -> std::string const& { return this->formatVersion; }
    auto maxOverviewRows() const -> std::size_t { return this->overviewCap; }

    auto storagePath(std::string_view fullName) const -> std::string;
    auto overviewTable(std::string_view branch) const -> std::string;

    auto store(NodeTree& tree, Node& node, StoreOptions const& options) -> Expected<void>;
    auto load(NodeTree& tree, std::string_view fullName, LoadOptions const& options) -> Expected<Node*>;
    auto deleteNode(NodeTree& tree, Node& node, DeleteOptions const& options) -> Expected<void>;

    auto storeTrajectoryRecord(TrajectoryRecord const& record) -> Expected<void>;
    auto loadTrajectoryRecord() -> Expected<TrajectoryRecord>;
    // Reads the root record and compares versions unless forced.
    auto checkVersion(bool force) -> Expected<TrajectoryRecord>;

    auto isStored(std::string_view fullName) -> bool;
    auto overview(std::string_view branch) -> Expected<std::vector<std::pair<std::string, Value>>>;

    // Copies every record of this trajectory to `destination` under `newName`.
    auto copyTo(StorageBackend& destination, std::string const& newName) -> Expected<void>;

    static auto skeletonOf(Node const& node) -> Value;

private:
    auto storeAncestors(Node& node) -> Expected<void>;
    auto storeOne(Node& node, StoreOptions const& options) -> Expected<void>;
    auto storeLinksOf(NodeTree& tree, Node& owner) -> Expected<void>;
    auto indexLeaf(Node const& node) -> Expected<void>;

    auto ensureAncestors(NodeTree& tree, std::vector<std::string> const& segments) -> Expected<Node*>;
    auto materialize(Node& parent, std::string const& childName, NodeRecord const& record, LoadOptions const& options) -> Expected<Node*>;
    auto loadLink(NodeTree& tree, Node& owner, std::string const& linkName, NodeRecord const& record) -> Expected<void>;
    auto filterPayload(Value const& payload, LoadOptions const& options) const -> Value;

    StorageBackend* storage;
    std::string     name;
    std::string     formatVersion;
    std::size_t     overviewCap;
};

} // namespace TS
