#pragma once
#include "core/Error.hpp"
#include "core/Item.hpp"

#include <cstddef>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace TS {

// Skeleton metadata plus the payload, if one was ever written.
struct NodeRecord {
    Value                skeleton;
    std::optional<Value> payload;
};

/**
 * @brief Exact-path key/value tree store behind the storage coordinator.
 *
 * Paths are dot separated full names. Each writeNode() is atomic: a reader
 * sees either the previous record or the new one. Overview tables are flat
 * bounded indexes keyed by table name; capping them is the caller's job.
 * Backends are not thread safe; the write queue serializes access.
 */
class StorageBackend {
public:
    virtual ~StorageBackend() = default;

    virtual auto open(std::string const& location) -> Expected<void> = 0;
    virtual auto close() -> void                                   = 0;
    virtual auto isOpen() const -> bool                            = 0;
    virtual auto location() const -> std::string const&            = 0;
    virtual auto serviceName() const -> std::string_view           = 0;

    // A missing payload keeps whatever payload is already stored.
    virtual auto writeNode(std::string const& path, Value const& skeleton, std::optional<Value> const& payload) -> Expected<void> = 0;
    virtual auto readNode(std::string const& path) -> Expected<NodeRecord>                                                   = 0;
    // Sorted child names, empty when the path has no children.
    virtual auto listChildren(std::string const& path) -> Expected<std::vector<std::string>> = 0;
    virtual auto hasNode(std::string const& path) -> bool                                    = 0;
    virtual auto removeNode(std::string const& path, bool recursive) -> Expected<void>       = 0;

    virtual auto upsertOverview(std::string const& table, std::string const& key, Value const& row) -> Expected<void> = 0;
    virtual auto removeOverview(std::string const& table, std::string const& key) -> Expected<void>                   = 0;
    virtual auto overviewSize(std::string const& table) -> std::size_t                                               = 0;
    virtual auto overviewHas(std::string const& table, std::string const& key) -> bool                               = 0;
    virtual auto overviewEntries(std::string const& table) -> Expected<std::vector<std::pair<std::string, Value>>>   = 0;
};

} // namespace TS
