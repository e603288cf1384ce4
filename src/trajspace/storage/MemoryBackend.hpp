#pragma once
#include "storage/StorageBackend.hpp"

#include <map>
#include <memory>
#include <mutex>

namespace TS {

/**
 * @brief Process-local backend.
 *
 * Stores are shared per location, so a second backend opened on the same
 * location sees what the first one wrote. discard() drops a location.
 */
class MemoryBackend final : public StorageBackend {
public:
    MemoryBackend() = default;

    auto open(std::string const& location) -> Expected<void> override;
    auto close() -> void override;
    auto isOpen() const -> bool override { return this->store != nullptr; }
    auto location() const -> std::string const& override { return this->boundLocation; }
    auto serviceName() const -> std::string_view override { return "memory"; }

    auto writeNode(std::string const& path, Value const& skeleton, std::optional<Value> const& payload) -> Expected<void> override;
    auto readNode(std::string const& path) -> Expected<NodeRecord> override;
    auto listChildren(std::string const& path) -> Expected<std::vector<std::string>> override;
    auto hasNode(std::string const& path) -> bool override;
    auto removeNode(std::string const& path, bool recursive) -> Expected<void> override;

    auto upsertOverview(std::string const& table, std::string const& key, Value const& row) -> Expected<void> override;
    auto removeOverview(std::string const& table, std::string const& key) -> Expected<void> override;
    auto overviewSize(std::string const& table) -> std::size_t override;
    auto overviewHas(std::string const& table, std::string const& key) -> bool override;
    auto overviewEntries(std::string const& table) -> Expected<std::vector<std::pair<std::string, Value>>> override;

    // Number of writeNode() calls that reached this location.
    auto writeCount() const -> std::size_t;

    static auto discard(std::string const& location) -> void;

private:
    struct Store {
        mutable std::mutex                                  mutex;
        std::map<std::string, NodeRecord>                   records;
        std::map<std::string, std::map<std::string, Value>> overviews;
        std::size_t                                         writes = 0;
    };

    static auto stores() -> std::map<std::string, std::shared_ptr<Store>>&;
    static auto acquire(std::string const& location) -> std::shared_ptr<Store>;
    auto        requireOpen() const -> Expected<void>;

    std::shared_ptr<Store> store;
    std::string            boundLocation;
};

} // namespace TS
