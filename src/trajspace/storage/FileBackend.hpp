#pragma once
#include "storage/StorageBackend.hpp"

#include <filesystem>

namespace TS {

/**
 * @brief Directory tree backend.
 *
 * Layout below the location directory:
 *   <seg>/<seg>/.../node.json   {"skeleton": ..., "payload": ...}
 *   .overview/<table>.json      {"<key>": row, ...}
 * Node names never contain '.', so the overview directory cannot clash with
 * a node. Files are replaced through a temp file and rename.
 */
class FileBackend final : public StorageBackend {
public:
    static constexpr std::string_view RecordFile   = "node.json";
    static constexpr std::string_view OverviewDir  = ".overview";

    explicit FileBackend(bool fsyncWrites = false);

    auto open(std::string const& location) -> Expected<void> override;
    auto close() -> void override;
    auto isOpen() const -> bool override { return this->opened; }
    auto location() const -> std::string const& override { return this->boundLocation; }
    auto serviceName() const -> std::string_view override { return "file"; }

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

private:
    auto requireOpen() const -> Expected<void>;
    auto directoryFor(std::string const& path) const -> std::filesystem::path;
    auto recordFileFor(std::string const& path) const -> std::filesystem::path;
    auto overviewFileFor(std::string const& table) const -> std::filesystem::path;
    auto readJson(std::filesystem::path const& file) const -> Expected<Value>;
    auto readOverview(std::string const& table) const -> Expected<Value>;

    std::filesystem::path root;
    std::string           boundLocation;
    bool                  opened = false;
    bool                  fsync  = false;
};

} // namespace TS
