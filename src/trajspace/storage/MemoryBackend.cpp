#include "storage/MemoryBackend.hpp"

#include "log/TaggedLogger.hpp"

namespace TS {

namespace {

std::mutex storesMutex;

auto isBelow(std::string const& key, std::string const& path) -> bool {
    if (path.empty())
        return true;
    return key.size() > path.size() && key.compare(0, path.size(), path) == 0 && key[path.size()] == '.';
}

} // namespace

auto MemoryBackend::stores() -> std::map<std::string, std::shared_ptr<Store>>& {
    static std::map<std::string, std::shared_ptr<Store>> byLocation;
    return byLocation;
}

auto MemoryBackend::acquire(std::string const& location) -> std::shared_ptr<Store> {
    std::lock_guard<std::mutex> lock(storesMutex);
    auto&                       slot = stores()[location];
    if (!slot)
        slot = std::make_shared<Store>();
    return slot;
}

auto MemoryBackend::discard(std::string const& location) -> void {
    std::lock_guard<std::mutex> lock(storesMutex);
    stores().erase(location);
}

auto MemoryBackend::open(std::string const& location) -> Expected<void> {
    if (location.empty())
        return std::unexpected(Error{Error::Code::StorageUnavailable, "Memory backend needs a location name"});
    this->store         = acquire(location);
    this->boundLocation = location;
    ts_log("MemoryBackend::open " + location, "Storage");
    return {};
}

auto MemoryBackend::close() -> void {
    this->store.reset();
}

auto MemoryBackend::requireOpen() const -> Expected<void> {
    if (!this->store)
        return std::unexpected(Error{Error::Code::StorageUnavailable, "Memory backend is not open"});
    return {};
}

auto MemoryBackend::writeNode(std::string const& path, Value const& skeleton, std::optional<Value> const& payload) -> Expected<void> {
    if (auto ready = this->requireOpen(); !ready)
        return ready;
    std::lock_guard<std::mutex> lock(this->store->mutex);
    auto&                       record = this->store->records[path];
    record.skeleton                    = skeleton;
    if (payload)
        record.payload = *payload;
    ++this->store->writes;
    return {};
}

auto MemoryBackend::readNode(std::string const& path) -> Expected<NodeRecord> {
    if (auto ready = this->requireOpen(); !ready)
        return std::unexpected(ready.error());
    std::lock_guard<std::mutex> lock(this->store->mutex);
    auto                        it = this->store->records.find(path);
    if (it == this->store->records.end())
        return std::unexpected(Error{Error::Code::DataNotInStorage, "No stored node " + path});
    return it->second;
}

auto MemoryBackend::listChildren(std::string const& path) -> Expected<std::vector<std::string>> {
    if (auto ready = this->requireOpen(); !ready)
        return std::unexpected(ready.error());
    std::lock_guard<std::mutex> lock(this->store->mutex);
    std::vector<std::string>    names;
    auto const                  prefix = path.empty() ? std::string{} : path + ".";
    for (auto it = this->store->records.lower_bound(prefix); it != this->store->records.end(); ++it) {
        if (!isBelow(it->first, path))
            break;
        auto rest = std::string_view(it->first).substr(prefix.size());
        if (rest.find('.') == std::string_view::npos)
            names.emplace_back(rest);
    }
    return names;
}

auto MemoryBackend::hasNode(std::string const& path) -> bool {
    if (!this->store)
        return false;
    std::lock_guard<std::mutex> lock(this->store->mutex);
    return this->store->records.contains(path);
}

auto MemoryBackend::removeNode(std::string const& path, bool recursive) -> Expected<void> {
    if (auto ready = this->requireOpen(); !ready)
        return ready;
    std::lock_guard<std::mutex> lock(this->store->mutex);
    auto&                       records = this->store->records;
    if (!records.contains(path))
        return std::unexpected(Error{Error::Code::DataNotInStorage, "No stored node " + path});
    auto const prefix = path + ".";
    auto       below  = records.lower_bound(prefix);
    bool const hasSub = below != records.end() && isBelow(below->first, path);
    if (hasSub && !recursive)
        return std::unexpected(Error{Error::Code::NotEmpty, "Stored node " + path + " has children"});
    while (below != records.end() && isBelow(below->first, path))
        below = records.erase(below);
    records.erase(path);
    return {};
}

auto MemoryBackend::upsertOverview(std::string const& table, std::string const& key, Value const& row) -> Expected<void> {
    if (auto ready = this->requireOpen(); !ready)
        return ready;
    std::lock_guard<std::mutex> lock(this->store->mutex);
    this->store->overviews[table][key] = row;
    return {};
}

auto MemoryBackend::removeOverview(std::string const& table, std::string const& key) -> Expected<void> {
    if (auto ready = this->requireOpen(); !ready)
        return ready;
    std::lock_guard<std::mutex> lock(this->store->mutex);
    if (auto it = this->store->overviews.find(table); it != this->store->overviews.end())
        it->second.erase(key);
    return {};
}

auto MemoryBackend::overviewSize(std::string const& table) -> std::size_t {
    if (!this->store)
        return 0;
    std::lock_guard<std::mutex> lock(this->store->mutex);
    auto                        it = this->store->overviews.find(table);
    return it == this->store->overviews.end() ? 0 : it->second.size();
}

auto MemoryBackend::overviewHas(std::string const& table, std::string const& key) -> bool {
    if (!this->store)
        return false;
    std::lock_guard<std::mutex> lock(this->store->mutex);
    auto                        it = this->store->overviews.find(table);
    return it != this->store->overviews.end() && it->second.contains(key);
}

auto MemoryBackend::overviewEntries(std::string const& table) -> Expected<std::vector<std::pair<std::string, Value>>> {
    if (auto ready = this->requireOpen(); !ready)
        return std::unexpected(ready.error());
    std::lock_guard<std::mutex>                  lock(this->store->mutex);
    std::vector<std::pair<std::string, Value>> entries;
    if (auto it = this->store->overviews.find(table); it != this->store->overviews.end())
        entries.assign(it->second.begin(), it->second.end());
    return entries;
}

auto MemoryBackend::writeCount() const -> std::size_t {
    if (!this->store)
        return 0;
    std::lock_guard<std::mutex> lock(this->store->mutex);
    return this->store->writes;
}

} // namespace TS
