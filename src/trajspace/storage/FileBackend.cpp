#include "storage/FileBackend.hpp"

#include "log/TaggedLogger.hpp"
#include "path/Naming.hpp"
#include "storage/FileUtils.hpp"

#include <algorithm>
#include <system_error>

namespace TS {

FileBackend::FileBackend(bool fsyncWrites)
    : fsync(fsyncWrites) {}

auto FileBackend::open(std::string const& location) -> Expected<void> {
    if (location.empty())
        return std::unexpected(Error{Error::Code::StorageUnavailable, "File backend needs a directory"});
    std::error_code ec;
    std::filesystem::path dir{location};
    std::filesystem::create_directories(dir, ec);
    if (ec || !std::filesystem::is_directory(dir, ec))
        return std::unexpected(Error{Error::Code::StorageUnavailable, "Cannot open storage directory " + location});
    this->root          = dir;
    this->boundLocation = location;
    this->opened        = true;
    ts_log("FileBackend::open " + location, "Storage");
    return {};
}

auto FileBackend::close() -> void {
    this->opened = false;
}

auto FileBackend::requireOpen() const -> Expected<void> {
    if (!this->opened)
        return std::unexpected(Error{Error::Code::StorageUnavailable, "File backend is not open"});
    return {};
}

auto FileBackend::directoryFor(std::string const& path) const -> std::filesystem::path {
    auto dir = this->root;
    for (auto const& segment : splitPath(path))
        dir /= segment;
    return dir;
}

auto FileBackend::recordFileFor(std::string const& path) const -> std::filesystem::path {
    return this->directoryFor(path) / RecordFile;
}

auto FileBackend::overviewFileFor(std::string const& table) const -> std::filesystem::path {
    return this->root / OverviewDir / (table + ".json");
}

auto FileBackend::readJson(std::filesystem::path const& file) const -> Expected<Value> {
    auto text = FileUtils::readTextFile(file);
    if (!text)
        return std::unexpected(text.error());
    auto parsed = Value::parse(*text, nullptr, false);
    if (parsed.is_discarded())
        return std::unexpected(Error{Error::Code::MalformedInput, "Corrupt storage file " + file.string()});
    return parsed;
}

auto FileBackend::writeNode(std::string const& path, Value const& skeleton, std::optional<Value> const& payload) -> Expected<void> {
    if (auto ready = this->requireOpen(); !ready)
        return ready;
    auto  file     = this->recordFileFor(path);
    Value document = Value::object();
    document["skeleton"] = skeleton;
    if (payload) {
        document["payload"] = *payload;
    } else if (std::filesystem::exists(file)) {
        auto previous = this->readJson(file);
        if (!previous)
            return std::unexpected(previous.error());
        if (auto it = previous->find("payload"); it != previous->end())
            document["payload"] = *it;
    }
    return FileUtils::writeTextFileAtomic(file, document.dump(), this->fsync);
}

auto FileBackend::readNode(std::string const& path) -> Expected<NodeRecord> {
    if (auto ready = this->requireOpen(); !ready)
        return std::unexpected(ready.error());
    auto file = this->recordFileFor(path);
    if (!std::filesystem::exists(file))
        return std::unexpected(Error{Error::Code::DataNotInStorage, "No stored node " + path});
    auto document = this->readJson(file);
    if (!document)
        return std::unexpected(document.error());
    NodeRecord record;
    record.skeleton = document->value("skeleton", Value::object());
    if (auto it = document->find("payload"); it != document->end())
        record.payload = *it;
    return record;
}

auto FileBackend::listChildren(std::string const& path) -> Expected<std::vector<std::string>> {
    if (auto ready = this->requireOpen(); !ready)
        return std::unexpected(ready.error());
    std::vector<std::string> names;
    auto                     dir = this->directoryFor(path);
    std::error_code          ec;
    if (!std::filesystem::is_directory(dir, ec))
        return names;
    for (auto const& entry : std::filesystem::directory_iterator(dir, ec)) {
        if (!entry.is_directory())
            continue;
        auto name = entry.path().filename().string();
        if (name.starts_with('.'))
            continue;
        if (std::filesystem::exists(entry.path() / RecordFile))
            names.push_back(std::move(name));
    }
    if (ec)
        return std::unexpected(Error{Error::Code::StorageUnavailable, "Cannot list " + dir.string()});
    std::sort(names.begin(), names.end());
    return names;
}

auto FileBackend::hasNode(std::string const& path) -> bool {
    if (!this->opened)
        return false;
    std::error_code ec;
    return std::filesystem::exists(this->recordFileFor(path), ec);
}

auto FileBackend::removeNode(std::string const& path, bool recursive) -> Expected<void> {
    if (auto ready = this->requireOpen(); !ready)
        return ready;
    if (!this->hasNode(path))
        return std::unexpected(Error{Error::Code::DataNotInStorage, "No stored node " + path});
    auto dir = this->directoryFor(path);
    if (recursive)
        return FileUtils::removePathIfExists(dir);
    auto children = this->listChildren(path);
    if (!children)
        return std::unexpected(children.error());
    if (!children->empty())
        return std::unexpected(Error{Error::Code::NotEmpty, "Stored node " + path + " has children"});
    return FileUtils::removePathIfExists(dir);
}

auto FileBackend::readOverview(std::string const& table) const -> Expected<Value> {
    auto file = this->overviewFileFor(table);
    if (!std::filesystem::exists(file))
        return Value::object();
    return this->readJson(file);
}

auto FileBackend::upsertOverview(std::string const& table, std::string const& key, Value const& row) -> Expected<void> {
    if (auto ready = this->requireOpen(); !ready)
        return ready;
    auto rows = this->readOverview(table);
    if (!rows)
        return std::unexpected(rows.error());
    (*rows)[key] = row;
    return FileUtils::writeTextFileAtomic(this->overviewFileFor(table), rows->dump(), this->fsync);
}

auto FileBackend::removeOverview(std::string const& table, std::string const& key) -> Expected<void> {
    if (auto ready = this->requireOpen(); !ready)
        return ready;
    auto rows = this->readOverview(table);
    if (!rows)
        return std::unexpected(rows.error());
    if (rows->erase(key) == 0)
        return {};
    return FileUtils::writeTextFileAtomic(this->overviewFileFor(table), rows->dump(), this->fsync);
}

auto FileBackend::overviewSize(std::string const& table) -> std::size_t {
    if (!this->opened)
        return 0;
    auto rows = this->readOverview(table);
    return rows ? rows->size() : 0;
}

auto FileBackend::overviewHas(std::string const& table, std::string const& key) -> bool {
    if (!this->opened)
        return false;
    auto rows = this->readOverview(table);
    return rows && rows->contains(key);
}

auto FileBackend::overviewEntries(std::string const& table) -> Expected<std::vector<std::pair<std::string, Value>>> {
    if (auto ready = this->requireOpen(); !ready)
        return std::unexpected(ready.error());
    auto rows = this->readOverview(table);
    if (!rows)
        return std::unexpected(rows.error());
    std::vector<std::pair<std::string, Value>> entries;
    for (auto it = rows->begin(); it != rows->end(); ++it)
        entries.emplace_back(it.key(), it.value());
    return entries;
}

} // namespace TS
