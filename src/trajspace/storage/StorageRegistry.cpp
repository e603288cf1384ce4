#include "storage/StorageRegistry.hpp"

#include "storage/FileBackend.hpp"
#include "storage/MemoryBackend.hpp"

namespace TS {

StorageRegistry::StorageRegistry() {
    this->factories.emplace("memory", [] { return std::make_unique<MemoryBackend>(); });
    this->factories.emplace("file", [] { return std::make_unique<FileBackend>(); });
}

auto StorageRegistry::instance() -> StorageRegistry& {
    static StorageRegistry registry;
    return registry;
}

auto StorageRegistry::registerService(std::string const& name, Factory factory) -> void {
    std::lock_guard<std::mutex> lock(this->mutex);
    this->factories[name] = std::move(factory);
}

auto StorageRegistry::create(std::string const& name) const -> Expected<std::unique_ptr<StorageBackend>> {
    std::lock_guard<std::mutex> lock(this->mutex);
    auto                        it = this->factories.find(name);
    if (it == this->factories.end())
        return std::unexpected(Error{Error::Code::NoSuchService, "No storage service named '" + name + "'"});
    return it->second();
}

auto StorageRegistry::contains(std::string const& name) const -> bool {
    std::lock_guard<std::mutex> lock(this->mutex);
    return this->factories.contains(name);
}

auto StorageRegistry::names() const -> std::vector<std::string> {
    std::lock_guard<std::mutex> lock(this->mutex);
    std::vector<std::string>    result;
    for (auto const& [name, factory] : this->factories)
        result.push_back(name);
    return result;
}

} // namespace TS
