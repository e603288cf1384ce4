#pragma once
#include "core/Error.hpp"
#include "storage/StorageBackend.hpp"

#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

namespace TS {

// Named backend factories; "memory" and "file" are always registered.
class StorageRegistry {
public:
    using Factory = std::function<std::unique_ptr<StorageBackend>()>;

    static auto instance() -> StorageRegistry&;

    auto registerService(std::string const& name, Factory factory) -> void;
    auto create(std::string const& name) const -> Expected<std::unique_ptr<StorageBackend>>;
    auto contains(std::string const& name) const -> bool;
    auto names() const -> std::vector<std::string>;

private:
    StorageRegistry();

    mutable std::mutex             mutex;
    std::map<std::string, Factory> factories;
};

} // namespace TS
