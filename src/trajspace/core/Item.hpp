#pragma once
#include "core/Error.hpp"

#include <memory>
#include <span>
#include <string>
#include <string_view>
#include <vector>

#include <nlohmann/json.hpp>

namespace TS {

using Value = nlohmann::json;

enum class ItemKind {
    Parameter,
    Result
};

[[nodiscard]] auto itemKindToString(ItemKind kind) -> std::string_view;
[[nodiscard]] auto itemKindFromString(std::string_view text) -> Expected<ItemKind>;

/**
 * @brief Payload held by a leaf node.
 *
 * The storage layer only talks to a payload through this interface. The
 * serializable representation returned by store() is a JSON object mapping
 * field names to values; load() accepts the same shape, possibly with only a
 * subset of the fields.
 */
class Item {
public:
    virtual ~Item() = default;

    virtual auto kind() const -> ItemKind = 0;
    virtual auto store() const -> Value                             = 0;
    virtual auto load(Value const& representation) -> Expected<void> = 0;
    virtual auto toDict() const -> Value                            = 0;
    virtual auto fieldNames() const -> std::vector<std::string>     = 0;
    virtual auto removeFields(std::span<std::string const> fields) -> Expected<void> = 0;
    virtual auto isEmpty() const -> bool                            = 0;
    virtual auto clear() -> void                                    = 0;
    virtual auto clone() const -> std::unique_ptr<Item>             = 0;

    auto isLocked() const -> bool { return this->locked; }
    auto lock() -> void { this->locked = true; }
    auto unlock() -> void { this->locked = false; }

    // Leaf full name, used in error messages only.
    auto setOwnerName(std::string name) -> void { this->ownerName = std::move(name); }
    auto getOwnerName() const -> std::string const& { return this->ownerName; }

protected:
    bool        locked = false;
    std::string ownerName;
};

[[nodiscard]] auto makeItem(ItemKind kind) -> std::unique_ptr<Item>;

} // namespace TS
