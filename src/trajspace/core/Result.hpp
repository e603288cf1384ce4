#pragma once
#include "core/Item.hpp"

#include <map>
#include <string>

namespace TS {

// Named result values computed during a run.
class Result final : public Item {
public:
    Result() = default;
    explicit Result(std::map<std::string, Value> fields);

    auto kind() const -> ItemKind override { return ItemKind::Result; }
    auto store() const -> Value override;
    auto load(Value const& representation) -> Expected<void> override;
    auto toDict() const -> Value override;
    auto fieldNames() const -> std::vector<std::string> override;
    auto removeFields(std::span<std::string const> fields) -> Expected<void> override;
    auto isEmpty() const -> bool override { return this->fields.empty(); }
    auto clear() -> void override { this->fields.clear(); }
    auto clone() const -> std::unique_ptr<Item> override;

    auto set(std::string const& name, Value value) -> Expected<void>;
    auto get(std::string const& name) const -> Expected<Value>;
    auto contains(std::string const& name) const -> bool { return this->fields.contains(name); }
    auto size() const -> std::size_t { return this->fields.size(); }

private:
    std::map<std::string, Value> fields;
};

} // namespace TS
