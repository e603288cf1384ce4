#pragma once
#include "core/Item.hpp"

#include <cstddef>
#include <optional>
#include <vector>

namespace TS {

/**
 * @brief A single configuration value that can be explored into a range.
 *
 * Length semantics: 0 when unset, 1 for a plain value, L once explored.
 * Field names used in the stored representation are "data" for the default
 * and "explored_data" for the range.
 */
class Parameter final : public Item {
public:
    static constexpr std::string_view DataField     = "data";
    static constexpr std::string_view ExploredField = "explored_data";

    Parameter() = default;
    explicit Parameter(Value value);

    auto kind() const -> ItemKind override { return ItemKind::Parameter; }
    auto store() const -> Value override;
    auto load(Value const& representation) -> Expected<void> override;
    auto toDict() const -> Value override;
    auto fieldNames() const -> std::vector<std::string> override;
    auto removeFields(std::span<std::string const> fields) -> Expected<void> override;
    auto isEmpty() const -> bool override;
    auto clear() -> void override;
    auto clone() const -> std::unique_ptr<Item> override;

    auto set(Value value) -> Expected<void>;
    auto get() const -> Expected<Value>;
    auto access(std::size_t n) const -> Expected<Value>;
    auto valueForRun(std::optional<std::size_t> run) const -> Expected<Value>;

    auto isArray() const -> bool { return !this->range.empty(); }
    auto size() const -> std::size_t;
    auto getRange() const -> std::vector<Value> const& { return this->range; }

    // Exploration is not a user edit and ignores the lock.
    auto explore(std::vector<Value> values) -> Expected<void>;
    auto addItems(std::vector<Value> const& values) -> Expected<void>;
    auto changeValuesInArray(std::vector<Value> const& values, std::vector<std::size_t> const& positions) -> Expected<void>;
    auto shrink() -> Expected<void>;

private:
    auto checkSameType(Value const& value) const -> Expected<void>;

    std::optional<Value> data;
    std::vector<Value>   range;
};

} // namespace TS
