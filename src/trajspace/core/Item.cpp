#include "core/Item.hpp"

#include "core/Parameter.hpp"
#include "core/Result.hpp"

namespace TS {

auto itemKindToString(ItemKind kind) -> std::string_view {
    switch (kind) {
    case ItemKind::Parameter:
        return "parameter";
    case ItemKind::Result:
        return "result";
    }
    return "unknown";
}

auto itemKindFromString(std::string_view text) -> Expected<ItemKind> {
    if (text == "parameter")
        return ItemKind::Parameter;
    if (text == "result")
        return ItemKind::Result;
    return std::unexpected(Error{Error::Code::MalformedInput, "Unknown item type: " + std::string(text)});
}

auto makeItem(ItemKind kind) -> std::unique_ptr<Item> {
    switch (kind) {
    case ItemKind::Parameter:
        return std::make_unique<Parameter>();
    case ItemKind::Result:
        return std::make_unique<Result>();
    }
    return nullptr;
}

} // namespace TS
