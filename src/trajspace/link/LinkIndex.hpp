#pragma once
#include "core/Error.hpp"
#include "core/Node.hpp"

#include <compare>
#include <cstddef>
#include <functional>
#include <map>
#include <set>
#include <string>
#include <string_view>

#include <parallel_hashmap/phmap.h>

namespace TS {

/**
 * @brief Named, non-owning edges between nodes of one tree.
 *
 * A link (owner, name) -> target behaves like a child called `name` during
 * lookups that ask for links, but ownership stays with the tree. Links may
 * form cycles. The reverse index answers which links point at a node so that
 * removing the node can cascade into its incoming links.
 */
class LinkIndex {
public:
    struct LinkRef {
        Node*       owner = nullptr;
        std::string name;

        auto operator<=>(LinkRef const& other) const -> std::strong_ordering {
            if (auto cmp = std::compare_three_way{}(this->owner, other.owner); cmp != 0)
                return cmp;
            return this->name <=> other.name;
        }
        auto operator==(LinkRef const& other) const -> bool = default;
    };

    explicit LinkIndex(Node const& root);

    LinkIndex(LinkIndex const&)            = delete;
    LinkIndex& operator=(LinkIndex const&) = delete;

    auto addLink(Node& owner, std::string const& name, Node& target) -> Expected<void>;
    auto removeLink(Node& owner, std::string_view name) -> Expected<void>;

    auto hasLink(Node const& owner, std::string_view name) const -> bool;
    auto target(Node const& owner, std::string_view name) const -> Node*;
    auto targetsOf(Node const& owner) const -> std::map<std::string, Node*>;
    auto ownersOf(Node const& target) const -> std::set<LinkRef>;
    auto refCount(Node const& target) const -> std::size_t;
    auto size() const -> std::size_t;

    // Drops every link owned by `owner`.
    auto dropOwnedBy(Node const& owner) -> void;
    // Drops every link pointing at `target`.
    auto dropTargeting(Node const& target) -> void;
    auto clear() -> void;

    auto forEach(std::function<void(Node& owner, std::string const& name, Node& target)> const& fn) const -> void;

private:
    Node const* root;
    phmap::flat_hash_map<Node const*, std::map<std::string, Node*, std::less<>>> forward;
    phmap::flat_hash_map<Node const*, std::set<LinkRef>>                          reverse;
};

} // namespace TS
