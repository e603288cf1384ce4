#pragma once

#include "core/Item.hpp"
#include "path/TransparentString.hpp"

#include <cstddef>
#include <map>
#include <memory>
#include <optional>
#include <set>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include <parallel_hashmap/phmap.h>

namespace TS {

enum class NodeKind {
    Group,
    Leaf
};

/**
 * Node of the trajectory tree.
 *
 * Structure:
 * - children: owned sub-tree keyed by the next path segment
 * - parent: non-owning back pointer, null for the root
 * - item: payload, only present on leaves
 *
 * Invariants:
 * - every node but the root is owned by exactly one parent
 * - fullName == parent.fullName + "." + name (no leading dot below the root)
 * - links never appear in children; they live in LinkIndex
 *
 * Storage bookkeeping:
 * - stored: the node has a record in the bound backend
 * - storedSkeleton: metadata as last written to or read from the backend
 * - payloadStored: a payload record was written or read for this leaf
 * - storedFields: payload fields known to be present in the backend
 */
struct Node final {
    using ChildrenMap = phmap::node_hash_map<std::string, std::unique_ptr<Node>, TransparentStringHash, std::equal_to<>>;

    Node() = default;
    Node(std::string nodeName, Node* parentNode, NodeKind nodeKind);
    ~Node() = default;

    Node(Node const&)            = delete;
    Node& operator=(Node const&) = delete;

    std::string name;
    std::string fullName;
    Node*       parent = nullptr;
    NodeKind    kind   = NodeKind::Group;

    ChildrenMap           children;
    std::unique_ptr<Item> item;

    std::string                  comment;
    std::map<std::string, Value> annotations;

    bool                  stored        = false;
    bool                  payloadStored = false;
    std::optional<Value>  storedSkeleton;
    std::set<std::string> storedFields;

    bool isGroup() const noexcept { return this->kind == NodeKind::Group; }
    bool isLeaf() const noexcept { return this->kind == NodeKind::Leaf; }
    bool isRoot() const noexcept { return this->parent == nullptr; }
    bool hasChildren() const noexcept { return !this->children.empty(); }

    auto depth() const -> std::size_t;

    Node const* getChild(std::string_view childName) const {
        auto it = this->children.find(childName);
        return it == this->children.end() ? nullptr : it->second.get();
    }

    Node* getChild(std::string_view childName) {
        auto it = this->children.find(childName);
        return it == this->children.end() ? nullptr : it->second.get();
    }

    // Child names in lexicographic order; hash order is not stable across runs.
    auto childNames() const -> std::vector<std::string>;

    // Creates a child and fixes its fullName; the name must be free.
    auto emplaceChild(std::string const& childName, NodeKind childKind) -> Node&;

    // Detaches and returns the child, or null if it does not exist.
    auto releaseChild(std::string_view childName) -> std::unique_ptr<Node>;

    // True if this node is `other` or lies below it.
    auto isWithin(Node const& other) const -> bool;
};

[[nodiscard]] auto joinName(std::string_view parentFullName, std::string_view childName) -> std::string;

} // namespace TS
