#pragma once
#include "core/Error.hpp"
#include "core/Node.hpp"
#include "link/LinkIndex.hpp"
#include "path/Naming.hpp"

#include <cstddef>
#include <deque>
#include <iterator>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_set>
#include <utility>
#include <vector>

namespace TS {

struct RemoveOptions {
    bool recursive   = false;
    bool removeLinks = true; // false: fail with LinkedNode while links from outside point into the subtree
};

struct IterOptions {
    bool                       recursive = true;
    bool                       withLinks = true;
    std::optional<std::size_t> maxDepth; // levels below the start node, unbounded when empty
};

/**
 * @brief Lazy breadth-first view over the nodes below a start node.
 *
 * Every begin() starts a fresh traversal, so a range can be iterated any
 * number of times. Nodes reachable through links are yielded once each, which
 * keeps cyclic links finite. The start node itself is not part of the range.
 */
class NodeRange {
    struct State {
        LinkIndex const*                          links = nullptr;
        IterOptions                               options;
        std::deque<std::pair<Node*, std::size_t>> pending;
        std::unordered_set<Node const*>           visited;

        auto enqueueChildrenOf(Node& node, std::size_t depth) -> void;
        auto next() -> Node*;
    };

public:
    class iterator {
    public:
        using iterator_category = std::input_iterator_tag;
        using value_type        = Node;
        using difference_type   = std::ptrdiff_t;
        using pointer           = Node*;
        using reference         = Node&;

        iterator() = default;

        auto operator*() const -> Node& { return *this->current; }
        auto operator->() const -> Node* { return this->current; }
        auto operator++() -> iterator& {
            this->current = this->state->next();
            return *this;
        }
        auto operator++(int) -> void { ++*this; }
        auto operator==(iterator const& other) const -> bool { return this->current == other.current; }

    private:
        friend class NodeRange;
        explicit iterator(std::shared_ptr<State> traversal)
            : state(std::move(traversal)), current(state->next()) {}

        std::shared_ptr<State> state;
        Node*                  current = nullptr;
    };

    NodeRange(Node& start, LinkIndex const& links, IterOptions options);

    auto begin() const -> iterator;
    auto end() const -> iterator { return iterator{}; }

    // Drains a fresh traversal into a vector.
    auto collect() const -> std::vector<Node*>;

private:
    Node*            start;
    LinkIndex const* links;
    IterOptions      options;
};

/**
 * @brief Ownership tree of groups and leaves plus its link edges.
 *
 * Paths passed to the mutating calls are dot separated and relative to the
 * root. Branch abbreviations and run aliases are translated before use.
 * Every mutating call validates the whole path before touching the tree.
 */
class NodeTree {
public:
    NodeTree();
    ~NodeTree() = default;

    NodeTree(NodeTree const&)            = delete;
    NodeTree& operator=(NodeTree const&) = delete;

    auto root() -> Node& { return *this->rootNode; }
    auto root() const -> Node const& { return *this->rootNode; }
    auto links() -> LinkIndex& { return this->linkIndex; }
    auto links() const -> LinkIndex const& { return this->linkIndex; }
    auto resolver() const -> NamingResolver const& { return this->naming; }

    auto addGroup(std::string_view path, std::optional<std::string> const& runName = std::nullopt) -> Expected<Node*>;
    auto addLeaf(std::string_view path, std::unique_ptr<Item> item, bool replace = false, std::optional<std::string> const& runName = std::nullopt)
            -> Expected<Node*>;
    auto addLink(Node& owner, std::string const& name, Node& target) -> Expected<void>;

    auto resolve(std::string_view path, ResolveOptions const& options = {}) -> Expected<Node*>;
    auto resolveFrom(Node& start, std::string_view path, ResolveOptions const& options = {}) -> Expected<Node*>;
    auto findAll(std::string_view path, ResolveOptions const& options = {}) -> Expected<std::vector<Node*>>;
    auto contains(std::string_view path, bool withLinks = true, bool shortcuts = true) -> bool;

    // Exact lookup by full name through real children only.
    auto find(std::string_view fullName) -> Node*;

    auto removeChild(Node& owner, std::string_view name, RemoveOptions const& options = {}) -> Expected<void>;
    auto removeNode(Node& node, RemoveOptions const& options = {}) -> Expected<void>;

    auto iterNodes(Node& start, IterOptions options = {}) const -> NodeRange;
    auto iterNodes(IterOptions options = {}) -> NodeRange { return this->iterNodes(*this->rootNode, options); }

    auto clear() -> void;

private:
    auto ensurePath(std::vector<std::string> const& segments, NodeKind finalKind, bool replace) -> Expected<Node*>;

    std::unique_ptr<Node> rootNode;
    LinkIndex             linkIndex;
    NamingResolver        naming;
};

} // namespace TS
