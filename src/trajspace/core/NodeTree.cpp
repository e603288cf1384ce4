#include "core/NodeTree.hpp"

#include "log/TaggedLogger.hpp"

namespace TS {

auto NodeRange::State::enqueueChildrenOf(Node& node, std::size_t depth) -> void {
    if (!node.isGroup())
        return;
    for (auto const& childName : node.childNames()) {
        Node* child = node.getChild(childName);
        if (this->visited.insert(child).second)
            this->pending.emplace_back(child, depth);
    }
    if (this->options.withLinks) {
        for (auto const& [linkName, target] : this->links->targetsOf(node)) {
            if (this->visited.insert(target).second)
                this->pending.emplace_back(target, depth);
        }
    }
}

auto NodeRange::State::next() -> Node* {
    if (this->pending.empty())
        return nullptr;
    auto [node, depth] = this->pending.front();
    this->pending.pop_front();
    bool const deeper = this->options.recursive && (!this->options.maxDepth || depth < *this->options.maxDepth);
    if (deeper)
        this->enqueueChildrenOf(*node, depth + 1);
    return node;
}

NodeRange::NodeRange(Node& startNode, LinkIndex const& linkIndex, IterOptions iterOptions)
    : start(&startNode), links(&linkIndex), options(iterOptions) {}

auto NodeRange::begin() const -> iterator {
    auto state     = std::make_shared<State>();
    state->links   = this->links;
    state->options = this->options;
    state->visited.insert(this->start);
    if (!this->options.maxDepth || *this->options.maxDepth > 0)
        state->enqueueChildrenOf(*this->start, 1);
    return iterator{std::move(state)};
}

auto NodeRange::collect() const -> std::vector<Node*> {
    std::vector<Node*> nodes;
    for (auto& node : *this)
        nodes.push_back(&node);
    return nodes;
}

NodeTree::NodeTree()
    : rootNode(std::make_unique<Node>()), linkIndex(*rootNode), naming(linkIndex) {}

auto NodeTree::ensurePath(std::vector<std::string> const& segments, NodeKind finalKind, bool replace) -> Expected<Node*> {
    if (segments.empty())
        return std::unexpected(Error{Error::Code::InvalidPath, "Empty path"});
    for (auto const& segment : segments) {
        if (!isValidName(segment))
            return std::unexpected(Error{Error::Code::InvalidPath, "Invalid name '" + segment + "'"});
    }

    // Validation pass: nothing is created before the whole path is known to fit.
    Node*       current  = this->rootNode.get();
    std::size_t existing = 0;
    for (; existing < segments.size(); ++existing) {
        auto const& segment = segments[existing];
        bool const  last    = existing + 1 == segments.size();
        if (this->linkIndex.hasLink(*current, segment)) {
            if (last)
                return std::unexpected(Error{Error::Code::AlreadyExists, "'" + segment + "' is a link of " + current->fullName});
            return std::unexpected(Error{Error::Code::TypeMismatch, "Cannot add below link '" + joinName(current->fullName, segment) + "'"});
        }
        Node* child = current->getChild(segment);
        if (!child)
            break;
        if (!last && child->isLeaf())
            return std::unexpected(Error{Error::Code::TypeMismatch, "Cannot add below leaf " + child->fullName});
        if (last) {
            if (child->kind != finalKind) {
                return std::unexpected(Error{Error::Code::TypeMismatch,
                                             child->fullName + " already exists as a " + (child->isLeaf() ? "leaf" : "group")});
            }
            if (child->isLeaf() && !replace)
                return std::unexpected(Error{Error::Code::AlreadyExists, child->fullName + " already exists"});
        }
        current = child;
    }

    for (std::size_t i = existing; i < segments.size(); ++i) {
        bool const last = i + 1 == segments.size();
        current         = &current->emplaceChild(segments[i], last ? finalKind : NodeKind::Group);
        ts_log("NodeTree::ensurePath created " + current->fullName, "NodeTree");
    }
    return current;
}

auto NodeTree::addGroup(std::string_view path, std::optional<std::string> const& runName) -> Expected<Node*> {
    auto segments = translatePath(path, runName);
    if (!segments)
        return std::unexpected(segments.error());
    return this->ensurePath(*segments, NodeKind::Group, false);
}

auto NodeTree::addLeaf(std::string_view path, std::unique_ptr<Item> item, bool replace, std::optional<std::string> const& runName)
        -> Expected<Node*> {
    if (!item)
        return std::unexpected(Error{Error::Code::InvalidArgument, "Leaf '" + std::string(path) + "' needs an item"});
    auto segments = translatePath(path, runName);
    if (!segments)
        return std::unexpected(segments.error());
    auto node = this->ensurePath(*segments, NodeKind::Leaf, replace);
    if (!node)
        return node;
    item->setOwnerName((*node)->fullName);
    (*node)->item = std::move(item);
    return node;
}

auto NodeTree::addLink(Node& owner, std::string const& name, Node& target) -> Expected<void> {
    if (!isValidName(name))
        return std::unexpected(Error{Error::Code::InvalidPath, "Invalid link name '" + name + "'"});
    return this->linkIndex.addLink(owner, name, target);
}

auto NodeTree::resolve(std::string_view path, ResolveOptions const& options) -> Expected<Node*> {
    return this->naming.resolve(*this->rootNode, path, options);
}

auto NodeTree::resolveFrom(Node& start, std::string_view path, ResolveOptions const& options) -> Expected<Node*> {
    return this->naming.resolve(start, path, options);
}

auto NodeTree::findAll(std::string_view path, ResolveOptions const& options) -> Expected<std::vector<Node*>> {
    return this->naming.findAll(*this->rootNode, path, options);
}

auto NodeTree::contains(std::string_view path, bool withLinks, bool shortcuts) -> bool {
    ResolveOptions options;
    options.withLinks = withLinks;
    options.shortcuts = shortcuts;
    return this->naming.resolve(*this->rootNode, path, options).has_value();
}

auto NodeTree::find(std::string_view fullName) -> Node* {
    Node* current = this->rootNode.get();
    if (fullName.empty())
        return current;
    for (auto const& segment : splitPath(fullName)) {
        current = current->getChild(segment);
        if (!current)
            return nullptr;
    }
    return current;
}

auto NodeTree::removeChild(Node& owner, std::string_view name, RemoveOptions const& options) -> Expected<void> {
    Node* child = owner.getChild(name);
    if (!child) {
        if (this->linkIndex.hasLink(owner, name))
            return this->linkIndex.removeLink(owner, name);
        return std::unexpected(Error{Error::Code::NoSuchPath, "No child '" + std::string(name) + "' in " + owner.fullName});
    }
    if (child->hasChildren() && !options.recursive)
        return std::unexpected(Error{Error::Code::NotEmpty, child->fullName + " has children, remove it recursively"});

    std::vector<Node*> subtree{child};
    for (std::size_t i = 0; i < subtree.size(); ++i) {
        for (auto& [childName, grandChild] : subtree[i]->children)
            subtree.push_back(grandChild.get());
    }

    if (!options.removeLinks) {
        for (Node* node : subtree) {
            for (auto const& ref : this->linkIndex.ownersOf(*node)) {
                if (!ref.owner->isWithin(*child)) {
                    return std::unexpected(Error{Error::Code::LinkedNode,
                                                 node->fullName + " is still linked as " + joinName(ref.owner->fullName, ref.name)});
                }
            }
        }
    }

    for (Node* node : subtree) {
        this->linkIndex.dropOwnedBy(*node);
        this->linkIndex.dropTargeting(*node);
    }
    ts_log("NodeTree::removeChild " + child->fullName + " nodes=" + std::to_string(subtree.size()), "NodeTree");
    owner.releaseChild(name);
    return {};
}

auto NodeTree::removeNode(Node& node, RemoveOptions const& options) -> Expected<void> {
    if (node.isRoot())
        return std::unexpected(Error{Error::Code::InvalidArgument, "Cannot remove the root"});
    return this->removeChild(*node.parent, node.name, options);
}

auto NodeTree::iterNodes(Node& start, IterOptions options) const -> NodeRange {
    return NodeRange{start, this->linkIndex, options};
}

auto NodeTree::clear() -> void {
    this->linkIndex.clear();
    this->rootNode->children.clear();
}

} // namespace TS
