#include "link/LinkIndex.hpp"

#include "log/TaggedLogger.hpp"

#include <vector>

namespace TS {

LinkIndex::LinkIndex(Node const& rootNode)
    : root(&rootNode) {}

auto LinkIndex::addLink(Node& owner, std::string const& name, Node& target) -> Expected<void> {
    if (name.empty() || name.find('.') != std::string::npos)
        return std::unexpected(Error{Error::Code::InvalidPath, "Invalid link name '" + name + "'"});
    if (!owner.isWithin(*this->root) || !target.isWithin(*this->root))
        return std::unexpected(Error{Error::Code::InvalidLinkTarget, "Links can only connect nodes of the same tree"});
    if (!owner.isGroup())
        return std::unexpected(Error{Error::Code::TypeMismatch, "Cannot add link '" + name + "' below leaf " + owner.fullName});
    if (target.isRoot())
        return std::unexpected(Error{Error::Code::InvalidLinkTarget, "Cannot link to the trajectory root"});
    if (owner.getChild(name))
        return std::unexpected(Error{Error::Code::AlreadyExists,
                                     "'" + name + "' is already a child of " + (owner.isRoot() ? "the root" : owner.fullName)});
    auto& links = this->forward[&owner];
    if (auto it = links.find(name); it != links.end()) {
        if (it->second == &target)
            return {};
        return std::unexpected(Error{Error::Code::AlreadyExists, "Link '" + name + "' already exists in " + owner.fullName});
    }
    links.emplace(name, &target);
    this->reverse[&target].insert(LinkRef{&owner, name});
    ts_log("LinkIndex::addLink " + owner.fullName + "." + name + " -> " + target.fullName, "LinkIndex");
    return {};
}

auto LinkIndex::removeLink(Node& owner, std::string_view name) -> Expected<void> {
    auto ownerIt = this->forward.find(&owner);
    if (ownerIt == this->forward.end())
        return std::unexpected(Error{Error::Code::NoSuchPath, "No link '" + std::string(name) + "' in " + owner.fullName});
    auto linkIt = ownerIt->second.find(name);
    if (linkIt == ownerIt->second.end())
        return std::unexpected(Error{Error::Code::NoSuchPath, "No link '" + std::string(name) + "' in " + owner.fullName});

    Node* target = linkIt->second;
    if (auto revIt = this->reverse.find(target); revIt != this->reverse.end()) {
        revIt->second.erase(LinkRef{&owner, linkIt->first});
        if (revIt->second.empty())
            this->reverse.erase(revIt);
    }
    ownerIt->second.erase(linkIt);
    if (ownerIt->second.empty())
        this->forward.erase(ownerIt);
    return {};
}

auto LinkIndex::hasLink(Node const& owner, std::string_view name) const -> bool {
    return this->target(owner, name) != nullptr;
}

auto LinkIndex::target(Node const& owner, std::string_view name) const -> Node* {
    auto ownerIt = this->forward.find(&owner);
    if (ownerIt == this->forward.end())
        return nullptr;
    auto linkIt = ownerIt->second.find(name);
    return linkIt == ownerIt->second.end() ? nullptr : linkIt->second;
}

auto LinkIndex::targetsOf(Node const& owner) const -> std::map<std::string, Node*> {
    auto ownerIt = this->forward.find(&owner);
    if (ownerIt == this->forward.end())
        return {};
    return {ownerIt->second.begin(), ownerIt->second.end()};
}

auto LinkIndex::ownersOf(Node const& target) const -> std::set<LinkRef> {
    auto it = this->reverse.find(&target);
    return it == this->reverse.end() ? std::set<LinkRef>{} : it->second;
}

auto LinkIndex::refCount(Node const& target) const -> std::size_t {
    auto it = this->reverse.find(&target);
    return it == this->reverse.end() ? 0 : it->second.size();
}

auto LinkIndex::size() const -> std::size_t {
    std::size_t total = 0;
    for (auto const& [owner, links] : this->forward)
        total += links.size();
    return total;
}

auto LinkIndex::dropOwnedBy(Node const& owner) -> void {
    auto ownerIt = this->forward.find(&owner);
    if (ownerIt == this->forward.end())
        return;
    for (auto const& [name, target] : ownerIt->second) {
        if (auto revIt = this->reverse.find(target); revIt != this->reverse.end()) {
            revIt->second.erase(LinkRef{const_cast<Node*>(&owner), name});
            if (revIt->second.empty())
                this->reverse.erase(revIt);
        }
    }
    this->forward.erase(ownerIt);
}

auto LinkIndex::dropTargeting(Node const& target) -> void {
    auto revIt = this->reverse.find(&target);
    if (revIt == this->reverse.end())
        return;
    std::vector<LinkRef> refs(revIt->second.begin(), revIt->second.end());
    this->reverse.erase(revIt);
    for (auto const& ref : refs) {
        auto ownerIt = this->forward.find(ref.owner);
        if (ownerIt == this->forward.end())
            continue;
        ownerIt->second.erase(ref.name);
        if (ownerIt->second.empty())
            this->forward.erase(ownerIt);
    }
}

auto LinkIndex::clear() -> void {
    this->forward.clear();
    this->reverse.clear();
}

auto LinkIndex::forEach(std::function<void(Node& owner, std::string const& name, Node& target)> const& fn) const -> void {
    for (auto const& [owner, links] : this->forward) {
        for (auto const& [name, target] : links)
            fn(*const_cast<Node*>(owner), name, *target);
    }
}

} // namespace TS
