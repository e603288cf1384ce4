#include "core/Node.hpp"

#include <algorithm>

namespace TS {

auto joinName(std::string_view parentFullName, std::string_view childName) -> std::string {
    if (parentFullName.empty())
        return std::string(childName);
    std::string result;
    result.reserve(parentFullName.size() + 1 + childName.size());
    result.append(parentFullName);
    result.push_back('.');
    result.append(childName);
    return result;
}

Node::Node(std::string nodeName, Node* parentNode, NodeKind nodeKind)
    : name(std::move(nodeName)), parent(parentNode), kind(nodeKind) {
    this->fullName = parentNode ? joinName(parentNode->fullName, this->name) : std::string{};
}

auto Node::depth() const -> std::size_t {
    std::size_t result = 0;
    for (Node const* current = this->parent; current; current = current->parent)
        ++result;
    return result;
}

auto Node::childNames() const -> std::vector<std::string> {
    std::vector<std::string> names;
    names.reserve(this->children.size());
    for (auto const& [childName, child] : this->children)
        names.push_back(childName);
    std::sort(names.begin(), names.end());
    return names;
}

auto Node::emplaceChild(std::string const& childName, NodeKind childKind) -> Node& {
    auto [it, inserted] = this->children.try_emplace(childName, std::make_unique<Node>(childName, this, childKind));
    return *it->second;
}

auto Node::releaseChild(std::string_view childName) -> std::unique_ptr<Node> {
    auto it = this->children.find(childName);
    if (it == this->children.end())
        return nullptr;
    auto released = std::move(it->second);
    this->children.erase(it);
    released->parent = nullptr;
    return released;
}

auto Node::isWithin(Node const& other) const -> bool {
    for (Node const* current = this; current; current = current->parent) {
        if (current == &other)
            return true;
    }
    return false;
}

} // namespace TS
