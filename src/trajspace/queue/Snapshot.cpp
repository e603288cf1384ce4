#include "queue/Snapshot.hpp"

#include "log/TaggedLogger.hpp"

#include <alpaca/alpaca.h>

#include <set>
#include <system_error>

namespace TS {

namespace {

template <typename T>
struct Wrapper {
    T obj;
};

auto entryOf(Node const& node) -> SnapshotEntry {
    SnapshotEntry entry;
    entry.fullName    = node.fullName;
    entry.kind        = node.isLeaf() ? 1 : 0;
    entry.comment     = node.comment;
    entry.annotations = Value(node.annotations).dump();
    entry.stored      = node.stored;
    if (node.isLeaf() && node.item) {
        entry.itemType = std::string(itemKindToString(node.item->kind()));
        entry.payload  = node.item->store().dump();
        entry.locked   = node.item->isLocked();
    }
    return entry;
}

auto parseJson(std::string const& text, std::string const& what) -> Expected<Value> {
    if (text.empty())
        return Value::object();
    auto parsed = Value::parse(text, nullptr, false);
    if (parsed.is_discarded())
        return std::unexpected(Error{Error::Code::MalformedInput, "Snapshot holds malformed JSON for " + what});
    return parsed;
}

auto parentName(std::string const& fullName) -> std::string {
    auto dot = fullName.rfind('.');
    return dot == std::string::npos ? std::string{} : fullName.substr(0, dot);
}

auto lastSegment(std::string const& fullName) -> std::string {
    auto dot = fullName.rfind('.');
    return dot == std::string::npos ? fullName : fullName.substr(dot + 1);
}

auto captureLinks(NodeTree& tree, TreeSnapshot& snapshot) -> void {
    tree.links().forEach([&](Node& owner, std::string const& name, Node& target) {
        snapshot.links.push_back(SnapshotLink{owner.fullName, name, target.fullName});
    });
}

} // namespace

auto captureTree(NodeTree& tree) -> TreeSnapshot {
    TreeSnapshot snapshot;
    for (auto& node : tree.iterNodes(IterOptions{.recursive = true, .withLinks = false}))
        snapshot.entries.push_back(entryOf(node));
    captureLinks(tree, snapshot);
    return snapshot;
}

auto captureSubtrees(NodeTree& tree, std::vector<Node*> const& tops) -> TreeSnapshot {
    TreeSnapshot snapshot;
    for (Node* top : tops) {
        snapshot.entries.push_back(entryOf(*top));
        for (auto& node : tree.iterNodes(*top, IterOptions{.recursive = true, .withLinks = false}))
            snapshot.entries.push_back(entryOf(node));
    }
    captureLinks(tree, snapshot);
    return snapshot;
}

auto graftSnapshot(NodeTree& tree, TreeSnapshot const& snapshot) -> Expected<GraftResult> {
    GraftResult           result;
    std::set<std::string> grafted;
    for (auto const& entry : snapshot.entries) {
        NodeKind const kind = entry.kind == 1 ? NodeKind::Leaf : NodeKind::Group;
        if (Node* existing = tree.find(entry.fullName)) {
            if (existing->kind != kind)
                return std::unexpected(Error{Error::Code::TypeMismatch, entry.fullName + " changed between group and leaf"});
            if (!grafted.contains(parentName(entry.fullName)))
                result.tops.push_back(existing);
            grafted.insert(entry.fullName);
            continue;
        }

        auto const parentFullName = parentName(entry.fullName);
        Node*      parent         = tree.find(parentFullName);
        if (!parent) {
            auto created = tree.addGroup(parentFullName);
            if (!created)
                return std::unexpected(created.error());
            parent = *created;
        }
        if (!parent->isGroup())
            return std::unexpected(Error{Error::Code::TypeMismatch, "Cannot graft below leaf " + parent->fullName});

        auto annotations = parseJson(entry.annotations, entry.fullName);
        if (!annotations)
            return std::unexpected(annotations.error());
        std::unique_ptr<Item> item;
        if (kind == NodeKind::Leaf) {
            auto itemKind = itemKindFromString(entry.itemType);
            if (!itemKind)
                return std::unexpected(itemKind.error());
            item         = makeItem(*itemKind);
            auto payload = parseJson(entry.payload, entry.fullName);
            if (!payload)
                return std::unexpected(payload.error());
            if (auto loaded = item->load(*payload); !loaded)
                return std::unexpected(loaded.error());
            if (entry.locked)
                item->lock();
        }

        Node& node = parent->emplaceChild(lastSegment(entry.fullName), kind);
        node.comment = entry.comment;
        for (auto it = annotations->begin(); it != annotations->end(); ++it)
            node.annotations[it.key()] = it.value();
        node.stored = entry.stored;
        if (item) {
            item->setOwnerName(node.fullName);
            node.item = std::move(item);
        }
        if (!grafted.contains(parentFullName))
            result.tops.push_back(&node);
        grafted.insert(entry.fullName);
    }

    for (auto const& link : snapshot.links) {
        Node* owner  = tree.find(link.owner);
        Node* target = tree.find(link.target);
        if (!owner || !target)
            return std::unexpected(Error{Error::Code::InvalidLinkTarget, "Snapshot link " + link.owner + "." + link.name + " is dangling"});
        if (tree.links().target(*owner, link.name) == target)
            continue;
        if (auto added = tree.addLink(*owner, link.name, *target); !added)
            return std::unexpected(added.error());
        result.linkOwners.push_back(owner);
    }
    return result;
}

auto encodeSnapshot(TreeSnapshot const& snapshot) -> Expected<std::vector<std::uint8_t>> {
    try {
        Wrapper<TreeSnapshot> wrapper{snapshot};
        std::vector<uint8_t>  bytes;
        (void)alpaca::serialize<Wrapper<TreeSnapshot>, 1>(wrapper, bytes);
        return bytes;
    } catch (std::exception const& e) {
        return std::unexpected(Error{Error::Code::MalformedInput, std::string("Snapshot serialization failed: ") + e.what()});
    }
}

auto decodeSnapshot(std::vector<std::uint8_t> const& bytes) -> Expected<TreeSnapshot> {
    try {
        std::error_code ec;
        auto const      wrapper = alpaca::deserialize<Wrapper<TreeSnapshot>, 1>(bytes, ec);
        if (ec)
            return std::unexpected(Error{Error::Code::MalformedInput, "Snapshot decoding failed: " + ec.message()});
        return wrapper.obj;
    } catch (std::exception const& e) {
        return std::unexpected(Error{Error::Code::MalformedInput, std::string("Snapshot decoding failed: ") + e.what()});
    }
}

auto runsToSnapshot(std::vector<RunInfo> const& runs) -> std::vector<SnapshotRun> {
    std::vector<SnapshotRun> result;
    result.reserve(runs.size());
    for (auto const& run : runs)
        result.push_back(SnapshotRun{run.index, run.name, run.completed});
    return result;
}

auto runsFromSnapshot(std::vector<SnapshotRun> const& runs) -> std::vector<RunInfo> {
    std::vector<RunInfo> result;
    result.reserve(runs.size());
    for (auto const& run : runs)
        result.push_back(RunInfo{static_cast<std::size_t>(run.index), run.name, run.completed});
    return result;
}

} // namespace TS
