#include "storage/StorageCoordinator.hpp"

#include "log/TaggedLogger.hpp"
#include "path/Naming.hpp"

#include <algorithm>
#include <deque>
#include <set>

namespace TS {

namespace {

constexpr std::string_view KindGroup      = "group";
constexpr std::string_view KindLeaf       = "leaf";
constexpr std::string_view KindLink       = "link";
constexpr std::string_view KindTrajectory = "trajectory";

constexpr std::string_view Branches[] = {Branch::Config, Branch::Parameters, Branch::DerivedParameters, Branch::Results};

auto recordKind(NodeRecord const& record) -> std::string {
    if (!record.skeleton.is_object())
        return {};
    return record.skeleton.value("kind", std::string{});
}

auto payloadKeys(Value const& payload) -> std::set<std::string> {
    std::set<std::string> keys;
    if (payload.is_object()) {
        for (auto it = payload.begin(); it != payload.end(); ++it)
            keys.insert(it.key());
    }
    return keys;
}

auto branchOf(std::string_view fullName) -> std::string_view {
    return fullName.substr(0, fullName.find('.'));
}

auto isSameOrBelow(std::string_view key, std::string_view fullName) -> bool {
    return key == fullName || (key.size() > fullName.size() && key.starts_with(fullName) && key[fullName.size()] == '.');
}

} // namespace

auto TrajectoryRecord::skeleton() const -> Value {
    return Value{{"kind", KindTrajectory}, {"name", this->name}, {"version", this->version}, {"comment", this->comment}};
}

auto TrajectoryRecord::payload() const -> Value {
    Value runList = Value::array();
    for (auto const& run : this->runs)
        runList.push_back(Value{{"index", run.index}, {"name", run.name}, {"completed", run.completed}});
    return Value{{"runs", std::move(runList)}};
}

auto TrajectoryRecord::fromRecord(NodeRecord const& record) -> Expected<TrajectoryRecord> {
    if (recordKind(record) != KindTrajectory)
        return std::unexpected(Error{Error::Code::MalformedInput, "Root record is not a trajectory"});
    TrajectoryRecord result;
    result.name    = record.skeleton.value("name", std::string{});
    result.version = record.skeleton.value("version", std::string{});
    result.comment = record.skeleton.value("comment", std::string{});
    if (record.payload && record.payload->is_object()) {
        for (auto const& run : record.payload->value("runs", Value::array())) {
            if (!run.is_object())
                return std::unexpected(Error{Error::Code::MalformedInput, "Malformed run entry in trajectory " + result.name});
            result.runs.push_back(RunInfo{run.value("index", std::size_t{0}), run.value("name", std::string{}), run.value("completed", false)});
        }
    }
    return result;
}

StorageCoordinator::StorageCoordinator(StorageBackend& backend, std::string trajectoryName, std::string version, std::size_t maxOverviewRows)
    : storage(&backend), name(std::move(trajectoryName)), formatVersion(std::move(version)), overviewCap(maxOverviewRows) {}

auto StorageCoordinator::storagePath(std::string_view fullName) const -> std::string {
    if (fullName.empty())
        return this->name;
    return joinName(this->name, fullName);
}

auto StorageCoordinator::overviewTable(std::string_view branch) const -> std::string {
    return this->name + "." + std::string(branch);
}

auto StorageCoordinator::skeletonOf(Node const& node) -> Value {
    Value skeleton = Value::object();
    skeleton["kind"]        = node.isLeaf() ? KindLeaf : KindGroup;
    skeleton["comment"]     = node.comment;
    skeleton["annotations"] = node.annotations;
    if (node.isLeaf() && node.item)
        skeleton["item_type"] = itemKindToString(node.item->kind());
    return skeleton;
}

// ---------------------------------------------------------------- store

auto StorageCoordinator::storeAncestors(Node& node) -> Expected<void> {
    std::vector<Node*> chain;
    for (Node* current = node.parent; current && !current->isRoot(); current = current->parent)
        chain.push_back(current);
    std::reverse(chain.begin(), chain.end());
    for (Node* ancestor : chain) {
        if (ancestor->stored)
            continue;
        if (auto written = this->storeOne(*ancestor, StoreOptions{.level = StoreLevel::Skeleton}); !written)
            return written;
    }
    return {};
}

auto StorageCoordinator::storeOne(Node& node, StoreOptions const& options) -> Expected<void> {
    auto const path            = this->storagePath(node.fullName);
    auto       skeleton        = skeletonOf(node);
    bool const skeletonChanged = !node.storedSkeleton || *node.storedSkeleton != skeleton;

    std::optional<Value> payload;
    if (node.isLeaf() && node.item && options.level != StoreLevel::Skeleton) {
        auto const full = node.item->store();
        if (options.level == StoreLevel::Overwrite || !node.payloadStored) {
            payload = full;
        } else {
            std::set<std::string> selected(options.overwriteFields.begin(), options.overwriteFields.end());
            if (options.level == StoreLevel::Incremental) {
                for (auto const& field : node.item->fieldNames()) {
                    if (!node.storedFields.contains(field))
                        selected.insert(field);
                }
            }
            if (!selected.empty()) {
                auto existing = this->storage->readNode(path);
                if (!existing && existing.error().code != Error::Code::DataNotInStorage)
                    return std::unexpected(existing.error());
                Value merged = existing && existing->payload && existing->payload->is_object() ? *existing->payload : Value::object();
                for (auto const& field : selected) {
                    if (auto it = full.find(field); it != full.end())
                        merged[field] = *it;
                    else
                        merged.erase(field);
                }
                payload = std::move(merged);
            }
        }
    }

    if (!payload && !skeletonChanged)
        return {};
    if (auto written = this->storage->writeNode(path, skeleton, payload); !written)
        return written;
    ts_log("StorageCoordinator::store " + path + (payload ? " with payload" : " skeleton"), "Storage");

    node.stored         = true;
    node.storedSkeleton = std::move(skeleton);
    if (payload) {
        node.payloadStored = true;
        node.storedFields  = payloadKeys(*payload);
    }
    if (node.isLeaf() && node.item)
        return this->indexLeaf(node);
    return {};
}

auto StorageCoordinator::indexLeaf(Node const& node) -> Expected<void> {
    auto const table = this->overviewTable(branchOf(node.fullName));
    if (!this->storage->overviewHas(table, node.fullName) && this->storage->overviewSize(table) >= this->overviewCap) {
        ts_log("Overview " + table + " is full, not indexing " + node.fullName, "Storage");
        return {};
    }
    Value row{{"item_type", itemKindToString(node.item->kind())}, {"comment", node.comment}, {"value", node.item->toDict()}};
    return this->storage->upsertOverview(table, node.fullName, row);
}

auto StorageCoordinator::storeLinksOf(NodeTree& tree, Node& owner) -> Expected<void> {
    for (auto const& [linkName, target] : tree.links().targetsOf(owner)) {
        if (!target->stored) {
            if (auto ancestors = this->storeAncestors(*target); !ancestors)
                return ancestors;
            if (auto written = this->storeOne(*target, StoreOptions{.level = StoreLevel::Skeleton}); !written)
                return written;
        }
        auto const path     = this->storagePath(joinName(owner.fullName, linkName));
        Value      skeleton{{"kind", KindLink}, {"target", target->fullName}};
        auto       existing = this->storage->readNode(path);
        if (existing && existing->skeleton == skeleton)
            continue;
        if (auto written = this->storage->writeNode(path, skeleton, std::nullopt); !written)
            return written;
    }
    return {};
}

auto StorageCoordinator::store(NodeTree& tree, Node& node, StoreOptions const& options) -> Expected<void> {
    if (!node.isRoot()) {
        if (auto ancestors = this->storeAncestors(node); !ancestors)
            return ancestors;
        if (auto written = this->storeOne(node, options); !written)
            return written;
    }

    std::optional<std::size_t> const maxDepth = options.recursive ? options.maxDepth : std::optional<std::size_t>{0};

    std::deque<std::pair<Node*, std::size_t>> pending{{&node, 0}};
    while (!pending.empty()) {
        auto [current, depth] = pending.front();
        pending.pop_front();
        if (!current->isGroup() || (maxDepth && depth >= *maxDepth))
            continue;
        if (options.withLinks) {
            if (auto links = this->storeLinksOf(tree, *current); !links)
                return links;
        }
        for (auto const& childName : current->childNames()) {
            Node* child = current->getChild(childName);
            if (auto written = this->storeOne(*child, options); !written)
                return written;
            pending.emplace_back(child, depth + 1);
        }
    }
    return {};
}

// ---------------------------------------------------------------- load

auto StorageCoordinator::filterPayload(Value const& payload, LoadOptions const& options) const -> Value {
    if (!payload.is_object() || (options.loadOnly.empty() && options.loadExcept.empty()))
        return payload;
    Value filtered = Value::object();
    for (auto it = payload.begin(); it != payload.end(); ++it) {
        bool const listedOnly   = std::find(options.loadOnly.begin(), options.loadOnly.end(), it.key()) != options.loadOnly.end();
        bool const listedExcept = std::find(options.loadExcept.begin(), options.loadExcept.end(), it.key()) != options.loadExcept.end();
        if (!options.loadOnly.empty() ? listedOnly : !listedExcept)
            filtered[it.key()] = it.value();
    }
    return filtered;
}

auto StorageCoordinator::materialize(Node& parent, std::string const& childName, NodeRecord const& record, LoadOptions const& options)
        -> Expected<Node*> {
    auto const kindText = recordKind(record);
    if (kindText != KindGroup && kindText != KindLeaf)
        return std::unexpected(Error{Error::Code::MalformedInput, "Stored node " + joinName(parent.fullName, childName) + " has no valid kind"});
    NodeKind const kind = kindText == KindLeaf ? NodeKind::Leaf : NodeKind::Group;

    Node* node    = parent.getChild(childName);
    bool  created = false;
    if (!node) {
        std::unique_ptr<Item> item;
        if (kind == NodeKind::Leaf) {
            auto itemKind = itemKindFromString(record.skeleton.value("item_type", std::string{}));
            if (!itemKind)
                return std::unexpected(itemKind.error());
            item = makeItem(*itemKind);
        }
        node = &parent.emplaceChild(childName, kind);
        if (item) {
            item->setOwnerName(node->fullName);
            node->item = std::move(item);
        }
        created = true;
    } else if (node->kind != kind) {
        return std::unexpected(Error{Error::Code::TypeMismatch, node->fullName + " is stored as a " + kindText});
    }

    if (created || options.level == LoadLevel::Overwrite) {
        node->comment = record.skeleton.value("comment", std::string{});
        node->annotations.clear();
        if (auto it = record.skeleton.find("annotations"); it != record.skeleton.end() && it->is_object()) {
            for (auto annotation = it->begin(); annotation != it->end(); ++annotation)
                node->annotations[annotation.key()] = annotation.value();
        }
    }
    node->stored         = true;
    node->storedSkeleton = record.skeleton;

    if (node->isLeaf() && node->item && record.payload) {
        bool const loadData = options.level == LoadLevel::Overwrite
                              || (options.level == LoadLevel::Data && (created || node->item->isEmpty()));
        if (loadData) {
            bool const filtered = !options.loadOnly.empty() || !options.loadExcept.empty();
            if (options.level == LoadLevel::Overwrite && !filtered)
                node->item->clear();
            if (auto loaded = node->item->load(this->filterPayload(*record.payload, options)); !loaded)
                return std::unexpected(loaded.error());
        }
        node->payloadStored = true;
        node->storedFields  = payloadKeys(*record.payload);
    }
    return node;
}

auto StorageCoordinator::ensureAncestors(NodeTree& tree, std::vector<std::string> const& segments) -> Expected<Node*> {
    Node*       current = &tree.root();
    std::string fullName;
    for (auto const& segment : segments) {
        fullName    = joinName(fullName, segment);
        Node* child = current->getChild(segment);
        if (!child) {
            auto record = this->storage->readNode(this->storagePath(fullName));
            if (!record)
                return std::unexpected(record.error());
            auto created = this->materialize(*current, segment, *record, LoadOptions{.level = LoadLevel::Skeleton});
            if (!created)
                return created;
            child = *created;
        }
        if (!child->isGroup())
            return std::unexpected(Error{Error::Code::TypeMismatch, child->fullName + " is a leaf"});
        current = child;
    }
    return current;
}

auto StorageCoordinator::loadLink(NodeTree& tree, Node& owner, std::string const& linkName, NodeRecord const& record) -> Expected<void> {
    auto const targetName = record.skeleton.value("target", std::string{});
    if (targetName.empty())
        return std::unexpected(Error{Error::Code::MalformedInput, "Link " + joinName(owner.fullName, linkName) + " has no target"});
    Node* target = tree.find(targetName);
    if (!target) {
        auto loaded = this->load(tree, targetName,
                                 LoadOptions{.recursive = false, .level = LoadLevel::Skeleton, .withLinks = false, .force = true});
        if (!loaded)
            return std::unexpected(loaded.error());
        target = *loaded;
    }
    if (tree.links().target(owner, linkName) == target)
        return {};
    return tree.addLink(owner, linkName, *target);
}

auto StorageCoordinator::load(NodeTree& tree, std::string_view fullName, LoadOptions const& options) -> Expected<Node*> {
    if (!options.loadOnly.empty() && !options.loadExcept.empty())
        return std::unexpected(Error{Error::Code::InvalidArgument, "Use either loadOnly or loadExcept, not both"});
    if (!options.force) {
        if (auto checked = this->checkVersion(false); !checked)
            return std::unexpected(checked.error());
    }

    Node* node = &tree.root();
    if (!fullName.empty()) {
        auto segments = splitPath(fullName);
        auto last     = segments.back();
        segments.pop_back();
        auto parent = this->ensureAncestors(tree, segments);
        if (!parent)
            return parent;
        auto record = this->storage->readNode(this->storagePath(fullName));
        if (!record)
            return std::unexpected(record.error());
        if (recordKind(*record) == KindLink) {
            if (!options.withLinks)
                return std::unexpected(Error{Error::Code::NoSuchPath, std::string(fullName) + " is a link"});
            if (auto linked = this->loadLink(tree, **parent, last, *record); !linked)
                return std::unexpected(linked.error());
            return tree.links().target(**parent, last);
        }
        auto materialized = this->materialize(**parent, last, *record, options);
        if (!materialized)
            return materialized;
        node = *materialized;
    }

    std::optional<std::size_t> const maxDepth = options.recursive ? options.maxDepth : std::optional<std::size_t>{0};

    std::deque<std::pair<Node*, std::size_t>> pending{{node, 0}};
    while (!pending.empty()) {
        auto [current, depth] = pending.front();
        pending.pop_front();
        if (!current->isGroup() || (maxDepth && depth >= *maxDepth))
            continue;
        auto const path     = this->storagePath(current->fullName);
        auto       children = this->storage->listChildren(path);
        if (!children)
            return std::unexpected(children.error());
        for (auto const& childName : *children) {
            auto record = this->storage->readNode(joinName(path, childName));
            if (!record)
                return std::unexpected(record.error());
            if (recordKind(*record) == KindLink) {
                if (!options.withLinks)
                    continue;
                if (auto linked = this->loadLink(tree, *current, childName, *record); !linked)
                    return std::unexpected(linked.error());
                continue;
            }
            auto child = this->materialize(*current, childName, *record, options);
            if (!child)
                return child;
            pending.emplace_back(*child, depth + 1);
        }
    }
    ts_log("StorageCoordinator::load " + std::string(fullName), "Storage");
    return node;
}

// ---------------------------------------------------------------- delete

auto StorageCoordinator::deleteNode(NodeTree& tree, Node& node, DeleteOptions const& options) -> Expected<void> {
    if (node.isRoot())
        return std::unexpected(Error{Error::Code::InvalidArgument, "Cannot delete the trajectory root"});

    if (!options.deleteOnly.empty()) {
        if (!node.isLeaf() || !node.item)
            return std::unexpected(Error{Error::Code::TypeMismatch, "Partial deletion needs a leaf, " + node.fullName + " is a group"});
        if (auto removed = node.item->removeFields(options.deleteOnly); !removed)
            return removed;
        for (auto const& field : options.deleteOnly)
            node.storedFields.erase(field);
        if (!options.removeFromStorage || !node.stored)
            return {};
        auto const path   = this->storagePath(node.fullName);
        auto       record = this->storage->readNode(path);
        if (!record)
            return std::unexpected(record.error());
        Value payload = record->payload ? *record->payload : Value::object();
        for (auto const& field : options.deleteOnly)
            payload.erase(field);
        if (auto written = this->storage->writeNode(path, record->skeleton, payload); !written)
            return written;
        return this->indexLeaf(node);
    }

    auto const fullName = node.fullName;
    auto const path     = this->storagePath(fullName);
    bool const onDisk   = options.removeFromStorage && this->storage->hasNode(path);
    if (onDisk && !options.recursive) {
        auto children = this->storage->listChildren(path);
        if (!children)
            return std::unexpected(children.error());
        if (!children->empty())
            return std::unexpected(Error{Error::Code::NotEmpty, "Stored node " + fullName + " has children, delete it recursively"});
    }

    // Link records outside the subtree that point into it.
    std::vector<std::string> danglingLinks;
    std::vector<Node*>       subtree{&node};
    for (std::size_t i = 0; i < subtree.size(); ++i) {
        for (auto const& ref : tree.links().ownersOf(*subtree[i])) {
            if (!ref.owner->isWithin(node))
                danglingLinks.push_back(joinName(ref.owner->fullName, ref.name));
        }
        for (auto& [childName, child] : subtree[i]->children)
            subtree.push_back(child.get());
    }

    if (auto removed = tree.removeNode(node, RemoveOptions{.recursive = options.recursive, .removeLinks = options.removeLinks}); !removed)
        return removed;
    if (!options.removeFromStorage)
        return {};

    if (onDisk) {
        if (auto erased = this->storage->removeNode(path, true); !erased)
            return erased;
    }
    for (auto const& link : danglingLinks) {
        auto const linkPath = this->storagePath(link);
        if (this->storage->hasNode(linkPath)) {
            if (auto erased = this->storage->removeNode(linkPath, false); !erased)
                return erased;
        }
    }
    auto const table   = this->overviewTable(branchOf(fullName));
    auto       entries = this->storage->overviewEntries(table);
    if (!entries)
        return std::unexpected(entries.error());
    for (auto const& [key, row] : *entries) {
        if (!isSameOrBelow(key, fullName))
            continue;
        if (auto erased = this->storage->removeOverview(table, key); !erased)
            return erased;
    }
    ts_log("StorageCoordinator::deleteNode " + fullName, "Storage");
    return {};
}

// ---------------------------------------------------------------- records

auto StorageCoordinator::storeTrajectoryRecord(TrajectoryRecord const& record) -> Expected<void> {
    return this->storage->writeNode(this->name, record.skeleton(), record.payload());
}

auto StorageCoordinator::loadTrajectoryRecord() -> Expected<TrajectoryRecord> {
    auto record = this->storage->readNode(this->name);
    if (!record)
        return std::unexpected(Error{Error::Code::DataNotInStorage, "Trajectory " + this->name + " is not stored in " + this->storage->location()});
    return TrajectoryRecord::fromRecord(*record);
}

auto StorageCoordinator::checkVersion(bool force) -> Expected<TrajectoryRecord> {
    auto record = this->loadTrajectoryRecord();
    if (!record)
        return record;
    if (!force && record->version != this->formatVersion) {
        return std::unexpected(Error{Error::Code::VersionMismatch,
                                     "Trajectory " + this->name + " was stored with version " + record->version + ", running version is "
                                             + this->formatVersion});
    }
    return record;
}

auto StorageCoordinator::isStored(std::string_view fullName) -> bool {
    return this->storage->hasNode(this->storagePath(fullName));
}

auto StorageCoordinator::overview(std::string_view branch) -> Expected<std::vector<std::pair<std::string, Value>>> {
    return this->storage->overviewEntries(this->overviewTable(branch));
}

auto StorageCoordinator::copyTo(StorageBackend& destination, std::string const& newName) -> Expected<void> {
    if (&destination == this->storage && newName == this->name)
        return {};
    auto rootRecord = this->storage->readNode(this->name);
    if (!rootRecord)
        return std::unexpected(rootRecord.error());
    rootRecord->skeleton["name"] = newName;
    if (auto written = destination.writeNode(newName, rootRecord->skeleton, rootRecord->payload); !written)
        return written;

    std::deque<std::pair<std::string, std::string>> pending{{this->name, newName}};
    while (!pending.empty()) {
        auto [source, target] = pending.front();
        pending.pop_front();
        auto children = this->storage->listChildren(source);
        if (!children)
            return std::unexpected(children.error());
        for (auto const& childName : *children) {
            auto record = this->storage->readNode(joinName(source, childName));
            if (!record)
                return std::unexpected(record.error());
            if (auto written = destination.writeNode(joinName(target, childName), record->skeleton, record->payload); !written)
                return written;
            pending.emplace_back(joinName(source, childName), joinName(target, childName));
        }
    }

    for (auto const branch : Branches) {
        auto entries = this->overview(branch);
        if (!entries)
            return std::unexpected(entries.error());
        for (auto const& [key, row] : *entries) {
            if (auto written = destination.upsertOverview(newName + "." + std::string(branch), key, row); !written)
                return written;
        }
    }
    return {};
}

} // namespace TS
