#include "Trajectory.hpp"

#include "log/TaggedLogger.hpp"
#include "path/Naming.hpp"
#include "queue/Snapshot.hpp"
#include "storage/StorageRegistry.hpp"

#include <algorithm>

namespace TS {

namespace {

constexpr std::string_view AllBranches[] = {Branch::Config, Branch::Parameters, Branch::DerivedParameters, Branch::Results};

auto isBranch(std::string_view segment) -> bool {
    return std::find(std::begin(AllBranches), std::end(AllBranches), segment) != std::end(AllBranches);
}

auto joinSegments(std::vector<std::string> const& segments) -> std::string {
    std::string joined;
    for (auto const& segment : segments)
        joined = joinName(joined, segment);
    return joined;
}

} // namespace

auto lifecycleToString(Lifecycle state) -> std::string_view {
    switch (state) {
    case Lifecycle::Built:
        return "built";
    case Lifecycle::PartiallyStored:
        return "partially_stored";
    case Lifecycle::FullyStored:
        return "fully_stored";
    case Lifecycle::Loaded:
        return "loaded";
    }
    return "unknown";
}

Trajectory::Trajectory(TrajectoryOptions trajectoryOptions)
    : options(std::move(trajectoryOptions)), formatVersion(FormatVersion), engine(nodes, runs) {}

Trajectory::~Trajectory() = default;

auto Trajectory::create(TrajectoryOptions trajectoryOptions) -> Expected<std::unique_ptr<Trajectory>> {
    if (auto invalid = ValidateTrajectoryOptions(trajectoryOptions))
        return std::unexpected(Error{Error::Code::InvalidArgument, *invalid});
    return std::make_unique<Trajectory>(std::move(trajectoryOptions));
}

auto Trajectory::setVersion(std::string version) -> void {
    this->formatVersion = std::move(version);
    if (this->coordinator)
        this->coordinator = std::make_unique<StorageCoordinator>(*this->backend, this->options.name, this->formatVersion, this->options.maxOverviewRows);
}

auto Trajectory::resolveOptions() const -> ResolveOptions {
    return ResolveOptions{.shortcuts = this->options.shortcuts, .withLinks = this->options.withLinks, .runName = this->currentRunName()};
}

auto Trajectory::currentRunName() const -> std::optional<std::string> {
    if (!this->currentRun || *this->currentRun >= this->runs.size())
        return std::nullopt;
    return this->runs[*this->currentRun].name;
}

// ---------------------------------------------------------------- building

auto Trajectory::branchPath(std::string_view branch, std::string_view path) const -> Expected<std::string> {
    auto segments = translatePath(path, this->currentRunName());
    if (!segments)
        return std::unexpected(segments.error());
    if (segments->empty())
        return std::unexpected(Error{Error::Code::InvalidPath, "Empty path"});
    if (segments->front() == branch)
        return joinSegments(*segments);
    if (isBranch(segments->front())) {
        return std::unexpected(Error{Error::Code::TypeMismatch,
                                     "'" + std::string(path) + "' belongs to " + segments->front() + ", not to " + std::string(branch)});
    }
    return joinName(branch, joinSegments(*segments));
}

auto Trajectory::addParameterTo(std::string_view branch, std::string_view path, Value value, std::string comment) -> Expected<Node*> {
    auto fullPath = this->branchPath(branch, path);
    if (!fullPath)
        return std::unexpected(fullPath.error());
    auto item = value.is_null() ? std::make_unique<Parameter>() : std::make_unique<Parameter>(std::move(value));
    auto node = this->nodes.addLeaf(*fullPath, std::move(item));
    if (!node)
        return node;
    (*node)->comment = std::move(comment);
    ts_log("Trajectory::addParameter " + (*node)->fullName, "Trajectory");
    return node;
}

auto Trajectory::addParameter(std::string_view path, Value value, std::string comment) -> Expected<Node*> {
    return this->addParameterTo(Branch::Parameters, path, std::move(value), std::move(comment));
}

auto Trajectory::addDerivedParameter(std::string_view path, Value value, std::string comment) -> Expected<Node*> {
    return this->addParameterTo(Branch::DerivedParameters, path, std::move(value), std::move(comment));
}

auto Trajectory::addConfig(std::string_view path, Value value, std::string comment) -> Expected<Node*> {
    return this->addParameterTo(Branch::Config, path, std::move(value), std::move(comment));
}

auto Trajectory::addResult(std::string_view path, std::map<std::string, Value> fields, std::string comment) -> Expected<Node*> {
    auto fullPath = this->branchPath(Branch::Results, path);
    if (!fullPath)
        return std::unexpected(fullPath.error());
    auto node = this->nodes.addLeaf(*fullPath, std::make_unique<Result>(std::move(fields)));
    if (!node)
        return node;
    (*node)->comment = std::move(comment);
    return node;
}

auto Trajectory::addGroup(std::string_view path, std::string comment) -> Expected<Node*> {
    auto segments = translatePath(path, this->currentRunName());
    if (!segments)
        return std::unexpected(segments.error());
    if (segments->empty() || !isBranch(segments->front()))
        return std::unexpected(Error{Error::Code::InvalidPath, "Groups live below config, parameters, derived_parameters or results: " + std::string(path)});
    auto node = this->nodes.addGroup(joinSegments(*segments));
    if (!node)
        return node;
    if (!comment.empty())
        (*node)->comment = std::move(comment);
    return node;
}

auto Trajectory::addLink(std::string_view ownerPath, std::string const& name, std::string_view targetPath) -> Expected<void> {
    auto owner = ownerPath.empty() ? Expected<Node*>{&this->nodes.root()} : this->get(ownerPath);
    if (!owner)
        return std::unexpected(owner.error());
    auto target = this->get(targetPath);
    if (!target)
        return std::unexpected(target.error());
    return this->nodes.addLink(**owner, name, **target);
}

auto Trajectory::removeLink(std::string_view ownerPath, std::string const& name) -> Expected<void> {
    return this->deleteLink(ownerPath, name, false);
}

// ---------------------------------------------------------------- lookup

auto Trajectory::exactFullName(std::string_view path) const -> Expected<std::string> {
    auto segments = translatePath(path, this->currentRunName());
    if (!segments)
        return std::unexpected(segments.error());
    if (std::any_of(segments->begin(), segments->end(), [](std::string const& segment) { return segment.empty(); }))
        return std::unexpected(Error{Error::Code::InvalidPath, "'" + std::string(path) + "' is not an exact path"});
    return joinSegments(*segments);
}

auto Trajectory::autoLoad(std::string_view path) -> Expected<Node*> {
    auto fullName = this->exactFullName(path);
    if (!fullName)
        return std::unexpected(Error{Error::Code::DataNotInStorage, "'" + std::string(path) + "' is not in memory and not an exact stored path"});
    auto coord = this->storage();
    if (!coord)
        return std::unexpected(coord.error());
    auto loaded = (*coord)->load(this->nodes, *fullName, LoadOptions{.recursive = false, .level = LoadLevel::Data});
    if (!loaded) {
        if (loaded.error().code == Error::Code::DataNotInStorage || loaded.error().code == Error::Code::NoSuchPath)
            return std::unexpected(Error{Error::Code::DataNotInStorage, "'" + std::string(path) + "' is neither in memory nor in storage"});
        return loaded;
    }
    ts_log("Trajectory auto-loaded " + *fullName, "Trajectory");
    return loaded;
}

auto Trajectory::get(std::string_view path) -> Expected<Node*> {
    return this->get(path, this->resolveOptions());
}

auto Trajectory::get(std::string_view path, ResolveOptions resolveOptions) -> Expected<Node*> {
    if (!resolveOptions.runName)
        resolveOptions.runName = this->currentRunName();
    auto node = this->nodes.resolve(path, resolveOptions);
    if (!node) {
        if (node.error().code == Error::Code::NoSuchPath && this->options.autoLoad)
            return this->autoLoad(path);
        return node;
    }
    Node* found = *node;
    if (this->options.autoLoad && found->isLeaf() && found->item && found->item->isEmpty() && found->stored) {
        auto coord = this->storage();
        if (!coord)
            return std::unexpected(coord.error());
        if (auto loaded = (*coord)->load(this->nodes, found->fullName, LoadOptions{.recursive = false, .level = LoadLevel::Data}); !loaded)
            return loaded;
    }
    return found;
}

auto Trajectory::contains(std::string_view path) -> bool {
    return this->nodes.resolve(path, this->resolveOptions()).has_value();
}

auto Trajectory::parameter(std::string_view path) -> Expected<Parameter*> {
    auto node = this->get(path);
    if (!node)
        return std::unexpected(node.error());
    auto* found = (*node)->isLeaf() ? dynamic_cast<Parameter*>((*node)->item.get()) : nullptr;
    if (!found)
        return std::unexpected(Error{Error::Code::TypeMismatch, (*node)->fullName + " is not a parameter"});
    return found;
}

auto Trajectory::result(std::string_view path) -> Expected<Result*> {
    auto node = this->get(path);
    if (!node)
        return std::unexpected(node.error());
    auto* found = (*node)->isLeaf() ? dynamic_cast<Result*>((*node)->item.get()) : nullptr;
    if (!found)
        return std::unexpected(Error{Error::Code::TypeMismatch, (*node)->fullName + " is not a result"});
    return found;
}

auto Trajectory::value(std::string_view path) -> Expected<Value> {
    auto node = this->get(path);
    if (!node)
        return std::unexpected(node.error());
    if (!(*node)->isLeaf() || !(*node)->item)
        return std::unexpected(Error{Error::Code::TypeMismatch, (*node)->fullName + " is a group"});
    if (auto* param = dynamic_cast<Parameter*>((*node)->item.get()))
        return param->valueForRun(this->currentRun);
    return (*node)->item->toDict();
}

auto Trajectory::getDefault(std::string_view path, Value fallback) -> Expected<Value> {
    auto found = this->value(path);
    if (!found && (found.error().code == Error::Code::NoSuchPath || found.error().code == Error::Code::DataNotInStorage))
        return fallback;
    return found;
}

auto Trajectory::getAll(std::string_view path) -> Expected<std::vector<Node*>> {
    return this->nodes.findAll(path, this->resolveOptions());
}

auto Trajectory::getFromRuns(std::string_view name, bool withLinks) -> Expected<std::vector<RunNode>> {
    std::vector<RunNode> found;
    for (auto const& run : this->runs) {
        for (auto branch : {Branch::Results, Branch::DerivedParameters}) {
            Node* group = this->nodes.find(joinName(joinName(branch, RunsGroupName), run.name));
            if (!group)
                continue;
            auto node = this->nodes.resolveFrom(*group, name,
                                                ResolveOptions{.shortcuts = this->options.shortcuts, .withLinks = withLinks, .runName = run.name});
            if (node) {
                found.push_back(RunNode{run.index, run.name, *node});
                break;
            }
            if (node.error().code != Error::Code::NoSuchPath)
                return std::unexpected(node.error());
        }
    }
    return found;
}

// ---------------------------------------------------------------- runs

auto Trajectory::setCurrentRun(std::size_t index) -> Expected<void> {
    if (index >= this->runs.size()) {
        return std::unexpected(Error{Error::Code::OutOfRange,
                                     "Run " + std::to_string(index) + " does not exist, the trajectory has " + std::to_string(this->runs.size())
                                             + " runs"});
    }
    this->currentRun = index;
    return {};
}

auto Trajectory::setCurrentRun(std::string_view runName) -> Expected<void> {
    auto translated = translateSegment(runName, std::nullopt);
    if (!translated)
        return std::unexpected(translated.error());
    for (auto const& run : this->runs) {
        if (run.name == *translated)
            return this->setCurrentRun(run.index);
    }
    return std::unexpected(Error{Error::Code::NoSuchPath, "No run named " + std::string(runName)});
}

auto Trajectory::markRunCompleted(std::size_t index) -> Expected<void> {
    if (index >= this->runs.size())
        return std::unexpected(Error{Error::Code::OutOfRange, "Run " + std::to_string(index) + " does not exist"});
    this->runs[index].completed = true;
    return {};
}

// ---------------------------------------------------------------- exploration

auto Trajectory::explore(Bindings const& bindings) -> Expected<std::size_t> {
    return this->engine.explore(bindings);
}

auto Trajectory::expand(Bindings const& bindings) -> Expected<std::size_t> {
    return this->engine.expand(bindings);
}

auto Trajectory::shrink() -> Expected<void> {
    if (this->storedWithRuns)
        return std::unexpected(Error{Error::Code::NotSupported, "Cannot shrink trajectory " + this->options.name + " after storing its runs"});
    if (auto shrunk = this->engine.shrink(); !shrunk)
        return shrunk;
    this->currentRun.reset();
    return {};
}

auto Trajectory::exploredParameters() -> std::vector<Node*> {
    return this->engine.exploredParameters();
}

// ---------------------------------------------------------------- storage

auto Trajectory::storage() -> Expected<StorageCoordinator*> {
    if (this->coordinator)
        return this->coordinator.get();
    if (!isValidName(this->options.name))
        return std::unexpected(Error{Error::Code::InvalidArgument, "Invalid trajectory name '" + this->options.name + "'"});
    auto created = StorageRegistry::instance().create(this->options.storageService);
    if (!created)
        return std::unexpected(created.error());
    if (auto opened = (*created)->open(this->options.location); !opened)
        return std::unexpected(opened.error());
    this->backend     = std::move(*created);
    this->coordinator = std::make_unique<StorageCoordinator>(*this->backend, this->options.name, this->formatVersion, this->options.maxOverviewRows);
    return this->coordinator.get();
}

auto Trajectory::record() const -> TrajectoryRecord {
    return TrajectoryRecord{this->options.name, this->formatVersion, this->options.comment, this->runs};
}

auto Trajectory::storeRecord() -> Expected<void> {
    auto coord = this->storage();
    if (!coord)
        return std::unexpected(coord.error());
    if (auto written = (*coord)->storeTrajectoryRecord(this->record()); !written)
        return written;
    this->nodes.root().stored = true;
    if (!this->runs.empty())
        this->storedWithRuns = true;
    return {};
}

auto Trajectory::store(StoreOptions const& storeOptions) -> Expected<void> {
    auto coord = this->storage();
    if (!coord)
        return std::unexpected(coord.error());
    if (auto written = this->storeRecord(); !written)
        return written;
    if (auto stored = (*coord)->store(this->nodes, this->nodes.root(), storeOptions); !stored)
        return stored;
    this->state = storeOptions.recursive && !storeOptions.maxDepth ? Lifecycle::FullyStored : Lifecycle::PartiallyStored;
    ts_log("Trajectory::store " + this->options.name + " as " + std::string(lifecycleToString(this->state)), "Trajectory");
    return {};
}

auto Trajectory::storeItem(std::string_view path, StoreOptions const& storeOptions) -> Expected<void> {
    auto node = this->nodes.resolve(path, this->resolveOptions());
    if (!node)
        return std::unexpected(node.error());
    auto coord = this->storage();
    if (!coord)
        return std::unexpected(coord.error());
    if (!this->nodes.root().stored) {
        if (auto written = this->storeRecord(); !written)
            return written;
    }
    if (auto stored = (*coord)->store(this->nodes, **node, storeOptions); !stored)
        return stored;
    if (this->state == Lifecycle::Built)
        this->state = Lifecycle::PartiallyStored;
    return {};
}

auto Trajectory::load(LoadOptions const& loadOptions) -> Expected<void> {
    auto coord = this->storage();
    if (!coord)
        return std::unexpected(coord.error());
    auto stored = (*coord)->checkVersion(loadOptions.force);
    if (!stored)
        return std::unexpected(stored.error());

    if (this->runs.empty() || loadOptions.level == LoadLevel::Overwrite) {
        this->runs = stored->runs;
        if (this->currentRun && *this->currentRun >= this->runs.size())
            this->currentRun.reset();
    } else {
        for (auto& run : this->runs) {
            auto it = std::find_if(stored->runs.begin(), stored->runs.end(), [&](RunInfo const& other) { return other.name == run.name; });
            if (it != stored->runs.end())
                run.completed = run.completed || it->completed;
        }
    }
    if (this->options.comment.empty() || loadOptions.level == LoadLevel::Overwrite)
        this->options.comment = stored->comment;

    LoadOptions treeOptions = loadOptions;
    treeOptions.force       = true;
    auto loaded             = (*coord)->load(this->nodes, "", treeOptions);
    if (!loaded)
        return std::unexpected(loaded.error());
    this->nodes.root().stored = true;
    this->storedWithRuns      = !this->runs.empty();
    this->state               = Lifecycle::Loaded;
    return {};
}

auto Trajectory::loadSkeleton() -> Expected<void> {
    return this->load(LoadOptions{.level = LoadLevel::Skeleton});
}

auto Trajectory::loadItem(std::string_view path, LoadOptions const& loadOptions) -> Expected<Node*> {
    auto fullName = this->exactFullName(path);
    if (!fullName)
        return std::unexpected(fullName.error());
    auto coord = this->storage();
    if (!coord)
        return std::unexpected(coord.error());
    return (*coord)->load(this->nodes, *fullName, loadOptions);
}

auto Trajectory::deleteItem(std::string_view path, DeleteOptions const& deleteOptions) -> Expected<void> {
    // A path ending in a link name removes the link, not its target.
    auto segments = translatePath(path, this->currentRunName());
    if (segments && !segments->empty()) {
        auto const       dot       = path.rfind('.');
        std::string_view ownerPath = dot == std::string_view::npos ? std::string_view{} : path.substr(0, dot);
        Node*            owner     = &this->nodes.root();
        if (!ownerPath.empty()) {
            auto resolved = this->nodes.resolve(ownerPath, this->resolveOptions());
            owner         = resolved ? *resolved : nullptr;
        }
        auto const& last = segments->back();
        if (owner && !owner->getChild(last) && this->nodes.links().hasLink(*owner, last))
            return this->deleteLink(ownerPath, last, deleteOptions.removeFromStorage);
    }

    auto node = this->nodes.resolve(path, this->resolveOptions());
    if (!node)
        return std::unexpected(node.error());
    auto coord = this->storage();
    if (!coord)
        return std::unexpected(coord.error());
    return (*coord)->deleteNode(this->nodes, **node, deleteOptions);
}

auto Trajectory::deleteLink(std::string_view ownerPath, std::string const& name, bool removeFromStorage) -> Expected<void> {
    Node* owner = &this->nodes.root();
    if (!ownerPath.empty()) {
        auto resolved = this->nodes.resolve(ownerPath, this->resolveOptions());
        if (!resolved)
            return std::unexpected(resolved.error());
        owner = *resolved;
    }
    if (auto removed = this->nodes.links().removeLink(*owner, name); !removed)
        return removed;
    if (!removeFromStorage)
        return {};
    auto coord = this->storage();
    if (!coord)
        return std::unexpected(coord.error());
    auto const linkPath = (*coord)->storagePath(joinName(owner->fullName, name));
    if ((*coord)->backend().hasNode(linkPath))
        return (*coord)->backend().removeNode(linkPath, false);
    return {};
}

auto Trajectory::migrate(std::string const& location, std::optional<std::string> newName) -> Expected<void> {
    auto const targetName = newName.value_or(this->options.name);
    if (!isValidName(targetName))
        return std::unexpected(Error{Error::Code::InvalidArgument, "Invalid trajectory name '" + targetName + "'"});
    auto created = StorageRegistry::instance().create(this->options.storageService);
    if (!created)
        return std::unexpected(created.error());
    std::unique_ptr<StorageBackend> destination = std::move(*created);
    if (auto opened = destination->open(location); !opened)
        return std::unexpected(opened.error());

    auto coord = this->storage();
    if (!coord)
        return std::unexpected(coord.error());
    if ((*coord)->isStored("")) {
        if (auto copied = (*coord)->copyTo(*destination, targetName); !copied)
            return copied;
    }

    auto rebound      = std::make_unique<StorageCoordinator>(*destination, targetName, this->formatVersion, this->options.maxOverviewRows);
    this->coordinator = std::move(rebound);
    this->backend     = std::move(destination);
    this->options.location = location;
    this->options.name     = targetName;
    ts_log("Trajectory::migrate to " + location + " as " + targetName, "Trajectory");
    return {};
}

auto Trajectory::overview(std::string_view branch) -> Expected<std::vector<std::pair<std::string, Value>>> {
    auto coord = this->storage();
    if (!coord)
        return std::unexpected(coord.error());
    return (*coord)->overview(branch);
}

// ---------------------------------------------------------------- worker messages

auto Trajectory::snapshot() -> Expected<std::vector<std::uint8_t>> {
    auto captured    = captureTree(this->nodes);
    captured.name    = this->options.name;
    captured.version = this->formatVersion;
    captured.runs    = runsToSnapshot(this->runs);
    return encodeSnapshot(captured);
}

auto Trajectory::fromSnapshot(std::vector<std::uint8_t> const& bytes, TrajectoryOptions trajectoryOptions) -> Expected<std::unique_ptr<Trajectory>> {
    auto decoded = decodeSnapshot(bytes);
    if (!decoded)
        return std::unexpected(decoded.error());
    trajectoryOptions.name = decoded->name;
    auto trajectory        = std::make_unique<Trajectory>(std::move(trajectoryOptions));
    trajectory->formatVersion = decoded->version;
    if (auto grafted = graftSnapshot(trajectory->nodes, *decoded); !grafted)
        return std::unexpected(grafted.error());
    trajectory->runs = runsFromSnapshot(decoded->runs);
    trajectory->nodes.root().stored = true;
    return trajectory;
}

auto Trajectory::packStoreRequest(StoreOptions const& storeOptions) -> Expected<StoreRequest> {
    std::vector<Node*> tops;
    for (auto& node : this->nodes.iterNodes(this->nodes.root(), IterOptions{.recursive = true, .withLinks = false})) {
        if (!node.stored && (node.parent->isRoot() || node.parent->stored))
            tops.push_back(&node);
    }
    auto captured    = captureSubtrees(this->nodes, tops);
    captured.name    = this->options.name;
    captured.version = this->formatVersion;
    captured.runs    = runsToSnapshot(this->runs);
    auto bytes       = encodeSnapshot(captured);
    if (!bytes)
        return std::unexpected(bytes.error());
    return StoreRequest{std::move(*bytes), storeOptions, this->currentRun, this->currentRunName().value_or(this->options.name)};
}

} // namespace TS
