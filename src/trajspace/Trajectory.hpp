#pragma once
#include "core/Error.hpp"
#include "core/NodeTree.hpp"
#include "core/Parameter.hpp"
#include "core/Result.hpp"
#include "core/TrajectoryOptions.hpp"
#include "explore/Exploration.hpp"
#include "queue/WriteQueue.hpp"
#include "storage/StorageBackend.hpp"
#include "storage/StorageCoordinator.hpp"

#include <cstddef>
#include <cstdint>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace TS {

inline constexpr std::string_view FormatVersion = "1.0";

enum class Lifecycle {
    Built,
    PartiallyStored,
    FullyStored,
    Loaded
};

[[nodiscard]] auto lifecycleToString(Lifecycle state) -> std::string_view;

struct RunNode {
    std::size_t index = 0;
    std::string runName;
    Node*       node = nullptr;
};

/**
 * @brief One experiment: a node tree with four branches, its runs and its storage binding.
 *
 * Branches are created on demand: config, parameters and derived_parameters
 * hold Parameter leaves, results holds Result leaves. Paths handed to the
 * add* calls may omit the branch name. While a run is bound, "$" and "crun"
 * stand for its name and lookups skip nodes that belong to other runs.
 *
 * The backend is opened on first use. With autoLoad enabled a lookup that
 * misses in memory falls back to loading the exact path from storage.
 */
class Trajectory {
public:
    explicit Trajectory(TrajectoryOptions options = {});
    ~Trajectory();

    // Validates the options first. A trajectory constructed with an invalid name refuses storage access.
    static auto create(TrajectoryOptions options = {}) -> Expected<std::unique_ptr<Trajectory>>;

    Trajectory(Trajectory const&)            = delete;
    Trajectory& operator=(Trajectory const&) = delete;

    auto name() const -> std::string const& { return this->options.name; }
    auto comment() const -> std::string const& { return this->options.comment; }
    auto setComment(std::string text) -> void { this->options.comment = std::move(text); }
    auto version() const -> std::string const& { return this->formatVersion; }
    auto setVersion(std::string version) -> void;
    auto settings() const -> TrajectoryOptions const& { return this->options; }
    auto setAutoLoad(bool enabled) -> void { this->options.autoLoad = enabled; }
    auto lifecycle() const -> Lifecycle { return this->state; }

    auto tree() -> NodeTree& { return this->nodes; }
    auto root() -> Node& { return this->nodes.root(); }

    // -- building
    auto addParameter(std::string_view path, Value value, std::string comment = {}) -> Expected<Node*>;
    auto addDerivedParameter(std::string_view path, Value value, std::string comment = {}) -> Expected<Node*>;
    auto addConfig(std::string_view path, Value value, std::string comment = {}) -> Expected<Node*>;
    auto addResult(std::string_view path, std::map<std::string, Value> fields = {}, std::string comment = {}) -> Expected<Node*>;
    auto addGroup(std::string_view path, std::string comment = {}) -> Expected<Node*>;
    auto addLink(std::string_view ownerPath, std::string const& name, std::string_view targetPath) -> Expected<void>;
    auto removeLink(std::string_view ownerPath, std::string const& name) -> Expected<void>;

    // -- lookup
    auto get(std::string_view path) -> Expected<Node*>;
    auto get(std::string_view path, ResolveOptions options) -> Expected<Node*>;
    auto contains(std::string_view path) -> bool;
    auto parameter(std::string_view path) -> Expected<Parameter*>;
    auto result(std::string_view path) -> Expected<Result*>;
    // Parameter value for the bound run (its default otherwise), or a result as a dict.
    auto value(std::string_view path) -> Expected<Value>;
    // Like value(), but a missing node yields `fallback`. Ambiguity still fails.
    auto getDefault(std::string_view path, Value fallback) -> Expected<Value>;
    auto getAll(std::string_view path) -> Expected<std::vector<Node*>>;
    // The node called `name` in every run that has one, in run order.
    auto getFromRuns(std::string_view name, bool withLinks = true) -> Expected<std::vector<RunNode>>;

    // -- runs
    auto size() const -> std::size_t { return this->runs.size(); }
    auto runList() const -> std::vector<RunInfo> const& { return this->runs; }
    auto setCurrentRun(std::size_t index) -> Expected<void>;
    auto setCurrentRun(std::string_view runName) -> Expected<void>;
    auto clearCurrentRun() -> void { this->currentRun.reset(); }
    auto currentRunIndex() const -> std::optional<std::size_t> { return this->currentRun; }
    auto currentRunName() const -> std::optional<std::string>;
    auto markRunCompleted(std::size_t index) -> Expected<void>;

    // -- exploration
    auto explore(Bindings const& bindings) -> Expected<std::size_t>;
    auto expand(Bindings const& bindings) -> Expected<std::size_t>;
    auto shrink() -> Expected<void>;
    auto exploredParameters() -> std::vector<Node*>;

    // -- storage
    auto storage() -> Expected<StorageCoordinator*>;
    auto store(StoreOptions const& options = {}) -> Expected<void>;
    auto storeItem(std::string_view path, StoreOptions const& options = {}) -> Expected<void>;
    auto storeRecord() -> Expected<void>;
    auto load(LoadOptions const& options = {}) -> Expected<void>;
    auto loadSkeleton() -> Expected<void>;
    auto loadItem(std::string_view path, LoadOptions const& options = {}) -> Expected<Node*>;
    auto deleteItem(std::string_view path, DeleteOptions const& options = {}) -> Expected<void>;
    auto deleteLink(std::string_view ownerPath, std::string const& name, bool removeFromStorage = true) -> Expected<void>;
    auto migrate(std::string const& location, std::optional<std::string> newName = std::nullopt) -> Expected<void>;
    auto overview(std::string_view branch) -> Expected<std::vector<std::pair<std::string, Value>>>;

    // -- worker messages
    auto snapshot() -> Expected<std::vector<std::uint8_t>>;
    static auto fromSnapshot(std::vector<std::uint8_t> const& bytes, TrajectoryOptions options) -> Expected<std::unique_ptr<Trajectory>>;
    // Packs every node that was never stored into one request for the writer.
    auto packStoreRequest(StoreOptions const& options = {}) -> Expected<StoreRequest>;

private:
    auto resolveOptions() const -> ResolveOptions;
    auto branchPath(std::string_view branch, std::string_view path) const -> Expected<std::string>;
    auto addParameterTo(std::string_view branch, std::string_view path, Value value, std::string comment) -> Expected<Node*>;
    auto exactFullName(std::string_view path) const -> Expected<std::string>;
    auto autoLoad(std::string_view path) -> Expected<Node*>;
    auto record() const -> TrajectoryRecord;

    TrajectoryOptions                   options;
    std::string                         formatVersion;
    NodeTree                            nodes;
    std::vector<RunInfo>                runs;
    ExplorationEngine                   engine;
    std::optional<std::size_t>          currentRun;
    Lifecycle                           state          = Lifecycle::Built;
    bool                                storedWithRuns = false;
    std::unique_ptr<StorageBackend>     backend;
    std::unique_ptr<StorageCoordinator> coordinator;
};

} // namespace TS
