#include "explore/Exploration.hpp"

#include "core/Parameter.hpp"
#include "log/TaggedLogger.hpp"
#include "path/Naming.hpp"

#include <algorithm>
#include <optional>
#include <set>

namespace TS {

namespace {

auto isQualified(std::vector<std::string> const& segments) -> bool {
    auto const& first = segments.front();
    return first == Branch::Parameters || first == Branch::Config || first == Branch::DerivedParameters || first == Branch::Results;
}

// Where a binding that resolves nowhere gets its new parameter.
auto creationPath(std::string const& name) -> Expected<std::string> {
    auto segments = translatePath(name, std::nullopt);
    if (!segments)
        return std::unexpected(segments.error());
    if (segments->empty())
        return std::unexpected(Error{Error::Code::InvalidPath, "Empty parameter name"});
    if (segments->front() == Branch::Results)
        return std::unexpected(Error{Error::Code::TypeMismatch, "Results cannot be explored: " + name});
    std::string fullPath = isQualified(*segments) ? std::string{} : std::string(Branch::Parameters);
    for (auto const& segment : *segments)
        fullPath = joinName(fullPath, segment);
    return fullPath;
}

} // namespace

auto cartesianProduct(Bindings const& dimensions) -> Expected<Bindings> {
    if (dimensions.empty())
        return std::unexpected(Error{Error::Code::InvalidArgument, "Cartesian product needs at least one dimension"});
    std::size_t total = 1;
    for (auto const& [name, values] : dimensions) {
        if (values.empty())
            return std::unexpected(Error{Error::Code::InvalidArgument, "Dimension '" + name + "' has no values"});
        total *= values.size();
    }

    Bindings product;
    product.reserve(dimensions.size());
    for (auto const& [name, values] : dimensions)
        product.emplace_back(name, std::vector<Value>{});

    for (std::size_t row = 0; row < total; ++row) {
        std::size_t rest = row;
        for (std::size_t d = dimensions.size(); d-- > 0;) {
            auto const& values = dimensions[d].second;
            product[d].second.push_back(values[rest % values.size()]);
            rest /= values.size();
        }
    }
    return product;
}

ExplorationEngine::ExplorationEngine(NodeTree& nodeTree, std::vector<RunInfo>& runList)
    : tree(&nodeTree), runs(&runList) {}

auto ExplorationEngine::checkLengths(Bindings const& bindings) const -> Expected<std::size_t> {
    if (bindings.empty())
        return std::unexpected(Error{Error::Code::InvalidArgument, "Nothing to explore"});
    std::size_t const length = bindings.front().second.size();
    for (auto const& [name, values] : bindings) {
        if (values.empty())
            return std::unexpected(Error{Error::Code::InvalidArgument, "Cannot explore '" + name + "' with an empty list"});
        if (values.size() != length) {
            return std::unexpected(Error{Error::Code::LengthMismatch,
                                         "Explored lists differ in length: '" + name + "' has " + std::to_string(values.size())
                                                 + " values, expected " + std::to_string(length)});
        }
    }
    return length;
}

auto ExplorationEngine::resolveTarget(std::string const& name) -> Expected<Target> {
    auto segments = translatePath(name, std::nullopt);
    if (!segments)
        return std::unexpected(segments.error());
    if (segments->empty())
        return std::unexpected(Error{Error::Code::InvalidPath, "Empty parameter name"});

    Expected<Node*> node = std::unexpected(Error{Error::Code::NoSuchPath, name});
    if (isQualified(*segments)) {
        node = this->tree->resolve(name);
    } else if (auto* branch = this->tree->root().getChild(Branch::Parameters)) {
        node = this->tree->resolveFrom(*branch, name);
    }
    if (!node)
        return std::unexpected(node.error());

    auto* parameter = (*node)->isLeaf() ? dynamic_cast<Parameter*>((*node)->item.get()) : nullptr;
    if (!parameter)
        return std::unexpected(Error{Error::Code::TypeMismatch, (*node)->fullName + " is not a parameter"});
    return Target{*node, parameter};
}

auto ExplorationEngine::createPending(std::vector<Pending> const& pending, Bindings const& bindings, std::vector<std::optional<Target>>& targets)
        -> Expected<void> {
    // Shallowest node each creation added, removed again when a later one fails.
    std::vector<std::string> addedTops;
    auto                     rollback = [&] {
        for (auto it = addedTops.rbegin(); it != addedTops.rend(); ++it) {
            Node* top = this->tree->find(*it);
            if (!top)
                continue;
            if (auto removed = this->tree->removeNode(*top, RemoveOptions{.recursive = true}); !removed)
                ts_log("ExplorationEngine rollback could not remove " + *it + ": " + describeError(removed.error()), "Exploration", "Error");
        }
    };

    for (auto const& entry : pending) {
        std::string prefix;
        std::string top;
        for (auto const& segment : splitPath(entry.fullPath)) {
            prefix = joinName(prefix, segment);
            if (!this->tree->find(prefix)) {
                top = prefix;
                break;
            }
        }
        auto created = this->tree->addLeaf(entry.fullPath, std::make_unique<Parameter>(bindings[entry.binding].second.front()));
        if (!created) {
            rollback();
            return std::unexpected(created.error());
        }
        if (!top.empty())
            addedTops.push_back(std::move(top));
        ts_log("ExplorationEngine created " + (*created)->fullName, "Exploration");
        targets[entry.binding] = Target{*created, static_cast<Parameter*>((*created)->item.get())};
    }
    return {};
}

auto ExplorationEngine::resetRuns(std::size_t count) -> void {
    std::size_t const previous = this->runs->size();
    this->runs->resize(count);
    for (std::size_t i = previous; i < count; ++i) {
        (*this->runs)[i].index = i;
        (*this->runs)[i].name  = formatRunName(i);
    }
}

auto ExplorationEngine::explore(Bindings const& bindings) -> Expected<std::size_t> {
    auto length = this->checkLengths(bindings);
    if (!length)
        return length;
    if (!this->runs->empty() && *length != this->runs->size()) {
        return std::unexpected(Error{Error::Code::LengthMismatch,
                                     "Trajectory already has " + std::to_string(this->runs->size()) + " runs, cannot explore "
                                             + std::to_string(*length)});
    }

    // Every binding is checked before the tree changes: existing parameters on a
    // clone, missing ones on a fresh parameter that is only added afterwards.
    std::vector<std::optional<Target>> targets(bindings.size());
    std::vector<Pending>               pending;
    std::set<Node const*>              seen;
    std::set<std::string>              seenPaths;
    for (std::size_t i = 0; i < bindings.size(); ++i) {
        auto const& [name, values] = bindings[i];
        auto target                = this->resolveTarget(name);
        if (target) {
            if (!seen.insert(target->node).second)
                return std::unexpected(Error{Error::Code::InvalidArgument, target->node->fullName + " is bound twice"});
            auto trial = target->parameter->clone();
            if (auto check = static_cast<Parameter&>(*trial).explore(values); !check)
                return std::unexpected(check.error());
            targets[i] = *target;
            continue;
        }
        if (target.error().code != Error::Code::NoSuchPath)
            return std::unexpected(target.error());

        auto fullPath = creationPath(name);
        if (!fullPath)
            return std::unexpected(fullPath.error());
        if (!seenPaths.insert(*fullPath).second)
            return std::unexpected(Error{Error::Code::InvalidArgument, *fullPath + " is bound twice"});
        Parameter fresh{values.front()};
        if (auto check = fresh.explore(values); !check)
            return std::unexpected(check.error());
        pending.push_back(Pending{i, std::move(*fullPath)});
    }

    if (auto created = this->createPending(pending, bindings, targets); !created)
        return std::unexpected(created.error());
    for (std::size_t i = 0; i < targets.size(); ++i) {
        if (auto explored = targets[i]->parameter->explore(bindings[i].second); !explored)
            return std::unexpected(explored.error());
    }
    this->resetRuns(*length);
    ts_log("ExplorationEngine::explore runs=" + std::to_string(*length), "Exploration");
    return *length;
}

auto ExplorationEngine::expand(Bindings const& bindings) -> Expected<std::size_t> {
    if (this->runs->empty())
        return this->explore(bindings);
    auto length = this->checkLengths(bindings);
    if (!length)
        return length;

    std::vector<Target>   targets;
    std::set<Node const*> seen;
    for (auto const& [name, values] : bindings) {
        auto target = this->resolveTarget(name);
        if (!target)
            return std::unexpected(target.error());
        if (!target->parameter->isArray())
            return std::unexpected(Error{Error::Code::ParameterNotArray, target->node->fullName + " is not explored, cannot expand it"});
        if (!seen.insert(target->node).second)
            return std::unexpected(Error{Error::Code::InvalidArgument, target->node->fullName + " is bound twice"});
        targets.push_back(*target);
    }
    for (Node* explored : this->exploredParameters()) {
        if (!seen.contains(explored))
            return std::unexpected(Error{Error::Code::InvalidArgument, "Expansion must extend every explored parameter, missing " + explored->fullName});
    }

    std::vector<std::vector<Value>> extended;
    for (std::size_t i = 0; i < targets.size(); ++i) {
        auto values = targets[i].parameter->getRange();
        values.insert(values.end(), bindings[i].second.begin(), bindings[i].second.end());
        auto trial = targets[i].parameter->clone();
        if (auto check = static_cast<Parameter&>(*trial).explore(values); !check)
            return std::unexpected(check.error());
        extended.push_back(std::move(values));
    }
    for (std::size_t i = 0; i < targets.size(); ++i) {
        if (auto explored = targets[i].parameter->explore(std::move(extended[i])); !explored)
            return std::unexpected(explored.error());
    }
    this->resetRuns(this->runs->size() + *length);
    return this->runs->size();
}

auto ExplorationEngine::shrink() -> Expected<void> {
    for (Node* node : this->exploredParameters()) {
        auto& parameter = static_cast<Parameter&>(*node->item);
        parameter.unlock();
        if (auto shrunk = parameter.shrink(); !shrunk)
            return shrunk;
    }
    this->runs->clear();
    return {};
}

auto ExplorationEngine::exploredParameters() const -> std::vector<Node*> {
    std::vector<Node*> explored;
    for (auto& node : this->tree->iterNodes(IterOptions{.recursive = true, .withLinks = false})) {
        if (!node.isLeaf())
            continue;
        if (auto* parameter = dynamic_cast<Parameter*>(node.item.get()); parameter && parameter->isArray())
            explored.push_back(&node);
    }
    return explored;
}

} // namespace TS
