#pragma once
#include "core/Error.hpp"
#include "core/Item.hpp"
#include "core/NodeTree.hpp"

#include <cstddef>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace TS {

class Parameter;

// Ordered list of (parameter name, values); order matters for cartesianProduct.
using Binding  = std::pair<std::string, std::vector<Value>>;
using Bindings = std::vector<Binding>;

struct RunInfo {
    std::size_t index = 0;
    std::string name;
    bool        completed = false;
};

// Full cross product, first dimension varies slowest and the last one fastest.
[[nodiscard]] auto cartesianProduct(Bindings const& dimensions) -> Expected<Bindings>;

/**
 * @brief Turns parameter value lists into runs.
 *
 * Names are resolved inside the parameters branch with shortcuts; a name that
 * does not resolve creates parameters.<name> whose default is the first
 * value. Exploration bypasses parameter locks.
 */
class ExplorationEngine {
public:
    ExplorationEngine(NodeTree& tree, std::vector<RunInfo>& runs);

    // Returns the number of runs.
    auto explore(Bindings const& bindings) -> Expected<std::size_t>;
    auto expand(Bindings const& bindings) -> Expected<std::size_t>;
    auto shrink() -> Expected<void>;

    auto exploredParameters() const -> std::vector<Node*>;

private:
    struct Target {
        Node*      node      = nullptr;
        Parameter* parameter = nullptr;
    };

    // A binding whose parameter does not exist yet.
    struct Pending {
        std::size_t binding = 0;
        std::string fullPath;
    };

    auto resolveTarget(std::string const& name) -> Expected<Target>;
    auto createPending(std::vector<Pending> const& pending, Bindings const& bindings, std::vector<std::optional<Target>>& targets) -> Expected<void>;
    auto checkLengths(Bindings const& bindings) const -> Expected<std::size_t>;
    auto resetRuns(std::size_t count) -> void;

    NodeTree*             tree;
    std::vector<RunInfo>* runs;
};

} // namespace TS
