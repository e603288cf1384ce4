#pragma once
#include "core/Error.hpp"
#include "core/Node.hpp"

#include <cstddef>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace TS {

class LinkIndex;

inline constexpr std::string_view RunWildcard     = "$";
inline constexpr std::string_view CurrentRunAlias = "crun";
inline constexpr std::string_view RunPrefix       = "run_";
inline constexpr std::string_view RunsGroupName   = "runs";

namespace Branch {
inline constexpr std::string_view Config            = "config";
inline constexpr std::string_view Parameters        = "parameters";
inline constexpr std::string_view DerivedParameters = "derived_parameters";
inline constexpr std::string_view Results           = "results";
} // namespace Branch

struct ResolveOptions {
    bool                       shortcuts = true;
    bool                       withLinks = true;
    std::optional<std::string> runName;
};

[[nodiscard]] auto formatRunName(std::size_t index) -> std::string;
[[nodiscard]] auto parseRunIndex(std::string_view name) -> std::optional<std::size_t>;
[[nodiscard]] auto isValidName(std::string_view name) -> bool;

// Splits on '.', keeping empty segments (they mark an explicit shortcut).
[[nodiscard]] auto splitPath(std::string_view path) -> std::vector<std::string>;

// Expands branch abbreviations, run indices and the run wildcard.
[[nodiscard]] auto translateSegment(std::string_view segment, std::optional<std::string> const& runName) -> Expected<std::string>;
[[nodiscard]] auto translatePath(std::string_view path, std::optional<std::string> const& runName) -> Expected<std::vector<std::string>>;

/**
 * @brief Path lookup over a node tree and its links.
 *
 * Resolution walks one segment at a time: a direct child wins, then a link of
 * the current node (only with links enabled), then, with shortcuts enabled, a
 * breadth-first search of the whole subtree. Every edge carrying the wanted
 * name is a candidate; two or more candidates make the lookup ambiguous.
 * Link targets are expanded at most once, so cyclic links terminate.
 */
class NamingResolver {
public:
    struct Candidate {
        Node*       node  = nullptr;
        Node*       owner = nullptr;
        std::string edgePath;
        bool        viaLink = false;
    };

    explicit NamingResolver(LinkIndex const& links);

    auto resolve(Node& start, std::string_view path, ResolveOptions const& options = {}) const -> Expected<Node*>;
    auto findAll(Node& start, std::string_view path, ResolveOptions const& options = {}) const -> Expected<std::vector<Node*>>;
    auto child(Node& node, std::string_view name, bool withLinks) const -> Node*;
    auto search(Node& start, std::string_view name, ResolveOptions const& options) const -> std::vector<Candidate>;

private:
    LinkIndex const* links;
};

} // namespace TS
