#include "path/Naming.hpp"

#include "link/LinkIndex.hpp"
#include "log/TaggedLogger.hpp"

#include <algorithm>
#include <cctype>
#include <charconv>
#include <cstdio>
#include <deque>
#include <unordered_set>

namespace TS {

namespace {

auto allDigits(std::string_view text) -> bool {
    return !text.empty() && std::all_of(text.begin(), text.end(), [](unsigned char ch) { return std::isdigit(ch) != 0; });
}

auto parseIndex(std::string_view digits) -> std::optional<std::size_t> {
    std::size_t value = 0;
    auto        res   = std::from_chars(digits.data(), digits.data() + digits.size(), value);
    if (res.ec != std::errc{} || res.ptr != digits.data() + digits.size())
        return std::nullopt;
    return value;
}

auto isForeignRun(std::string_view edgePath, std::string const& runName) -> bool {
    for (auto const& segment : splitPath(edgePath)) {
        if (parseRunIndex(segment) && segment != runName)
            return true;
    }
    return false;
}

// True if `wanted` appears in `segments` in order, gaps allowed.
auto isSubsequence(std::vector<std::string> const& wanted, std::vector<std::string> const& segments) -> bool {
    auto it = segments.begin();
    for (auto const& segment : wanted) {
        it = std::find(it, segments.end(), segment);
        if (it == segments.end())
            return false;
        ++it;
    }
    return true;
}

} // namespace

auto formatRunName(std::size_t index) -> std::string {
    char buffer[32];
    std::snprintf(buffer, sizeof(buffer), "run_%08zu", index);
    return buffer;
}

auto parseRunIndex(std::string_view name) -> std::optional<std::size_t> {
    if (!name.starts_with(RunPrefix))
        return std::nullopt;
    auto digits = name.substr(RunPrefix.size());
    if (digits.size() != 8 || !allDigits(digits))
        return std::nullopt;
    return parseIndex(digits);
}

auto isValidName(std::string_view name) -> bool {
    if (name.empty() || std::isdigit(static_cast<unsigned char>(name.front())))
        return false;
    for (unsigned char ch : name) {
        if (!std::isalnum(ch) && ch != '_')
            return false;
    }
    if (name == "par" || name == "dpar" || name == "res" || name == "conf" || name == CurrentRunAlias)
        return false;
    if (name.starts_with("r_") && allDigits(name.substr(2)))
        return false;
    return true;
}

auto splitPath(std::string_view path) -> std::vector<std::string> {
    std::vector<std::string> segments;
    if (path.empty())
        return segments;
    std::size_t start = 0;
    while (true) {
        auto dot = path.find('.', start);
        if (dot == std::string_view::npos) {
            segments.emplace_back(path.substr(start));
            break;
        }
        segments.emplace_back(path.substr(start, dot - start));
        start = dot + 1;
    }
    return segments;
}

auto translateSegment(std::string_view segment, std::optional<std::string> const& runName) -> Expected<std::string> {
    if (segment == RunWildcard || segment == CurrentRunAlias) {
        if (!runName)
            return std::unexpected(Error{Error::Code::NoRunBound, "'" + std::string(segment) + "' used while no run is bound"});
        return *runName;
    }
    if (segment == "par")
        return std::string(Branch::Parameters);
    if (segment == "dpar")
        return std::string(Branch::DerivedParameters);
    if (segment == "res")
        return std::string(Branch::Results);
    if (segment == "conf")
        return std::string(Branch::Config);
    if (segment.starts_with("r_") && allDigits(segment.substr(2))) {
        if (auto index = parseIndex(segment.substr(2)))
            return formatRunName(*index);
    }
    if (segment.starts_with(RunPrefix)) {
        auto digits = segment.substr(RunPrefix.size());
        if (allDigits(digits) && digits.size() != 8) {
            if (auto index = parseIndex(digits))
                return formatRunName(*index);
        }
    }
    return std::string(segment);
}

auto translatePath(std::string_view path, std::optional<std::string> const& runName) -> Expected<std::vector<std::string>> {
    auto segments = splitPath(path);
    for (auto& segment : segments) {
        auto translated = translateSegment(segment, runName);
        if (!translated)
            return std::unexpected(translated.error());
        segment = std::move(*translated);
    }
    return segments;
}

NamingResolver::NamingResolver(LinkIndex const& linkIndex)
    : links(&linkIndex) {}

auto NamingResolver::child(Node& node, std::string_view name, bool withLinks) const -> Node* {
    if (auto* direct = node.getChild(name))
        return direct;
    if (withLinks)
        return this->links->target(node, name);
    return nullptr;
}

auto NamingResolver::search(Node& start, std::string_view name, ResolveOptions const& options) const -> std::vector<Candidate> {
    std::vector<Candidate>          candidates;
    std::deque<Node*>               pending{&start};
    std::unordered_set<Node const*> visited{&start};

    auto consider = [&](Node& owner, std::string const& edgeName, Node& target, bool viaLink) {
        if (edgeName == name) {
            auto edgePath = joinName(owner.fullName, edgeName);
            if (!options.runName || !isForeignRun(edgePath, *options.runName))
                candidates.push_back(Candidate{&target, &owner, std::move(edgePath), viaLink});
        }
        if (target.isGroup() && visited.insert(&target).second)
            pending.push_back(&target);
    };

    while (!pending.empty()) {
        Node* group = pending.front();
        pending.pop_front();
        for (auto const& childName : group->childNames())
            consider(*group, childName, *group->getChild(childName), false);
        if (options.withLinks) {
            for (auto const& [linkName, target] : this->links->targetsOf(*group))
                consider(*group, linkName, *target, true);
        }
    }
    ts_log("NamingResolver::search " + std::string(name) + " candidates=" + std::to_string(candidates.size()), "Naming");
    return candidates;
}

auto NamingResolver::resolve(Node& start, std::string_view path, ResolveOptions const& options) const -> Expected<Node*> {
    auto segments = translatePath(path, options.runName);
    if (!segments)
        return std::unexpected(segments.error());
    if (!segments->empty() && segments->back().empty())
        return std::unexpected(Error{Error::Code::InvalidPath, "Path '" + std::string(path) + "' ends with a separator"});

    Node* current     = &start;
    bool  forceSearch = false;
    for (auto const& segment : *segments) {
        if (segment.empty()) {
            if (!options.shortcuts)
                return std::unexpected(Error{Error::Code::InvalidPath, "Empty segment in '" + std::string(path) + "' without shortcuts"});
            forceSearch = true;
            continue;
        }
        if (current->isLeaf())
            return std::unexpected(Error{Error::Code::NoSuchPath, "Leaf " + current->fullName + " has no child " + segment});

        Node* next = forceSearch ? nullptr : this->child(*current, segment, options.withLinks);
        if (!next) {
            if (!options.shortcuts)
                return std::unexpected(Error{Error::Code::NoSuchPath, "No node '" + segment + "' below '" + current->fullName + "'"});
            auto candidates = this->search(*current, segment, options);
            if (candidates.size() > 1) {
                return std::unexpected(Error{Error::Code::NotUniqueNode,
                                             "Node '" + segment + "' found more than once, first as '" + candidates[0].edgePath
                                                     + "' and again as '" + candidates[1].edgePath + "'"});
            }
            if (candidates.empty())
                return std::unexpected(Error{Error::Code::NoSuchPath, "No node '" + segment + "' below '" + current->fullName + "'"});
            next = candidates.front().node;
        }
        forceSearch = false;
        current     = next;
    }
    return current;
}

auto NamingResolver::findAll(Node& start, std::string_view path, ResolveOptions const& options) const -> Expected<std::vector<Node*>> {
    if (!options.shortcuts) {
        auto exact = this->resolve(start, path, options);
        if (!exact) {
            if (exact.error().code == Error::Code::NoSuchPath)
                return std::vector<Node*>{};
            return std::unexpected(exact.error());
        }
        return std::vector<Node*>{*exact};
    }

    auto segments = translatePath(path, options.runName);
    if (!segments)
        return std::unexpected(segments.error());
    std::erase_if(*segments, [](std::string const& segment) { return segment.empty(); });
    if (segments->empty())
        return std::unexpected(Error{Error::Code::InvalidPath, "Empty search path"});

    auto const               name = segments->back();
    std::vector<std::string> prefix(segments->begin(), segments->end() - 1);

    std::vector<Node*>              found;
    std::unordered_set<Node const*> seen;
    for (auto const& candidate : this->search(start, name, options)) {
        auto edgeSegments = splitPath(candidate.edgePath);
        edgeSegments.pop_back();
        if (!isSubsequence(prefix, edgeSegments))
            continue;
        if (seen.insert(candidate.node).second)
            found.push_back(candidate.node);
    }
    return found;
}

} // namespace TS
