#include "core/TrajectoryOptions.hpp"

#include "path/Naming.hpp"
#include "storage/FileUtils.hpp"
#include "storage/StorageRegistry.hpp"

#include <nlohmann/json.hpp>

#include <algorithm>
#include <cctype>
#include <charconv>
#include <cstdlib>
#include <iostream>
#include <iterator>
#include <string_view>

namespace TS {

namespace {

template <typename T>
bool parse_integer(std::string_view text, T& out) {
    T    value{};
    auto result = std::from_chars(text.data(), text.data() + text.size(), value);
    if (result.ec != std::errc{} || result.ptr != text.data() + text.size()) {
        return false;
    }
    out = value;
    return true;
}

std::optional<bool> parse_bool(std::string_view text) {
    if (text.empty()) {
        return std::nullopt;
    }
    std::string normalized;
    normalized.reserve(text.size());
    std::transform(text.begin(), text.end(), std::back_inserter(normalized), [](unsigned char ch) {
        return static_cast<char>(std::tolower(ch));
    });
    if (normalized == "1" || normalized == "true" || normalized == "yes" || normalized == "on") {
        return true;
    }
    if (normalized == "0" || normalized == "false" || normalized == "no" || normalized == "off") {
        return false;
    }
    return std::nullopt;
}

template <typename Setter>
bool apply_env(char const* key, Setter&& setter) {
    if (const char* raw = std::getenv(key)) {
        return setter(std::string_view{raw});
    }
    return true;
}

template <typename T>
auto read_field(nlohmann::json const& document, char const* key, T& out) -> std::optional<Error> {
    auto it = document.find(key);
    if (it == document.end()) {
        return std::nullopt;
    }
    try {
        out = it->get<T>();
    } catch (nlohmann::json::exception const& e) {
        return Error{Error::Code::MalformedInput, std::string("Option '") + key + "': " + e.what()};
    }
    return std::nullopt;
}

} // namespace

auto LoadTrajectoryOptionsFile(std::filesystem::path const& path) -> Expected<TrajectoryOptions> {
    auto text = FileUtils::readTextFile(path);
    if (!text) {
        return std::unexpected(text.error());
    }
    auto document = nlohmann::json::parse(*text, nullptr, false);
    if (document.is_discarded() || !document.is_object()) {
        return std::unexpected(Error{Error::Code::MalformedInput, "Options file " + path.string() + " is not a JSON object"});
    }

    TrajectoryOptions options;
    for (auto error : {read_field(document, "name", options.name),
                       read_field(document, "comment", options.comment),
                       read_field(document, "storage_service", options.storageService),
                       read_field(document, "location", options.location),
                       read_field(document, "auto_load", options.autoLoad),
                       read_field(document, "with_links", options.withLinks),
                       read_field(document, "shortcuts", options.shortcuts),
                       read_field(document, "max_overview_rows", options.maxOverviewRows),
                       read_field(document, "queue_capacity", options.queueCapacity),
                       read_field(document, "worker_count", options.workerCount)}) {
        if (error) {
            return std::unexpected(*error);
        }
    }
    return options;
}

bool ApplyTrajectoryEnvOverrides(TrajectoryOptions& options) {
    if (!apply_env("TRAJSPACE_STORAGE", [&](std::string_view value) {
            if (value.empty()) {
                std::cerr << "TRAJSPACE_STORAGE must not be empty\n";
                return false;
            }
            options.storageService = std::string{value};
            return true;
        })) {
        return false;
    }

    if (!apply_env("TRAJSPACE_LOCATION", [&](std::string_view value) {
            if (value.empty()) {
                std::cerr << "TRAJSPACE_LOCATION must not be empty\n";
                return false;
            }
            options.location = std::string{value};
            return true;
        })) {
        return false;
    }

    if (!apply_env("TRAJSPACE_WORKERS", [&](std::string_view value) {
            std::size_t workers = 0;
            if (!parse_integer(value, workers) || workers == 0) {
                std::cerr << "TRAJSPACE_WORKERS must be a positive integer\n";
                return false;
            }
            options.workerCount = workers;
            return true;
        })) {
        return false;
    }

    if (!apply_env("TRAJSPACE_AUTO_LOAD", [&](std::string_view value) {
            auto parsed = parse_bool(value);
            if (!parsed) {
                std::cerr << "TRAJSPACE_AUTO_LOAD must be a boolean\n";
                return false;
            }
            options.autoLoad = *parsed;
            return true;
        })) {
        return false;
    }

    return apply_env("TRAJSPACE_QUEUE_CAPACITY", [&](std::string_view value) {
        std::size_t capacity = 0;
        if (!parse_integer(value, capacity) || capacity == 0) {
            std::cerr << "TRAJSPACE_QUEUE_CAPACITY must be a positive integer\n";
            return false;
        }
        options.queueCapacity = capacity;
        return true;
    });
}

auto ValidateTrajectoryOptions(TrajectoryOptions const& options) -> std::optional<std::string> {
    if (!isValidName(options.name)) {
        return std::string{"Trajectory name must be a valid node name: " + options.name};
    }
    if (!StorageRegistry::instance().contains(options.storageService)) {
        return std::string{"Unknown storage service: " + options.storageService};
    }
    if (options.location.empty()) {
        return std::string{"Storage location must not be empty"};
    }
    if (options.maxOverviewRows == 0) {
        return std::string{"max_overview_rows must be > 0"};
    }
    if (options.queueCapacity == 0) {
        return std::string{"queue_capacity must be > 0"};
    }
    if (options.workerCount == 0) {
        return std::string{"worker_count must be > 0"};
    }
    return std::nullopt;
}

} // namespace TS
