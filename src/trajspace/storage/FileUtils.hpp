#pragma once

#include "core/Error.hpp"

#include <filesystem>
#include <string>

namespace TS::FileUtils {

[[nodiscard]] auto fsyncFileDescriptor(int fd) -> Expected<void>;
[[nodiscard]] auto fsyncDirectory(std::filesystem::path const& dir) -> Expected<void>;

// Writes through `<path>.tmp` and renames, so readers see the old or the new file.
[[nodiscard]] auto writeTextFileAtomic(std::filesystem::path const& path, std::string const& text, bool fsyncData) -> Expected<void>;
[[nodiscard]] auto readTextFile(std::filesystem::path const& path) -> Expected<std::string>;

[[nodiscard]] auto removePathIfExists(std::filesystem::path const& path) -> Expected<void>;

} // namespace TS::FileUtils
