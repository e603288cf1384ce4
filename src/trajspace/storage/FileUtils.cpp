#include "storage/FileUtils.hpp"

#include <fstream>
#include <sstream>
#include <system_error>

#ifdef _WIN32
#include <fcntl.h>
#include <io.h>
#include <sys/stat.h>
#else
#include <fcntl.h>
#include <sys/stat.h>
#include <unistd.h>
#endif

namespace TS::FileUtils {

namespace {

auto closeDescriptor(int fd) -> int {
#ifdef _WIN32
    return _close(fd);
#else
    return ::close(fd);
#endif
}

} // namespace

auto fsyncFileDescriptor(int fd) -> Expected<void> {
#ifdef _WIN32
    if (_commit(fd) != 0) {
        return std::unexpected(Error{Error::Code::StorageUnavailable, "_commit failed"});
    }
#else
    if (::fsync(fd) != 0) {
        return std::unexpected(Error{Error::Code::StorageUnavailable, "fsync failed"});
    }
#endif
    return {};
}

auto fsyncDirectory(std::filesystem::path const& dir) -> Expected<void> {
#ifdef _WIN32
    (void)dir;
    return {};
#else
    int fd = ::open(dir.c_str(), O_RDONLY | O_DIRECTORY);
    if (fd < 0) {
        return std::unexpected(Error{Error::Code::StorageUnavailable, "open directory failed: " + dir.string()});
    }
    auto result = fsyncFileDescriptor(fd);
    ::close(fd);
    return result;
#endif
}

auto writeTextFileAtomic(std::filesystem::path const& path, std::string const& text, bool fsyncData) -> Expected<void> {
    std::error_code ec;
    auto            parent = path.parent_path();
    if (!parent.empty()) {
        std::filesystem::create_directories(parent, ec);
        if (ec) {
            return std::unexpected(Error{Error::Code::StorageUnavailable, "Failed to create directories " + parent.string()});
        }
    }

    auto tmpPath = path;
    tmpPath += ".tmp";

#ifdef _WIN32
    int fd = _open(tmpPath.string().c_str(), _O_CREAT | _O_TRUNC | _O_WRONLY | _O_BINARY, _S_IREAD | _S_IWRITE);
#else
    int fd = ::open(tmpPath.c_str(), O_CREAT | O_TRUNC | O_WRONLY, 0644);
#endif
    if (fd < 0) {
        return std::unexpected(Error{Error::Code::StorageUnavailable, "Failed to open temp file " + tmpPath.string()});
    }

    std::size_t totalWritten = 0;
    while (totalWritten < text.size()) {
        auto const* ptr       = text.data() + totalWritten;
        auto const  remaining = text.size() - totalWritten;
#ifdef _WIN32
        auto written = _write(fd, ptr, static_cast<unsigned int>(remaining));
#else
        auto written = ::write(fd, ptr, remaining);
#endif
        if (written <= 0) {
            closeDescriptor(fd);
            return std::unexpected(Error{Error::Code::StorageUnavailable, "Failed to write temp file " + tmpPath.string()});
        }
        totalWritten += static_cast<std::size_t>(written);
    }

    if (fsyncData) {
        if (auto sync = fsyncFileDescriptor(fd); !sync) {
            closeDescriptor(fd);
            return sync;
        }
    }

    if (closeDescriptor(fd) != 0) {
        return std::unexpected(Error{Error::Code::StorageUnavailable, "Failed to close temp file " + tmpPath.string()});
    }

    std::filesystem::rename(tmpPath, path, ec);
    if (ec) {
        return std::unexpected(Error{Error::Code::StorageUnavailable, "Failed to rename temp file onto " + path.string()});
    }

    if (fsyncData && !parent.empty()) {
        return fsyncDirectory(parent);
    }
    return {};
}

auto readTextFile(std::filesystem::path const& path) -> Expected<std::string> {
    std::ifstream stream(path);
    if (!stream) {
        return std::unexpected(Error{Error::Code::NoSuchPath, "File not found: " + path.string()});
    }
    std::ostringstream oss;
    oss << stream.rdbuf();
    if (!stream.good() && !stream.eof()) {
        return std::unexpected(Error{Error::Code::StorageUnavailable, "Failed to read file " + path.string()});
    }
    return oss.str();
}

auto removePathIfExists(std::filesystem::path const& path) -> Expected<void> {
    std::error_code ec;
    std::filesystem::remove_all(path, ec);
    if (ec) {
        return std::unexpected(Error{Error::Code::StorageUnavailable, "Failed to remove " + path.string() + ": " + ec.message()});
    }
    return {};
}

} // namespace TS::FileUtils
