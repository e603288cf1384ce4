#pragma once
#include <expected>
#include <optional>
#include <string>
#include <string_view>

namespace TS {

struct Error {
    enum class Code {
        UnknownError = 0,
        NoSuchPath,
        InvalidPath,
        NotUniqueNode,
        DataNotInStorage,
        NoSuchService,
        VersionMismatch,
        ParameterLocked,
        ParameterNotArray,
        TypeMismatch,
        NoRunBound,
        AlreadyExists,
        NotEmpty,
        LinkedNode,
        InvalidLinkTarget,
        LengthMismatch,
        OutOfRange,
        InvalidArgument,
        StorageUnavailable,
        MalformedInput,
        QueueClosed,
        NotSupported
    };

    Error(Code c, std::string m)
        : code(c), message(std::move(m)) {}

    Code                       code;
    std::optional<std::string> message;
};

template <typename T>
using Expected = std::expected<T, Error>;

[[nodiscard]] inline auto errorCodeToString(Error::Code code) -> std::string_view {
    switch (code) {
    case Error::Code::UnknownError:
        return "unknown_error";
    case Error::Code::NoSuchPath:
        return "no_such_path";
    case Error::Code::InvalidPath:
        return "invalid_path";
    case Error::Code::NotUniqueNode:
        return "not_unique_node";
    case Error::Code::DataNotInStorage:
        return "data_not_in_storage";
    case Error::Code::NoSuchService:
        return "no_such_service";
    case Error::Code::VersionMismatch:
        return "version_mismatch";
    case Error::Code::ParameterLocked:
        return "parameter_locked";
    case Error::Code::ParameterNotArray:
        return "parameter_not_array";
    case Error::Code::TypeMismatch:
        return "type_mismatch";
    case Error::Code::NoRunBound:
        return "no_run_bound";
    case Error::Code::AlreadyExists:
        return "already_exists";
    case Error::Code::NotEmpty:
        return "not_empty";
    case Error::Code::LinkedNode:
        return "linked_node";
    case Error::Code::InvalidLinkTarget:
        return "invalid_link_target";
    case Error::Code::LengthMismatch:
        return "length_mismatch";
    case Error::Code::OutOfRange:
        return "out_of_range";
    case Error::Code::InvalidArgument:
        return "invalid_argument";
    case Error::Code::StorageUnavailable:
        return "storage_unavailable";
    case Error::Code::MalformedInput:
        return "malformed_input";
    case Error::Code::QueueClosed:
        return "queue_closed";
    case Error::Code::NotSupported:
        return "not_supported";
    }
    return "unknown_error";
}

[[nodiscard]] inline auto describeError(Error const& error) -> std::string {
    auto const label = errorCodeToString(error.code);
    if (error.message && !error.message->empty()) {
        std::string description;
        description.reserve(label.size() + 1 + error.message->size());
        description.append(label.data(), label.size());
        description.push_back(':');
        description.append(error.message->data(), error.message->size());
        return description;
    }
    return std::string{label};
}

} // namespace TS
