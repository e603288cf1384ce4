#pragma once
#include <cstddef>
#include <functional>
#include <string>
#include <string_view>

namespace TS {

// Lets string-keyed maps be searched with std::string_view without a temporary.
struct TransparentStringHash {
    using is_transparent = void;

    auto operator()(std::string_view value) const noexcept -> std::size_t {
        return std::hash<std::string_view>{}(value);
    }
    auto operator()(std::string const& value) const noexcept -> std::size_t {
        return std::hash<std::string_view>{}(value);
    }
    auto operator()(char const* value) const noexcept -> std::size_t {
        return std::hash<std::string_view>{}(value);
    }
};

} // namespace TS
