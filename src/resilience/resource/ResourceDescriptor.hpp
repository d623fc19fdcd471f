#pragma once

#include <cstddef>
#include <cstdint>
#include <string_view>

namespace RS {

enum class ResourceKind : std::uint8_t {
    Visual = 0,
    Layout,
    Color,
    Dimension
};

inline constexpr std::size_t ResourceKindCount = 4;

[[nodiscard]] constexpr auto resourceKindToString(ResourceKind kind) -> std::string_view {
    switch (kind) {
    case ResourceKind::Visual:
        return "visual";
    case ResourceKind::Layout:
        return "layout";
    case ResourceKind::Color:
        return "color";
    case ResourceKind::Dimension:
        return "dimension";
    }
    return "visual";
}

struct ResourceDescriptor {
    std::string_view name;
    ResourceKind     kind;
};

} // namespace RS
