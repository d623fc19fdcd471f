#pragma once
#include "core/Renderable.hpp"
#include "resource/ResourceDescriptor.hpp"

#include <cstdint>
#include <optional>
#include <span>
#include <string>
#include <string_view>

namespace RS {

// Replacement used when a catalog resource does not resolve.
struct ResourceFallback {
    enum class Type : std::uint8_t {
        None = 0,
        Drawable,
        Color,
        Dimension
    };

    Type             type     = Type::None;
    std::string_view drawable = {};
    ColorToken       color    = ColorToken::Transparent;
    float            dp       = 0.0f;

    static constexpr auto Absent() -> ResourceFallback { return {}; }
    static constexpr auto Builtin(std::string_view name) -> ResourceFallback { return {Type::Drawable, name, ColorToken::Transparent, 0.0f}; }
    static constexpr auto Palette(ColorToken token) -> ResourceFallback { return {Type::Color, {}, token, 0.0f}; }
    static constexpr auto Dp(float value) -> ResourceFallback { return {Type::Dimension, {}, ColorToken::Transparent, value}; }

    [[nodiscard]] constexpr auto present() const -> bool {
        switch (this->type) {
        case Type::None:
            return false;
        case Type::Drawable:
            return !this->drawable.empty();
        case Type::Color:
            return true;
        case Type::Dimension:
            return this->dp > 0.0f;
        }
        return false;
    }

    [[nodiscard]] auto describe() const -> std::string;
};

struct CatalogEntry {
    std::string_view name;
    ResourceKind     kind;
    ResourceFallback fallback = ResourceFallback::Absent();

    [[nodiscard]] constexpr auto descriptor() const -> ResourceDescriptor { return {this->name, this->kind}; }
};

// Layout resources are structural and never carry a fallback; every other
// entry must. Used in static_asserts next to each catalog definition.
[[nodiscard]] constexpr auto fallbacksComplete(std::span<CatalogEntry const> entries) -> bool {
    for (auto const& entry : entries) {
        bool const isLayout = entry.kind == ResourceKind::Layout;
        if (isLayout == entry.fallback.present()) {
            return false;
        }
    }
    return true;
}

[[nodiscard]] constexpr auto findCatalogEntry(std::span<CatalogEntry const> entries, std::string_view name) -> CatalogEntry const* {
    for (auto const& entry : entries) {
        if (entry.name == name) {
            return &entry;
        }
    }
    return nullptr;
}

[[nodiscard]] constexpr auto countOfKind(std::span<CatalogEntry const> entries, ResourceKind kind) -> std::size_t {
    std::size_t count = 0;
    for (auto const& entry : entries) {
        if (entry.kind == kind) {
            ++count;
        }
    }
    return count;
}

} // namespace RS
