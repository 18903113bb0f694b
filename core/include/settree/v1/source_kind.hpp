#pragma once

#include <cstdint>
#include <string_view>

namespace settree::v1 {

/// Origin format of a partial tree
enum class SourceKind : std::uint8_t {
    Hardware,  // devicetree-like hardware description
    Config     // software configuration
};

[[nodiscard]] constexpr std::string_view to_string(SourceKind kind) noexcept {
    switch (kind) {
        case SourceKind::Hardware: return "hardware";
        case SourceKind::Config: return "config";
    }
    return "unknown";
}

[[nodiscard]] constexpr std::string_view default_schema_property(SourceKind kind) noexcept {
    return kind == SourceKind::Hardware ? "compatible" : "schema";
}

[[nodiscard]] constexpr std::string_view default_enabled_property(SourceKind kind) noexcept {
    return kind == SourceKind::Hardware ? "status" : "enabled";
}

}  // namespace settree::v1
