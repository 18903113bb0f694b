#pragma once

#include "settree/v1/errors.hpp"

#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

namespace settree::v1 {

// Diagnostic codes (warnings)
inline constexpr const char* kDiagVendorPrefix = "SETTREE_W_VENDOR_PREFIX";
inline constexpr const char* kDiagEnumNotTokenizable = "SETTREE_W_ENUM_NOT_TOKENIZABLE";
inline constexpr const char* kDiagEnumLowercaseOnly = "SETTREE_W_ENUM_LOWERCASE_ONLY";
inline constexpr const char* kDiagDeprecatedProperty = "SETTREE_W_DEPRECATED_PROPERTY";
inline constexpr const char* kDiagRegUnitAddress = "SETTREE_W_REG_UNIT_ADDRESS";

enum class WarningKind : std::uint8_t {
    VendorPrefix,
    EnumTokenizable,
    DeprecatedProperty,
    RegUnitAddress
};

[[nodiscard]] constexpr std::string_view to_string(WarningKind kind) noexcept {
    switch (kind) {
        case WarningKind::VendorPrefix: return "vendor_prefix";
        case WarningKind::EnumTokenizable: return "enum_tokenizable";
        case WarningKind::DeprecatedProperty: return "deprecated_property";
        case WarningKind::RegUnitAddress: return "reg_unit_address";
    }
    return "unknown";
}

/// Collects non-fatal findings as coded messages. A finding whose kind was
/// promoted with escalate() is thrown instead of being recorded.
class Diagnostics {
public:
    void escalate(WarningKind kind) { escalated_.push_back(kind); }

    [[nodiscard]] bool escalated(WarningKind kind) const noexcept;

    /// Record a warning, or throw it as the error matching its kind when
    /// the kind has been escalated.
    void warn(WarningKind kind, std::string_view code, const std::string& message);

    [[nodiscard]] const std::vector<std::string>& warnings() const { return warnings_; }
    [[nodiscard]] bool has_warning(std::string_view code) const;
    void clear() { warnings_.clear(); }

private:
    std::vector<WarningKind> escalated_;
    std::vector<std::string> warnings_;
};

}  // namespace settree::v1
