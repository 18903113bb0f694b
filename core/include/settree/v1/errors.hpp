#pragma once

// =============================================================================
// settree - Error Taxonomy
// =============================================================================
// Every fatal condition is reported as an exception derived from
// SettingsError. The message carries a stable diagnostic code in the form
// "[SETTREE_E_...] message" so callers and tests can match on the code.
// =============================================================================

#include <stdexcept>
#include <string>
#include <string_view>
#include <utility>

namespace settree::v1 {

// Diagnostic codes (errors)
inline constexpr const char* kDiagYamlSyntax = "SETTREE_E_YAML_SYNTAX";
inline constexpr const char* kDiagIncludeFilter = "SETTREE_E_INCLUDE_FILTER";
inline constexpr const char* kDiagIncludeNotFound = "SETTREE_E_INCLUDE_NOT_FOUND";
inline constexpr const char* kDiagUnknownKey = "SETTREE_E_UNKNOWN_KEY";
inline constexpr const char* kDiagMergeConflict = "SETTREE_E_MERGE_CONFLICT";
inline constexpr const char* kDiagTypeMismatch = "SETTREE_E_TYPE_MISMATCH";
inline constexpr const char* kDiagBadDefault = "SETTREE_E_BAD_DEFAULT";
inline constexpr const char* kDiagBadConst = "SETTREE_E_BAD_CONST";
inline constexpr const char* kDiagMissingKey = "SETTREE_E_MISSING_KEY";
inline constexpr const char* kDiagLegacyKey = "SETTREE_E_LEGACY_KEY";
inline constexpr const char* kDiagSpecifierSpace = "SETTREE_E_SPECIFIER_SPACE";
inline constexpr const char* kDiagDuplicateBinding = "SETTREE_E_DUPLICATE_BINDING";
inline constexpr const char* kDiagRequiredMissing = "SETTREE_E_REQUIRED_MISSING";
inline constexpr const char* kDiagEnumViolation = "SETTREE_E_ENUM";
inline constexpr const char* kDiagConstViolation = "SETTREE_E_CONST";
inline constexpr const char* kDiagBadValue = "SETTREE_E_BAD_VALUE";
inline constexpr const char* kDiagBadReference = "SETTREE_E_BAD_REFERENCE";
inline constexpr const char* kDiagBadExpression = "SETTREE_E_BAD_EXPRESSION";
inline constexpr const char* kDiagCellCount = "SETTREE_E_CELL_COUNT";
inline constexpr const char* kDiagMapNoMatch = "SETTREE_E_MAP_NO_MATCH";
inline constexpr const char* kDiagMapLoop = "SETTREE_E_MAP_LOOP";
inline constexpr const char* kDiagUndeclaredProperty = "SETTREE_E_UNDECLARED_PROPERTY";
inline constexpr const char* kDiagPropertyCollision = "SETTREE_E_PROPERTY_COLLISION";
inline constexpr const char* kDiagEnabledConflict = "SETTREE_E_ENABLED_CONFLICT";
inline constexpr const char* kDiagDependencyLoop = "SETTREE_E_DEPENDENCY_LOOP";
inline constexpr const char* kDiagNoRoots = "SETTREE_E_NO_ROOTS";
inline constexpr const char* kDiagUnknownVertex = "SETTREE_E_UNKNOWN_VERTEX";
inline constexpr const char* kDiagBadState = "SETTREE_E_STATE";
inline constexpr const char* kDiagBadSchemaId = "SETTREE_E_SCHEMA_ID";

[[nodiscard]] inline std::string with_diag_code(std::string_view code, std::string_view message) {
    std::string out;
    out.reserve(code.size() + message.size() + 3);
    out.append("[").append(code).append("] ").append(message);
    return out;
}

class SettingsError : public std::runtime_error {
public:
    SettingsError(std::string code, const std::string& message)
        : std::runtime_error(with_diag_code(code, message)), code_(std::move(code)) {}

    [[nodiscard]] const std::string& code() const noexcept { return code_; }

private:
    std::string code_;
};

/// Malformed binding document or binding set
class SchemaError : public SettingsError {
public:
    using SettingsError::SettingsError;
};

/// Property value that does not satisfy its declaration
class PropertyError : public SettingsError {
public:
    using SettingsError::SettingsError;
};

/// Dependency cycle or rootless graph
class GraphError : public SettingsError {
public:
    using SettingsError::SettingsError;
};

/// API used out of order
class StateError : public SettingsError {
public:
    using SettingsError::SettingsError;
};

/// Sources that cannot be merged into one entity
class MergeError : public SettingsError {
public:
    using SettingsError::SettingsError;
};

}  // namespace settree::v1
