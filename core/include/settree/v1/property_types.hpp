#pragma once

#include "settree/v1/source_kind.hpp"

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace settree::v1 {

/// Closed set of property value types
enum class TypeTag : std::uint8_t {
    Boolean,
    Integer,
    IntegerArray,
    ByteArray,
    String,
    StringArray,
    NodeRef,       // phandle / pointer
    NodeRefList,   // phandles / pointer-array
    IndexedRefs,   // phandle-array
    Path,
    Opaque,        // compound
    Float,
    FloatArray,
    ChildNode      // child binding carrier, never resolved to a value
};

[[nodiscard]] constexpr std::string_view to_string(TypeTag tag) noexcept {
    switch (tag) {
        case TypeTag::Boolean: return "boolean";
        case TypeTag::Integer: return "integer";
        case TypeTag::IntegerArray: return "integer-array";
        case TypeTag::ByteArray: return "byte-array";
        case TypeTag::String: return "string";
        case TypeTag::StringArray: return "string-array";
        case TypeTag::NodeRef: return "node-reference";
        case TypeTag::NodeRefList: return "node-reference-list";
        case TypeTag::IndexedRefs: return "indexed-reference-list";
        case TypeTag::Path: return "path";
        case TypeTag::Opaque: return "opaque";
        case TypeTag::Float: return "float";
        case TypeTag::FloatArray: return "float-array";
        case TypeTag::ChildNode: return "node";
    }
    return "unknown";
}

/// One row of the per-source type table: how a binding type spelling maps to
/// a value tag and which constraints it accepts.
struct TypeInfo {
    std::string_view name;
    TypeTag tag = TypeTag::Opaque;
    bool can_default = false;
    bool can_const = false;
    std::optional<std::int64_t> min;   // range of sized integer spellings
    std::optional<std::int64_t> max;
};

/// Look up a type spelling for a source kind. Unknown spellings yield
/// nullopt.
[[nodiscard]] std::optional<TypeInfo> find_type(SourceKind kind, std::string_view name);

/// All type spellings accepted for a source kind, in table order.
[[nodiscard]] std::vector<std::string_view> type_names(SourceKind kind);

/// Array tags whose elements are plain scalars
[[nodiscard]] constexpr bool is_scalar_list(TypeTag tag) noexcept {
    return tag == TypeTag::IntegerArray || tag == TypeTag::StringArray || tag == TypeTag::FloatArray;
}

}  // namespace settree::v1
