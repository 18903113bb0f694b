#include "settree/v1/property_types.hpp"

#include <limits>

namespace settree::v1 {

namespace {

constexpr std::int64_t kI64Min = std::numeric_limits<std::int64_t>::min();
constexpr std::int64_t kI64Max = std::numeric_limits<std::int64_t>::max();

TypeInfo row(std::string_view name, TypeTag tag, bool can_default, bool can_const) {
    TypeInfo info;
    info.name = name;
    info.tag = tag;
    info.can_default = can_default;
    info.can_const = can_const;
    return info;
}

TypeInfo sized(std::string_view name, TypeTag tag, std::int64_t min, std::int64_t max) {
    TypeInfo info = row(name, tag, true, true);
    info.min = min;
    info.max = max;
    return info;
}

const std::vector<TypeInfo>& hardware_types() {
    static const std::vector<TypeInfo> table = {
        row("boolean", TypeTag::Boolean, false, false),
        row("int", TypeTag::Integer, true, true),
        row("array", TypeTag::IntegerArray, true, true),
        row("uint8-array", TypeTag::ByteArray, true, true),
        row("string", TypeTag::String, true, true),
        row("string-array", TypeTag::StringArray, true, true),
        row("phandle", TypeTag::NodeRef, false, false),
        row("phandles", TypeTag::NodeRefList, false, false),
        row("phandle-array", TypeTag::IndexedRefs, false, false),
        row("path", TypeTag::Path, false, false),
        row("compound", TypeTag::Opaque, false, false),
        row("node", TypeTag::ChildNode, false, false),
    };
    return table;
}

const std::vector<TypeInfo>& config_types() {
    static const std::vector<TypeInfo> table = {
        row("boolean", TypeTag::Boolean, true, false),
        row("int", TypeTag::Integer, true, true),
        row("array", TypeTag::IntegerArray, true, true),
        row("uint8-array", TypeTag::ByteArray, true, true),
        row("string", TypeTag::String, true, true),
        row("string-array", TypeTag::StringArray, true, true),
        row("pointer", TypeTag::NodeRef, false, false),
        row("pointer-array", TypeTag::NodeRefList, false, false),
        row("float", TypeTag::Float, true, false),
        row("float-array", TypeTag::FloatArray, true, false),
        row("double", TypeTag::Float, true, false),
        row("double-array", TypeTag::FloatArray, true, false),
        sized("int8", TypeTag::Integer, -128, 127),
        sized("int16", TypeTag::Integer, -32768, 32767),
        sized("int32", TypeTag::Integer, -2147483648LL, 2147483647LL),
        sized("int64", TypeTag::Integer, kI64Min, kI64Max),
        sized("uint8", TypeTag::Integer, 0, 255),
        sized("uint16", TypeTag::Integer, 0, 65535),
        sized("uint32", TypeTag::Integer, 0, 4294967295LL),
        sized("uint64", TypeTag::Integer, 0, kI64Max),
        sized("int8-array", TypeTag::IntegerArray, -128, 127),
        sized("int16-array", TypeTag::IntegerArray, -32768, 32767),
        sized("int32-array", TypeTag::IntegerArray, -2147483648LL, 2147483647LL),
        sized("int64-array", TypeTag::IntegerArray, kI64Min, kI64Max),
        sized("uint16-array", TypeTag::IntegerArray, 0, 65535),
        sized("uint32-array", TypeTag::IntegerArray, 0, 4294967295LL),
        sized("uint64-array", TypeTag::IntegerArray, 0, kI64Max),
        row("node", TypeTag::ChildNode, false, false),
    };
    return table;
}

const std::vector<TypeInfo>& table_for(SourceKind kind) {
    return kind == SourceKind::Hardware ? hardware_types() : config_types();
}

}  // namespace

std::optional<TypeInfo> find_type(SourceKind kind, std::string_view name) {
    for (const auto& info : table_for(kind)) {
        if (info.name == name) {
            return info;
        }
    }
    return std::nullopt;
}

std::vector<std::string_view> type_names(SourceKind kind) {
    std::vector<std::string_view> names;
    for (const auto& info : table_for(kind)) {
        names.push_back(info.name);
    }
    return names;
}

}  // namespace settree::v1
