#include "value_conversion.hpp"

#include "settree/v1/errors.hpp"
#include "settree/v1/int_expr.hpp"
#include "settree/v1/partial_tree.hpp"

#include <algorithm>
#include <array>
#include <cctype>
#include <string>

namespace settree::v1::detail {

namespace {

using Converter = PropertyValue (*)(const ConversionContext&, const RawValue&);

struct ConversionRule {
    TypeTag tag;
    SourceKind kind;
    Converter convert;
};

[[noreturn]] void fail(const ConversionContext& ctx, const std::string& expected, const RawValue& raw) {
    throw PropertyError(kDiagTypeMismatch, "expected property '" + std::string(ctx.prop_name) + "' on " +
                                               ctx.node.path() + " in " + ctx.spec.path() + " to be " + expected +
                                               ", not " + raw.describe());
}

std::int64_t check_range(const ConversionContext& ctx, std::int64_t value) {
    const TypeInfo& info = ctx.spec.type_info();
    if ((info.min && value < *info.min) || (info.max && value > *info.max)) {
        throw PropertyError(kDiagBadValue, "value " + std::to_string(value) + " of property '" +
                                               std::string(ctx.prop_name) + "' on " + ctx.node.path() +
                                               " is out of range for type '" + ctx.spec.type() + "'");
    }
    return value;
}

// One list level: a single item stands for a list of one
const std::vector<RawValue>& items_of(const RawValue& raw, std::vector<RawValue>& single) {
    if (raw.is(RawKind::List)) {
        return raw.items;
    }
    single.assign(1, raw);
    return single;
}

std::int64_t config_int(const ConversionContext& ctx, const RawValue& raw) {
    if (raw.is(RawKind::Integer)) {
        return check_range(ctx, raw.integer);
    }
    if (raw.is(RawKind::String) && is_int_expression(raw.text)) {
        try {
            return check_range(ctx, eval_int_expression(raw.text));
        } catch (const PropertyError& e) {
            if (e.code() != kDiagBadExpression) {
                throw;
            }
            throw PropertyError(kDiagBadExpression, "expected property '" + std::string(ctx.prop_name) + "' on " +
                                                        ctx.node.path() + " in " + ctx.spec.path() +
                                                        " to be an integer expression: " + e.what());
        }
    }
    fail(ctx, "an integer", raw);
}

// --- Boolean -------------------------------------------------------------

PropertyValue hw_boolean(const ConversionContext& ctx, const RawValue& raw) {
    if (!raw.is(RawKind::Empty)) {
        fail(ctx, "a presence-only (empty) property", raw);
    }
    return true;
}

PropertyValue cfg_boolean(const ConversionContext& ctx, const RawValue& raw) {
    if (!raw.is(RawKind::Boolean)) {
        fail(ctx, "a boolean", raw);
    }
    return raw.boolean;
}

// --- Integers ------------------------------------------------------------

PropertyValue hw_integer(const ConversionContext& ctx, const RawValue& raw) {
    if (raw.is(RawKind::Integer)) {
        return raw.integer;
    }
    if (raw.is(RawKind::List) && raw.items.size() == 1 && raw.items.front().is(RawKind::Integer)) {
        return raw.items.front().integer;
    }
    fail(ctx, "a single cell", raw);
}

PropertyValue cfg_integer(const ConversionContext& ctx, const RawValue& raw) {
    return config_int(ctx, raw);
}

PropertyValue hw_integer_array(const ConversionContext& ctx, const RawValue& raw) {
    std::vector<RawValue> single;
    std::vector<std::int64_t> values;
    for (const auto& item : items_of(raw, single)) {
        if (!item.is(RawKind::Integer)) {
            fail(ctx, "a list of cells", raw);
        }
        values.push_back(item.integer);
    }
    return values;
}

PropertyValue cfg_integer_array(const ConversionContext& ctx, const RawValue& raw) {
    if (!raw.is(RawKind::List)) {
        fail(ctx, "a list of integers", raw);
    }
    std::vector<std::int64_t> values;
    values.reserve(raw.items.size());
    for (const auto& item : raw.items) {
        values.push_back(config_int(ctx, item));
    }
    return values;
}

// --- Bytes ---------------------------------------------------------------

PropertyValue hw_bytes(const ConversionContext& ctx, const RawValue& raw) {
    if (!raw.is(RawKind::Bytes)) {
        fail(ctx, "a byte string", raw);
    }
    return raw.bytes;
}

std::optional<Bytes> parse_hex(std::string_view text) {
    Bytes bytes;
    int high = -1;
    for (const char c : text) {
        if (std::isspace(static_cast<unsigned char>(c)) != 0) {
            if (high >= 0) {
                return std::nullopt;
            }
            continue;
        }
        if (std::isxdigit(static_cast<unsigned char>(c)) == 0) {
            return std::nullopt;
        }
        const int digit = std::isdigit(static_cast<unsigned char>(c)) != 0
                              ? c - '0'
                              : std::tolower(static_cast<unsigned char>(c)) - 'a' + 10;
        if (high < 0) {
            high = digit;
        } else {
            bytes.push_back(static_cast<std::uint8_t>(high * 16 + digit));
            high = -1;
        }
    }
    if (high >= 0) {
        return std::nullopt;
    }
    return bytes;
}

PropertyValue cfg_bytes(const ConversionContext& ctx, const RawValue& raw) {
    if (raw.is(RawKind::Bytes)) {
        return raw.bytes;
    }
    if (raw.is(RawKind::Integer)) {
        if (raw.integer < 0 || raw.integer > 255) {
            fail(ctx, "a byte (0..255)", raw);
        }
        return Bytes{static_cast<std::uint8_t>(raw.integer)};
    }
    if (raw.is(RawKind::String)) {
        if (auto bytes = parse_hex(raw.text)) {
            return std::move(*bytes);
        }
        throw PropertyError(kDiagBadValue, "value of property '" + std::string(ctx.prop_name) + "' ('" + raw.text +
                                               "') on " + ctx.node.path() + " in " + ctx.spec.path() +
                                               " is not a valid hex number");
    }
    fail(ctx, "a scalar value", raw);
}

// --- Strings -------------------------------------------------------------

PropertyValue any_string(const ConversionContext& ctx, const RawValue& raw) {
    if (raw.is(RawKind::String)) {
        return raw.text;
    }
    if (raw.is(RawKind::List) && raw.items.size() == 1 && raw.items.front().is(RawKind::String)) {
        return raw.items.front().text;
    }
    fail(ctx, "a string", raw);
}

PropertyValue hw_strings(const ConversionContext& ctx, const RawValue& raw) {
    std::vector<RawValue> single;
    std::vector<std::string> values;
    for (const auto& item : items_of(raw, single)) {
        if (!item.is(RawKind::String)) {
            fail(ctx, "a string or a list of strings", raw);
        }
        values.push_back(item.text);
    }
    return values;
}

PropertyValue cfg_strings(const ConversionContext& ctx, const RawValue& raw) {
    if (!raw.is_list_of(RawKind::String)) {
        fail(ctx, "a list of strings", raw);
    }
    std::vector<std::string> values;
    values.reserve(raw.items.size());
    for (const auto& item : raw.items) {
        values.push_back(item.text);
    }
    return values;
}

// --- Node references -----------------------------------------------------

PropertyValue hw_node_ref(const ConversionContext& ctx, const RawValue& raw) {
    const RawValue* ref = &raw;
    if (raw.is(RawKind::List) && raw.items.size() == 1) {
        ref = &raw.items.front();
    }
    if (!ref->is(RawKind::Reference)) {
        fail(ctx, "a node reference", raw);
    }
    return NodeRef{ctx.tree.resolve_reference(ctx.node, ctx.prop_name, *ref)};
}

PropertyValue hw_node_refs(const ConversionContext& ctx, const RawValue& raw) {
    std::vector<RawValue> single;
    std::vector<NodeRef> refs;
    for (const auto& item : items_of(raw, single)) {
        if (!item.is(RawKind::Reference)) {
            fail(ctx, "a list of node references", raw);
        }
        refs.push_back(NodeRef{ctx.tree.resolve_reference(ctx.node, ctx.prop_name, item)});
    }
    return refs;
}

PropertyValue cfg_pointer(const ConversionContext& ctx, const RawValue& raw) {
    if (!raw.is(RawKind::String) && !raw.is(RawKind::Reference)) {
        fail(ctx, "'&foo' or '/bar/foo'", raw);
    }
    return NodeRef{ctx.tree.resolve_reference(ctx.node, ctx.prop_name, raw)};
}

PropertyValue cfg_pointers(const ConversionContext& ctx, const RawValue& raw) {
    if (!raw.is(RawKind::List)) {
        fail(ctx, "a list of pointers", raw);
    }
    std::size_t handles = 0;
    for (const auto& item : raw.items) {
        if (!item.is(RawKind::String) && !item.is(RawKind::Reference)) {
            fail(ctx, "a list of '&foo' or '/bar/foo'", raw);
        }
        if (item.is(RawKind::String) && !item.text.empty() && item.text.front() == '&') {
            ++handles;
        }
    }
    if (handles != 0 && handles != raw.items.size()) {
        throw PropertyError(kDiagBadReference, "property '" + std::string(ctx.prop_name) + "' on " +
                                                   ctx.node.path() +
                                                   " mixes '&label' and path references in one list");
    }
    std::vector<NodeRef> refs;
    refs.reserve(raw.items.size());
    for (const auto& item : raw.items) {
        refs.push_back(NodeRef{ctx.tree.resolve_reference(ctx.node, ctx.prop_name, item)});
    }
    return refs;
}

PropertyValue hw_indexed_refs(const ConversionContext& ctx, const RawValue& raw) {
    return ctx.tree.resolve_indexed_refs(ctx.node, ctx.spec, ctx.prop_name, raw);
}

PropertyValue hw_path(const ConversionContext& ctx, const RawValue& raw) {
    if (raw.is(RawKind::Reference)) {
        return NodeRef{ctx.tree.resolve_reference(ctx.node, ctx.prop_name, raw)};
    }
    if (raw.is(RawKind::String)) {
        if (raw.text.empty() || raw.text.front() != '/') {
            throw PropertyError(kDiagBadReference, "property '" + std::string(ctx.prop_name) + "' on " +
                                                       ctx.node.path() + " is not an absolute path: '" + raw.text +
                                                       "'");
        }
        return NodeRef{ctx.tree.resolve_reference(ctx.node, ctx.prop_name, RawValue::reference(raw.text))};
    }
    fail(ctx, "a path", raw);
}

PropertyValue hw_opaque(const ConversionContext&, const RawValue&) {
    return std::monostate{};
}

// --- Floats --------------------------------------------------------------

double config_float(const ConversionContext& ctx, const RawValue& raw) {
    if (raw.is(RawKind::Float)) {
        return raw.real;
    }
    if (raw.is(RawKind::Integer)) {
        return static_cast<double>(raw.integer);
    }
    fail(ctx, "a float", raw);
}

PropertyValue cfg_float(const ConversionContext& ctx, const RawValue& raw) {
    return config_float(ctx, raw);
}

PropertyValue cfg_floats(const ConversionContext& ctx, const RawValue& raw) {
    if (!raw.is(RawKind::List)) {
        fail(ctx, "a list of floats", raw);
    }
    std::vector<double> values;
    values.reserve(raw.items.size());
    for (const auto& item : raw.items) {
        values.push_back(config_float(ctx, item));
    }
    return values;
}

constexpr std::array<ConversionRule, 21> kConversionTable{{
    {TypeTag::Boolean, SourceKind::Hardware, hw_boolean},
    {TypeTag::Boolean, SourceKind::Config, cfg_boolean},
    {TypeTag::Integer, SourceKind::Hardware, hw_integer},
    {TypeTag::Integer, SourceKind::Config, cfg_integer},
    {TypeTag::IntegerArray, SourceKind::Hardware, hw_integer_array},
    {TypeTag::IntegerArray, SourceKind::Config, cfg_integer_array},
    {TypeTag::ByteArray, SourceKind::Hardware, hw_bytes},
    {TypeTag::ByteArray, SourceKind::Config, cfg_bytes},
    {TypeTag::String, SourceKind::Hardware, any_string},
    {TypeTag::String, SourceKind::Config, any_string},
    {TypeTag::StringArray, SourceKind::Hardware, hw_strings},
    {TypeTag::StringArray, SourceKind::Config, cfg_strings},
    {TypeTag::NodeRef, SourceKind::Hardware, hw_node_ref},
    {TypeTag::NodeRef, SourceKind::Config, cfg_pointer},
    {TypeTag::NodeRefList, SourceKind::Hardware, hw_node_refs},
    {TypeTag::NodeRefList, SourceKind::Config, cfg_pointers},
    {TypeTag::IndexedRefs, SourceKind::Hardware, hw_indexed_refs},
    {TypeTag::Path, SourceKind::Hardware, hw_path},
    {TypeTag::Opaque, SourceKind::Hardware, hw_opaque},
    {TypeTag::Float, SourceKind::Config, cfg_float},
    {TypeTag::FloatArray, SourceKind::Config, cfg_floats},
}};

}  // namespace

PropertyValue convert_raw_value(const ConversionContext& ctx, const RawValue& raw) {
    const SourceKind kind = ctx.tree.kind();
    const TypeTag tag = ctx.spec.tag();
    const auto it = std::find_if(kConversionTable.begin(), kConversionTable.end(),
                                 [&](const ConversionRule& rule) { return rule.tag == tag && rule.kind == kind; });
    if (it == kConversionTable.end()) {
        throw PropertyError(kDiagTypeMismatch, "type '" + ctx.spec.type() + "' of property '" +
                                                   std::string(ctx.prop_name) + "' on " + ctx.node.path() +
                                                   " has no value in a " + std::string(to_string(kind)) + " source");
    }
    return it->convert(ctx, raw);
}

}  // namespace settree::v1::detail
