#pragma once

// =============================================================================
// settree - Raw Source Tree
// =============================================================================
// Plain node/property data handed over by a source front end. Values are
// already decoded from source syntax; references to other nodes stay
// symbolic (a label or an absolute path) until a partial tree resolves them.
// =============================================================================

#include "settree/v1/source_kind.hpp"

#include <cstdint>
#include <deque>
#include <initializer_list>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace settree::v1 {

using Bytes = std::vector<std::uint8_t>;

enum class RawKind : std::uint8_t {
    Empty,      // presence-only property
    Boolean,
    Integer,
    Float,
    String,
    Bytes,
    Reference,  // label or absolute path of another node
    List
};

[[nodiscard]] constexpr std::string_view to_string(RawKind kind) noexcept {
    switch (kind) {
        case RawKind::Empty: return "empty";
        case RawKind::Boolean: return "boolean";
        case RawKind::Integer: return "integer";
        case RawKind::Float: return "float";
        case RawKind::String: return "string";
        case RawKind::Bytes: return "bytes";
        case RawKind::Reference: return "reference";
        case RawKind::List: return "list";
    }
    return "unknown";
}

struct RawValue {
    RawKind kind = RawKind::Empty;
    bool boolean = false;
    std::int64_t integer = 0;
    double real = 0.0;
    std::string text;               // String and Reference
    Bytes bytes;
    std::vector<RawValue> items;    // List

    [[nodiscard]] static RawValue empty() { return {}; }
    [[nodiscard]] static RawValue from_bool(bool value);
    [[nodiscard]] static RawValue from_int(std::int64_t value);
    [[nodiscard]] static RawValue from_float(double value);
    [[nodiscard]] static RawValue from_string(std::string value);
    [[nodiscard]] static RawValue from_bytes(Bytes value);
    [[nodiscard]] static RawValue reference(std::string target);
    [[nodiscard]] static RawValue list(std::vector<RawValue> values);
    [[nodiscard]] static RawValue cells(std::initializer_list<std::int64_t> values);
    [[nodiscard]] static RawValue strings(std::initializer_list<std::string> values);

    [[nodiscard]] bool is(RawKind k) const noexcept { return kind == k; }
    /// True for a list whose items all have the given kind (an empty list
    /// qualifies).
    [[nodiscard]] bool is_list_of(RawKind k) const noexcept;
    /// True for a null reference slot (integer 0 where a reference may stand)
    [[nodiscard]] bool is_null_reference() const noexcept {
        return kind == RawKind::Integer && integer == 0;
    }

    [[nodiscard]] std::string describe() const;
};

struct RawProperty {
    std::string name;
    RawValue value;
};

struct RawNode {
    std::string path;
    std::string name;
    std::optional<std::string> parent;   // parent path, unset for the root
    std::vector<std::string> children;   // child paths in source order
    std::vector<RawProperty> properties; // source order
    std::vector<std::string> labels;

    [[nodiscard]] const RawValue* find(std::string_view prop_name) const;
    [[nodiscard]] bool has(std::string_view prop_name) const { return find(prop_name) != nullptr; }

    /// Builder helpers
    RawNode& set(std::string prop_name, RawValue value);
    RawNode& label(std::string value);
};

class RawTree {
public:
    explicit RawTree(SourceKind kind, std::string source_path = {});

    [[nodiscard]] SourceKind kind() const noexcept { return kind_; }
    [[nodiscard]] const std::string& source_path() const noexcept { return source_path_; }

    [[nodiscard]] const std::string& schema_property() const noexcept { return schema_property_; }
    [[nodiscard]] const std::string& enabled_property() const noexcept { return enabled_property_; }
    void set_schema_property(std::string name) { schema_property_ = std::move(name); }
    void set_enabled_property(std::string name) { enabled_property_ = std::move(name); }

    /// Add a node at an absolute path. The parent must already exist; the
    /// root ("/") is created on demand.
    RawNode& add_node(const std::string& path);

    [[nodiscard]] RawNode* find(std::string_view path);
    [[nodiscard]] const RawNode* find(std::string_view path) const;
    [[nodiscard]] const std::deque<RawNode>& nodes() const noexcept { return nodes_; }
    [[nodiscard]] std::deque<RawNode>& nodes() noexcept { return nodes_; }

private:
    SourceKind kind_;
    std::string source_path_;
    std::string schema_property_;
    std::string enabled_property_;
    std::deque<RawNode> nodes_;  // stable references for the builder
};

/// Parent path of an absolute path ("/" for first-level nodes)
[[nodiscard]] std::string parent_path_of(std::string_view path);
/// Last path component ("/" for the root)
[[nodiscard]] std::string name_of(std::string_view path);
/// Number of path components ("/" has depth 0)
[[nodiscard]] std::size_t path_depth(std::string_view path) noexcept;

}  // namespace settree::v1
