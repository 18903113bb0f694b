#pragma once

// =============================================================================
// settree - Per-Source Nodes and Properties
// =============================================================================

#include "settree/v1/binding.hpp"
#include "settree/v1/raw_tree.hpp"
#include "settree/v1/values.hpp"

#include <compare>
#include <functional>
#include <map>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <typeinfo>
#include <variant>
#include <vector>

namespace settree::v1 {

/// A property resolved against its declaration
class Property {
public:
    Property(const PropertySpec& spec, std::string name, PropertyValue value, std::string node_path)
        : spec_(&spec), name_(std::move(name)), value_(std::move(value)), node_path_(std::move(node_path)) {}

    [[nodiscard]] const std::string& name() const noexcept { return name_; }
    [[nodiscard]] const PropertySpec& spec() const noexcept { return *spec_; }
    [[nodiscard]] TypeTag tag() const noexcept { return spec_->tag(); }
    [[nodiscard]] const std::string& type() const noexcept { return spec_->type(); }
    [[nodiscard]] const PropertyValue& value() const noexcept { return value_; }
    [[nodiscard]] const std::string& node_path() const noexcept { return node_path_; }

    /// Typed access; throws PropertyError if the value holds another type
    template <typename T>
    [[nodiscard]] const T& as() const;

    /// Index of a scalar value in the declared enum list, if any
    [[nodiscard]] std::optional<std::size_t> enum_index() const;
    /// Index in the declared enum list of each scalar sub-value (one per
    /// array element), nullopt when the property has no enum
    [[nodiscard]] std::optional<std::vector<std::size_t>> enum_indices() const;
    /// String value or string-array elements as identifier tokens; throws
    /// PropertyError for other types
    [[nodiscard]] std::vector<std::string> val_as_tokens() const;
    /// Description of the declaration, whitespace trimmed
    [[nodiscard]] std::optional<std::string> description() const;

private:
    const PropertySpec* spec_;
    std::string name_;
    PropertyValue value_;
    std::string node_path_;
};

/// Sort key of a node: parent path, name without unit address, unit address
/// (-1 when there is none)
struct NodeKey {
    std::string parent_path;
    std::string name;
    std::int64_t unit_addr = -1;

    auto operator<=>(const NodeKey&) const = default;
};

class Node {
public:
    Node(SourceKind kind, const RawNode& raw, std::string source_path);

    [[nodiscard]] SourceKind kind() const noexcept { return kind_; }
    [[nodiscard]] const std::string& path() const noexcept { return raw_->path; }
    [[nodiscard]] const std::string& name() const noexcept { return raw_->name; }
    [[nodiscard]] const std::optional<std::string>& parent_path() const noexcept { return raw_->parent; }
    [[nodiscard]] const std::vector<std::string>& children() const noexcept { return raw_->children; }
    [[nodiscard]] const std::vector<std::string>& labels() const noexcept { return raw_->labels; }
    [[nodiscard]] const std::string& source_path() const noexcept { return source_path_; }
    [[nodiscard]] const RawNode& raw() const noexcept { return *raw_; }

    /// Schema identifiers declared by the node, in source order
    [[nodiscard]] const std::vector<std::string>& schemas() const noexcept { return schemas_; }
    /// Schema identifiers for which a binding was found
    [[nodiscard]] const std::vector<std::string>& matching_schemas() const noexcept { return matching_schemas_; }
    /// Matched bindings, explicit schema matches before inherited child bindings
    [[nodiscard]] const std::vector<BindingPtr>& bindings() const noexcept { return bindings_; }
    [[nodiscard]] std::vector<std::string> binding_paths() const;
    /// Effective property specs (more specific bindings win)
    [[nodiscard]] const std::vector<const PropertySpec*>& specs() const noexcept { return specs_; }

    [[nodiscard]] bool enabled() const noexcept { return enabled_; }
    /// Label candidates offered to the merged label table
    [[nodiscard]] const std::vector<std::string>& label_candidates() const noexcept { return label_candidates_; }

    [[nodiscard]] const std::vector<Property>& properties() const noexcept { return properties_; }
    [[nodiscard]] const Property* find_property(std::string_view prop_name) const;

    [[nodiscard]] const NodeKey& key() const noexcept { return key_; }

    /// Description of the most specific binding, whitespace trimmed
    [[nodiscard]] std::optional<std::string> description() const;
    [[nodiscard]] bool read_only() const noexcept { return read_only_; }
    /// True if a binding of the node declares a child binding
    [[nodiscard]] bool has_child_binding() const;
    /// Position of 'child_path' among children(); throws PropertyError when
    /// it is not a child of this node
    [[nodiscard]] std::size_t child_index(std::string_view child_path) const;
    /// Path identifier: "N" for the root, "N_S_soc_S_uart_1000" for
    /// "/soc/uart@1000"
    [[nodiscard]] std::string z_path_id() const;

    // Hardware description data (empty for configuration nodes)
    [[nodiscard]] const std::optional<std::uint64_t>& unit_addr() const noexcept { return unit_addr_; }
    [[nodiscard]] const std::vector<Register>& regs() const noexcept { return regs_; }
    [[nodiscard]] const std::vector<Range>& ranges() const noexcept { return ranges_; }
    [[nodiscard]] const std::vector<ControllerAndData>& interrupts() const noexcept { return interrupts_; }
    [[nodiscard]] const std::vector<std::string>& buses() const noexcept { return buses_; }
    [[nodiscard]] const std::optional<std::string>& bus_node() const noexcept { return bus_node_; }
    [[nodiscard]] const std::vector<std::string>& on_buses() const noexcept { return on_buses_; }
    [[nodiscard]] bool is_pci_device() const;
    [[nodiscard]] const std::map<std::string, std::vector<std::string>, std::less<>>& specifier2cells() const noexcept {
        return specifier2cells_;
    }

    // Filled in by the owning partial tree while it is processed
    void set_schemas(std::vector<std::string> schemas) { schemas_ = std::move(schemas); }
    void add_binding(BindingPtr binding, std::optional<std::string> schema);
    void set_specs(std::vector<const PropertySpec*> specs) { specs_ = std::move(specs); }
    void set_enabled(bool enabled) noexcept { enabled_ = enabled; }
    void set_read_only(bool read_only) noexcept { read_only_ = read_only; }
    void set_label_candidates(std::vector<std::string> labels) { label_candidates_ = std::move(labels); }
    void add_property(Property property) { properties_.push_back(std::move(property)); }
    void set_key(NodeKey key) { key_ = std::move(key); }
    void set_unit_addr(std::optional<std::uint64_t> addr) { unit_addr_ = addr; }
    void set_regs(std::vector<Register> regs) { regs_ = std::move(regs); }
    void set_ranges(std::vector<Range> ranges) { ranges_ = std::move(ranges); }
    void set_interrupts(std::vector<ControllerAndData> interrupts) { interrupts_ = std::move(interrupts); }
    void set_bus_info(std::vector<std::string> buses,
                      std::optional<std::string> bus_node,
                      std::vector<std::string> on_buses);
    void set_specifier2cells(std::map<std::string, std::vector<std::string>, std::less<>> cells) {
        specifier2cells_ = std::move(cells);
    }

private:
    SourceKind kind_;
    const RawNode* raw_;
    std::string source_path_;
    std::vector<std::string> schemas_;
    std::vector<std::string> matching_schemas_;
    std::vector<BindingPtr> bindings_;
    std::vector<const PropertySpec*> specs_;
    bool enabled_ = true;
    bool read_only_ = true;
    std::vector<std::string> label_candidates_;
    std::vector<Property> properties_;
    NodeKey key_;

    std::optional<std::uint64_t> unit_addr_;
    std::vector<Register> regs_;
    std::vector<Range> ranges_;
    std::vector<ControllerAndData> interrupts_;
    std::vector<std::string> buses_;
    std::optional<std::string> bus_node_;
    std::vector<std::string> on_buses_;
    std::map<std::string, std::vector<std::string>, std::less<>> specifier2cells_;
};

// =============================================================================
// Property template implementation
// =============================================================================

[[noreturn]] void throw_property_type_mismatch(const Property& property, std::string_view requested);

template <typename T>
const T& Property::as() const {
    if (const T* value = std::get_if<T>(&value_)) {
        return *value;
    }
    throw_property_type_mismatch(*this, typeid(T).name());
}

}  // namespace settree::v1
