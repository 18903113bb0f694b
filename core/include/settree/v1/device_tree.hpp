#pragma once

// =============================================================================
// settree - Hardware Description Trees
// =============================================================================
// Partial tree driver for devicetree-like sources. Adds what only hardware
// descriptions have: status values, bus variants, address translation
// through 'ranges', interrupts and indexed references (phandle-arrays)
// mapped through <namespace>-map properties.
// =============================================================================

#include "settree/v1/partial_tree.hpp"

#include <cstddef>
#include <cstdint>
#include <set>
#include <string>
#include <vector>

namespace settree::v1 {

struct DeviceTreeOptions {
    bool default_prop_types = true;                // Type standard properties of unbound nodes
    bool err_on_deprecated = false;                // Deprecated property use is an error
    bool warn_reg_unit_address_mismatch = true;    // Compare unit address and first 'reg' address
    bool err_on_reg_unit_address_mismatch = false; // ...and fail instead of warning
    bool fixed_partitions_on_any_bus = true;       // 'fixed-partitions' nodes sit on no bus
    bool err_on_enum_tokenizable = false;          // Non-tokenizable enums are errors
    std::set<std::string> infer_binding_for_paths; // Nodes typed from their raw values
    BindingOptions binding;                        // Used when loading a binding directory
};

/// Values accepted for 'status'
[[nodiscard]] const std::vector<std::string>& status_values();

class DeviceTree final : public PartialTree {
public:
    DeviceTree(RawTree raw, const std::vector<BindingPtr>& bindings, DeviceTreeOptions options = {});
    DeviceTree(RawTree raw, const BindingDirectory& directory, DeviceTreeOptions options = {});

    [[nodiscard]] const DeviceTreeOptions& options() const noexcept { return options_; }

    [[nodiscard]] std::vector<std::string> source_dependencies(const Node& node) const override;

    [[nodiscard]] std::string resolve_reference(const Node& node,
                                                std::string_view prop_name,
                                                const RawValue& value) const override;
    [[nodiscard]] IndexedRefList resolve_indexed_refs(const Node& node,
                                                      const PropertySpec& spec,
                                                      std::string_view prop_name,
                                                      const RawValue& value) const override;

protected:
    void prepare_node(Node& node) override;
    [[nodiscard]] BindingPtr find_binding(const Node& node, std::string_view schema) const override;
    [[nodiscard]] BindingPtr inferred_binding(const Node& node) const override;
    [[nodiscard]] std::vector<const PropertySpec*> default_specs(const Node& node) const override;
    [[nodiscard]] bool compute_enabled(const Node& node) const override;
    [[nodiscard]] std::vector<std::string> label_candidates(const Node& node) const override;
    [[nodiscard]] bool exempt_from_undeclared(const Node& node, std::string_view prop_name) const override;
    void finish_node(Node& node) override;
    void check_node(const Node& node) override;

private:
    using Cells = std::vector<std::uint32_t>;

    struct Mapped {
        const RawNode* controller;
        Cells data;
    };

    void setup();

    [[nodiscard]] const RawNode& raw_node(std::string_view path) const;
    [[nodiscard]] const RawNode* raw_parent(const RawNode& node) const;
    [[nodiscard]] const RawNode& referenced(const RawNode& from, std::string_view prop_name,
                                            const RawValue& ref) const;

    [[nodiscard]] Cells cells_of(const RawNode& node, std::string_view prop_name) const;
    [[nodiscard]] std::uint32_t num_of(const RawNode& node, std::string_view prop_name) const;
    [[nodiscard]] std::uint32_t address_cells(const RawNode& node) const;
    [[nodiscard]] std::uint32_t size_cells(const RawNode& node) const;
    [[nodiscard]] std::uint32_t interrupt_cells(const RawNode& node) const;
    [[nodiscard]] const RawNode& interrupt_parent(const RawNode& node) const;

    [[nodiscard]] std::uint64_t translate(std::uint64_t addr, const RawNode& node) const;
    [[nodiscard]] std::optional<std::uint64_t> unit_address(const Node& node) const;

    [[nodiscard]] std::vector<Register> compute_regs(const Node& node) const;
    [[nodiscard]] std::vector<Range> compute_ranges(const Node& node) const;
    [[nodiscard]] std::vector<ControllerAndData> compute_interrupts(const Node& node) const;

    /// '<reference> <cells...>' pairs; nullopt entries are null references
    [[nodiscard]] std::vector<std::optional<Mapped>> reference_cells(const RawNode& node,
                                                                     std::string_view prop_name,
                                                                     const RawValue& value,
                                                                     const std::string& space) const;
    [[nodiscard]] Mapped map_interrupt(const RawNode& child, const RawNode& parent, const Cells& spec) const;
    /// Translate 'spec' through '<space>-map' nexus nodes; 'hops' counts the
    /// maps already crossed
    [[nodiscard]] Mapped map_specifier(const std::string& space, const RawNode& child, const RawNode& parent,
                                       const Cells& spec, bool require_controller, bool interrupt,
                                       std::size_t hops = 0) const;
    [[nodiscard]] std::uint32_t parent_spec_len(const std::string& space, const RawNode& child,
                                                const RawNode& parent, bool interrupt) const;
    [[nodiscard]] std::vector<std::pair<std::string, std::int64_t>> named_cells(
        const Node& node, const RawNode& controller, const Cells& data, const std::string& space) const;
    template <typename T>
    void add_names(const RawNode& node, const std::string& space, std::vector<T>& objs) const;

    DeviceTreeOptions options_;
    BindingPtr default_binding_;
    std::map<std::string, BindingPtr, std::less<>> inferred_;
};

}  // namespace settree::v1
