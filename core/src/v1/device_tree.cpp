#include "settree/v1/device_tree.hpp"
#include "settree/v1/errors.hpp"

#include <yaml-cpp/yaml.h>

#include <algorithm>
#include <cctype>
#include <map>
#include <set>
#include <sstream>
#include <utility>

namespace settree::v1 {

namespace {

constexpr std::uint32_t kDefaultAddressCells = 2;
constexpr std::uint32_t kDefaultSizeCells = 1;
constexpr std::size_t kMaxMapHops = 64;

using Cells = std::vector<std::uint32_t>;

bool ends_with(std::string_view text, std::string_view suffix) {
    return text.size() >= suffix.size() && text.compare(text.size() - suffix.size(), suffix.size(), suffix) == 0;
}

std::uint64_t to_num(Cells::const_iterator first, Cells::const_iterator last) {
    std::uint64_t value = 0;
    for (auto it = first; it != last; ++it) {
        value = (value << 32) | *it;
    }
    return value;
}

// Bitwise AND, the shorter operand padded with ones on the left
Cells and_cells(const Cells& a, const Cells& b) {
    const std::size_t len = std::max(a.size(), b.size());
    Cells out(len);
    for (std::size_t i = 0; i < len; ++i) {
        const std::uint32_t x = i + a.size() >= len ? a[i + a.size() - len] : 0xffffffffU;
        const std::uint32_t y = i + b.size() >= len ? b[i + b.size() - len] : 0xffffffffU;
        out[i] = x & y;
    }
    return out;
}

// Bitwise OR, the shorter operand padded with zeros on the left
Cells or_cells(const Cells& a, const Cells& b) {
    const std::size_t len = std::max(a.size(), b.size());
    Cells out(len);
    for (std::size_t i = 0; i < len; ++i) {
        const std::uint32_t x = i + a.size() >= len ? a[i + a.size() - len] : 0U;
        const std::uint32_t y = i + b.size() >= len ? b[i + b.size() - len] : 0U;
        out[i] = x | y;
    }
    return out;
}

Cells not_cells(const Cells& a) {
    Cells out(a.size());
    std::transform(a.begin(), a.end(), out.begin(), [](std::uint32_t x) { return ~x; });
    return out;
}

std::string describe_cells(const Cells& cells) {
    std::ostringstream out;
    out << "<";
    for (std::size_t i = 0; i < cells.size(); ++i) {
        out << (i == 0 ? "" : " ") << "0x" << std::hex << cells[i];
    }
    out << ">";
    return out.str();
}

void set_name(Register& reg, const std::string& name) { reg.name = name; }
void set_name(ControllerAndData& entry, const std::string& name) { entry.name = name; }
void set_name(std::optional<ControllerAndData>& entry, const std::string& name) {
    if (entry) {
        entry->name = name;
    }
}

// Property types of nodes without a binding
constexpr std::pair<const char*, const char*> kDefaultPropTypes[] = {
    {"compatible", "string-array"},
    {"status", "string"},
    {"ranges", "compound"},
    {"reg", "array"},
    {"reg-names", "string-array"},
    {"label", "string"},
    {"interrupts", "array"},
    {"interrupts-extended", "compound"},
    {"interrupt-names", "string-array"},
    {"interrupt-controller", "boolean"},
};

const InMemoryBindings& no_includes() {
    static const InMemoryBindings resolver;
    return resolver;
}

BindingOptions synthesized_binding_options() {
    BindingOptions options;
    options.require_schema = false;
    return options;
}

BindingPtr make_default_binding() {
    YAML::Node doc;
    doc["description"] = "Default property types for nodes without a binding";
    for (const auto& [name, type] : kDefaultPropTypes) {
        YAML::Node prop;
        prop["type"] = type;
        prop["required"] = false;
        if (std::string_view(name) == "status") {
            for (const auto& value : status_values()) {
                prop["enum"].push_back(value);
            }
        }
        doc["properties"][name] = prop;
    }
    return Binding::from_yaml(doc, "<default>", SourceKind::Hardware, no_includes(), synthesized_binding_options());
}

std::optional<std::string> inferred_type(const RawValue& value) {
    switch (value.kind) {
        case RawKind::Empty: return "boolean";
        case RawKind::Bytes: return "uint8-array";
        case RawKind::Integer: return "int";
        case RawKind::String: return "string";
        case RawKind::Reference: return "path";
        case RawKind::List: {
            if (value.items.size() == 1 && value.items.front().is(RawKind::Integer)) {
                return "int";
            }
            if (value.is_list_of(RawKind::Integer)) {
                return "array";
            }
            if (value.is_list_of(RawKind::String)) {
                return "string-array";
            }
            if (value.items.size() == 1 && value.items.front().is(RawKind::Reference)) {
                return "phandle";
            }
            if (value.is_list_of(RawKind::Reference)) {
                return "phandles";
            }
            const bool refs_and_cells =
                std::all_of(value.items.begin(), value.items.end(), [](const RawValue& item) {
                    return item.is(RawKind::Reference) || item.is(RawKind::Integer);
                });
            if (refs_and_cells) {
                return "phandle-array";
            }
            return std::nullopt;
        }
        case RawKind::Boolean:
        case RawKind::Float:
            return std::nullopt;
    }
    return std::nullopt;
}

}  // namespace

const std::vector<std::string>& status_values() {
    static const std::vector<std::string> values = {"ok", "okay", "disabled", "reserved", "fail", "fail-sss"};
    return values;
}

// =============================================================================
// Construction
// =============================================================================

DeviceTree::DeviceTree(RawTree raw, const std::vector<BindingPtr>& bindings, DeviceTreeOptions options)
    : PartialTree(std::move(raw), bindings), options_(std::move(options)) {
    setup();
}

DeviceTree::DeviceTree(RawTree raw, const BindingDirectory& directory, DeviceTreeOptions options)
    : PartialTree(std::move(raw), directory, options.binding), options_(std::move(options)) {
    setup();
}

void DeviceTree::setup() {
    if (kind() != SourceKind::Hardware) {
        throw StateError(kDiagBadState, "a device tree needs a hardware source, got " +
                                         std::string(to_string(kind())) + " (" + source_path() + ")");
    }
    if (options_.err_on_deprecated) {
        diagnostics().escalate(WarningKind::DeprecatedProperty);
    }
    if (options_.err_on_reg_unit_address_mismatch) {
        diagnostics().escalate(WarningKind::RegUnitAddress);
    }
    if (options_.err_on_enum_tokenizable) {
        diagnostics().escalate(WarningKind::EnumTokenizable);
    }

    // "ok" is accepted for backwards compatibility and means "okay"
    const std::string& status_prop = raw().enabled_property();
    for (auto& node : mutable_raw().nodes()) {
        const RawValue* status = node.find(status_prop);
        if (status != nullptr && status->is(RawKind::String) && status->text == "ok") {
            node.set(status_prop, RawValue::from_string("okay"));
        }
    }

    default_binding_ = make_default_binding();

    for (const auto& path : options_.infer_binding_for_paths) {
        const RawNode* node = raw().find(path);
        if (node == nullptr) {
            continue;
        }
        YAML::Node doc;
        doc["description"] = "Inferred binding from properties";
        doc["properties"] = YAML::Node(YAML::NodeType::Map);
        for (const auto& prop : node->properties) {
            const auto type = inferred_type(prop.value);
            if (!type) {
                throw PropertyError(kDiagTypeMismatch, "cannot infer binding from property '" + prop.name +
                                                           "' on " + path + " with value " + prop.value.describe());
            }
            doc["properties"][prop.name]["type"] = *type;
        }
        inferred_.emplace(path, Binding::from_yaml(doc, "<inferred>", SourceKind::Hardware, no_includes(),
                                                   synthesized_binding_options()));
    }
}

// =============================================================================
// Node hooks
// =============================================================================

void DeviceTree::prepare_node(Node& node) {
    if (inferred_.count(node.path()) != 0 && node.raw().has(raw().schema_property())) {
        throw PropertyError(kDiagBadValue, "'" + raw().schema_property() + "' in node with inferred binding: " +
                                               node.path());
    }
    node.set_read_only(node.raw().has("read-only"));

    std::optional<std::string> bus_node;
    std::vector<std::string> on_buses;
    if (node.parent_path()) {
        const auto schemas = raw_schemas(raw(), node.raw());
        const bool fixed_partitions = options_.fixed_partitions_on_any_bus &&
                                      std::find(schemas.begin(), schemas.end(), "fixed-partitions") != schemas.end();
        const Node* parent = node_in_progress(*node.parent_path());
        if (!fixed_partitions && parent != nullptr) {
            std::set<std::string> parent_buses;
            for (const auto& binding : parent->bindings()) {
                parent_buses.insert(binding->buses().begin(), binding->buses().end());
            }
            if (!parent_buses.empty()) {
                bus_node = parent->path();
                on_buses.assign(parent_buses.begin(), parent_buses.end());
            } else {
                bus_node = parent->bus_node();
                on_buses = parent->on_buses();
            }
        }
    }
    node.set_bus_info({}, std::move(bus_node), std::move(on_buses));
}

BindingPtr DeviceTree::find_binding(const Node& node, std::string_view schema) const {
    for (const auto& variant : node.on_buses()) {
        if (BindingPtr binding = registered_binding(schema, variant)) {
            return binding;
        }
    }
    return registered_binding(schema);
}

BindingPtr DeviceTree::inferred_binding(const Node& node) const {
    const auto it = inferred_.find(node.path());
    return it != inferred_.end() ? it->second : nullptr;
}

std::vector<const PropertySpec*> DeviceTree::default_specs(const Node& node) const {
    (void)node;
    std::vector<const PropertySpec*> specs;
    if (options_.default_prop_types) {
        for (const auto& spec : default_binding_->specs()) {
            specs.push_back(&spec);
        }
    }
    return specs;
}

bool DeviceTree::compute_enabled(const Node& node) const {
    const RawValue* status = node.raw().find(raw().enabled_property());
    if (status == nullptr) {
        return true;
    }
    if (!status->is(RawKind::String)) {
        throw PropertyError(kDiagTypeMismatch, "'" + raw().enabled_property() + "' in " + node.path() + " in " +
                                                   source_path() + " should be a string, not " + status->describe());
    }
    return status->text == "okay";
}

std::vector<std::string> DeviceTree::label_candidates(const Node& node) const {
    return node.labels();
}

bool DeviceTree::exempt_from_undeclared(const Node& node, std::string_view prop_name) const {
    static const std::set<std::string, std::less<>> reserved = {
        "phandle", "interrupt-parent", "interrupts-extended", "device_type", "ranges",
    };
    return PartialTree::exempt_from_undeclared(node, prop_name) || ends_with(prop_name, "-controller") ||
           (!prop_name.empty() && prop_name.front() == '#') || reserved.count(prop_name) != 0;
}

void DeviceTree::finish_node(Node& node) {
    std::set<std::string> buses;
    std::map<std::string, std::vector<std::string>, std::less<>> specifier2cells;
    for (const auto& binding : node.bindings()) {
        buses.insert(binding->buses().begin(), binding->buses().end());
        for (const auto& [space, names] : binding->specifier2cells()) {
            specifier2cells.emplace(space, names);  // earlier bindings win
        }
    }
    node.set_bus_info({buses.begin(), buses.end()}, node.bus_node(), node.on_buses());
    node.set_specifier2cells(std::move(specifier2cells));

    node.set_unit_addr(unit_address(node));
    NodeKey key{node.parent_path().value_or(""), node.name(), -1};
    if (node.unit_addr()) {
        key.name = node.name().substr(0, node.name().rfind('@'));
        key.unit_addr = static_cast<std::int64_t>(*node.unit_addr());
    }
    node.set_key(std::move(key));

    node.set_regs(compute_regs(node));
    node.set_ranges(compute_ranges(node));
    node.set_interrupts(compute_interrupts(node));
}

void DeviceTree::check_node(const Node& node) {
    if (const RawValue* status = node.raw().find(raw().enabled_property())) {
        const auto& ok = status_values();
        if (!status->is(RawKind::String) || std::find(ok.begin(), ok.end(), status->text) == ok.end()) {
            std::string expected;
            for (const auto& value : ok) {
                expected += (expected.empty() ? "" : ", ") + value;
            }
            throw PropertyError(kDiagBadValue, "unknown '" + raw().enabled_property() + "' value " +
                                                   status->describe() + " in " + node.path() + " in " +
                                                   source_path() + ", expected one of " + expected);
        }
    }

    if (const RawValue* ranges = node.raw().find("ranges")) {
        const bool cells = ranges->is(RawKind::Empty) || ranges->is(RawKind::Integer) ||
                           ranges->is_list_of(RawKind::Integer);
        if (!cells) {
            throw PropertyError(kDiagTypeMismatch, "expected 'ranges = < ... >;' in " + node.path() + " in " +
                                                       source_path() + ", not " + ranges->describe());
        }
    }

    if (options_.warn_reg_unit_address_mismatch && !node.regs().empty() && !node.is_pci_device() &&
        node.regs().front().addr != node.unit_addr()) {
        std::ostringstream message;
        message << "unit address and first address in 'reg' (0x" << std::hex << node.regs().front().addr.value_or(0)
                << ") don't match for " << node.path();
        diagnostics().warn(WarningKind::RegUnitAddress, kDiagRegUnitAddress, message.str());
    }
}

std::vector<std::string> DeviceTree::source_dependencies(const Node& node) const {
    std::vector<std::string> controllers;
    for (const auto& interrupt : node.interrupts()) {
        controllers.push_back(interrupt.controller);
    }
    return controllers;
}

// =============================================================================
// References
// =============================================================================

std::string DeviceTree::resolve_reference(const Node& node, std::string_view prop_name, const RawValue& value) const {
    if (!value.is(RawKind::Reference)) {
        throw PropertyError(kDiagBadReference, "property '" + std::string(prop_name) + "' on " + node.path() +
                                                   " should be a node reference, not " + value.describe());
    }
    const std::string& target = value.text;
    if (!target.empty() && target.front() == '/') {
        if (raw().find(target) != nullptr || (merged() != nullptr && merged()->has_path(target))) {
            return target;
        }
        throw PropertyError(kDiagBadReference, "property '" + std::string(prop_name) + "' on " + node.path() +
                                                   " refers to missing node " + target);
    }
    const auto paths = paths_for_label(target);
    if (paths.size() == 1) {
        return paths.front();
    }
    if (paths.size() > 1) {
        throw PropertyError(kDiagBadReference, "property '" + std::string(prop_name) + "' on " + node.path() +
                                                   " refers to ambiguous label '" + target + "'");
    }
    if (merged() != nullptr) {
        if (auto path = merged()->path_for_label(target)) {
            return *path;
        }
    }
    throw PropertyError(kDiagBadReference, "property '" + std::string(prop_name) + "' on " + node.path() +
                                               " refers to undefined label '" + target + "'");
}

const RawNode& DeviceTree::raw_node(std::string_view path) const {
    const RawNode* node = raw().find(path);
    if (node == nullptr) {
        throw PropertyError(kDiagBadReference, "no node '" + std::string(path) + "' in " + source_path());
    }
    return *node;
}

const RawNode* DeviceTree::raw_parent(const RawNode& node) const {
    return node.parent ? raw().find(*node.parent) : nullptr;
}

const RawNode& DeviceTree::referenced(const RawNode& from, std::string_view prop_name, const RawValue& ref) const {
    const std::string& target = ref.text;
    if (!target.empty() && target.front() == '/') {
        return raw_node(target);
    }
    const auto paths = paths_for_label(target);
    if (paths.size() != 1) {
        throw PropertyError(kDiagBadReference, "bad reference '&" + target + "' in property '" +
                                                   std::string(prop_name) + "' on " + from.path);
    }
    return raw_node(paths.front());
}

// =============================================================================
// Cells
// =============================================================================

DeviceTree::Cells DeviceTree::cells_of(const RawNode& node, std::string_view prop_name) const {
    const RawValue* value = node.find(prop_name);
    if (value == nullptr || value->is(RawKind::Empty)) {
        return {};
    }
    std::vector<RawValue> single;
    const std::vector<RawValue>* items = &value->items;
    if (value->is(RawKind::Integer)) {
        single.push_back(*value);
        items = &single;
    } else if (!value->is(RawKind::List)) {
        throw PropertyError(kDiagTypeMismatch, "expected '" + std::string(prop_name) + "' on " + node.path +
                                                   " to be a list of cells, not " + value->describe());
    }
    Cells cells;
    cells.reserve(items->size());
    for (const auto& item : *items) {
        if (!item.is(RawKind::Integer) || item.integer < 0 || item.integer > 0xffffffffLL) {
            throw PropertyError(kDiagTypeMismatch, "expected '" + std::string(prop_name) + "' on " + node.path +
                                                       " to be a list of 32-bit cells, not " + value->describe());
        }
        cells.push_back(static_cast<std::uint32_t>(item.integer));
    }
    return cells;
}

std::uint32_t DeviceTree::num_of(const RawNode& node, std::string_view prop_name) const {
    const Cells cells = cells_of(node, prop_name);
    if (cells.size() != 1) {
        throw PropertyError(kDiagCellCount, "expected '" + std::string(prop_name) + "' on " + node.path +
                                                " to be a single cell");
    }
    return cells.front();
}

std::uint32_t DeviceTree::address_cells(const RawNode& node) const {
    const RawNode* parent = raw_parent(node);
    if (parent != nullptr && parent->has("#address-cells")) {
        return num_of(*parent, "#address-cells");
    }
    return kDefaultAddressCells;
}

std::uint32_t DeviceTree::size_cells(const RawNode& node) const {
    const RawNode* parent = raw_parent(node);
    if (parent != nullptr && parent->has("#size-cells")) {
        return num_of(*parent, "#size-cells");
    }
    return kDefaultSizeCells;
}

std::uint32_t DeviceTree::interrupt_cells(const RawNode& node) const {
    if (!node.has("#interrupt-cells")) {
        throw PropertyError(kDiagCellCount, node.path + " lacks #interrupt-cells");
    }
    return num_of(node, "#interrupt-cells");
}

const RawNode& DeviceTree::interrupt_parent(const RawNode& start) const {
    for (const RawNode* node = &start; node != nullptr; node = raw_parent(*node)) {
        if (const RawValue* ref = node->find("interrupt-parent")) {
            const RawValue* target = ref;
            if (ref->is(RawKind::List) && ref->items.size() == 1) {
                target = &ref->items.front();
            }
            if (!target->is(RawKind::Reference)) {
                throw PropertyError(kDiagBadReference, "'interrupt-parent' on " + node->path +
                                                           " should be a node reference, not " + ref->describe());
            }
            return referenced(*node, "interrupt-parent", *target);
        }
    }
    throw PropertyError(kDiagBadReference, start.path + " has an 'interrupts' property, but neither the node nor "
                                                        "any of its parents has an 'interrupt-parent' property");
}

// =============================================================================
// Addresses
// =============================================================================

std::uint64_t DeviceTree::translate(std::uint64_t addr, const RawNode& node) const {
    const RawNode* parent = raw_parent(node);
    if (parent == nullptr || !parent->has("ranges")) {
        return addr;
    }
    const Cells ranges = cells_of(*parent, "ranges");
    if (ranges.empty()) {
        // Identical address spaces
        return translate(addr, *parent);
    }

    const std::uint32_t child_ac = address_cells(node);
    const std::uint32_t parent_ac = address_cells(*parent);
    const std::uint32_t child_sc = size_cells(node);
    const std::size_t entry = child_ac + parent_ac + child_sc;
    if (entry == 0 || ranges.size() % entry != 0) {
        throw PropertyError(kDiagCellCount, "'ranges' in " + parent->path + " has " +
                                                std::to_string(ranges.size()) +
                                                " cells, which is not evenly divisible by " + std::to_string(entry));
    }
    for (auto it = ranges.begin(); it != ranges.end(); it += static_cast<std::ptrdiff_t>(entry)) {
        const std::uint64_t child_addr = to_num(it, it + child_ac);
        const std::uint64_t parent_addr = to_num(it + child_ac, it + child_ac + parent_ac);
        const std::uint64_t length = to_num(it + child_ac + parent_ac, it + static_cast<std::ptrdiff_t>(entry));
        if (child_addr <= addr && addr - child_addr < length) {
            return translate(parent_addr + (addr - child_addr), *parent);
        }
    }
    return addr;
}

std::optional<std::uint64_t> DeviceTree::unit_address(const Node& node) const {
    const auto at = node.name().find('@');
    if (at == std::string::npos || node.is_pci_device()) {
        return std::nullopt;
    }
    const std::string text = node.name().substr(at + 1);
    std::uint64_t addr = 0;
    const bool hex = !text.empty() && std::all_of(text.begin(), text.end(), [](char c) {
        return std::isxdigit(static_cast<unsigned char>(c)) != 0;
    });
    if (!hex) {
        throw PropertyError(kDiagBadValue, node.path() + " in " + source_path() + " has non-hex unit address");
    }
    for (const char c : text) {
        const int digit = std::isdigit(static_cast<unsigned char>(c)) != 0
                              ? c - '0'
                              : std::tolower(static_cast<unsigned char>(c)) - 'a' + 10;
        addr = (addr << 4) | static_cast<std::uint64_t>(digit);
    }
    return translate(addr, node.raw());
}

std::vector<Register> DeviceTree::compute_regs(const Node& node) const {
    const RawNode& raw_n = node.raw();
    if (!raw_n.has("reg")) {
        return {};
    }
    const std::uint32_t ac = address_cells(raw_n);
    const std::uint32_t sc = size_cells(raw_n);
    const Cells cells = cells_of(raw_n, "reg");
    const std::size_t entry = ac + sc;
    if (entry == 0 || cells.size() % entry != 0) {
        throw PropertyError(kDiagCellCount, "'reg' property in " + node.path() + " in " + source_path() +
                                                " has length " + std::to_string(cells.size()) +
                                                " cells, which is not evenly divisible by " + std::to_string(entry) +
                                                " (<#address-cells> = " + std::to_string(ac) +
                                                ", <#size-cells> = " + std::to_string(sc) + ")");
    }

    std::vector<Register> regs;
    for (auto it = cells.begin(); it != cells.end(); it += static_cast<std::ptrdiff_t>(entry)) {
        Register reg{node.path(), std::nullopt, std::nullopt, std::nullopt};
        if (ac != 0) {
            reg.addr = translate(to_num(it, it + ac), raw_n);
        }
        if (sc != 0) {
            reg.size = to_num(it + ac, it + static_cast<std::ptrdiff_t>(entry));
            if (*reg.size == 0 && !node.is_pci_device()) {
                throw PropertyError(kDiagBadValue, "zero-sized 'reg' in " + node.path() +
                                                       " seems meaningless (maybe you want a size of one or "
                                                       "#size-cells = 0 instead)");
            }
        }
        regs.push_back(std::move(reg));
    }
    add_names(raw_n, "reg", regs);
    return regs;
}

std::vector<Range> DeviceTree::compute_ranges(const Node& node) const {
    const RawNode& raw_n = node.raw();
    if (!raw_n.has("ranges")) {
        return {};
    }
    const std::uint32_t child_ac = raw_n.has("#address-cells") ? num_of(raw_n, "#address-cells") : kDefaultAddressCells;
    const std::uint32_t parent_ac = address_cells(raw_n);
    const std::uint32_t child_sc = raw_n.has("#size-cells") ? num_of(raw_n, "#size-cells") : kDefaultSizeCells;
    const std::size_t entry = child_ac + parent_ac + child_sc;
    const Cells cells = cells_of(raw_n, "ranges");
    if (entry == 0) {
        if (!cells.empty()) {
            throw PropertyError(kDiagCellCount, "'ranges' should be empty in " + node.path() +
                                                    " since <#address-cells> = 0, <#address-cells for parent> = 0 "
                                                    "and <#size-cells> = 0");
        }
        return {};
    }
    if (cells.size() % entry != 0) {
        throw PropertyError(kDiagCellCount, "'ranges' property in " + node.path() + " has length " +
                                                std::to_string(cells.size()) +
                                                " cells, which is not evenly divisible by " + std::to_string(entry));
    }

    std::vector<Range> ranges;
    for (auto it = cells.begin(); it != cells.end(); it += static_cast<std::ptrdiff_t>(entry)) {
        Range range;
        range.node = node.path();
        range.child_bus_cells = child_ac;
        range.parent_bus_cells = parent_ac;
        range.length_cells = child_sc;
        if (child_ac != 0) {
            range.child_bus_addr = to_num(it, it + child_ac);
        }
        if (parent_ac != 0) {
            range.parent_bus_addr = to_num(it + child_ac, it + child_ac + parent_ac);
        }
        if (child_sc != 0) {
            range.length = to_num(it + child_ac + parent_ac, it + static_cast<std::ptrdiff_t>(entry));
        }
        ranges.push_back(std::move(range));
    }
    return ranges;
}

// =============================================================================
// Interrupts and indexed references
// =============================================================================

std::vector<ControllerAndData> DeviceTree::compute_interrupts(const Node& node) const {
    const RawNode& raw_n = node.raw();
    std::vector<Mapped> mapped;

    const RawValue* extended = raw_n.find("interrupts-extended");
    const RawValue* plain = raw_n.find("interrupts");
    // '<&ctrl ...>' in 'interrupts' names its controller like 'interrupts-extended'
    const bool plain_with_refs =
        plain != nullptr && plain->is(RawKind::List) &&
        std::any_of(plain->items.begin(), plain->items.end(),
                    [](const RawValue& item) { return item.is(RawKind::Reference); });

    if (extended != nullptr || plain_with_refs) {
        const char* prop_name = extended != nullptr ? "interrupts-extended" : "interrupts";
        for (auto& entry : reference_cells(raw_n, prop_name, extended != nullptr ? *extended : *plain, "interrupt")) {
            if (!entry) {
                throw PropertyError(kDiagBadReference, "node '" + node.path() + "' " + prop_name +
                                                           " property has an empty element");
            }
            mapped.push_back(map_interrupt(raw_n, *entry->controller, entry->data));
        }
    } else if (plain != nullptr) {
        const RawNode& parent = interrupt_parent(raw_n);
        const std::uint32_t n = interrupt_cells(parent);
        const Cells cells = cells_of(raw_n, "interrupts");
        if (n == 0 || cells.size() % n != 0) {
            throw PropertyError(kDiagCellCount, "'interrupts' property in " + node.path() + " has length " +
                                                    std::to_string(cells.size()) +
                                                    " cells, which is not evenly divisible by <#interrupt-cells> = " +
                                                    std::to_string(n));
        }
        for (auto it = cells.begin(); it != cells.end(); it += n) {
            mapped.push_back(map_interrupt(raw_n, parent, Cells(it, it + n)));
        }
    }

    std::vector<ControllerAndData> interrupts;
    interrupts.reserve(mapped.size());
    for (const auto& m : mapped) {
        interrupts.push_back(ControllerAndData{node.path(), m.controller->path,
                                               named_cells(node, *m.controller, m.data, "interrupt"), std::nullopt,
                                               "interrupt"});
    }
    add_names(raw_n, "interrupt", interrupts);
    return interrupts;
}

IndexedRefList DeviceTree::resolve_indexed_refs(const Node& node,
                                                const PropertySpec& spec,
                                                std::string_view prop_name,
                                                const RawValue& value) const {
    std::string space;
    if (spec.specifier_space()) {
        space = *spec.specifier_space();
    } else if (ends_with(prop_name, "gpios")) {
        // foo-gpios still maps to #gpio-cells
        space = "gpio";
    } else {
        space = std::string(prop_name.substr(0, prop_name.size() - 1));
    }

    IndexedRefList entries;
    for (auto& entry : reference_cells(node.raw(), prop_name, value, space)) {
        if (!entry) {
            entries.emplace_back(std::nullopt);
            continue;
        }
        const Mapped mapped = map_specifier(space, node.raw(), *entry->controller, entry->data, false, false);
        entries.emplace_back(ControllerAndData{node.path(), mapped.controller->path,
                                               named_cells(node, *mapped.controller, mapped.data, space),
                                               std::nullopt, space});
    }
    add_names(node.raw(), space, entries);
    return entries;
}

std::vector<std::optional<DeviceTree::Mapped>> DeviceTree::reference_cells(const RawNode& node,
                                                                            std::string_view prop_name,
                                                                            const RawValue& value,
                                                                            const std::string& space) const {
    std::vector<RawValue> single;
    const std::vector<RawValue>* items = &value.items;
    if (!value.is(RawKind::List)) {
        single.push_back(value);
        items = &single;
    }
    const std::string cells_name = "#" + space + "-cells";

    std::vector<std::optional<Mapped>> out;
    for (std::size_t i = 0; i < items->size();) {
        const RawValue& head = (*items)[i++];
        if (head.is_null_reference()) {
            // Unspecified element
            out.emplace_back(std::nullopt);
            continue;
        }
        if (!head.is(RawKind::Reference)) {
            throw PropertyError(kDiagBadReference,
                                "expected property '" + std::string(prop_name) + "' in " + node.path +
                                    " to be a mix of references and cells ('<&foo 1 2 &bar 3>'), not " +
                                    value.describe());
        }
        const RawNode& controller = referenced(node, prop_name, head);
        if (!controller.has(cells_name)) {
            throw PropertyError(kDiagCellCount, controller.path + " lacks " + cells_name);
        }
        const std::uint32_t n = num_of(controller, cells_name);
        if (i + n > items->size()) {
            throw PropertyError(kDiagCellCount, "missing data after reference in property '" +
                                                    std::string(prop_name) + "' on " + node.path);
        }
        Cells data;
        for (std::uint32_t k = 0; k < n; ++k, ++i) {
            const RawValue& cell = (*items)[i];
            if (!cell.is(RawKind::Integer) || cell.integer < 0 || cell.integer > 0xffffffffLL) {
                throw PropertyError(kDiagCellCount, "expected " + std::to_string(n) + " cells after reference to " +
                                                        controller.path + " in property '" +
                                                        std::string(prop_name) + "' on " + node.path);
            }
            data.push_back(static_cast<std::uint32_t>(cell.integer));
        }
        out.emplace_back(Mapped{&controller, std::move(data)});
    }
    return out;
}

DeviceTree::Mapped DeviceTree::map_interrupt(const RawNode& child, const RawNode& parent, const Cells& spec) const {
    if (parent.has("interrupt-controller")) {
        return {&parent, spec};
    }

    // The interrupt-map key starts with the child's unit address
    if (!child.has("reg")) {
        throw PropertyError(kDiagBadValue, child.path + " lacks 'reg' property (needed for 'interrupt-map' unit "
                                                        "address lookup)");
    }
    const Cells reg = cells_of(child, "reg");
    const std::uint32_t ac = address_cells(child);
    if (reg.size() < ac) {
        throw PropertyError(kDiagCellCount, child.path + " has too short 'reg' property (while doing "
                                                         "'interrupt-map' unit address lookup)");
    }
    Cells full(reg.begin(), reg.begin() + ac);
    full.insert(full.end(), spec.begin(), spec.end());

    Mapped mapped = map_specifier("interrupt", child, parent, full, true, true);

    // Strip the parent unit address part
    if (!mapped.controller->has("#address-cells")) {
        throw PropertyError(kDiagCellCount, "missing #address-cells on " + mapped.controller->path +
                                                " (while handling interrupt-map)");
    }
    const std::size_t strip = std::min<std::size_t>(num_of(*mapped.controller, "#address-cells"),
                                                      mapped.data.size());
    mapped.data.erase(mapped.data.begin(), mapped.data.begin() + static_cast<std::ptrdiff_t>(strip));
    return mapped;
}

std::uint32_t DeviceTree::parent_spec_len(const std::string& space, const RawNode& child, const RawNode& parent,
                                          bool interrupt) const {
    if (interrupt) {
        if (!parent.has("#address-cells")) {
            throw PropertyError(kDiagCellCount, "missing #address-cells on " + parent.path +
                                                    " (while handling interrupt-map)");
        }
        return num_of(parent, "#address-cells") + interrupt_cells(parent);
    }
    const std::string cells_name = "#" + space + "-cells";
    if (!parent.has(cells_name)) {
        throw PropertyError(kDiagCellCount, "expected '" + cells_name + "' property on " + parent.path +
                                                " (referenced by " + child.path + ")");
    }
    return num_of(parent, cells_name);
}

DeviceTree::Mapped DeviceTree::map_specifier(const std::string& space, const RawNode& child, const RawNode& parent,
                                             const Cells& spec, bool require_controller, bool interrupt,
                                             std::size_t hops) const {
    const std::string map_name = space + "-map";
    if (hops > kMaxMapHops) {
        throw PropertyError(kDiagMapLoop, "'" + map_name + "' translation of " + child.path + " crossed more than " +
                                              std::to_string(kMaxMapHops) + " nexus nodes");
    }
    const RawValue* map = parent.find(map_name);
    if (map == nullptr) {
        if (require_controller && !parent.has(space + "-controller")) {
            throw PropertyError(kDiagBadReference, "expected '" + space + "-controller' property on " +
                                                       parent.path + " (referenced by " + child.path + ")");
        }
        return {&parent, spec};
    }

    Cells masked = spec;
    if (parent.has(map_name + "-mask")) {
        const Cells mask = cells_of(parent, map_name + "-mask");
        if (mask.size() != spec.size()) {
            throw PropertyError(kDiagCellCount, child.path + ": expected '" + map_name + "-mask' in " + parent.path +
                                                    " to be " + std::to_string(spec.size()) + " cells, is " +
                                                    std::to_string(mask.size()) + " cells");
        }
        masked = and_cells(spec, mask);
    }

    if (!map->is(RawKind::List)) {
        throw PropertyError(kDiagTypeMismatch, "bad value for '" + map_name + "' in " + parent.path + ": " +
                                                   map->describe());
    }
    const auto& items = map->items;
    const auto read_cells = [&](std::size_t& pos, std::size_t count, const char* what) {
        if (pos + count > items.size()) {
            throw PropertyError(kDiagCellCount, "bad value for '" + map_name + "' in " + parent.path +
                                                    ", missing/truncated " + what);
        }
        Cells out;
        for (std::size_t k = 0; k < count; ++k, ++pos) {
            const RawValue& item = items[pos];
            if (!item.is(RawKind::Integer) || item.integer < 0 || item.integer > 0xffffffffLL) {
                throw PropertyError(kDiagTypeMismatch, "bad value for '" + map_name + "' in " + parent.path +
                                                           ", expected a cell in " + what);
            }
            out.push_back(static_cast<std::uint32_t>(item.integer));
        }
        return out;
    };

    std::size_t pos = 0;
    while (pos < items.size()) {
        const Cells child_entry = read_cells(pos, spec.size(), "child data");
        if (pos >= items.size() || !items[pos].is(RawKind::Reference)) {
            throw PropertyError(kDiagBadReference, "bad value for '" + map_name + "' in " + parent.path +
                                                       ", missing/truncated reference");
        }
        const RawNode& map_parent = referenced(parent, map_name, items[pos++]);
        Cells parent_entry = read_cells(pos, parent_spec_len(space, child, map_parent, interrupt), "parent data");

        if (child_entry != masked) {
            continue;
        }

        if (parent.has(map_name + "-pass-thru")) {
            const Cells pass_thru = cells_of(parent, map_name + "-pass-thru");
            if (pass_thru.size() != spec.size()) {
                throw PropertyError(kDiagCellCount, child.path + ": expected '" + map_name + "-pass-thru' in " +
                                                        parent.path + " to be " + std::to_string(spec.size()) +
                                                        " cells, is " + std::to_string(pass_thru.size()) + " cells");
            }
            Cells merged_spec =
                or_cells(and_cells(spec, pass_thru), and_cells(parent_entry, not_cells(pass_thru)));
            parent_entry.assign(merged_spec.end() - static_cast<std::ptrdiff_t>(parent_entry.size()),
                                merged_spec.end());
        }
        return map_specifier(space, parent, map_parent, parent_entry, require_controller, interrupt, hops + 1);
    }

    throw PropertyError(kDiagMapNoMatch, "child specifier for " + child.path + " (" + describe_cells(spec) +
                                             ") does not appear in '" + map_name + "' in " + parent.path);
}

std::vector<std::pair<std::string, std::int64_t>> DeviceTree::named_cells(const Node& node,
                                                                          const RawNode& controller,
                                                                          const Cells& data,
                                                                          const std::string& space) const {
    const Node* controller_node = node_in_progress(controller.path);
    if (controller_node == nullptr || controller_node->bindings().empty()) {
        throw PropertyError(kDiagCellCount, space + " controller " + controller.path + " for " + node.path() +
                                                " lacks binding");
    }
    // No '<space>-cells' in the bindings counts as an empty list
    std::vector<std::string> names;
    for (const auto& binding : controller_node->bindings()) {
        const auto it = binding->specifier2cells().find(space);
        if (it != binding->specifier2cells().end()) {
            names = it->second;
            break;
        }
    }
    if (names.size() != data.size()) {
        throw PropertyError(kDiagCellCount, "unexpected '" + space + "-cells:' length in binding for " +
                                                controller.path + " - " + std::to_string(names.size()) +
                                                " instead of " + std::to_string(data.size()));
    }
    std::vector<std::pair<std::string, std::int64_t>> cells;
    cells.reserve(names.size());
    for (std::size_t i = 0; i < names.size(); ++i) {
        cells.emplace_back(names[i], static_cast<std::int64_t>(data[i]));
    }
    return cells;
}

template <typename T>
void DeviceTree::add_names(const RawNode& node, const std::string& space, std::vector<T>& objs) const {
    const std::string names_prop = space + "-names";
    const RawValue* value = node.find(names_prop);
    if (value == nullptr) {
        return;
    }
    std::vector<std::string> names;
    if (value->is(RawKind::String)) {
        names.push_back(value->text);
    } else if (value->is_list_of(RawKind::String)) {
        for (const auto& item : value->items) {
            names.push_back(item.text);
        }
    } else {
        throw PropertyError(kDiagTypeMismatch, "'" + names_prop + "' in " + node.path +
                                                   " should be a list of strings, not " + value->describe());
    }
    if (names.size() != objs.size()) {
        throw PropertyError(kDiagCellCount, names_prop + " property in " + node.path + " in " + source_path() +
                                                " has " + std::to_string(names.size()) + " strings, expected " +
                                                std::to_string(objs.size()) + " strings");
    }
    for (std::size_t i = 0; i < objs.size(); ++i) {
        set_name(objs[i], names[i]);
    }
}

}  // namespace settree::v1
