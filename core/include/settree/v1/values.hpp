#pragma once

// =============================================================================
// settree - Resolved Property Values
// =============================================================================
// A resolved value is a tagged union over the closed property type set.
// References to other nodes are held by path; the owning tree resolves them
// through its path table on access.
// =============================================================================

#include "settree/v1/raw_tree.hpp"

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <variant>
#include <vector>

namespace settree::v1 {

struct NodeRef {
    std::string path;

    bool operator==(const NodeRef&) const = default;
};

/// One element of an indexed reference list ("phandle-array"), also used for
/// interrupt specifiers.
struct ControllerAndData {
    std::string node;                    // path of the node holding the property
    std::string controller;              // path of the resolved controller
    std::vector<std::pair<std::string, std::int64_t>> data;
    std::optional<std::string> name;     // from the matching <x>-names entry
    std::string basename;                // specifier namespace

    [[nodiscard]] std::optional<std::int64_t> cell(std::string_view cell_name) const;

    bool operator==(const ControllerAndData&) const = default;
};

using IndexedRefList = std::vector<std::optional<ControllerAndData>>;

using PropertyValue = std::variant<
    std::monostate,             // no value
    bool,
    std::int64_t,
    std::vector<std::int64_t>,
    Bytes,
    std::string,
    std::vector<std::string>,
    NodeRef,                    // node reference and path
    std::vector<NodeRef>,
    IndexedRefList,
    double,
    std::vector<double>
>;

[[nodiscard]] inline bool has_value(const PropertyValue& value) noexcept {
    return !std::holds_alternative<std::monostate>(value);
}

/// Human readable rendering used in diagnostics
[[nodiscard]] std::string describe(const PropertyValue& value);

/// Scalar sub-values of a value in order: the value itself for scalars, the
/// elements of integer, byte, float and string arrays, nothing otherwise
[[nodiscard]] std::vector<PropertyValue> scalar_parts(const PropertyValue& value);

// =============================================================================
// Hardware address data
// =============================================================================

struct Register {
    std::string node;
    std::optional<std::string> name;
    std::optional<std::uint64_t> addr;
    std::optional<std::uint64_t> size;

    bool operator==(const Register&) const = default;
};

struct Range {
    std::string node;
    std::uint32_t child_bus_cells = 0;
    std::optional<std::uint64_t> child_bus_addr;
    std::uint32_t parent_bus_cells = 0;
    std::optional<std::uint64_t> parent_bus_addr;
    std::uint32_t length_cells = 0;
    std::optional<std::uint64_t> length;
};

}  // namespace settree::v1
