#pragma once

// Raw value -> typed value conversion, one table indexed by (type tag,
// source kind).

#include "settree/v1/node.hpp"
#include "settree/v1/property_spec.hpp"
#include "settree/v1/raw_tree.hpp"
#include "settree/v1/values.hpp"

#include <string_view>

namespace settree::v1 {
class PartialTree;
}

namespace settree::v1::detail {

struct ConversionContext {
    const PartialTree& tree;
    const Node& node;
    const PropertySpec& spec;
    std::string_view prop_name;
};

/// Convert a present raw value. Throws PropertyError when the raw value does
/// not fit the declared type.
[[nodiscard]] PropertyValue convert_raw_value(const ConversionContext& ctx, const RawValue& raw);

}  // namespace settree::v1::detail
