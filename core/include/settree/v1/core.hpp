#pragma once

// =============================================================================
// settree v1 - Settings Tree Core
// =============================================================================
// Main header of the v1 API:
// - Bindings loaded from YAML with include filtering and merging
// - Typed, validated nodes for hardware and configuration sources
// - Merged settings tree with dependency ordinals and lookup tables
// =============================================================================

#include "settree/v1/errors.hpp"
#include "settree/v1/diagnostics.hpp"
#include "settree/v1/source_kind.hpp"
#include "settree/v1/raw_tree.hpp"
#include "settree/v1/property_types.hpp"
#include "settree/v1/values.hpp"
#include "settree/v1/property_spec.hpp"
#include "settree/v1/binding.hpp"
#include "settree/v1/int_expr.hpp"
#include "settree/v1/node.hpp"
#include "settree/v1/partial_tree.hpp"
#include "settree/v1/device_tree.hpp"
#include "settree/v1/config_tree.hpp"
#include "settree/v1/parser/config_loader.hpp"
#include "settree/v1/graph.hpp"
#include "settree/v1/settings_tree.hpp"
#include "settree/v1/util.hpp"
