#pragma once

// Scalar classification shared by the binding and configuration loaders.
// yaml-cpp hands out every scalar as text; this maps plain scalars onto the
// YAML 1.2 core schema so a quoted "5" stays a string while 5 is an integer.

#include <yaml-cpp/yaml.h>

#include <cstdint>
#include <optional>
#include <string>

namespace settree::v1::detail {

enum class ScalarClass : std::uint8_t {
    Null,
    Boolean,
    Integer,
    Float,
    String
};

[[nodiscard]] ScalarClass classify_scalar(const YAML::Node& node);

[[nodiscard]] std::optional<bool> scalar_bool(const YAML::Node& node);
[[nodiscard]] std::optional<std::int64_t> scalar_int(const YAML::Node& node);
[[nodiscard]] std::optional<double> scalar_float(const YAML::Node& node);
/// The text of a scalar classified as String
[[nodiscard]] std::optional<std::string> scalar_string(const YAML::Node& node);

[[nodiscard]] std::string yaml_node_class(const YAML::Node& node);
[[nodiscard]] bool yaml_equal(const YAML::Node& a, const YAML::Node& b);
/// Flow-style single line rendering for messages
[[nodiscard]] std::string yaml_inline(const YAML::Node& node);

}  // namespace settree::v1::detail
