#pragma once

// =============================================================================
// settree - Software Configuration Trees
// =============================================================================
// Partial tree driver for YAML configuration sources. Nodes are nested maps;
// a node's name doubles as its label when it is unique. Integers may be
// written as integer expressions and pointers may target nodes of sources
// merged earlier.
// =============================================================================

#include "settree/v1/partial_tree.hpp"

#include <filesystem>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace settree::v1 {

struct ConfigTreeOptions {
    bool err_on_deprecated = false;        // Deprecated property use is an error
    bool err_on_enum_tokenizable = false;  // Non-tokenizable enums are errors
    BindingOptions binding;                // Used when loading a binding directory
};

class ConfigTree final : public PartialTree {
public:
    ConfigTree(RawTree raw, const std::vector<BindingPtr>& bindings, ConfigTreeOptions options = {});
    ConfigTree(RawTree raw, const BindingDirectory& directory, ConfigTreeOptions options = {});

    /// Load a configuration overlay file (see parser::ConfigLoader)
    [[nodiscard]] static std::unique_ptr<ConfigTree> from_file(const std::filesystem::path& path,
                                                               const BindingDirectory& directory,
                                                               ConfigTreeOptions options = {});

    [[nodiscard]] const ConfigTreeOptions& options() const noexcept { return options_; }

    /// Resolves '&label' by label and anything else by path, then by label.
    /// Nodes of this tree are searched before nodes merged earlier.
    [[nodiscard]] std::string resolve_reference(const Node& node,
                                                std::string_view prop_name,
                                                const RawValue& value) const override;

protected:
    [[nodiscard]] bool compute_enabled(const Node& node) const override;
    [[nodiscard]] std::vector<std::string> label_candidates(const Node& node) const override;

private:
    void setup();
    [[nodiscard]] std::optional<std::string> by_label(std::string_view label) const;

    ConfigTreeOptions options_;
};

}  // namespace settree::v1
