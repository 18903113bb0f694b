#pragma once

// =============================================================================
// settree - Bindings
// =============================================================================
// A binding describes the allowed shape of nodes that declare a matching
// schema identifier. Loading a binding resolves its 'include:' directives:
// included documents are filtered (property-allowlist / property-blocklist /
// child-binding filters), expanded depth first and merged into the including
// document, whose own declarations take precedence.
// =============================================================================

#include "settree/v1/property_spec.hpp"
#include "settree/v1/source_kind.hpp"

#include <yaml-cpp/yaml.h>

#include <filesystem>
#include <map>
#include <memory>
#include <optional>
#include <regex>
#include <string>
#include <string_view>
#include <vector>

namespace settree::v1 {

using NameList = std::optional<std::vector<std::string>>;

struct BindingOptions {
    bool require_schema = true;        // Fail when the schema key is missing
    bool require_description = true;   // Fail when 'description' is missing
    // Keys an including document may silently override while merging
    std::vector<std::string> overridable_keys = {"description", "schema", "compatible"};
};

struct BindingDocument {
    std::string path;
    std::string text;
};

/// Locates documents named in 'include:' directives.
class IncludeResolver {
public:
    virtual ~IncludeResolver() = default;

    /// Look up an included document by file name. nullopt if unknown.
    [[nodiscard]] virtual std::optional<BindingDocument> find(std::string_view name) const = 0;
};

/// Include resolver over documents held in memory
class InMemoryBindings final : public IncludeResolver {
public:
    void add(std::string name, std::string text);

    [[nodiscard]] std::optional<BindingDocument> find(std::string_view name) const override;

    /// Names looked up so far, in order
    [[nodiscard]] const std::vector<std::string>& lookups() const noexcept { return lookups_; }

private:
    std::map<std::string, std::string, std::less<>> documents_;
    mutable std::vector<std::string> lookups_;
};

/// Include resolver over binding directories. Every *.yaml / *.yml file below
/// the given roots is addressable by its file name.
class BindingDirectory final : public IncludeResolver {
public:
    explicit BindingDirectory(std::vector<std::filesystem::path> roots);

    [[nodiscard]] std::optional<BindingDocument> find(std::string_view name) const override;

    /// Binding files in scan order
    [[nodiscard]] const std::vector<std::filesystem::path>& files() const noexcept { return files_; }

private:
    std::vector<std::filesystem::path> files_;
    std::map<std::string, std::filesystem::path, std::less<>> by_name_;
};

class Binding {
    // Restricts construction to the load functions
    struct Passkey {
        explicit Passkey() = default;
    };

public:
    struct ChildBindings {
        std::string pattern;
        std::vector<std::shared_ptr<const Binding>> bindings;

        [[nodiscard]] bool matches(std::string_view node_name) const;

    private:
        friend class Binding;
        std::optional<std::regex> regex_;
    };

    /// Load a binding file. Throws SchemaError.
    [[nodiscard]] static std::shared_ptr<const Binding> load(const std::filesystem::path& path,
                                                             SourceKind kind,
                                                             const IncludeResolver& resolver,
                                                             const BindingOptions& options = {});

    /// Load a binding from text; 'path' is used for messages and as the
    /// origin of the declared properties.
    [[nodiscard]] static std::shared_ptr<const Binding> load_string(const std::string& text,
                                                                    std::string path,
                                                                    SourceKind kind,
                                                                    const IncludeResolver& resolver,
                                                                    const BindingOptions& options = {});

    /// Build a binding from an already parsed document. The document is
    /// copied. 'allowlist' and 'blocklist' are the filters propagated by an
    /// including binding.
    [[nodiscard]] static std::shared_ptr<const Binding> from_yaml(const YAML::Node& source,
                                                                  std::string path,
                                                                  SourceKind kind,
                                                                  const IncludeResolver& resolver,
                                                                  const BindingOptions& options = {},
                                                                  const NameList& allowlist = std::nullopt,
                                                                  const NameList& blocklist = std::nullopt,
                                                                  bool is_child = false);

    [[nodiscard]] const std::string& path() const noexcept { return path_; }
    [[nodiscard]] SourceKind kind() const noexcept { return kind_; }
    [[nodiscard]] bool is_child() const noexcept { return is_child_; }

    /// Schema identifier, unset for anonymous child bindings
    [[nodiscard]] const std::optional<std::string>& schema() const noexcept { return schema_; }
    /// Key carrying the schema identifier ("schema", or legacy "compatible")
    [[nodiscard]] const std::string& schema_key() const noexcept { return schema_key_; }
    [[nodiscard]] const std::optional<std::string>& description() const noexcept { return description_; }

    /// Property declarations in declaration order
    [[nodiscard]] const std::vector<PropertySpec>& specs() const noexcept { return specs_; }
    /// Spec covering a property name: exact name first, then patterns
    [[nodiscard]] const PropertySpec* find_spec(std::string_view prop_name) const;

    [[nodiscard]] const std::vector<ChildBindings>& child_bindings() const noexcept { return child_bindings_; }
    /// Child bindings whose pattern matches a child node name, in table order
    [[nodiscard]] std::vector<std::shared_ptr<const Binding>> child_bindings_for(std::string_view node_name) const;

    /// Buses provided by nodes with this binding ('bus:')
    [[nodiscard]] const std::vector<std::string>& buses() const noexcept { return buses_; }
    /// Bus variant ('on-bus:')
    [[nodiscard]] const std::optional<std::string>& on_bus() const noexcept { return on_bus_; }
    /// Specifier namespace -> cell names, from '<namespace>-cells' keys
    [[nodiscard]] const std::map<std::string, std::vector<std::string>, std::less<>>& specifier2cells() const noexcept {
        return specifier2cells_;
    }

    /// Merged document (includes resolved)
    [[nodiscard]] const YAML::Node& yaml() const noexcept { return yaml_; }
    /// Re-serialize the merged document
    [[nodiscard]] std::string dump() const;

    Binding(Passkey, SourceKind kind, std::string path, bool is_child);

private:
    void build(YAML::Node source,
               const IncludeResolver& resolver,
               const BindingOptions& options,
               const NameList& allowlist,
               const NameList& blocklist);
    void check_top_level(const BindingOptions& options);

    SourceKind kind_;
    std::string path_;
    bool is_child_ = false;
    YAML::Node yaml_;
    std::string schema_key_;
    std::optional<std::string> schema_;
    std::optional<std::string> description_;
    std::vector<PropertySpec> specs_;
    std::vector<ChildBindings> child_bindings_;
    std::vector<std::string> buses_;
    std::optional<std::string> on_bus_;
    std::map<std::string, std::vector<std::string>, std::less<>> specifier2cells_;
};

using BindingPtr = std::shared_ptr<const Binding>;

}  // namespace settree::v1
