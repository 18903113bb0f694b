#include <catch2/catch.hpp>

#include "settree/v1/binding.hpp"
#include "settree/v1/config_tree.hpp"
#include "settree/v1/errors.hpp"
#include "settree/v1/parser/config_loader.hpp"

#include <cstddef>
#include <optional>
#include <string>
#include <vector>

using namespace settree::v1;

namespace {

BindingPtr cfg_binding(const std::string& text, const std::string& path = "config.yaml") {
    const InMemoryBindings resolver;
    return Binding::load_string(text, path, SourceKind::Config, resolver);
}

template <typename Fn>
std::string property_error_code(Fn&& fn) {
    try {
        fn();
    } catch (const PropertyError& e) {
        return e.code();
    }
    return "";
}

constexpr const char* kAppBinding = R"(
description: Application settings
schema: vnd,app
properties:
  rate:
    type: int
    required: true
  mask:
    type: uint32
  gain:
    type: float
    default: 1.5
  verbose:
    type: boolean
    default: false
  tags:
    type: string-array
  blob:
    type: uint8-array
  peer:
    type: pointer
  peers:
    type: pointer-array
)";

constexpr const char* kLoggerBinding = R"(
description: Logger settings
schema: vnd,logger
properties:
  level:
    type: uint8
)";

RawTree load(const std::string& text) {
    return parser::ConfigLoader().load_string(text, "app.yaml");
}

}  // namespace

TEST_CASE("v1 config loader merges overlays in order", "[v1][config][loader]") {
    const RawTree raw = load(R"(
- /:
    app:
      schema: vnd,app
      rate: 1
      limits:
        low: 1
        high: 9
- /app/limits:
    high: 10
- app:
    rate: 2
)");

    CHECK(raw.kind() == SourceKind::Config);
    CHECK(raw.source_path() == "app.yaml");
    const RawNode* app = raw.find("/app");
    REQUIRE(app != nullptr);
    CHECK(app->find("rate")->integer == 2);
    CHECK(app->find("schema")->text == "vnd,app");
    CHECK(app->children == std::vector<std::string>{"/app/limits"});

    const RawNode* limits = raw.find("/app/limits");
    REQUIRE(limits != nullptr);
    CHECK(limits->find("low")->integer == 1);
    CHECK(limits->find("high")->integer == 10);
    CHECK(limits->parent == std::optional<std::string>("/app"));
}

TEST_CASE("v1 config loader decodes scalar kinds", "[v1][config][loader]") {
    const RawTree raw = load(R"(
- /node:
    flag: true
    count: 0x10
    ratio: 0.5
    name: text
    quoted: "12"
    expr: 1+2
    items: [1, 2]
    nothing:
)");
    const RawNode* node = raw.find("/node");
    REQUIRE(node != nullptr);
    CHECK(node->find("flag")->is(RawKind::Boolean));
    CHECK(node->find("count")->integer == 16);
    CHECK(node->find("ratio")->is(RawKind::Float));
    CHECK(node->find("name")->text == "text");
    CHECK(node->find("quoted")->is(RawKind::String));
    CHECK(node->find("expr")->text == "1+2");
    CHECK(node->find("items")->is_list_of(RawKind::Integer));
    CHECK(node->find("nothing")->is(RawKind::Empty));
}

TEST_CASE("v1 config loader skips extension mount points", "[v1][config][loader]") {
    const std::string text = R"(
- /:
    app:
      rate: 1
- x-snippet:
    rate: 5
)";
    CHECK(load(text).find("/app")->find("rate")->integer == 1);

    parser::ConfigLoaderOptions options;
    options.skip_extensions = false;
    CHECK(property_error_code([&] { (void)parser::ConfigLoader(options).load_string(text); }) ==
          kDiagBadReference);
}

TEST_CASE("v1 config loader rejects bad mount points and documents", "[v1][config][loader]") {
    CHECK(property_error_code([] { (void)load("- missing:\n    a: 1\n"); }) == kDiagBadReference);
    CHECK(property_error_code([] {
              (void)load("- /:\n    a:\n      dup: {v: 1}\n    b:\n      dup: {v: 2}\n- dup:\n    v: 3\n");
          }) == kDiagBadReference);
    CHECK(property_error_code([] { (void)load("- a/b:\n    v: 1\n"); }) == kDiagBadValue);
    CHECK(property_error_code([] { (void)load("- /a: 5\n"); }) == kDiagTypeMismatch);
    CHECK(property_error_code([] { (void)load("app: {}\n"); }) == kDiagTypeMismatch);
    CHECK(property_error_code([] { (void)load("- [unclosed\n"); }) == kDiagYamlSyntax);
}

TEST_CASE("v1 config tree types properties from its binding", "[v1][config][tree]") {
    ConfigTree tree(load(R"(
- /:
    app:
      schema: vnd,app
      rate: 2*4
      mask: "0x10|0x01"
      tags: [a, b]
      blob: "de ad"
      peer: "&logger"
      peers: ["&logger", "&net"]
    logger:
      schema: vnd,logger
      level: 3
    net:
      enabled: false
)"),
                    {cfg_binding(kAppBinding), cfg_binding(kLoggerBinding, "logger.yaml")});
    tree.process();

    const Node& app = tree.node("/app");
    CHECK(app.enabled());
    CHECK(app.schemas() == std::vector<std::string>{"vnd,app"});
    CHECK(app.find_property("rate")->as<std::int64_t>() == 8);
    CHECK(app.find_property("mask")->as<std::int64_t>() == 17);
    CHECK(app.find_property("gain")->as<double>() == 1.5);
    CHECK(app.find_property("verbose")->as<bool>() == false);
    CHECK(app.find_property("tags")->as<std::vector<std::string>>() == std::vector<std::string>{"a", "b"});
    CHECK(app.find_property("blob")->as<Bytes>() == Bytes{0xde, 0xad});
    CHECK(app.find_property("peer")->as<NodeRef>() == NodeRef{"/logger"});
    CHECK(app.find_property("peers")->as<std::vector<NodeRef>>() ==
          std::vector<NodeRef>{NodeRef{"/logger"}, NodeRef{"/net"}});
    CHECK(app.find_property("schema") == nullptr);

    CHECK(tree.node("/logger").find_property("level")->as<std::int64_t>() == 3);
    CHECK_FALSE(tree.node("/net").enabled());
    CHECK(tree.node("/net").label_candidates() == std::vector<std::string>{"net"});
    CHECK(tree.node_by_label("logger") == &tree.node("/logger"));
}

TEST_CASE("v1 config tree pointers resolve by label and by path", "[v1][config][tree]") {
    const auto binding = cfg_binding(R"(
description: Pointer holder
schema: vnd,holder
properties:
  target:
    type: pointer
  targets:
    type: pointer-array
)");
    const auto resolve = [&](const std::string& target) {
        ConfigTree tree(load("- /:\n    holder:\n      schema: vnd,holder\n      target: " + target +
                             "\n    group:\n      item: {}\n"),
                        {binding});
        tree.process();
        return tree.node("/holder").find_property("target")->as<NodeRef>().path;
    };

    CHECK(resolve("\"&item\"") == "/group/item");
    CHECK(resolve("/group/item") == "/group/item");
    CHECK(resolve("item") == "/group/item");
    CHECK(property_error_code([&] { (void)resolve("\"&nobody\""); }) == kDiagBadReference);
    CHECK(property_error_code([&] { (void)resolve("/group/none"); }) == kDiagBadReference);

    ConfigTree mixed(load(R"(
- /:
    holder:
      schema: vnd,holder
      targets: ["&item", /group/item]
    group:
      item: {}
)"),
                     {binding});
    CHECK(property_error_code([&] { mixed.process(); }) == kDiagBadReference);
}

TEST_CASE("v1 config tree reports value errors", "[v1][config][tree]") {
    const auto run = [](const std::string& props) {
        ConfigTree tree(load("- /:\n    logger:\n      schema: vnd,logger\n" + props),
                        {cfg_binding(kLoggerBinding, "logger.yaml")});
        tree.process();
    };

    CHECK(property_error_code([&] { run("      level: 300\n"); }) == kDiagBadValue);
    CHECK(property_error_code([&] { run("      level: 1/0\n"); }) == kDiagBadExpression);
    CHECK(property_error_code([&] { run("      level: loud\n"); }) == kDiagTypeMismatch);
    CHECK(property_error_code([&] { run("      level: 1\n      colour: red\n"); }) == kDiagUndeclaredProperty);
    CHECK(property_error_code([&] { run("      enabled: yes\n"); }) == kDiagTypeMismatch);
    CHECK_NOTHROW(run("      level: 255\n      enabled: false\n"));
}

TEST_CASE("v1 config tree requires a config source", "[v1][config][tree]") {
    CHECK_THROWS_AS(ConfigTree(RawTree(SourceKind::Hardware, "board.dts"), std::vector<BindingPtr>{}), StateError);

    const auto hw = [] {
        const InMemoryBindings resolver;
        return Binding::load_string("description: d\ncompatible: \"vnd,x\"\n", "x.yaml", SourceKind::Hardware,
                                    resolver);
    }();
    CHECK_THROWS_AS(ConfigTree(RawTree(SourceKind::Config, "app.yaml"), {hw}), SchemaError);
}

TEST_CASE("v1 config tree indexes enum values per element", "[v1][config][enum]") {
    ConfigTree tree(load(R"(
- /:
    radio:
      schema: vnd,radio
      mode: low-power
      modes: [low-power, fast]
      widths: [32, 8]
      level: 3
)"),
                    {cfg_binding(R"(
description: Radio settings
schema: vnd,radio
properties:
  mode:
    type: string
    description: |
      Operating mode
    enum: [fast, low-power]
  modes:
    type: string-array
    enum: [fast, low-power]
  widths:
    type: array
    enum: [8, 16, 32]
  level:
    type: int
)",
                                 "radio.yaml")});
    tree.process();

    const Node& radio = tree.node("/radio");
    const Property* mode = radio.find_property("mode");
    REQUIRE(mode != nullptr);
    CHECK(mode->enum_index() == std::optional<std::size_t>(1));
    CHECK(mode->enum_indices() == std::optional<std::vector<std::size_t>>(std::vector<std::size_t>{1}));
    CHECK(mode->val_as_tokens() == std::vector<std::string>{"low_power"});
    CHECK(mode->description() == std::optional<std::string>("Operating mode"));

    const Property* modes = radio.find_property("modes");
    CHECK_FALSE(modes->enum_index().has_value());
    CHECK(modes->enum_indices() == std::optional<std::vector<std::size_t>>({1, 0}));
    CHECK(modes->val_as_tokens() == std::vector<std::string>{"low_power", "fast"});
    CHECK_FALSE(modes->description().has_value());

    CHECK(radio.find_property("widths")->enum_indices() == std::optional<std::vector<std::size_t>>({2, 0}));

    const Property* level = radio.find_property("level");
    CHECK_FALSE(level->enum_indices().has_value());
    CHECK(property_error_code([&] { (void)level->val_as_tokens(); }) == kDiagTypeMismatch);
}

TEST_CASE("v1 config tree escalates enum token warnings on request", "[v1][config][enum]") {
    const std::string text = "- /:\n    logger:\n      schema: vnd,mixed\n";
    const auto binding = cfg_binding(R"(
description: Mixed case enum
schema: vnd,mixed
properties:
  level:
    type: string
    enum: [Low, low]
)",
                                     "mixed.yaml");

    ConfigTree lenient(load(text), {binding});
    lenient.process();
    CHECK(lenient.diagnostics().has_warning(kDiagEnumLowercaseOnly));

    ConfigTreeOptions options;
    options.err_on_enum_tokenizable = true;
    ConfigTree strict(load(text), {binding}, options);
    CHECK(property_error_code([&] { strict.process(); }) == kDiagEnumLowercaseOnly);
}
