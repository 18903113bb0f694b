#include <catch2/catch.hpp>

#include "settree/v1/binding.hpp"
#include "settree/v1/device_tree.hpp"
#include "settree/v1/errors.hpp"

#include <functional>
#include <memory>
#include <string>
#include <vector>

using namespace settree::v1;

namespace {

BindingPtr hw_binding(const std::string& text, const std::string& path = "test.yaml") {
    const InMemoryBindings resolver;
    return Binding::load_string(text, path, SourceKind::Hardware, resolver);
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

constexpr const char* kIntcBinding = R"(
description: Interrupt controller
compatible: "vnd,intc"
interrupt-cells: [irq, level]
)";

constexpr const char* kGpioBinding = R"(
description: GPIO controller
compatible: "vnd,gpio"
gpio-cells: [pin, flags]
)";

}  // namespace

TEST_CASE("v1 device tree resolves interrupts given as a phandle-array", "[v1][device_tree][interrupts]") {
    RawTree raw(SourceKind::Hardware, "board.dts");
    raw.add_node("/ctrl")
        .set("compatible", RawValue::from_string("vnd,intc"))
        .set("interrupt-controller", RawValue::empty())
        .set("#interrupt-cells", RawValue::cells({2}))
        .label("ctrl");
    raw.add_node("/dev")
        .set("compatible", RawValue::from_string("vnd,dev"))
        .set("interrupts",
             RawValue::list({RawValue::reference("ctrl"), RawValue::from_int(1), RawValue::from_int(2)}));

    const auto dev_binding = hw_binding(R"(
description: Device with a routed interrupt
compatible: "vnd,dev"
properties:
  interrupts:
    type: phandle-array
    specifier-space: interrupt
)");

    DeviceTree tree(std::move(raw), {hw_binding(kIntcBinding), dev_binding});
    tree.process();

    const ControllerAndData expected{"/dev", "/ctrl", {{"irq", 1}, {"level", 2}}, std::nullopt, "interrupt"};

    const Node& dev = tree.node("/dev");
    const Property* interrupts = dev.find_property("interrupts");
    REQUIRE(interrupts != nullptr);
    const auto& entries = interrupts->as<IndexedRefList>();
    REQUIRE(entries.size() == 1);
    REQUIRE(entries.front().has_value());
    CHECK(*entries.front() == expected);
    CHECK(entries.front()->cell("level") == std::optional<std::int64_t>(2));
    CHECK_FALSE(entries.front()->cell("missing").has_value());

    REQUIRE(dev.interrupts().size() == 1);
    CHECK(dev.interrupts().front() == expected);
    CHECK(tree.source_dependencies(dev) == std::vector<std::string>{"/ctrl"});
}

TEST_CASE("v1 device tree resolves plain interrupts through interrupt-parent", "[v1][device_tree][interrupts]") {
    RawTree raw(SourceKind::Hardware, "board.dts");
    raw.add_node("/")
        .set("interrupt-parent", RawValue::reference("intc"));
    raw.add_node("/intc")
        .set("compatible", RawValue::from_string("vnd,intc"))
        .set("interrupt-controller", RawValue::empty())
        .set("#interrupt-cells", RawValue::cells({2}))
        .label("intc");
    raw.add_node("/timer")
        .set("interrupts", RawValue::cells({5, 1, 6, 1}))
        .set("interrupt-names", RawValue::strings({"tick", "alarm"}));

    DeviceTree tree(std::move(raw), {hw_binding(kIntcBinding)});
    tree.process();

    const auto& interrupts = tree.node("/timer").interrupts();
    REQUIRE(interrupts.size() == 2);
    CHECK(interrupts[0].controller == "/intc");
    CHECK(interrupts[0].name == std::optional<std::string>("tick"));
    CHECK(interrupts[0].cell("irq") == std::optional<std::int64_t>(5));
    CHECK(interrupts[1].name == std::optional<std::string>("alarm"));
    CHECK(interrupts[1].cell("irq") == std::optional<std::int64_t>(6));
    // Nodes without a binding keep the raw cells as an array
    CHECK(tree.node("/timer").find_property("interrupts")->as<std::vector<std::int64_t>>() ==
          std::vector<std::int64_t>{5, 1, 6, 1});
}

TEST_CASE("v1 device tree translates reg addresses through ranges", "[v1][device_tree][reg]") {
    RawTree raw(SourceKind::Hardware, "board.dts");
    raw.add_node("/soc")
        .set("#address-cells", RawValue::cells({1}))
        .set("#size-cells", RawValue::cells({1}))
        .set("ranges", RawValue::cells({0x0, 0x0, 0x40000000, 0x10000}));
    raw.add_node("/soc/uart@1000")
        .set("reg", RawValue::cells({0x1000, 0x100}))
        .set("reg-names", RawValue::from_string("regs"));

    DeviceTree tree(std::move(raw), std::vector<BindingPtr>{});
    tree.process();

    const Node& uart = tree.node("/soc/uart@1000");
    REQUIRE(uart.regs().size() == 1);
    CHECK(uart.regs().front().addr == std::optional<std::uint64_t>(0x40001000));
    CHECK(uart.regs().front().size == std::optional<std::uint64_t>(0x100));
    CHECK(uart.regs().front().name == std::optional<std::string>("regs"));
    CHECK(uart.unit_addr() == std::optional<std::uint64_t>(0x40001000));
    CHECK(uart.key().name == "uart");
    CHECK(uart.key().unit_addr == 0x40001000);
    CHECK_FALSE(tree.diagnostics().has_warning(kDiagRegUnitAddress));

    const Node& soc = tree.node("/soc");
    REQUIRE(soc.ranges().size() == 1);
    CHECK(soc.ranges().front().child_bus_cells == 1);
    CHECK(soc.ranges().front().parent_bus_cells == 2);
    CHECK(soc.ranges().front().child_bus_addr == std::optional<std::uint64_t>(0));
    CHECK(soc.ranges().front().parent_bus_addr == std::optional<std::uint64_t>(0x40000000));
    CHECK(soc.ranges().front().length == std::optional<std::uint64_t>(0x10000));
    CHECK(soc.children() == std::vector<std::string>{"/soc/uart@1000"});
}

TEST_CASE("v1 device tree reg uses the default cell sizes", "[v1][device_tree][reg]") {
    RawTree raw(SourceKind::Hardware, "board.dts");
    raw.add_node("/memory@80000000").set("reg", RawValue::cells({0x0, 0x80000000, 0x1000}));

    DeviceTree tree(std::move(raw), std::vector<BindingPtr>{});
    tree.process();

    const auto& regs = tree.node("/memory@80000000").regs();
    REQUIRE(regs.size() == 1);
    CHECK(regs.front().addr == std::optional<std::uint64_t>(0x80000000));
    CHECK(regs.front().size == std::optional<std::uint64_t>(0x1000));
}

TEST_CASE("v1 device tree reports reg and unit address mismatches", "[v1][device_tree][reg]") {
    const auto make_raw = [] {
        RawTree raw(SourceKind::Hardware, "board.dts");
        raw.add_node("/soc")
            .set("#address-cells", RawValue::cells({1}))
            .set("#size-cells", RawValue::cells({1}));
        raw.add_node("/soc/timer@2000").set("reg", RawValue::cells({0x3000, 0x10}));
        return raw;
    };

    SECTION("as a warning by default") {
        DeviceTree tree(make_raw(), std::vector<BindingPtr>{});
        tree.process();
        CHECK(tree.diagnostics().has_warning(kDiagRegUnitAddress));
    }

    SECTION("as an error when escalated") {
        DeviceTreeOptions options;
        options.err_on_reg_unit_address_mismatch = true;
        DeviceTree tree(make_raw(), std::vector<BindingPtr>{}, options);
        CHECK(property_error_code([&] { tree.process(); }) == kDiagRegUnitAddress);
    }

    SECTION("reg with a bad cell count") {
        RawTree raw = make_raw();
        raw.find("/soc/timer@2000")->set("reg", RawValue::cells({0x2000, 0x10, 0x1}));
        DeviceTree tree(std::move(raw), std::vector<BindingPtr>{});
        CHECK(property_error_code([&] { tree.process(); }) == kDiagCellCount);
    }
}

TEST_CASE("v1 device tree maps specifiers through a nexus with mask and pass-thru", "[v1][device_tree][map]") {
    const auto make_raw = [](std::int64_t pin) {
        RawTree raw(SourceKind::Hardware, "board.dts");
        raw.add_node("/gpio")
            .set("compatible", RawValue::from_string("vnd,gpio"))
            .set("gpio-controller", RawValue::empty())
            .set("#gpio-cells", RawValue::cells({2}))
            .label("gpio");
        raw.add_node("/connector")
            .set("#gpio-cells", RawValue::cells({2}))
            .set("gpio-map", RawValue::list({RawValue::from_int(0), RawValue::from_int(0), RawValue::reference("gpio"),
                                             RawValue::from_int(12), RawValue::from_int(0), RawValue::from_int(1),
                                             RawValue::from_int(0), RawValue::reference("gpio"),
                                             RawValue::from_int(13), RawValue::from_int(0)}))
            .set("gpio-map-mask", RawValue::cells({0xffffffff, 0x0}))
            .set("gpio-map-pass-thru", RawValue::cells({0x0, 0xffffffff}))
            .label("conn");
        raw.add_node("/dev")
            .set("compatible", RawValue::from_string("vnd,dev"))
            .set("power-gpios",
                 RawValue::list({RawValue::reference("conn"), RawValue::from_int(pin), RawValue::from_int(5)}));
        return raw;
    };
    const auto dev_binding = hw_binding(R"(
description: Device with a power GPIO
compatible: "vnd,dev"
properties:
  power-gpios:
    type: phandle-array
)");

    SECTION("matching entry") {
        DeviceTree tree(make_raw(1), {hw_binding(kGpioBinding), dev_binding});
        tree.process();

        const auto& entries = tree.node("/dev").find_property("power-gpios")->as<IndexedRefList>();
        REQUIRE(entries.size() == 1);
        REQUIRE(entries.front().has_value());
        CHECK(entries.front()->controller == "/gpio");
        CHECK(entries.front()->basename == "gpio");
        // Pin taken from the map, flags passed through from the child
        CHECK(entries.front()->data ==
              std::vector<std::pair<std::string, std::int64_t>>{{"pin", 13}, {"flags", 5}});
    }

    SECTION("no matching entry") {
        DeviceTree tree(make_raw(2), {hw_binding(kGpioBinding), dev_binding});
        CHECK(property_error_code([&] { tree.process(); }) == kDiagMapNoMatch);
    }
}

TEST_CASE("v1 device tree rejects nexus maps that point at each other", "[v1][device_tree][map]") {
    RawTree raw(SourceKind::Hardware, "board.dts");
    raw.add_node("/nexus-a")
        .set("#gpio-cells", RawValue::cells({2}))
        .set("gpio-map", RawValue::list({RawValue::from_int(0), RawValue::from_int(0), RawValue::reference("b"),
                                         RawValue::from_int(0), RawValue::from_int(0)}))
        .label("a");
    raw.add_node("/nexus-b")
        .set("#gpio-cells", RawValue::cells({2}))
        .set("gpio-map", RawValue::list({RawValue::from_int(0), RawValue::from_int(0), RawValue::reference("a"),
                                         RawValue::from_int(0), RawValue::from_int(0)}))
        .label("b");
    raw.add_node("/dev")
        .set("compatible", RawValue::from_string("vnd,dev"))
        .set("power-gpios", RawValue::list({RawValue::reference("a"), RawValue::from_int(0), RawValue::from_int(0)}));

    DeviceTree tree(std::move(raw), {hw_binding(R"(
description: Device with a power GPIO
compatible: "vnd,dev"
properties:
  power-gpios:
    type: phandle-array
)")});
    CHECK(property_error_code([&] { tree.process(); }) == kDiagMapLoop);
}

TEST_CASE("v1 device tree keeps null entries of indexed references", "[v1][device_tree][map]") {
    RawTree raw(SourceKind::Hardware, "board.dts");
    raw.add_node("/gpio")
        .set("compatible", RawValue::from_string("vnd,gpio"))
        .set("gpio-controller", RawValue::empty())
        .set("#gpio-cells", RawValue::cells({2}))
        .label("gpio");
    raw.add_node("/dev")
        .set("compatible", RawValue::from_string("vnd,dev"))
        .set("cs-gpios", RawValue::list({RawValue::from_int(0), RawValue::reference("gpio"), RawValue::from_int(3),
                                         RawValue::from_int(1)}));

    DeviceTree tree(std::move(raw), {hw_binding(kGpioBinding), hw_binding(R"(
description: Chip selects
compatible: "vnd,dev"
properties:
  cs-gpios:
    type: phandle-array
)")});
    tree.process();

    const auto& entries = tree.node("/dev").find_property("cs-gpios")->as<IndexedRefList>();
    REQUIRE(entries.size() == 2);
    CHECK_FALSE(entries[0].has_value());
    REQUIRE(entries[1].has_value());
    CHECK(entries[1]->cell("pin") == std::optional<std::int64_t>(3));
}

TEST_CASE("v1 device tree status values", "[v1][device_tree][status]") {
    const auto binding = hw_binding("description: Device\ncompatible: \"vnd,dev\"\n");

    RawTree raw(SourceKind::Hardware, "board.dts");
    raw.add_node("/legacy").set("status", RawValue::from_string("ok"));
    raw.add_node("/off").set("compatible", RawValue::from_string("vnd,dev")).set("status",
                                                                                 RawValue::from_string("disabled"));
    raw.add_node("/plain");

    DeviceTree tree(std::move(raw), {binding});
    tree.process();

    CHECK(tree.node("/legacy").enabled());
    CHECK(tree.node("/legacy").find_property("status")->as<std::string>() == "okay");
    CHECK_FALSE(tree.node("/off").enabled());
    CHECK(tree.node("/plain").enabled());

    RawTree bad(SourceKind::Hardware, "board.dts");
    bad.add_node("/broken").set("compatible", RawValue::from_string("vnd,dev")).set("status",
                                                                                    RawValue::from_string("broken"));
    DeviceTree bad_tree(std::move(bad), {binding});
    CHECK(property_error_code([&] { bad_tree.process(); }) == kDiagBadValue);
}

TEST_CASE("v1 device tree checks bound properties", "[v1][device_tree][validation]") {
    const auto binding = hw_binding(R"(
description: Sensor
compatible: "vnd,sensor"
properties:
  rate:
    type: int
    required: true
    enum: [10, 100]
  mode:
    type: string
    const: fast
  old-rate:
    type: int
    deprecated: true
  flags:
    type: array
    default: [1, 2]
)");
    const auto run = [&](const std::function<void(RawNode&)>& fill, DeviceTreeOptions options = {}) {
        RawTree raw(SourceKind::Hardware, "board.dts");
        fill(raw.add_node("/sensor").set("compatible", RawValue::from_string("vnd,sensor")));
        DeviceTree tree(std::move(raw), {binding}, std::move(options));
        tree.process();
        return tree.node("/sensor").find_property("flags")->as<std::vector<std::int64_t>>();
    };

    CHECK(run([](RawNode& n) { n.set("rate", RawValue::cells({10})); }) == std::vector<std::int64_t>{1, 2});

    CHECK(property_error_code([&] { (void)run([](RawNode&) {}); }) == kDiagRequiredMissing);
    CHECK(property_error_code([&] {
              (void)run([](RawNode& n) { n.set("rate", RawValue::cells({10})).set("colour", RawValue::empty()); });
          }) == kDiagUndeclaredProperty);
    CHECK(property_error_code([&] { (void)run([](RawNode& n) { n.set("rate", RawValue::cells({11})); }); }) ==
          kDiagEnumViolation);
    CHECK(property_error_code([&] {
              (void)run([](RawNode& n) {
                  n.set("rate", RawValue::cells({10})).set("mode", RawValue::from_string("slow"));
              });
          }) == kDiagConstViolation);
    CHECK(property_error_code([&] {
              (void)run([](RawNode& n) { n.set("rate", RawValue::from_string("ten")); });
          }) == kDiagTypeMismatch);

    DeviceTreeOptions strict;
    strict.err_on_deprecated = true;
    CHECK(property_error_code([&] {
              (void)run([](RawNode& n) { n.set("rate", RawValue::cells({10})).set("old-rate", RawValue::cells({1})); },
                        strict);
          }) == kDiagDeprecatedProperty);
}

TEST_CASE("v1 device tree skips required checks on disabled nodes", "[v1][device_tree][validation]") {
    RawTree raw(SourceKind::Hardware, "board.dts");
    raw.add_node("/sensor")
        .set("compatible", RawValue::from_string("vnd,sensor"))
        .set("status", RawValue::from_string("disabled"));

    DeviceTree tree(std::move(raw), {hw_binding(R"(
description: Sensor
compatible: "vnd,sensor"
properties:
  rate:
    type: int
    required: true
)")});
    tree.process();
    CHECK(tree.node("/sensor").find_property("rate") == nullptr);
}

TEST_CASE("v1 device tree selects bus variants of a binding", "[v1][device_tree][bus]") {
    RawTree raw(SourceKind::Hardware, "board.dts");
    raw.add_node("/spi")
        .set("compatible", RawValue::from_string("vnd,spi"))
        .set("#address-cells", RawValue::cells({1}))
        .set("#size-cells", RawValue::cells({0}));
    raw.add_node("/spi/sensor@0")
        .set("compatible", RawValue::from_string("vnd,sensor"))
        .set("reg", RawValue::cells({0}))
        .set("spi-max-frequency", RawValue::cells({1000000}));

    const auto controller = hw_binding("description: SPI controller\ncompatible: \"vnd,spi\"\nbus: spi\n", "spi.yaml");
    const auto on_spi = hw_binding(R"(
description: Sensor on SPI
compatible: "vnd,sensor"
on-bus: spi
properties:
  reg:
    type: array
  spi-max-frequency:
    type: int
    required: true
)", "sensor-spi.yaml");
    const auto on_i2c = hw_binding(R"(
description: Sensor on I2C
compatible: "vnd,sensor"
on-bus: i2c
properties:
  reg:
    type: array
)", "sensor-i2c.yaml");

    DeviceTree tree(std::move(raw), {controller, on_spi, on_i2c});
    tree.process();

    CHECK(tree.node("/spi").buses() == std::vector<std::string>{"spi"});
    const Node& sensor = tree.node("/spi/sensor@0");
    CHECK(sensor.on_buses() == std::vector<std::string>{"spi"});
    CHECK(sensor.bus_node() == std::optional<std::string>("/spi"));
    CHECK(sensor.binding_paths() == std::vector<std::string>{"sensor-spi.yaml"});
    CHECK(sensor.find_property("spi-max-frequency")->as<std::int64_t>() == 1000000);
    REQUIRE(sensor.regs().size() == 1);
    CHECK(sensor.regs().front().addr == std::optional<std::uint64_t>(0));
    CHECK_FALSE(sensor.regs().front().size.has_value());
    CHECK(tree.bindings().size() == 3);
}

TEST_CASE("v1 device tree rejects two bindings for one schema", "[v1][device_tree][bindings]") {
    const auto first = hw_binding("description: A\ncompatible: \"vnd,dup\"\n", "a.yaml");
    const auto second = hw_binding("description: B\ncompatible: \"vnd,dup\"\n", "b.yaml");

    try {
        DeviceTree tree(RawTree(SourceKind::Hardware, "board.dts"), {first, second});
        FAIL("expected SchemaError");
    } catch (const SchemaError& e) {
        CHECK(e.code() == kDiagDuplicateBinding);
    }
}

TEST_CASE("v1 device tree resolves node references", "[v1][device_tree][references]") {
    RawTree raw(SourceKind::Hardware, "board.dts");
    raw.add_node("/clock").label("clk");
    raw.add_node("/dev")
        .set("compatible", RawValue::from_string("vnd,dev"))
        .set("clock", RawValue::reference("clk"))
        .set("peers", RawValue::list({RawValue::reference("clk"), RawValue::reference("/dev")}));

    DeviceTree tree(std::move(raw), {hw_binding(R"(
description: Device with references
compatible: "vnd,dev"
properties:
  clock:
    type: phandle
  peers:
    type: phandles
)")});
    tree.process();

    const Node& dev = tree.node("/dev");
    CHECK(dev.find_property("clock")->as<NodeRef>() == NodeRef{"/clock"});
    CHECK(dev.find_property("peers")->as<std::vector<NodeRef>>() ==
          std::vector<NodeRef>{NodeRef{"/clock"}, NodeRef{"/dev"}});
    CHECK(tree.node_by_label("clk") == &tree.node("/clock"));

    RawTree dangling(SourceKind::Hardware, "board.dts");
    dangling.add_node("/dev")
        .set("compatible", RawValue::from_string("vnd,dev"))
        .set("clock", RawValue::reference("nowhere"));
    DeviceTree bad(std::move(dangling), {hw_binding(R"(
description: Device with references
compatible: "vnd,dev"
properties:
  clock:
    type: phandle
)")});
    CHECK(property_error_code([&] { bad.process(); }) == kDiagBadReference);
}

TEST_CASE("v1 device tree infers bindings for selected paths", "[v1][device_tree][inferred]") {
    RawTree raw(SourceKind::Hardware, "board.dts");
    raw.add_node("/uart").label("uart0");
    raw.add_node("/chosen")
        .set("console", RawValue::reference("uart0"))
        .set("speed", RawValue::cells({115200}))
        .set("bootargs", RawValue::from_string("quiet"));

    DeviceTreeOptions options;
    options.infer_binding_for_paths = {"/chosen"};
    DeviceTree tree(std::move(raw), std::vector<BindingPtr>{}, options);
    tree.process();

    const Node& chosen = tree.node("/chosen");
    CHECK(chosen.find_property("console")->tag() == TypeTag::Path);
    CHECK(chosen.find_property("console")->as<NodeRef>() == NodeRef{"/uart"});
    CHECK(chosen.find_property("speed")->as<std::int64_t>() == 115200);
    CHECK(chosen.find_property("bootargs")->as<std::string>() == "quiet");
}

TEST_CASE("v1 device tree queries require processing", "[v1][device_tree][state]") {
    RawTree raw(SourceKind::Hardware, "board.dts");
    raw.add_node("/dev");
    DeviceTree tree(std::move(raw), std::vector<BindingPtr>{});

    CHECK(tree.state() == TreeState::Unprocessed);
    CHECK_THROWS_AS(tree.nodes(), StateError);
    tree.process();
    CHECK(tree.state() == TreeState::Checked);
    CHECK(tree.nodes().size() == 2);
    CHECK_THROWS_AS(tree.process(), StateError);
    CHECK_THROWS_AS(tree.node("/missing"), PropertyError);
}

TEST_CASE("v1 device tree reports enums that do not tokenize", "[v1][device_tree][enum]") {
    const auto make_tree = [](const std::string& enum_list, bool escalate) {
        RawTree raw(SourceKind::Hardware, "board.dts");
        raw.add_node("/dev").set("compatible", RawValue::from_string("vnd,dev"));
        DeviceTreeOptions options;
        options.err_on_enum_tokenizable = escalate;
        return std::make_unique<DeviceTree>(std::move(raw),
                                            std::vector<BindingPtr>{hw_binding(R"(
description: Device with a mode
compatible: "vnd,dev"
properties:
  mode:
    type: string
    enum: )" + enum_list + "\n")},
                                            options);
    };

    SECTION("tokens that collide") {
        auto tree = make_tree("[\"a b\", \"a-b\"]", false);
        tree->process();
        CHECK(tree->diagnostics().has_warning(kDiagEnumNotTokenizable));
        CHECK_FALSE(tree->diagnostics().has_warning(kDiagEnumLowercaseOnly));
        CHECK(tree->diagnostics().warnings().front().find("'mode'") != std::string::npos);
    }

    SECTION("tokens that only differ in case") {
        auto tree = make_tree("[Fast, fast]", false);
        tree->process();
        CHECK(tree->diagnostics().has_warning(kDiagEnumLowercaseOnly));
        CHECK_FALSE(tree->diagnostics().has_warning(kDiagEnumNotTokenizable));
    }

    SECTION("tokenizable enum") {
        auto tree = make_tree("[fast, slow]", false);
        tree->process();
        CHECK(tree->diagnostics().warnings().empty());
    }

    SECTION("escalated to errors") {
        auto colliding = make_tree("[\"a b\", \"a-b\"]", true);
        CHECK(property_error_code([&] { colliding->process(); }) == kDiagEnumNotTokenizable);
        auto mixed_case = make_tree("[Fast, fast]", true);
        CHECK(property_error_code([&] { mixed_case->process(); }) == kDiagEnumLowercaseOnly);
    }
}

TEST_CASE("v1 device tree marks read-only nodes", "[v1][device_tree][node]") {
    RawTree raw(SourceKind::Hardware, "board.dts");
    raw.add_node("/flash").set("read-only", RawValue::empty());
    raw.add_node("/ram");

    DeviceTree tree(std::move(raw), std::vector<BindingPtr>{});
    tree.process();
    CHECK(tree.node("/flash").read_only());
    CHECK_FALSE(tree.node("/ram").read_only());
}
