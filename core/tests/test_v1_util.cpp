#include <catch2/catch.hpp>

#include "settree/v1/errors.hpp"
#include "settree/v1/util.hpp"

#include <filesystem>
#include <fstream>
#include <string>

using namespace settree::v1;

TEST_CASE("v1 util token and identifier helpers", "[v1][util]") {
    CHECK(str_as_token("foo-bar.1") == "foo_bar_1");
    CHECK(str_as_token("vnd,uart@40") == "vnd_uart_40");
    CHECK(str_as_token("plain_name") == "plain_name");

    CHECK(str_to_ident("Vnd,UART-Lite") == "vnd_uart_lite");
    CHECK(str_to_ident("/soc/serial@1000") == "_soc_serial_1000");
    CHECK(str_to_ident("a+b.c") == "a_b_c");
}

TEST_CASE("v1 util parses vendor prefix tables", "[v1][util][vendor]") {
    const auto prefixes = parse_vendor_prefixes("# known vendors\n\nvnd\tVendor Inc.\r\nacme\tAcme Corp\n   \n");
    REQUIRE(prefixes.size() == 2);
    CHECK(prefixes.at("vnd") == "Vendor Inc.");
    CHECK(prefixes.at("acme") == "Acme Corp");

    try {
        (void)parse_vendor_prefixes("vnd\tVendor\nbroken line\n", "vendors.txt");
        FAIL("expected SchemaError");
    } catch (const SchemaError& e) {
        CHECK(e.code() == kDiagBadValue);
        CHECK(std::string(e.what()).find("vendors.txt:2") != std::string::npos);
    }
    CHECK_THROWS_AS(parse_vendor_prefixes("\tno prefix\n"), SchemaError);
}

TEST_CASE("v1 util loads vendor prefix files", "[v1][util][vendor]") {
    const auto path = std::filesystem::temp_directory_path() / "settree_vendor_prefixes.txt";
    {
        std::ofstream out(path);
        out << "vnd\tVendor Inc.\n";
    }
    CHECK(load_vendor_prefixes(path).at("vnd") == "Vendor Inc.");
    std::filesystem::remove(path);

    try {
        (void)load_vendor_prefixes(path);
        FAIL("expected SchemaError");
    } catch (const SchemaError& e) {
        CHECK(e.code() == kDiagIncludeNotFound);
    }
}
