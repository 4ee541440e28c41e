#include "Helpers.hpp"

#include <stkm/Registry.hpp>

#include <catch2/catch.hpp>

#include <algorithm>

namespace {

liberror::Result<void> nothing(stkm::Machine&, std::optional<stkm::Value>)
{
    return {};
}

}

TEST_CASE( "registry", "[registry]" ) {
    stkm::Registry registry;

    SECTION( "base instruction set" ) {
        auto const* push = registry.lookup_by_name("PUSH").value();
        REQUIRE(push->code == 0x01);
        REQUIRE(push->hasOperand);
        REQUIRE(push->cost == 1);

        REQUIRE(registry.lookup_by_code(0xFF).value()->name == "HALT");
        REQUIRE(registry.lookup_by_code(0x0A).value()->name == "JUMP");
        REQUIRE(registry.lookup_by_name("DIV").value()->cost == 10);
        REQUIRE(registry.lookup_by_name("PRINT").value()->cost == 5);

        REQUIRE(registry.operand_bearing("JZ"));
        REQUIRE_FALSE(registry.operand_bearing("ADD"));
        REQUIRE_FALSE(registry.is_extension("ADD"));
        REQUIRE(registry.names().size() == 12);
    }

    SECTION( "unknown lookups" ) {
        REQUIRE(test::error_kind(registry.lookup_by_name("FOO")) == stkm::ErrorKind::UNKNOWN_OPCODE);
        REQUIRE(test::error_kind(registry.lookup_by_code(0x99)) == stkm::ErrorKind::UNKNOWN_OPCODE_NUMBER);
        REQUIRE_FALSE(registry.operand_bearing("FOO"));
        REQUIRE_FALSE(registry.is_extension("FOO"));
    }

    SECTION( "extensions join the table" ) {
        REQUIRE(registry.register_extension("NOP", 0x40, false, nothing).has_value());

        REQUIRE(registry.is_extension("NOP"));
        REQUIRE(registry.lookup_by_code(0x40).value()->name == "NOP");
        REQUIRE(registry.lookup_by_name("NOP").value()->cost == 1);
        REQUIRE(registry.names().size() == 13);
    }

    SECTION( "extensions cannot shadow base opcodes" ) {
        REQUIRE(test::error_kind(registry.register_extension("PUSH", 0x40, false, nothing)) == stkm::ErrorKind::NAME_CONFLICT);
        REQUIRE(test::error_kind(registry.register_extension("NOP", 0x01, false, nothing)) == stkm::ErrorKind::CODE_CONFLICT);

        auto const* push = registry.lookup_by_name("PUSH").value();
        REQUIRE(push->code == 0x01);
        REQUIRE(push->hasOperand);
        REQUIRE_FALSE(registry.is_extension("PUSH"));
        REQUIRE_FALSE(registry.contains("NOP"));
    }

    SECTION( "the first extension wins" ) {
        REQUIRE(registry.register_extension("NOP", 0x40, false, nothing).has_value());

        REQUIRE(test::error_kind(registry.register_extension("NOP", 0x41, true, nothing)) == stkm::ErrorKind::NAME_CONFLICT);
        REQUIRE(test::error_kind(registry.register_extension("SKIP", 0x40, false, nothing)) == stkm::ErrorKind::CODE_CONFLICT);

        REQUIRE(registry.lookup_by_name("NOP").value()->code == 0x40);
        REQUIRE_FALSE(registry.operand_bearing("NOP"));
        REQUIRE_FALSE(registry.contains("SKIP"));
    }

    SECTION( "malformed extensions" ) {
        REQUIRE(test::error_kind(registry.register_extension("nop", 0x40, false, nothing)) == stkm::ErrorKind::EXTENSION_LOAD);
        REQUIRE(test::error_kind(registry.register_extension("", 0x40, false, nothing)) == stkm::ErrorKind::EXTENSION_LOAD);
        REQUIRE(test::error_kind(registry.register_extension("NOP", 0x40, false, {})) == stkm::ErrorKind::EXTENSION_LOAD);
    }

    SECTION( "suggestions" ) {
        auto const suggestions = registry.suggest("ADDD");
        REQUIRE_FALSE(suggestions.empty());
        REQUIRE(suggestions.size() <= 3);
        REQUIRE(std::ranges::find(suggestions, "ADD") != suggestions.end());

        auto const message = test::error_text(registry.lookup_by_name("ADDD"));
        REQUIRE(message.find("did you mean ADD") != std::string::npos);

        REQUIRE(registry.suggest("QQQQQQ").empty());
    }
}
