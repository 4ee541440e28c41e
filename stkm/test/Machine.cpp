#include "Helpers.hpp"

#include <stkm/Machine.hpp>

#include <catch2/catch.hpp>

#include <limits>
#include <sstream>
#include <vector>

namespace {

std::vector<stkm::Value> contents(stkm::Stack const& stack)
{
    auto const values = stack.values();
    return { values.begin(), values.end() };
}

}

TEST_CASE( "machine", "[machine]" ) {
    stkm::Registry registry;
    std::ostringstream output;
    stkm::Machine machine(registry, output);

    SECTION( "load resets the machine" ) {
        machine.load(test::assemble(registry, "PUSH 1\nPUSH 2\nHALT"));
        REQUIRE(machine.execute().has_value());
        REQUIRE(machine.stack().size() == 2);

        machine.load(test::assemble(registry, "HALT"));

        REQUIRE(machine.stack().empty());
        REQUIRE(machine.program_counter() == 0);
        REQUIRE(machine.state() == stkm::State::IDLE);
        REQUIRE(machine.outcome() == stkm::Outcome::NONE);
        REQUIRE(machine.statistics().instructions == 0);
    }

    SECTION( "add and print" ) {
        machine.load(test::assemble(registry, "PUSH 5\nPUSH 3\nADD\nPRINT\nHALT"));

        REQUIRE(machine.execute().has_value());
        REQUIRE(output.str() == "8\n");
        REQUIRE(machine.stack().empty());
        REQUIRE(machine.outcome() == stkm::Outcome::HALTED);
        REQUIRE(machine.state() == stkm::State::IDLE);
    }

    SECTION( "operands are popped b then a" ) {
        machine.load(test::assemble(registry, "PUSH 10\nPUSH 4\nSUB\nPUSH 3\nMUL"));

        REQUIRE(machine.execute().has_value());
        REQUIRE(contents(machine.stack()) == std::vector<stkm::Value> { 18 });
    }

    SECTION( "division floors" ) {
        machine.load(test::assemble(registry, "PUSH 7\nPUSH 2\nDIV\nPUSH -7\nPUSH 2\nDIV\nPUSH 7\nPUSH -2\nDIV\nPUSH -8\nPUSH -2\nDIV"));

        REQUIRE(machine.execute().has_value());
        REQUIRE(contents(machine.stack()) == std::vector<stkm::Value> { 3, -4, -4, 4 });
    }

    SECTION( "division by zero freezes the machine" ) {
        machine.load(test::assemble(registry, "PUSH 5\nPUSH 0\nDIV\nPUSH 1"));

        auto const result = machine.execute();

        REQUIRE(test::error_kind(result) == stkm::ErrorKind::DIVISION_BY_ZERO);
        REQUIRE(machine.program_counter() == 2);
        REQUIRE(contents(machine.stack()) == std::vector<stkm::Value> { 5, 0 });
        REQUIRE(machine.outcome() == stkm::Outcome::FAULTED);
        REQUIRE(test::error_kind(machine.fault()) == stkm::ErrorKind::DIVISION_BY_ZERO);
    }

    SECTION( "underflow" ) {
        machine.load(test::assemble(registry, "PUSH 1\nADD"));

        REQUIRE(test::error_kind(machine.execute()) == stkm::ErrorKind::STACK_UNDERFLOW);
        REQUIRE(machine.program_counter() == 1);
        REQUIRE(contents(machine.stack()) == std::vector<stkm::Value> { 1 });
    }

    SECTION( "stack operations" ) {
        machine.load(test::assemble(registry, "PUSH 1\nPUSH 2\nSWAP\nDUP\nPUSH 9\nPOP"));

        REQUIRE(machine.execute().has_value());
        REQUIRE(contents(machine.stack()) == std::vector<stkm::Value> { 2, 1, 1 });
    }

    SECTION( "arithmetic wraps at 32 bits" ) {
        machine.load(test::assemble(registry, "PUSH 2147483647\nPUSH 1\nADD"));

        REQUIRE(machine.execute().has_value());
        REQUIRE(machine.stack().peek().value() == std::numeric_limits<stkm::Value>::min());
    }

    SECTION( "jump sets the next address" ) {
        machine.load({ { "JUMP", 2 }, { "PUSH", 99 }, { "PUSH", 1 }, { "HALT", {} } });

        REQUIRE(machine.execute().has_value());
        REQUIRE(contents(machine.stack()) == std::vector<stkm::Value> { 1 });
    }

    SECTION( "jz jumps only on zero and always pops" ) {
        machine.load({ { "PUSH", 0 }, { "JZ", 3 }, { "PUSH", 99 }, { "PUSH", 7 }, { "JZ", 6 }, { "PUSH", 1 }, { "HALT", {} } });

        REQUIRE(machine.execute().has_value());
        REQUIRE(contents(machine.stack()) == std::vector<stkm::Value> { 1 });
    }

    SECTION( "countdown loop" ) {
        machine.load(test::assemble(registry, R"(
            PUSH 5
            LOOP:
            DUP
            PRINT
            PUSH 1
            SUB
            DUP
            JZ END
            JUMP LOOP
            END:
            POP
            HALT
        )"));

        REQUIRE(machine.execute().has_value());
        REQUIRE(output.str() == "5\n4\n3\n2\n1\n");
        REQUIRE(machine.stack().empty());
    }

    SECTION( "running off the end completes normally" ) {
        machine.load(test::assemble(registry, "PUSH 1"));

        REQUIRE(machine.execute().has_value());
        REQUIRE(machine.outcome() == stkm::Outcome::COMPLETED);
        REQUIRE(machine.program_counter() == 1);
    }

    SECTION( "jumping out of the program completes normally" ) {
        machine.load({ { "JUMP", 100 }, { "PUSH", 1 } });

        REQUIRE(machine.execute().has_value());
        REQUIRE(machine.outcome() == stkm::Outcome::COMPLETED);
        REQUIRE(machine.stack().empty());

        machine.load({ { "JUMP", -1 } });

        REQUIRE(machine.execute().has_value());
        REQUIRE(machine.outcome() == stkm::Outcome::COMPLETED);
    }

    SECTION( "halt stops before the rest of the program" ) {
        machine.load(test::assemble(registry, "HALT\nPUSH 1"));

        REQUIRE(machine.execute().has_value());
        REQUIRE(machine.stack().empty());
        REQUIRE(machine.program_counter() == 0);
    }

    SECTION( "unknown opcode at runtime" ) {
        machine.load({ { "ADDD", {} } });

        auto const result = machine.execute();

        REQUIRE(test::error_kind(result) == stkm::ErrorKind::UNKNOWN_OPCODE);
        REQUIRE(test::error_text(result).find("did you mean ADD") != std::string::npos);
    }

    SECTION( "missing operand" ) {
        machine.load({ { "PUSH", {} } });

        REQUIRE(test::error_kind(machine.execute()) == stkm::ErrorKind::INVALID_OPERAND);
    }

    SECTION( "counters" ) {
        machine.load(test::assemble(registry, "PUSH 5\nPUSH 3\nMUL\nPUSH 2\nDIV\nPRINT\nJUMP 8\nPUSH 0\nHALT"));

        REQUIRE(machine.execute().has_value());
        REQUIRE(machine.statistics().instructions == 8);
        REQUIRE(machine.statistics().cycles == 1 + 1 + 3 + 1 + 10 + 5 + 2 + 1);
    }
}

TEST_CASE( "machine tracing", "[machine]" ) {
    stkm::Registry registry;
    std::ostringstream output;
    stkm::Machine machine(registry, output);

    SECTION( "a snapshot precedes every instruction" ) {
        machine.load(test::assemble(registry, "PUSH 1\nPUSH 2\nADD\nHALT"));

        std::vector<stkm::Snapshot> snapshots;

        for (auto const& snapshot : machine.trace())
        {
            snapshots.push_back(snapshot);
        }

        REQUIRE(snapshots.size() == 4);
        REQUIRE(snapshots[0].programCounter == 0);
        REQUIRE(snapshots[0].stack.empty());
        REQUIRE(snapshots[2].instruction == stkm::Instruction { "ADD", std::nullopt });
        REQUIRE(snapshots[2].stack == std::vector<stkm::Value> { 1, 2 });
        REQUIRE(snapshots[3].stack == std::vector<stkm::Value> { 3 });
        REQUIRE(machine.outcome() == stkm::Outcome::HALTED);
        REQUIRE(machine.fault().has_value());
    }

    SECTION( "snapshots show only the top of the stack" ) {
        machine.load(test::assemble(registry, "PUSH 1\nPUSH 2\nPUSH 3\nHALT"));

        std::vector<stkm::Value> last;

        for (auto const& snapshot : machine.trace(2))
        {
            last = snapshot.stack;
        }

        REQUIRE(last == std::vector<stkm::Value> { 2, 3 });
    }

    SECTION( "interrupting cancels between instructions" ) {
        machine.load(test::assemble(registry, "PUSH 1\nPUSH 2\nPUSH 3\nHALT"));

        for (auto const& snapshot : machine.trace())
        {
            if (snapshot.programCounter == 1)
            {
                machine.interrupt();
                break;
            }
        }

        REQUIRE(machine.outcome() == stkm::Outcome::CANCELLED);
        REQUIRE(machine.state() == stkm::State::IDLE);
        REQUIRE(contents(machine.stack()) == std::vector<stkm::Value> { 1 });
    }

    SECTION( "abandoning the trace cancels the run" ) {
        machine.load(test::assemble(registry, "PUSH 1\nPUSH 2\nPUSH 3\nHALT"));

        for (auto const& snapshot : machine.trace())
        {
            if (snapshot.programCounter == 2)
            {
                break;
            }
        }

        REQUIRE(machine.state() == stkm::State::IDLE);
        REQUIRE(machine.outcome() == stkm::Outcome::CANCELLED);
        REQUIRE(contents(machine.stack()) == std::vector<stkm::Value> { 1, 2 });
    }

    SECTION( "an interrupt raised while suspended is honoured on resume" ) {
        machine.load(test::assemble(registry, "PUSH 1\nPUSH 2\nHALT"));

        size_t seen = 0;

        for ([[maybe_unused]] auto const& snapshot : machine.trace())
        {
            seen += 1;
            machine.interrupt();
        }

        REQUIRE(seen == 1);
        REQUIRE(machine.stack().empty());
        REQUIRE(machine.outcome() == stkm::Outcome::CANCELLED);
    }

    SECTION( "failures end the trace and are kept" ) {
        machine.load(test::assemble(registry, "PUSH 1\nPUSH 0\nDIV\nPRINT"));

        size_t seen = 0;

        for ([[maybe_unused]] auto const& snapshot : machine.trace())
        {
            seen += 1;
        }

        REQUIRE(seen == 3);
        REQUIRE(machine.outcome() == stkm::Outcome::FAULTED);
        REQUIRE(test::error_kind(machine.fault()) == stkm::ErrorKind::DIVISION_BY_ZERO);
        REQUIRE(output.str().empty());
    }
}
