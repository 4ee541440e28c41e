#pragma once

#include "stkm/Constructs.hpp"
#include "stkm/Registry.hpp"
#include "stkm/Stack.hpp"

#include <libcoro/Generator.hpp>
#include <liberror/Result.hpp>

#include <cstdint>
#include <iostream>
#include <vector>

namespace stkm {

enum class State { IDLE, RUNNING };

enum class Outcome { NONE, COMPLETED, HALTED, CANCELLED, FAULTED };

struct Statistics
{
    int64_t instructions;
    int64_t cycles;
};

struct Snapshot
{
    int32_t programCounter;
    Instruction instruction;

    // the topmost values, bottom to top
    std::vector<Value> stack;
};

class Machine
{
public:
    static constexpr size_t TRACE_STACK_LIMIT = 10;

    explicit Machine(Registry const& registry, std::ostream& output = std::cout)
        : registry_(registry)
        , output_(output)
        , program_()
        , stack_()
        , programCounter_()
        , state_(State::IDLE)
        , outcome_(Outcome::NONE)
        , statistics_()
        , fault_()
    {}

public:
    void load(Program program);

    liberror::Result<void> execute();

    //
    // Runs the loaded program, suspending before every instruction with a
    // snapshot of the machine. Whoever drives the generator decides when the
    // next instruction runs; calling interrupt() between two resumptions
    // cancels the run, as does destroying the generator before it finishes.
    // A failure ends the generator and is left in fault().
    //
    libcoro::Generator<Snapshot> trace(size_t depth = TRACE_STACK_LIMIT);

    void interrupt();

    Stack& stack() { return stack_; }
    Stack const& stack() const { return stack_; }
    std::ostream& output() { return output_; }

    Registry const& registry() const { return registry_; }
    Program const& program() const { return program_; }
    int32_t program_counter() const { return programCounter_; }
    State state() const { return state_; }
    Outcome outcome() const { return outcome_; }
    Statistics statistics() const { return statistics_; }
    liberror::Result<void> const& fault() const { return fault_; }

private:
    bool in_bounds() const;
    Snapshot snapshot(size_t depth) const;

    liberror::Result<void> step();
    liberror::Result<bool> dispatch(Instruction const& instruction, OpcodeInfo const& info);

    liberror::Result<void> arithmetic(Opcode opcode);
    liberror::Result<Value> operand_of(Instruction const& instruction) const;

private:
    Registry const& registry_;
    std::ostream& output_;

    Program program_;
    Stack stack_;
    int32_t programCounter_;

    State state_;
    Outcome outcome_;
    Statistics statistics_;
    liberror::Result<void> fault_;
};

} // stkm
