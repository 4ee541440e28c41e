#include "stkm/Machine.hpp"
#include "stkm/Arithmetic.hpp"
#include "stkm/Error.hpp"

#include <fmt/ostream.h>
#include <liberror/Try.hpp>

#include <algorithm>
#include <utility>

using namespace liberror;
using namespace libcoro;

namespace stkm {

namespace {

// cancels a trace whose generator is destroyed while suspended
class CancelOnExit
{
public:
    explicit CancelOnExit(Machine& machine) : machine_(machine) {}
    ~CancelOnExit() { machine_.interrupt(); }

    CancelOnExit(CancelOnExit const&) = delete;
    CancelOnExit& operator=(CancelOnExit const&) = delete;

private:
    Machine& machine_;
};

}

void Machine::load(Program program)
{
    program_ = std::move(program);
    stack_.clear();
    programCounter_ = 0;
    state_ = State::IDLE;
    outcome_ = Outcome::NONE;
    statistics_ = {};
    fault_ = {};
}

bool Machine::in_bounds() const
{
    return programCounter_ >= 0 && static_cast<size_t>(programCounter_) < program_.size();
}

Snapshot Machine::snapshot(size_t depth) const
{
    auto const values = stack_.values();
    auto const shown = std::min(depth, values.size());

    return {
        .programCounter = programCounter_,
        .instruction = program_.at(static_cast<size_t>(programCounter_)),
        .stack = { values.end() - static_cast<ptrdiff_t>(shown), values.end() }
    };
}

void Machine::interrupt()
{
    if (state_ == State::RUNNING)
    {
        state_ = State::IDLE;
        outcome_ = Outcome::CANCELLED;
    }
}

Result<void> Machine::execute()
{
    state_ = State::RUNNING;

    while (state_ == State::RUNNING)
    {
        if (!in_bounds())
        {
            state_ = State::IDLE;
            outcome_ = Outcome::COMPLETED;
            break;
        }

        if (auto result = step(); !result.has_value())
        {
            state_ = State::IDLE;
            outcome_ = Outcome::FAULTED;
            fault_ = result;
            return result;
        }
    }

    return {};
}

Generator<Snapshot> Machine::trace(size_t depth)
{
    CancelOnExit guard(*this);
    state_ = State::RUNNING;

    while (state_ == State::RUNNING)
    {
        if (!in_bounds())
        {
            state_ = State::IDLE;
            outcome_ = Outcome::COMPLETED;
            co_return;
        }

        co_yield snapshot(depth);

        // interrupted while suspended
        if (state_ != State::RUNNING)
        {
            co_return;
        }

        if (auto result = step(); !result.has_value())
        {
            state_ = State::IDLE;
            outcome_ = Outcome::FAULTED;
            fault_ = result;
            co_return;
        }
    }
}

Result<void> Machine::step()
{
    auto const& instruction = program_.at(static_cast<size_t>(programCounter_));
    auto const* info = TRY(registry_.lookup_by_name(instruction.opcode));

    statistics_.instructions += 1;
    statistics_.cycles += info->cost;

    auto const jumped = TRY(dispatch(instruction, *info));

    if (!jumped && state_ == State::RUNNING)
    {
        programCounter_ += 1;
    }

    return {};
}

Result<Value> Machine::operand_of(Instruction const& instruction) const
{
    if (!instruction.operand.has_value())
    {
        return fail(ErrorKind::INVALID_OPERAND, "{} at address {} requires an operand", instruction.opcode, programCounter_);
    }

    return *instruction.operand;
}

Result<void> Machine::arithmetic(Opcode opcode)
{
    if (stack_.size() < 2)
    {
        return fail(ErrorKind::STACK_UNDERFLOW, "{} needs two values but the stack holds {}", magic_enum::enum_name(opcode), stack_.size());
    }

    int64_t const b = TRY(stack_.peek());

    if (opcode == Opcode::DIV && b == 0)
    {
        return fail(ErrorKind::DIVISION_BY_ZERO, "division by zero at address {}", programCounter_);
    }

    TRY(stack_.pop());
    int64_t const a = TRY(stack_.pop());

    auto const result = [&] {
        switch (opcode)
        {
        case Opcode::ADD: return a + b;
        case Opcode::SUB: return a - b;
        case Opcode::MUL: return a * b;
        case Opcode::DIV: return floor_div(a, b);
        default: std::unreachable();
        }
    }();

    // wraps into the signed 32-bit range
    stack_.push(static_cast<Value>(result));

    return {};
}

Result<bool> Machine::dispatch(Instruction const& instruction, OpcodeInfo const& info)
{
    if (info.behavior)
    {
        TRY(info.behavior(*this, instruction.operand));
        return false;
    }

    switch (auto const opcode = Opcode(info.code); opcode)
    {
    case Opcode::PUSH: {
        stack_.push(TRY(operand_of(instruction)));
        break;
    }
    case Opcode::POP: {
        TRY(stack_.pop());
        break;
    }
    case Opcode::ADD:
    case Opcode::SUB:
    case Opcode::MUL:
    case Opcode::DIV: {
        TRY(arithmetic(opcode));
        break;
    }
    case Opcode::DUP: {
        stack_.push(TRY(stack_.peek()));
        break;
    }
    case Opcode::SWAP: {
        if (stack_.size() < 2)
        {
            return fail(ErrorKind::STACK_UNDERFLOW, "SWAP needs two values but the stack holds {}", stack_.size());
        }

        auto const b = TRY(stack_.pop());
        auto const a = TRY(stack_.pop());
        stack_.push(b);
        stack_.push(a);
        break;
    }
    case Opcode::PRINT: {
        fmt::print(output_, "{}\n", TRY(stack_.pop()));
        break;
    }
    case Opcode::JUMP: {
        programCounter_ = TRY(operand_of(instruction));
        return true;
    }
    case Opcode::JZ: {
        auto const target = TRY(operand_of(instruction));

        if (TRY(stack_.pop()) == 0)
        {
            programCounter_ = target;
            return true;
        }

        break;
    }
    case Opcode::HALT: {
        state_ = State::IDLE;
        outcome_ = Outcome::HALTED;
        break;
    }
    }

    return false;
}

} // stkm
