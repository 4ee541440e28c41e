#include "stkm/Extensions.hpp"
#include "stkm/Arithmetic.hpp"
#include "stkm/Error.hpp"
#include "stkm/Machine.hpp"

#include <fmt/ostream.h>
#include <liberror/Try.hpp>

#include <algorithm>
#include <functional>

using namespace liberror;

namespace stkm {

static Result<void> require(Machine& machine, std::string_view opcode, size_t depth)
{
    if (machine.stack().size() < depth)
    {
        return fail(ErrorKind::STACK_UNDERFLOW, "{} needs {} values but the stack holds {}", opcode, depth, machine.stack().size());
    }

    return {};
}

static Extension comparison(std::string name, uint8_t code, std::function<bool(Value, Value)> compare)
{
    return {
        .name = name,
        .code = code,
        .hasOperand = false,
        .behavior = [name, compare] (Machine& machine, std::optional<Value>) -> Result<void> {
            TRY(require(machine, name, 2));
            auto const b = TRY(machine.stack().pop());
            auto const a = TRY(machine.stack().pop());
            machine.stack().push(compare(a, b) ? 1 : 0);
            return {};
        }
    };
}

static Result<void> mod(Machine& machine, std::optional<Value>)
{
    TRY(require(machine, "MOD", 2));

    if (TRY(machine.stack().peek()) == 0)
    {
        return fail(ErrorKind::DIVISION_BY_ZERO, "modulo by zero at address {}", machine.program_counter());
    }

    int64_t const b = TRY(machine.stack().pop());
    int64_t const a = TRY(machine.stack().pop());
    machine.stack().push(static_cast<Value>(floor_mod(a, b)));

    return {};
}

static Result<void> neg(Machine& machine, std::optional<Value>)
{
    int64_t const value = TRY(machine.stack().pop());
    machine.stack().push(static_cast<Value>(-value));
    return {};
}

static Result<void> depth(Machine& machine, std::optional<Value>)
{
    machine.stack().push(static_cast<Value>(machine.stack().size()));
    return {};
}

static Result<void> over(Machine& machine, std::optional<Value>)
{
    TRY(require(machine, "OVER", 2));
    auto const b = TRY(machine.stack().pop());
    auto const a = TRY(machine.stack().peek());
    machine.stack().push(b);
    machine.stack().push(a);
    return {};
}

static Result<void> rot(Machine& machine, std::optional<Value>)
{
    TRY(require(machine, "ROT", 3));
    auto const c = TRY(machine.stack().pop());
    auto const b = TRY(machine.stack().pop());
    auto const a = TRY(machine.stack().pop());
    machine.stack().push(b);
    machine.stack().push(c);
    machine.stack().push(a);
    return {};
}

static Result<void> peek(Machine& machine, std::optional<Value>)
{
    fmt::print(machine.output(), "PEEK: Top item is {}\n", TRY(machine.stack().peek()));
    return {};
}

std::vector<Extension> standard_extensions()
{
    return {
        { .name = "MOD",   .code = 0x10, .hasOperand = false, .behavior = mod },
        { .name = "NEG",   .code = 0x11, .hasOperand = false, .behavior = neg },
        comparison("EQ",  0x12, std::equal_to<Value>()),
        comparison("NEQ", 0x13, std::not_equal_to<Value>()),
        comparison("LT",  0x14, std::less<Value>()),
        comparison("GT",  0x15, std::greater<Value>()),
        comparison("LTE", 0x16, std::less_equal<Value>()),
        comparison("GTE", 0x17, std::greater_equal<Value>()),
        { .name = "DEPTH", .code = 0x18, .hasOperand = false, .behavior = depth },
        { .name = "OVER",  .code = 0x19, .hasOperand = false, .behavior = over },
        { .name = "ROT",   .code = 0x1A, .hasOperand = false, .behavior = rot },
        { .name = "PEEK",  .code = 0x1B, .hasOperand = false, .behavior = peek },
    };
}

LoadReport register_extensions(Registry& registry, std::vector<Extension> extensions, std::string const& source)
{
    std::ranges::stable_sort(extensions, {}, &Extension::name);

    LoadReport report;

    for (auto& extension : extensions)
    {
        auto name = extension.name;

        if (auto result = registry.register_extension(std::move(extension)); !result.has_value())
        {
            report.rejected.push_back({ source, std::string(result.error().message()) });
            continue;
        }

        report.loaded.push_back(std::move(name));
    }

    return report;
}

LoadReport register_standard_extensions(Registry& registry)
{
    return register_extensions(registry, standard_extensions(), "standard extensions");
}

} // stkm
