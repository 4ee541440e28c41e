#include "stkm/Stack.hpp"
#include "stkm/Error.hpp"

namespace stkm {

void Stack::push(Value value)
{
    values_.push_back(value);
}

liberror::Result<Value> Stack::pop()
{
    if (values_.empty())
    {
        return fail(ErrorKind::STACK_UNDERFLOW, "cannot pop from an empty stack");
    }

    auto value = values_.back();
    values_.pop_back();

    return value;
}

liberror::Result<Value> Stack::peek() const
{
    if (values_.empty())
    {
        return fail(ErrorKind::STACK_UNDERFLOW, "cannot peek an empty stack");
    }

    return values_.back();
}

} // stkm
