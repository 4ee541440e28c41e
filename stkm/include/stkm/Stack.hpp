#pragma once

#include "stkm/Constructs.hpp"

#include <liberror/Result.hpp>

#include <span>
#include <vector>

namespace stkm {

class Stack
{
public:
    void push(Value value);
    liberror::Result<Value> pop();
    liberror::Result<Value> peek() const;

    size_t size() const { return values_.size(); }
    bool empty() const { return values_.empty(); }
    void clear() { values_.clear(); }

    // bottom to top
    std::span<Value const> values() const { return values_; }

private:
    std::vector<Value> values_;
};

} // stkm
