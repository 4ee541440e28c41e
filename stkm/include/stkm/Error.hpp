#pragma once

#include <fmt/core.h>
#include <liberror/Result.hpp>
#include <magic_enum/magic_enum.hpp>

#include <optional>
#include <string>
#include <string_view>
#include <utility>

namespace stkm {

enum class ErrorKind
{
    STACK_UNDERFLOW,
    DIVISION_BY_ZERO,
    UNKNOWN_OPCODE,
    UNKNOWN_OPCODE_NUMBER,
    DUPLICATE_LABEL,
    EMPTY_LABEL_NAME,
    UNDEFINED_LABEL,
    INVALID_OPERAND,
    SOURCE_NOT_FOUND,
    BAD_MAGIC,
    UNSUPPORTED_VERSION,
    MALFORMED_BYTECODE,
    NAME_CONFLICT,
    CODE_CONFLICT,
    EXTENSION_LOAD,
    IO_ERROR
};

//
// every error produced by stkm reads "[KIND] message", so the kind survives
// the trip through liberror::Error, which only carries text.
//
inline std::string describe(ErrorKind kind, std::string_view message)
{
    return fmt::format("[{}] {}", magic_enum::enum_name(kind), message);
}

template <class ... Args>
auto fail(ErrorKind kind, fmt::format_string<Args...> format, Args&& ... args)
{
    return liberror::make_error("{}", describe(kind, fmt::format(format, std::forward<Args>(args)...)));
}

inline std::optional<ErrorKind> kind_of(std::string_view message)
{
    if (!message.starts_with('['))
    {
        return std::nullopt;
    }

    auto const end = message.find(']');

    if (end == std::string_view::npos)
    {
        return std::nullopt;
    }

    return magic_enum::enum_cast<ErrorKind>(message.substr(1, end - 1));
}

} // stkm
