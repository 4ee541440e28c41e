#include "stkm/Bytecode.hpp"
#include "stkm/Error.hpp"
#include "stkm/MemManip.hpp"

#include <liberror/Try.hpp>

#include <algorithm>
#include <limits>

using namespace liberror;

namespace stkm {

Result<std::vector<uint8_t>> Codec::encode(Program const& program) const
{
    if (program.size() > std::numeric_limits<uint32_t>::max())
    {
        return fail(ErrorKind::MALFORMED_BYTECODE, "{} instructions do not fit in a bytecode header", program.size());
    }

    std::vector<uint8_t> bytes;
    bytes.reserve(record_offset(program.size()));

    bytes.insert(bytes.end(), MAGIC.begin(), MAGIC.end());
    bytes.push_back(VERSION);

    for (auto byte : uint_2_bytes(static_cast<uint32_t>(program.size())))
    {
        bytes.push_back(byte);
    }

    for (auto const& instruction : program)
    {
        auto const* info = TRY(registry_.lookup_by_name(instruction.opcode));

        bytes.push_back(info->code);

        for (auto byte : int_2_bytes(instruction.operand.value_or(0)))
        {
            bytes.push_back(byte);
        }
    }

    return bytes;
}

Result<std::vector<Record>> Codec::decode_records(std::span<uint8_t const> bytes) const
{
    if (bytes.size() < MAGIC.size() || !std::ranges::equal(bytes.first(MAGIC.size()), MAGIC, [] (uint8_t lhs, char rhs) { return lhs == static_cast<uint8_t>(rhs); }))
    {
        return fail(ErrorKind::BAD_MAGIC, "not a STKM bytecode file");
    }

    if (bytes.size() < HEADER_SIZE)
    {
        return fail(ErrorKind::MALFORMED_BYTECODE, "header is truncated, {} of {} bytes present", bytes.size(), HEADER_SIZE);
    }

    if (auto version = bytes[4]; version != VERSION)
    {
        return fail(ErrorKind::UNSUPPORTED_VERSION, "unsupported version {} (expected {})", version, VERSION);
    }

    auto const count = static_cast<size_t>(bytes_2_uint(bytes.subspan(5, 4)));
    auto const expected = static_cast<size_t>(bytes.size() - HEADER_SIZE);

    if (expected / RECORD_SIZE < count)
    {
        return fail(ErrorKind::MALFORMED_BYTECODE, "header declares {} instructions but only {} bytes of records follow", count, expected);
    }

    if (expected != count * RECORD_SIZE)
    {
        return fail(ErrorKind::MALFORMED_BYTECODE, "{} trailing bytes after {} instructions", expected - count * RECORD_SIZE, count);
    }

    std::vector<Record> records;
    records.reserve(count);

    for (size_t index = 0; index < count; ++index)
    {
        auto const offset = record_offset(index);
        auto const record = bytes.subspan(offset, RECORD_SIZE);

        auto const code = record[0];
        auto const stored = bytes_2_int(record.subspan(1, 4));

        auto const* info = TRY(registry_.lookup_by_code(code));

        std::optional<Value> operand;

        if (info->hasOperand || stored != 0)
        {
            operand = stored;
        }

        Record decoded {
            .instruction = { info->name, operand },
            .code = code,
            .offset = offset,
            .raw = {}
        };

        std::ranges::copy(record, decoded.raw.begin());
        records.push_back(std::move(decoded));
    }

    return records;
}

Result<Program> Codec::decode(std::span<uint8_t const> bytes) const
{
    auto records = TRY(decode_records(bytes));

    Program program;
    program.reserve(records.size());

    for (auto& record : records)
    {
        program.push_back(std::move(record.instruction));
    }

    return program;
}

} // stkm
