#include "stkm/Files.hpp"
#include "stkm/Error.hpp"

#include <liberror/Try.hpp>

#include <fstream>
#include <iterator>
#include <system_error>

using namespace liberror;

namespace stkm {

static Result<std::vector<char>> slurp(std::filesystem::path const& path)
{
    if (!std::filesystem::is_regular_file(path))
    {
        return fail(ErrorKind::SOURCE_NOT_FOUND, "file '{}' not found", path.string());
    }

    std::ifstream stream(path, std::ios::binary);

    if (!stream)
    {
        return fail(ErrorKind::SOURCE_NOT_FOUND, "file '{}' could not be opened", path.string());
    }

    std::vector<char> contents { std::istreambuf_iterator<char>(stream), std::istreambuf_iterator<char>() };

    if (stream.bad())
    {
        return fail(ErrorKind::IO_ERROR, "failed while reading '{}'", path.string());
    }

    return contents;
}

Result<std::string> read_text(std::filesystem::path const& path)
{
    auto const contents = TRY(slurp(path));
    return std::string(contents.begin(), contents.end());
}

Result<std::vector<uint8_t>> read_bytes(std::filesystem::path const& path)
{
    auto const contents = TRY(slurp(path));
    return std::vector<uint8_t>(contents.begin(), contents.end());
}

static Result<void> write_raw(std::filesystem::path const& path, char const* data, size_t size)
{
    auto temporary = path;
    temporary += ".partial";

    {
        std::ofstream stream(temporary, std::ios::binary | std::ios::trunc);

        if (!stream)
        {
            return fail(ErrorKind::IO_ERROR, "could not open '{}' for writing", temporary.string());
        }

        stream.write(data, static_cast<std::streamsize>(size));

        if (!stream.flush())
        {
            std::error_code ignored;
            std::filesystem::remove(temporary, ignored);
            return fail(ErrorKind::IO_ERROR, "failed while writing '{}'", temporary.string());
        }
    }

    std::error_code error;
    std::filesystem::rename(temporary, path, error);

    if (error)
    {
        std::error_code ignored;
        std::filesystem::remove(temporary, ignored);
        return fail(ErrorKind::IO_ERROR, "could not move '{}' to '{}': {}", temporary.string(), path.string(), error.message());
    }

    return {};
}

Result<void> write_file(std::filesystem::path const& path, std::span<uint8_t const> contents)
{
    return write_raw(path, reinterpret_cast<char const*>(contents.data()), contents.size());
}

Result<void> write_file(std::filesystem::path const& path, std::string_view contents)
{
    return write_raw(path, contents.data(), contents.size());
}

} // stkm
