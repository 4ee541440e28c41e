#pragma once

#include <stkm/Assembler.hpp>
#include <stkm/Error.hpp>
#include <stkm/Machine.hpp>
#include <stkm/Registry.hpp>

#include <liberror/Result.hpp>

#include <atomic>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>

#include <unistd.h>

namespace test {

template <class T>
std::optional<stkm::ErrorKind> error_kind(liberror::Result<T> const& result)
{
    if (result.has_value())
    {
        return std::nullopt;
    }

    return stkm::kind_of(result.error().message());
}

template <class T>
std::string error_text(liberror::Result<T> const& result)
{
    return result.has_value() ? std::string() : std::string(result.error().message());
}

inline stkm::Program assemble(stkm::Registry const& registry, std::string_view source)
{
    return stkm::Assembler(registry).assemble_text(source).value();
}

class TemporaryDirectory
{
public:
    TemporaryDirectory()
    {
        static std::atomic<int> counter = 0;
        path_ = std::filesystem::temp_directory_path() / ("stkm-test-" + std::to_string(::getpid()) + "-" + std::to_string(counter++));
        std::filesystem::create_directories(path_);
    }

    ~TemporaryDirectory()
    {
        std::error_code ignored;
        std::filesystem::remove_all(path_, ignored);
    }

    TemporaryDirectory(TemporaryDirectory const&) = delete;
    TemporaryDirectory& operator=(TemporaryDirectory const&) = delete;

    std::filesystem::path const& path() const { return path_; }

private:
    std::filesystem::path path_;
};

}
