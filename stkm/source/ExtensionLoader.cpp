#include "stkm/Extensions.hpp"
#include "stkm/Error.hpp"

#include <dlfcn.h>

#include <algorithm>
#include <iterator>
#include <memory>
#include <system_error>

namespace stkm {

static std::string last_dl_error(std::string_view fallback)
{
    char const* error = dlerror();
    return error != nullptr ? std::string(error) : std::string(fallback);
}

static std::vector<std::filesystem::path> discover(std::filesystem::path const& directory)
{
    std::vector<std::filesystem::path> libraries;
    std::error_code error;

    for (auto const& entry : std::filesystem::directory_iterator(directory, error))
    {
        if (entry.is_regular_file(error) && entry.path().extension() == EXTENSION_SUFFIX)
        {
            libraries.push_back(entry.path());
        }
    }

    std::ranges::sort(libraries, {}, [] (auto const& path) { return path.filename(); });

    return libraries;
}

LoadReport load_extensions(Registry& registry, std::filesystem::path const& directory)
{
    LoadReport report;

    if (!std::filesystem::is_directory(directory))
    {
        return report;
    }

    for (auto const& path : discover(directory))
    {
        auto const source = path.filename().string();

        dlerror();
        std::shared_ptr<void> library(dlopen(path.c_str(), RTLD_NOW | RTLD_LOCAL), [] (void* handle) {
            if (handle != nullptr) dlclose(handle);
        });

        if (library == nullptr)
        {
            report.rejected.push_back({ source, describe(ErrorKind::EXTENSION_LOAD, last_dl_error("dlopen failed")) });
            continue;
        }

        dlerror();
        auto entry = reinterpret_cast<ExtensionEntryPoint>(dlsym(library.get(), EXTENSION_ENTRY_POINT));

        if (entry == nullptr)
        {
            report.rejected.push_back({ source, describe(ErrorKind::EXTENSION_LOAD, last_dl_error("missing stkm_extensions entry point")) });
            continue;
        }

        std::vector<Extension> extensions;
        entry(extensions);

        auto registered = register_extensions(registry, std::move(extensions), source);

        if (!registered.loaded.empty())
        {
            registry.retain(library);
        }

        std::ranges::move(registered.loaded, std::back_inserter(report.loaded));
        std::ranges::move(registered.rejected, std::back_inserter(report.rejected));
    }

    return report;
}

} // stkm
