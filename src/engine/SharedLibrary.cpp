// SPDX-License-Identifier: Apache-2.0
#include "SharedLibrary.hpp"

#include <format>
#include <utility>

#ifdef _WIN32
    #define WIN32_LEAN_AND_MEAN
    #include <windows.h>
#else
    #include <dlfcn.h>
#endif

namespace xcaption
{

namespace
{

#ifdef _WIN32
    auto lastSystemError() -> std::string
    {
        auto const code = GetLastError();
        char* buffer = nullptr;
        auto const size = FormatMessageA(FORMAT_MESSAGE_ALLOCATE_BUFFER | FORMAT_MESSAGE_FROM_SYSTEM
                                             | FORMAT_MESSAGE_IGNORE_INSERTS,
                                         nullptr,
                                         code,
                                         0,
                                         reinterpret_cast<LPSTR>(&buffer),
                                         0,
                                         nullptr);
        auto message = size ? std::string(buffer, size) : std::format("error code {}", code);
        LocalFree(buffer);
        while (!message.empty() && (message.back() == '\n' || message.back() == '\r'))
            message.pop_back();
        return message;
    }
#endif

} // namespace

SharedLibrary::~SharedLibrary()
{
    close();
}

SharedLibrary::SharedLibrary(SharedLibrary&& other) noexcept: _handle(std::exchange(other._handle, nullptr))
{
}

SharedLibrary& SharedLibrary::operator=(SharedLibrary&& other) noexcept
{
    if (this != &other)
    {
        close();
        _handle = std::exchange(other._handle, nullptr);
    }
    return *this;
}

auto SharedLibrary::open(const std::filesystem::path& path) -> Result<SharedLibrary>
{
#ifdef _WIN32
    auto* const handle = LoadLibraryW(path.wstring().c_str());
    if (!handle)
    {
        auto const reason = lastSystemError();
        auto error = Error { .code = ErrorCode::EngineLoadFailed, .message = reason, .originalMessage = reason };
        return makeError(std::move(error));
    }
    return SharedLibrary(static_cast<void*>(handle));
#else
    // RTLD_LOCAL keeps the addon's ggml symbols out of the global namespace.
    auto* const handle = dlopen(path.c_str(), RTLD_NOW | RTLD_LOCAL);
    if (!handle)
    {
        auto const* const text = dlerror();
        auto const reason = text ? std::string(text) : std::format("dlopen failed for {}", path.string());
        auto error = Error { .code = ErrorCode::EngineLoadFailed, .message = reason, .originalMessage = reason };
        return makeError(std::move(error));
    }
    return SharedLibrary(handle);
#endif
}

auto SharedLibrary::symbol(const std::string& name) const -> void*
{
    if (!_handle)
        return nullptr;
#ifdef _WIN32
    return reinterpret_cast<void*>(GetProcAddress(static_cast<HMODULE>(_handle), name.c_str()));
#else
    return dlsym(_handle, name.c_str());
#endif
}

void SharedLibrary::close() noexcept
{
    if (!_handle)
        return;
#ifdef _WIN32
    FreeLibrary(static_cast<HMODULE>(_handle));
#else
    dlclose(_handle);
#endif
    _handle = nullptr;
}

} // namespace xcaption
