#include "Assertions.hpp"

#include <folio/Platform/Log.hpp>
#include <folio/Utils/SynchronizedValue.hpp>

#include <array>
#include <cstdio>
#include <exception>
#include <stdexcept>

namespace
{
    // returns a static, global, buffer that assertion error messages can be formatted into
    //
    // avoids memory allocations during assertion errors
    folio::SynchronizedValue<std::array<char, 2048>>& GetGlobalAssertionErrorBuffer()
    {
        static folio::SynchronizedValue<std::array<char, 2048>> s_MessageBuffer{};
        return s_MessageBuffer;
    }
}

void folio::OnAssertionFailure(char const* failingCode,
                               char const* func,
                               char const* file,
                               unsigned int line) noexcept
{
    auto& buf = GetGlobalAssertionErrorBuffer();
    auto guard = buf.lock();

    std::snprintf(guard->data(), guard->size(), "%s:%s:%u: assert(%s): failed", file, func, line, failingCode);
    log::critical("%s", guard->data());
    std::terminate();
}

void folio::OnThrowingAssertionFailure(
    char const* failingCode,
    char const* func,
    char const* file,
    unsigned int line)
{
    auto& buf = GetGlobalAssertionErrorBuffer();
    auto guard = buf.lock();

    std::snprintf(guard->data(), guard->size(), "%s:%s:%u: throw_if_not(%s): failed", file, func, line, failingCode);
    log::error("%s", guard->data());
    throw std::runtime_error{guard->data()};
}
