#pragma once

#include <folio/Utils/Macros.hpp>

namespace folio
{
    // calls into (hidden) assertion-handling implementation
    [[noreturn]] void OnAssertionFailure(char const* failingCode,
                                         char const* func,
                                         char const* file,
                                         unsigned int line) noexcept;

    // calls into (hidden) throwing-assertion implementation
    [[noreturn]] void OnThrowingAssertionFailure(char const* failingCode,
        char const* func,
        char const* file,
        unsigned int line);
}

#define FOLIO_THROWING_ASSERT(expr) \
    (static_cast<bool>(expr) ? (void)0 : folio::OnThrowingAssertionFailure(#expr, __func__, FOLIO_FILENAME, __LINE__))

// always execute this assertion - even if in release mode /w debug flags disabled
#define FOLIO_ASSERT_ALWAYS(expr)                                                                                     \
    (static_cast<bool>(expr) ? (void)0 : folio::OnAssertionFailure(#expr, __func__, FOLIO_FILENAME, __LINE__))

#ifdef FOLIO_FORCE_ASSERTS_ENABLED
#define FOLIO_ASSERT(expr) FOLIO_ASSERT_ALWAYS(expr)
#elif !defined(NDEBUG)
#define FOLIO_ASSERT(expr) FOLIO_ASSERT_ALWAYS(expr)
#else
#define FOLIO_ASSERT(expr)
#endif
