#pragma once
#include <string_view>

#define QS_ASSERT(condition) \
    do { \
        if (!(condition)) [[unlikely]] { \
            ::qs::_assertionFail(#condition, __FILE__, __LINE__); \
        } \
    } while (false)

#if defined (QUICSOCK_DEBUG)
# define QS_DEBUG_ASSERT(condition) QS_ASSERT(condition)
#else
# define QS_DEBUG_ASSERT(condition) (void)0
#endif

namespace qs {
    [[noreturn]] void _assertionFail(std::string_view what, std::string_view file, int line);
}
