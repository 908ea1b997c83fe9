#pragma once

#include <Geode/Result.hpp>

namespace qs {

using geode::Ok;
using geode::Err;

[[noreturn]] inline void unreachable() {
#if defined __clang__ || defined __GNUC__
    __builtin_unreachable();
#elif defined _MSC_VER
    __assume(0);
#endif
}

}
