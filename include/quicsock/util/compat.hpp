#pragma once

#include <std23/move_only_function.h>

namespace qs {
    template <class S>
    using move_only_function = std23::move_only_function<S>;
}
