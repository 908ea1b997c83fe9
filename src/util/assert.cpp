#include <quicsock/util/assert.hpp>
#include <quicsock/Log.hpp>
#include <fmt/format.h>
#include <stdexcept>

void qs::_assertionFail(std::string_view what, std::string_view file, int line) {
    qs::log::error("Assertion failed ({} at {}:{})", what, file, line);

    throw std::runtime_error(fmt::format("Assertion failed ({}) at {}:{}", what, file, line));
}
