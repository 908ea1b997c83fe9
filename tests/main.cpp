#include <gtest/gtest.h>

#include <arc/prelude.hpp>
#include <quicsock/Log.hpp>

// Tests run on a blocking thread, so that they can wait on futures spawned onto the runtime.
arc::Future<int> amain(int argc, char** argv) {
    ::testing::InitGoogleTest(&argc, argv);

    qs::log::setMinLevel(qs::log::Level::Info);
    qs::log::setLogFunction([](qs::log::Level level, const std::string& message) {
        fmt::println("[{}] {}", qs::log::levelToString(level), message);
    });

    co_return co_await arc::spawnBlocking<int>([] {
        return RUN_ALL_TESTS();
    });
}

ARC_DEFINE_MAIN_NT(amain, 4);
