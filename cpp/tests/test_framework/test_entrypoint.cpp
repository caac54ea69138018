// tests/test_framework/test_entrypoint.cpp
/**
 * @file test_entrypoint.cpp
 * @brief Main entry point for every plexus test executable.
 *
 * Logging is lowered to warnings so expected failures (bind collisions, protocol
 * misuse) stay visible without flooding the output. Set PLEXUS_TEST_LOG_LEVEL=trace
 * to see everything. The shared ZeroMQ context is destroyed after the run, once
 * every endpoint owned by a test has been closed.
 */
#include "test_entrypoint.h"
#include "plx_messaging.hpp"

#include <cstdlib>
#include <string_view>

int main(int argc, char **argv)
{
    using plexus::utils::Logger;

    auto level = Logger::Level::L_WARNING;
    if (const char *env = std::getenv("PLEXUS_TEST_LOG_LEVEL"))
    {
        const std::string_view requested(env);
        if (requested == "trace")
            level = Logger::Level::L_TRACE;
        else if (requested == "debug")
            level = Logger::Level::L_DEBUG;
        else if (requested == "info")
            level = Logger::Level::L_INFO;
    }
    Logger::instance().set_level(level);

    ::testing::InitGoogleTest(&argc, argv);
    const int rc = RUN_ALL_TESTS();

    plexus::msg::zmq_context_shutdown();
    Logger::instance().flush();
    return rc;
}
