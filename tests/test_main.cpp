// doctest runner for every tests/test_*.cpp suite. Logging is silenced so
// expected failures do not clutter the report.
#define DOCTEST_CONFIG_IMPLEMENT
#include <doctest/doctest.h>
#include "chunkwire/log.hpp"

int main(int argc, char** argv) {
    chunkwire::set_log_level(chunkwire::LogLevel::Off);

    doctest::Context ctx;
    ctx.applyCommandLine(argc, argv);
    return ctx.run();
}
